#pragma once

#include "Platform/IProcessProbe.h"
#include "Platform/ISensorsCommand.h"
#include "Platform/ISystemProbe.h"
#include "Platform/IThermalProbe.h"

#include <chrono>
#include <memory>
#include <string>

namespace Platform
{

/// Creates the platform-appropriate IProcessProbe implementation.
[[nodiscard]] std::unique_ptr<IProcessProbe> makeProcessProbe();

/// Creates the platform-appropriate ISystemProbe implementation.
[[nodiscard]] std::unique_ptr<ISystemProbe> makeSystemProbe();

/// Creates the platform-appropriate IThermalProbe implementation.
[[nodiscard]] std::unique_ptr<IThermalProbe> makeThermalProbe();

/// Creates the platform-appropriate ISensorsCommand implementation running `command`,
/// which is abandoned if it has not finished within `timeout`.
[[nodiscard]] std::unique_ptr<ISensorsCommand> makeSensorsCommand(const std::string& command, std::chrono::milliseconds timeout);

} // namespace Platform
