#pragma once

#include <optional>
#include <string>

namespace Platform
{

/// Runs an external sensor-reporting command (lm-sensors `sensors`) and returns its output.
/// The text is handed to the domain parser untouched.
class ISensorsCommand
{
  public:
    virtual ~ISensorsCommand() = default;

    ISensorsCommand() = default;
    ISensorsCommand(const ISensorsCommand&) = default;
    ISensorsCommand& operator=(const ISensorsCommand&) = default;
    ISensorsCommand(ISensorsCommand&&) = default;
    ISensorsCommand& operator=(ISensorsCommand&&) = default;

    /// Standard output of the command, or nullopt if it could not run or exited non-zero.
    [[nodiscard]] virtual std::optional<std::string> run() = 0;
};

} // namespace Platform
