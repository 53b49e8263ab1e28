#include "Platform/Factory.h"

#include "LinuxProcessProbe.h"
#include "LinuxSensorsCommand.h"
#include "LinuxSystemProbe.h"
#include "LinuxThermalProbe.h"

#include <memory>

namespace Platform
{

std::unique_ptr<IProcessProbe> makeProcessProbe()
{
    return std::make_unique<LinuxProcessProbe>();
}

std::unique_ptr<ISystemProbe> makeSystemProbe()
{
    return std::make_unique<LinuxSystemProbe>();
}

std::unique_ptr<IThermalProbe> makeThermalProbe()
{
    return std::make_unique<LinuxThermalProbe>();
}

std::unique_ptr<ISensorsCommand> makeSensorsCommand(const std::string& command, std::chrono::milliseconds timeout)
{
    return std::make_unique<LinuxSensorsCommand>(command, timeout);
}

} // namespace Platform
