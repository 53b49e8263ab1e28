#pragma once

#include "Platform/ISensorsCommand.h"
#include "Platform/IThermalProbe.h"
#include "Sample.h"

#include <memory>
#include <optional>

namespace Domain
{

/// Plausible range for a host temperature. Disabled zones report values like
/// -273.2 or 0x7fffffff millidegrees; those are discarded, not clamped.
inline constexpr double MIN_PLAUSIBLE_CELSIUS = -40.0;
inline constexpr double MAX_PLAUSIBLE_CELSIUS = 150.0;

[[nodiscard]] constexpr bool isPlausibleCelsius(double celsius) noexcept
{
    return celsius >= MIN_PLAUSIBLE_CELSIUS && celsius <= MAX_PLAUSIBLE_CELSIUS;
}

/// Point-in-time highest temperature.
///
/// Policy: maximum of the sysfs thermal zones if any reading is plausible;
/// otherwise the maximum temperature parsed from the sensors command;
/// otherwise nullopt. Missing sensors are a normal state, never an error.
class TemperatureReader
{
  public:
    /// Either collaborator may be null, which disables that source.
    TemperatureReader(std::unique_ptr<Platform::IThermalProbe> thermalProbe, std::unique_ptr<Platform::ISensorsCommand> sensorsCommand);
    ~TemperatureReader() = default;

    TemperatureReader(const TemperatureReader&) = delete;
    TemperatureReader& operator=(const TemperatureReader&) = delete;
    TemperatureReader(TemperatureReader&&) = default;
    TemperatureReader& operator=(TemperatureReader&&) = default;

    [[nodiscard]] std::optional<TemperatureReading> capture();

  private:
    [[nodiscard]] std::optional<TemperatureReading> readThermalZones();
    [[nodiscard]] std::optional<TemperatureReading> readSensorsCommand();

    std::unique_ptr<Platform::IThermalProbe> m_ThermalProbe;
    std::unique_ptr<Platform::ISensorsCommand> m_SensorsCommand;
};

} // namespace Domain
