#pragma once

#include "Platform/IThermalProbe.h"

#include <filesystem>
#include <vector>

namespace Platform
{

/// Linux implementation of IThermalProbe.
/// Reads /sys/class/thermal/thermal_zone*/temp (millidegrees Celsius).
class LinuxThermalProbe : public IThermalProbe
{
  public:
    /// @param thermalRoot Directory holding the thermal_zone* entries.
    explicit LinuxThermalProbe(std::filesystem::path thermalRoot = "/sys/class/thermal");
    ~LinuxThermalProbe() override = default;

    LinuxThermalProbe(const LinuxThermalProbe&) = delete;
    LinuxThermalProbe& operator=(const LinuxThermalProbe&) = delete;
    LinuxThermalProbe(LinuxThermalProbe&&) = default;
    LinuxThermalProbe& operator=(LinuxThermalProbe&&) = default;

    [[nodiscard]] ThermalCounters read() override;
    [[nodiscard]] ThermalCapabilities capabilities() const override;

  private:
    void discoverZones();

    std::filesystem::path m_ThermalRoot;
    std::vector<std::filesystem::path> m_ZonePaths;
    ThermalCapabilities m_Capabilities;
};

} // namespace Platform
