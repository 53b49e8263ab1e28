#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace Platform
{

/// One thermal zone value, already converted from millidegrees.
struct ThermalZoneReading
{
    std::string zone; // e.g. "thermal_zone0"
    std::string type; // e.g. "x86_pkg_temp" (empty if unreadable)
    double celsius = 0.0;
};

/// Raw thermal zone readings from OS.
/// Domain decides which values are plausible and which one to report.
struct ThermalCounters
{
    std::vector<ThermalZoneReading> zones;
    std::size_t unreadableZones = 0; // Zones present but with a missing/garbled temp file
};

/// Reports what this platform's thermal probe found.
struct ThermalCapabilities
{
    bool hasThermalZones = false;
    std::size_t zoneCount = 0;
};

} // namespace Platform
