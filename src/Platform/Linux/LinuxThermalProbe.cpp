// Keep this translation unit parseable on non-Linux platforms by compiling
// the implementation only when targeting Linux.
#if defined(__linux__)

#include "LinuxThermalProbe.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace Platform
{

namespace
{

constexpr double MILLIDEGREES_PER_DEGREE = 1000.0;

[[nodiscard]] std::optional<std::int64_t> readMillidegrees(const std::filesystem::path& tempPath)
{
    std::ifstream tempFile(tempPath);
    if (!tempFile.is_open())
    {
        return std::nullopt;
    }

    std::string text;
    if (!std::getline(tempFile, text))
    {
        return std::nullopt;
    }

    const auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos)
    {
        return std::nullopt;
    }

    std::int64_t value = 0;
    const char* const last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data() + begin, last, value);
    if (ec != std::errc{})
    {
        return std::nullopt;
    }
    // Only trailing whitespace may follow the number.
    if (!std::all_of(ptr, last, [](char c) { return c == ' ' || c == '\t' || c == '\r'; }))
    {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::string readZoneType(const std::filesystem::path& zonePath)
{
    std::ifstream typeFile(zonePath / "type");
    std::string type;
    if (typeFile.is_open())
    {
        std::getline(typeFile, type);
    }
    return type;
}

} // namespace

LinuxThermalProbe::LinuxThermalProbe(std::filesystem::path thermalRoot) : m_ThermalRoot(std::move(thermalRoot))
{
    discoverZones();
    spdlog::debug("LinuxThermalProbe: found {} thermal zones under {}", m_ZonePaths.size(), m_ThermalRoot.string());
}

void LinuxThermalProbe::discoverZones()
{
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(m_ThermalRoot, ec))
    {
        spdlog::debug("LinuxThermalProbe: {} not found or not a directory", m_ThermalRoot.string());
        return;
    }

    for (fs::directory_iterator iter(m_ThermalRoot, ec); !ec && iter != fs::directory_iterator(); iter.increment(ec))
    {
        const auto name = iter->path().filename().string();
        if (name.starts_with("thermal_zone"))
        {
            m_ZonePaths.push_back(iter->path());
        }
    }

    if (ec)
    {
        spdlog::warn("LinuxThermalProbe: error iterating {}: {}", m_ThermalRoot.string(), ec.message());
    }

    // Stable order: thermal_zone0, thermal_zone1, ...
    std::sort(m_ZonePaths.begin(), m_ZonePaths.end());

    m_Capabilities.hasThermalZones = !m_ZonePaths.empty();
    m_Capabilities.zoneCount = m_ZonePaths.size();
}

ThermalCounters LinuxThermalProbe::read()
{
    ThermalCounters counters;
    counters.zones.reserve(m_ZonePaths.size());

    for (const auto& zonePath : m_ZonePaths)
    {
        const auto millidegrees = readMillidegrees(zonePath / "temp");
        if (!millidegrees)
        {
            // Disabled zones commonly return EINVAL/ENODATA on read.
            ++counters.unreadableZones;
            continue;
        }

        ThermalZoneReading reading;
        reading.zone = zonePath.filename().string();
        reading.type = readZoneType(zonePath);
        reading.celsius = static_cast<double>(*millidegrees) / MILLIDEGREES_PER_DEGREE;
        counters.zones.push_back(std::move(reading));
    }

    return counters;
}

ThermalCapabilities LinuxThermalProbe::capabilities() const
{
    return m_Capabilities;
}

} // namespace Platform

#endif
