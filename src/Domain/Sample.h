#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Domain
{

/// Where a temperature value came from.
enum class TemperatureSource
{
    ThermalZone,    // sysfs thermal_zone*/temp
    SensorsCommand, // parsed from `sensors` output
};

[[nodiscard]] constexpr std::string_view toString(TemperatureSource source) noexcept
{
    switch (source)
    {
    case TemperatureSource::ThermalZone:
        return "thermal zone";
    case TemperatureSource::SensorsCommand:
        return "sensors";
    }
    return "unknown";
}

/// Highest plausible temperature seen at one point in time.
/// Absence is modelled with std::optional, never a sentinel value.
struct TemperatureReading
{
    double celsius = 0.0;
    TemperatureSource source = TemperatureSource::ThermalZone;
    std::string label; // Zone type or sensor label of the hottest reading
};

/// CPU share of one process over a sample window.
/// cpuPercent uses 100 per fully busy logical CPU.
struct ProcessUsage
{
    std::int32_t pid = 0;
    double cpuPercent = 0.0;
    std::string name;
    std::string user;
};

/// One measurement cycle. Immutable once produced by the Sampler.
struct Sample
{
    std::chrono::system_clock::time_point timestamp; // Wall clock, for display only
    std::chrono::steady_clock::time_point windowStart;
    std::chrono::steady_clock::time_point windowEnd;

    double overallCpuPercent = 0.0; // 0-100 across all logical CPUs

    // Descending cpuPercent, ties by ascending pid.
    std::vector<ProcessUsage> rankedProcesses;

    std::optional<TemperatureReading> temperature;

    std::size_t processesCompared = 0; // Pids present in both captures

    [[nodiscard]] std::chrono::duration<double> windowLength() const
    {
        return windowEnd - windowStart;
    }

    /// First n entries of the ranking (fewer if the ranking is shorter).
    [[nodiscard]] std::vector<ProcessUsage> topProcesses(std::size_t n) const
    {
        const auto count = std::min(n, rankedProcesses.size());
        return {rankedProcesses.begin(), rankedProcesses.begin() + static_cast<std::ptrdiff_t>(count)};
    }
};

} // namespace Domain
