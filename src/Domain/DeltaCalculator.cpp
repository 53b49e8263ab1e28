#include "DeltaCalculator.h"

#include "Numeric.h"

#include <spdlog/spdlog.h>

#include <chrono>

namespace Domain
{

DeltaCalculator::DeltaCalculator(DeltaConfig config) : m_Config(config)
{
    if (m_Config.logicalCpuCount <= 0)
    {
        spdlog::warn("DeltaCalculator: invalid logical CPU count {}, using 1", m_Config.logicalCpuCount);
        m_Config.logicalCpuCount = 1;
    }
    if (m_Config.ticksPerSecond <= 0)
    {
        spdlog::warn("DeltaCalculator: invalid tick rate {}, using 100", m_Config.ticksPerSecond);
        m_Config.ticksPerSecond = 100;
    }
    spdlog::debug("DeltaCalculator: {} logical CPUs, {} ticks/sec", m_Config.logicalCpuCount, m_Config.ticksPerSecond);
}

double DeltaCalculator::overallCpuPercent(const Platform::SystemCounters& prev, const Platform::SystemCounters& curr) const
{
    if (curr.captureTime <= prev.captureTime)
    {
        // Clock anomaly or identical capture: no measurable work.
        return 0.0;
    }

    const std::uint64_t totalDelta = Numeric::saturatingDelta(curr.cpuTotal.total(), prev.cpuTotal.total());
    if (totalDelta == 0)
    {
        return 0.0;
    }

    const std::uint64_t activeDelta = Numeric::saturatingDelta(curr.cpuTotal.active(), prev.cpuTotal.active());
    return Numeric::clampPercent(Numeric::toDouble(activeDelta) / Numeric::toDouble(totalDelta) * 100.0);
}

std::unordered_map<std::int32_t, double> DeltaCalculator::perProcessPercent(const Platform::ProcessSnapshot& prev,
                                                                           const Platform::ProcessSnapshot& curr) const
{
    std::unordered_map<std::int32_t, double> result;
    result.reserve(curr.processes.size());

    const double elapsedSeconds = std::chrono::duration<double>(curr.captureTime - prev.captureTime).count();
    const double ceiling = maxProcessPercent();
    const double ticksPerSecond = Numeric::toDouble(m_Config.ticksPerSecond);

    for (const auto& [pid, current] : curr.processes)
    {
        const auto prevIt = prev.processes.find(pid);
        if (prevIt == prev.processes.end())
        {
            // Started during the interval
            continue;
        }

        const auto& previous = prevIt->second;
        if (previous.startTimeTicks != 0 && current.startTimeTicks != 0 && previous.startTimeTicks != current.startTimeTicks)
        {
            // Same pid, different process
            continue;
        }
        if (current.totalTime() < previous.totalTime())
        {
            // Counter went backwards: pid reuse without a start time to tell us
            continue;
        }

        if (elapsedSeconds <= 0.0)
        {
            result.emplace(pid, 0.0);
            continue;
        }

        const auto tickDelta = Numeric::toDouble(current.totalTime() - previous.totalTime());
        const double percent = (tickDelta / ticksPerSecond) / elapsedSeconds * 100.0;
        result.emplace(pid, Numeric::clampPercent(percent, ceiling));
    }

    return result;
}

double DeltaCalculator::maxProcessPercent() const
{
    return 100.0 * Numeric::toDouble(m_Config.logicalCpuCount);
}

} // namespace Domain
