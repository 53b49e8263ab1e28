#pragma once

#include "Platform/ProcessTypes.h"
#include "Platform/SystemTypes.h"

#include <cstdint>
#include <unordered_map>

namespace Domain
{

/// Host facts the percentage math depends on.
/// Passed in explicitly so tests and multiple engines can vary them independently.
struct DeltaConfig
{
    int logicalCpuCount = 1;
    long ticksPerSecond = 100;
};

/// Turns pairs of cumulative counter captures into percentages.
///
/// Overall CPU is 0-100 for the whole machine. Per-process CPU uses the
/// "100 per logical CPU" convention, so a process saturating two cores
/// reads 200 and the ceiling is 100 x logicalCpuCount.
class DeltaCalculator
{
  public:
    explicit DeltaCalculator(DeltaConfig config);

    /// busy_delta / total_delta x 100.
    /// Returns 0 when no ticks elapsed or when curr was not captured after prev.
    [[nodiscard]] double overallCpuPercent(const Platform::SystemCounters& prev, const Platform::SystemCounters& curr) const;

    /// CPU% for every pid present in both snapshots with a non-negative tick delta
    /// and an unchanged start time. New, exited and reused pids are left out.
    [[nodiscard]] std::unordered_map<std::int32_t, double> perProcessPercent(const Platform::ProcessSnapshot& prev,
                                                                            const Platform::ProcessSnapshot& curr) const;

    /// Upper bound for a single process: 100 x logical CPUs.
    [[nodiscard]] double maxProcessPercent() const;

    [[nodiscard]] const DeltaConfig& config() const
    {
        return m_Config;
    }

  private:
    DeltaConfig m_Config;
};

} // namespace Domain
