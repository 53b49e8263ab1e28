#pragma once

#include "Platform/ProcessTypes.h"
#include "Sample.h"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace Domain
{

/// Joins per-pid percentages with the identity recorded in the snapshot and
/// orders them by descending cpuPercent, then ascending pid.
/// A non-zero limit keeps only the first `limit` entries.
[[nodiscard]] std::vector<ProcessUsage> rankProcesses(const std::unordered_map<std::int32_t, double>& percentByPid,
                                                      const Platform::ProcessSnapshot& snapshot,
                                                      std::size_t limit = 0);

} // namespace Domain
