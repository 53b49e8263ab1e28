#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace Platform
{

/// Substitute used when a process name cannot be resolved.
inline constexpr const char* PLACEHOLDER_PROCESS_NAME = "<unknown>";

/// Substitute used when the owner of a process cannot be read.
inline constexpr const char* PLACEHOLDER_USER = "?";

/// Raw counters from OS - no computed values.
/// Probes populate this; domain computes deltas and rates.
struct ProcessCounters
{
    std::int32_t pid = 0;
    std::string name;
    std::string user; // Username (owner) of the process
    char state = '?'; // Raw state character from OS (e.g., 'R', 'S', 'Z')

    std::uint64_t startTimeTicks = 0; // For PID reuse detection

    // CPU time (cumulative ticks/jiffies)
    std::uint64_t userTime = 0;
    std::uint64_t systemTime = 0;

    [[nodiscard]] std::uint64_t totalTime() const
    {
        return userTime + systemTime;
    }
};

/// All processes visible at one point in time, keyed by pid.
struct ProcessSnapshot
{
    std::unordered_map<std::int32_t, ProcessCounters> processes;
    std::chrono::steady_clock::time_point captureTime;

    // Partial data loss: processes that vanished mid-read, and fields filled with placeholders.
    std::size_t skippedCount = 0;
    std::size_t placeholderCount = 0;
};

} // namespace Platform
