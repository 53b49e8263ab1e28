#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

namespace Platform
{

/// Raw CPU counters from OS (cumulative ticks/jiffies).
/// Probes populate this; domain computes deltas and percentages.
struct CpuCounters
{
    uint64_t user = 0;    // Normal processes executing in user mode
    uint64_t nice = 0;    // Niced processes executing in user mode
    uint64_t system = 0;  // Processes executing in kernel mode
    uint64_t idle = 0;    // Twiddling thumbs
    uint64_t iowait = 0;  // Waiting for I/O to complete
    uint64_t irq = 0;     // Servicing interrupts
    uint64_t softirq = 0; // Servicing softirqs
    uint64_t steal = 0;   // Involuntary wait (virtualized)
    uint64_t guest = 0;   // Running a guest (virtualized)
    uint64_t guestNice = 0;

    /// Total CPU time (all states).
    [[nodiscard]] uint64_t total() const
    {
        return user + nice + system + idle + iowait + irq + softirq + steal + guest + guestNice;
    }

    /// Active (non-idle) time.
    [[nodiscard]] uint64_t active() const
    {
        return user + nice + system + irq + softirq + steal + guest + guestNice;
    }
};

/// One read of the system-wide CPU accounting.
struct SystemCounters
{
    CpuCounters cpuTotal;                // Aggregate across all cores
    std::vector<CpuCounters> cpuPerCore; // cpu0, cpu1, ...
    int logicalCpuCount = 0;

    // Monotonic time of the read; deltas are measured against this, never the wall clock.
    std::chrono::steady_clock::time_point captureTime;
};

} // namespace Platform
