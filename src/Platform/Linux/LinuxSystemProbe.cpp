#include "LinuxSystemProbe.h"

#include "Platform/ProbeError.h"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include <unistd.h>

namespace Platform
{

LinuxSystemProbe::LinuxSystemProbe(std::filesystem::path procRoot)
    : m_ProcRoot(std::move(procRoot)), m_TicksPerSecond(sysconf(_SC_CLK_TCK)),
      m_NumCores(static_cast<int>(sysconf(_SC_NPROCESSORS_ONLN)))
{
    if (m_TicksPerSecond <= 0)
    {
        m_TicksPerSecond = 100; // Common default
        spdlog::warn("Failed to get CLK_TCK, using default: {}", m_TicksPerSecond);
    }
    if (m_NumCores <= 0)
    {
        m_NumCores = 1;
        spdlog::warn("Failed to get CPU count, using default: {}", m_NumCores);
    }

    spdlog::debug("LinuxSystemProbe: {} cores, {} ticks/sec, root={}", m_NumCores, m_TicksPerSecond, m_ProcRoot.string());
}

SystemCounters LinuxSystemProbe::read()
{
    // Format: /proc/stat
    // cpu  user nice system idle iowait irq softirq steal guest guest_nice
    // cpu0 user nice system idle iowait irq softirq steal guest guest_nice
    // cpu1 ...
    // intr ...

    const auto statPath = m_ProcRoot / "stat";
    std::ifstream statFile(statPath);
    if (!statFile.is_open())
    {
        throw SourceUnavailableError(ProbeSource::CpuStatistics, statPath.string(), std::strerror(errno));
    }

    SystemCounters counters;
    std::string line;
    bool foundTotal = false;

    while (std::getline(statFile, line))
    {
        if (!line.starts_with("cpu"))
        {
            // Past CPU lines
            break;
        }

        std::string label;
        CpuCounters cpu{};
        if (!parseCpuLine(line, label, cpu))
        {
            spdlog::debug("LinuxSystemProbe: skipping malformed line '{}'", line);
            continue;
        }

        if (label == "cpu")
        {
            // Aggregate line (no number suffix)
            counters.cpuTotal = cpu;
            foundTotal = true;
        }
        else
        {
            // Per-core line (cpu0, cpu1, etc.)
            counters.cpuPerCore.push_back(cpu);
        }
    }
    counters.captureTime = std::chrono::steady_clock::now();

    if (!foundTotal)
    {
        throw SourceUnavailableError(ProbeSource::CpuStatistics, statPath.string(), "aggregate cpu line missing or malformed");
    }

    counters.logicalCpuCount = counters.cpuPerCore.empty() ? m_NumCores : static_cast<int>(counters.cpuPerCore.size());
    return counters;
}

int LinuxSystemProbe::logicalCpuCount() const
{
    return m_NumCores;
}

long LinuxSystemProbe::ticksPerSecond() const
{
    return m_TicksPerSecond;
}

bool LinuxSystemProbe::parseCpuLine(std::string_view line, std::string& label, CpuCounters& cpu)
{
    std::istringstream iss{std::string(line)};
    iss >> label;
    if (!label.starts_with("cpu"))
    {
        return false;
    }

    iss >> cpu.user >> cpu.nice >> cpu.system >> cpu.idle;
    if (iss.fail())
    {
        return false;
    }

    // Older kernels may not have all fields; whatever is missing stays 0.
    std::array<uint64_t*, 6> optionalFields{&cpu.iowait, &cpu.irq, &cpu.softirq, &cpu.steal, &cpu.guest, &cpu.guestNice};
    for (uint64_t* field : optionalFields)
    {
        if (!(iss >> *field))
        {
            *field = 0;
            break;
        }
    }

    return true;
}

} // namespace Platform
