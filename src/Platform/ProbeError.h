#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace Platform
{

/// Data sources without which no meaningful measurement is possible.
enum class ProbeSource
{
    CpuStatistics, // Aggregate CPU counters (/proc/stat)
    ProcessList,   // Process enumeration root (/proc)
};

[[nodiscard]] constexpr std::string_view toString(ProbeSource source) noexcept
{
    switch (source)
    {
    case ProbeSource::CpuStatistics:
        return "CPU statistics";
    case ProbeSource::ProcessList:
        return "process list";
    }
    return "unknown source";
}

/// Thrown by probes when a whole source cannot be read.
/// Per-item failures (a process exiting mid-read) are never reported this way.
class SourceUnavailableError : public std::runtime_error
{
  public:
    SourceUnavailableError(ProbeSource source, std::string path, const std::string& detail)
        : std::runtime_error(std::string(toString(source)) + " unavailable (" + path + "): " + detail), m_Source(source),
          m_Path(std::move(path))
    {
    }

    [[nodiscard]] ProbeSource source() const noexcept
    {
        return m_Source;
    }

    [[nodiscard]] const std::string& path() const noexcept
    {
        return m_Path;
    }

  private:
    ProbeSource m_Source;
    std::string m_Path;
};

} // namespace Platform
