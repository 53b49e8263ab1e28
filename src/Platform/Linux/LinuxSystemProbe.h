#pragma once

#include "Platform/ISystemProbe.h"

#include <filesystem>
#include <string_view>

namespace Platform
{

/// Linux implementation of ISystemProbe.
/// Reads aggregate and per-core CPU counters from /proc/stat.
class LinuxSystemProbe : public ISystemProbe
{
  public:
    /// @param procRoot Root of the proc filesystem (tests point this at a fixture tree).
    explicit LinuxSystemProbe(std::filesystem::path procRoot = "/proc");
    ~LinuxSystemProbe() override = default;

    LinuxSystemProbe(const LinuxSystemProbe&) = delete;
    LinuxSystemProbe& operator=(const LinuxSystemProbe&) = delete;
    LinuxSystemProbe(LinuxSystemProbe&&) = default;
    LinuxSystemProbe& operator=(LinuxSystemProbe&&) = default;

    [[nodiscard]] SystemCounters read() override;
    [[nodiscard]] int logicalCpuCount() const override;
    [[nodiscard]] long ticksPerSecond() const override;

    /// Parse one "cpu..." line of /proc/stat.
    /// Returns false if the label or the mandatory user/nice/system/idle fields are missing.
    /// Fields newer kernels append (iowait .. guest_nice) default to 0 when absent.
    [[nodiscard]] static bool parseCpuLine(std::string_view line, std::string& label, CpuCounters& cpu);

  private:
    std::filesystem::path m_ProcRoot;
    long m_TicksPerSecond;
    int m_NumCores;
};

} // namespace Platform
