#pragma once

#include "Platform/IProcessProbe.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>

#include <sys/types.h>

namespace Platform
{

/// Linux implementation of IProcessProbe.
/// Reads from /proc filesystem.
class LinuxProcessProbe : public IProcessProbe
{
  public:
    /// @param procRoot Root of the proc filesystem (tests point this at a fixture tree).
    explicit LinuxProcessProbe(std::filesystem::path procRoot = "/proc");
    ~LinuxProcessProbe() override = default;

    LinuxProcessProbe(const LinuxProcessProbe&) = delete;
    LinuxProcessProbe& operator=(const LinuxProcessProbe&) = delete;
    LinuxProcessProbe(LinuxProcessProbe&&) = default;
    LinuxProcessProbe& operator=(LinuxProcessProbe&&) = default;

    [[nodiscard]] ProcessSnapshot enumerate() override;
    [[nodiscard]] long ticksPerSecond() const override;

    /// Parse the contents of /proc/[pid]/stat.
    /// The name sits between the first '(' and the LAST ')', so names containing
    /// spaces or parentheses survive. Returns false on truncated or garbled input.
    [[nodiscard]] static bool parseStatLine(std::string_view line, ProcessCounters& counters);

  private:
    std::filesystem::path m_ProcRoot;
    long m_TicksPerSecond;
    std::unordered_map<uid_t, std::string> m_UsernameCache;

    /// Parse /proc/[pid]/stat for a single process
    [[nodiscard]] bool parseProcessStat(const std::filesystem::path& pidDir, ProcessCounters& counters) const;

    /// Read /proc/[pid]/comm as a fallback name
    [[nodiscard]] static std::string readComm(const std::filesystem::path& pidDir);

    /// Parse /proc/[pid]/status for owner (UID) info; false if the owner is unknown
    [[nodiscard]] bool parseProcessStatus(const std::filesystem::path& pidDir, ProcessCounters& counters);

    /// Get username from UID, with caching
    [[nodiscard]] const std::string& username(uid_t uid);
};

} // namespace Platform
