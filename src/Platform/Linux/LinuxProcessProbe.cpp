// Keep this translation unit parseable on non-Linux platforms by compiling
// the implementation only when targeting Linux and required headers exist.
#if defined(__linux__) && __has_include(<pwd.h>) && __has_include(<unistd.h>)

#include "LinuxProcessProbe.h"

#include "Platform/ProbeError.h"

#include <spdlog/spdlog.h>

#include <charconv>
#include <chrono>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include <pwd.h>
#include <unistd.h>

namespace Platform
{

LinuxProcessProbe::LinuxProcessProbe(std::filesystem::path procRoot)
    : m_ProcRoot(std::move(procRoot)), m_TicksPerSecond(sysconf(_SC_CLK_TCK))
{
    if (m_TicksPerSecond <= 0)
    {
        m_TicksPerSecond = 100; // Common default
        spdlog::warn("Failed to get CLK_TCK, using default: {}", m_TicksPerSecond);
    }
}

ProcessSnapshot LinuxProcessProbe::enumerate()
{
    ProcessSnapshot snapshot;
    snapshot.processes.reserve(500); // Reasonable initial size

    std::error_code errorCode;
    std::filesystem::directory_iterator iter(m_ProcRoot, errorCode);
    if (errorCode)
    {
        throw SourceUnavailableError(ProbeSource::ProcessList, m_ProcRoot.string(), errorCode.message());
    }

    for (; iter != std::filesystem::directory_iterator(); iter.increment(errorCode))
    {
        const auto& entry = *iter;
        const auto filename = entry.path().filename().string();
        int32_t pid = 0;

        // Check if directory name is a number (process ID)
        auto result = std::from_chars(filename.data(), filename.data() + filename.size(), pid);
        if (result.ec != std::errc{} || result.ptr != filename.data() + filename.size() || pid <= 0)
        {
            continue;
        }

        ProcessCounters counters{};
        if (!parseProcessStat(entry.path(), counters) || counters.pid != pid)
        {
            // Exited between readdir and open, or stat was unreadable.
            spdlog::debug("Skipping pid {}: stat unavailable", pid);
            ++snapshot.skippedCount;
            continue;
        }

        if (counters.name.empty())
        {
            counters.name = readComm(entry.path());
            if (counters.name.empty())
            {
                counters.name = PLACEHOLDER_PROCESS_NAME;
                ++snapshot.placeholderCount;
            }
        }

        if (!parseProcessStatus(entry.path(), counters))
        {
            ++snapshot.placeholderCount;
        }

        snapshot.processes.emplace(pid, std::move(counters));
    }
    snapshot.captureTime = std::chrono::steady_clock::now();

    if (errorCode)
    {
        spdlog::warn("Error iterating {}: {}", m_ProcRoot.string(), errorCode.message());
    }

    spdlog::debug("LinuxProcessProbe: {} processes, {} skipped, {} placeholders",
                  snapshot.processes.size(),
                  snapshot.skippedCount,
                  snapshot.placeholderCount);
    return snapshot;
}

long LinuxProcessProbe::ticksPerSecond() const
{
    return m_TicksPerSecond;
}

bool LinuxProcessProbe::parseStatLine(std::string_view line, ProcessCounters& counters)
{
    // Format: /proc/[pid]/stat
    // Fields: pid (comm) state ppid pgrp session tty_nr tpgid flags
    //         minflt cminflt majflt cmajflt utime stime cutime cstime
    //         priority nice num_threads itrealvalue starttime ...

    // Find the last ')' to handle names like "process (name)"
    const auto nameStart = line.find('(');
    const auto nameEnd = line.rfind(')');

    if (nameStart == std::string_view::npos || nameEnd == std::string_view::npos || nameEnd <= nameStart)
    {
        return false;
    }

    int32_t pid = 0;
    const auto pidField = line.substr(0, nameStart);
    const auto pidBegin = pidField.find_first_not_of(' ');
    if (pidBegin == std::string_view::npos)
    {
        return false;
    }
    if (std::from_chars(pidField.data() + pidBegin, pidField.data() + pidField.size(), pid).ec != std::errc{})
    {
        return false;
    }

    std::istringstream fieldStream{std::string(line.substr(nameEnd + 1))};

    std::string stateStr;
    int32_t parentPid = 0;
    int32_t pgrp = 0;
    int32_t session = 0;
    int32_t ttyNr = 0;
    int32_t tpgid = 0;
    uint32_t flags = 0;
    uint64_t minflt = 0;
    uint64_t cminflt = 0;
    uint64_t majflt = 0;
    uint64_t cmajflt = 0;
    uint64_t utime = 0;
    uint64_t stime = 0;
    int64_t cutime = 0;
    int64_t cstime = 0;
    int64_t priority = 0;
    int64_t nice = 0;
    int64_t numThreads = 0;
    int64_t itrealvalue = 0;
    uint64_t starttime = 0;

    // clang-format off
    fieldStream >> stateStr >> parentPid >> pgrp >> session >> ttyNr >> tpgid
                >> flags >> minflt >> cminflt >> majflt >> cmajflt
                >> utime >> stime;
    // clang-format on

    if (fieldStream.fail())
    {
        return false;
    }

    // starttime is only used to detect pid reuse; tolerate truncated lines.
    fieldStream >> cutime >> cstime >> priority >> nice >> numThreads >> itrealvalue >> starttime;
    if (fieldStream.fail())
    {
        starttime = 0;
    }

    counters.pid = pid;
    counters.name = std::string(line.substr(nameStart + 1, nameEnd - nameStart - 1));
    counters.state = stateStr.empty() ? '?' : stateStr[0];
    counters.userTime = utime;
    counters.systemTime = stime;
    counters.startTimeTicks = starttime;

    return true;
}

bool LinuxProcessProbe::parseProcessStat(const std::filesystem::path& pidDir, ProcessCounters& counters) const
{
    std::ifstream statFile(pidDir / "stat");
    if (!statFile.is_open())
    {
        return false;
    }

    std::string line;
    if (!std::getline(statFile, line))
    {
        return false;
    }

    return parseStatLine(line, counters);
}

std::string LinuxProcessProbe::readComm(const std::filesystem::path& pidDir)
{
    std::ifstream commFile(pidDir / "comm");
    std::string comm;
    if (commFile.is_open())
    {
        std::getline(commFile, comm);
    }
    return comm;
}

bool LinuxProcessProbe::parseProcessStatus(const std::filesystem::path& pidDir, ProcessCounters& counters)
{
    // Read /proc/[pid]/status for UID (owner) information
    // Format is key:value pairs, one per line
    // We need: Uid: <real> <effective> <saved> <filesystem>

    std::ifstream statusFile(pidDir / "status");
    if (statusFile.is_open())
    {
        std::string line;
        while (std::getline(statusFile, line))
        {
            if (line.starts_with("Uid:"))
            {
                std::istringstream iss(line.substr(4)); // Skip "Uid:"
                uid_t realUid = 0;
                iss >> realUid;
                if (!iss.fail())
                {
                    counters.user = username(realUid);
                    return true;
                }
                break;
            }
        }
    }

    counters.user = PLACEHOLDER_USER;
    return false;
}

const std::string& LinuxProcessProbe::username(uid_t uid)
{
    auto it = m_UsernameCache.find(uid);
    if (it != m_UsernameCache.end())
    {
        return it->second;
    }

    // Look up username from passwd database
    const struct passwd* pwd = getpwuid(uid);
    std::string name;
    if (pwd != nullptr && pwd->pw_name != nullptr)
    {
        name = pwd->pw_name;
    }
    else
    {
        // Fall back to UID as string
        name = std::to_string(uid);
    }

    return m_UsernameCache.emplace(uid, std::move(name)).first->second;
}

} // namespace Platform

#endif
