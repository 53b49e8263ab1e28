#if defined(__linux__) && __has_include(<sys/wait.h>)

#include "LinuxSensorsCommand.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <optional>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Platform
{

namespace
{

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds MIN_TIMEOUT{1};
constexpr std::chrono::milliseconds MAX_TIMEOUT{10 * 60 * 1000};
constexpr std::chrono::milliseconds REAP_POLL_INTERVAL{5};

/// Closes a pipe end on scope exit.
class FdGuard
{
  public:
    explicit FdGuard(int fd) : m_Fd(fd)
    {
    }

    ~FdGuard()
    {
        if (m_Fd != -1)
        {
            ::close(m_Fd);
        }
    }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    FdGuard(FdGuard&&) = delete;
    FdGuard& operator=(FdGuard&&) = delete;

    [[nodiscard]] int get() const
    {
        return m_Fd;
    }

  private:
    int m_Fd;
};

[[nodiscard]] int remainingMs(Clock::time_point deadline)
{
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return static_cast<int>(std::max<std::chrono::milliseconds::rep>(remaining.count(), 0));
}

void killAndReap(pid_t pid)
{
    // Negative pid: the shell and everything it started share its process group
    ::kill(-pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR)
    {
    }
}

/// Wait status of the child, or nullopt if it outlived the deadline (it is killed then).
[[nodiscard]] std::optional<int> reapBefore(pid_t pid, Clock::time_point deadline)
{
    int status = 0;
    while (true)
    {
        const pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid)
        {
            return status;
        }
        if (waited == -1 && errno != EINTR)
        {
            spdlog::debug("LinuxSensorsCommand: waitpid failed: {}", std::strerror(errno));
            return std::nullopt;
        }
        if (Clock::now() >= deadline)
        {
            killAndReap(pid);
            return std::nullopt;
        }
        std::this_thread::sleep_for(REAP_POLL_INTERVAL);
    }
}

} // namespace

LinuxSensorsCommand::LinuxSensorsCommand(std::string command, std::chrono::milliseconds timeout, std::size_t maxOutputBytes)
    : m_Command(std::move(command)), m_Timeout(std::clamp(timeout, MIN_TIMEOUT, MAX_TIMEOUT)), m_MaxOutputBytes(maxOutputBytes)
{
}

std::optional<std::string> LinuxSensorsCommand::run()
{
    if (m_Command.empty())
    {
        return std::nullopt;
    }

    std::array<int, 2> fds{-1, -1};
    if (::pipe2(fds.data(), O_CLOEXEC) == -1)
    {
        spdlog::debug("LinuxSensorsCommand: pipe failed: {}", std::strerror(errno));
        return std::nullopt;
    }
    FdGuard readEnd(fds[0]);

    const pid_t pid = ::fork();
    if (pid == -1)
    {
        spdlog::debug("LinuxSensorsCommand: fork failed: {}", std::strerror(errno));
        ::close(fds[1]);
        return std::nullopt;
    }

    if (pid == 0)
    {
        // Child: only async-signal-safe calls until exec
        ::setpgid(0, 0);
        ::dup2(fds[1], STDOUT_FILENO);
        const int devNull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
        if (devNull != -1)
        {
            ::dup2(devNull, STDIN_FILENO);
            ::dup2(devNull, STDERR_FILENO);
        }
        ::execl("/bin/sh", "sh", "-c", m_Command.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    // Set from both sides so the group exists before any kill
    ::setpgid(pid, pid);
    ::close(fds[1]);

    const auto deadline = Clock::now() + m_Timeout;
    std::string output;
    std::size_t droppedBytes = 0;
    std::array<char, 4096> buffer{};
    bool timedOut = false;
    bool readFailed = false;
    int readError = 0;

    while (true)
    {
        const int waitMs = remainingMs(deadline);
        if (waitMs == 0)
        {
            timedOut = true;
            break;
        }

        pollfd pfd{.fd = readEnd.get(), .events = POLLIN, .revents = 0};
        const int ready = ::poll(&pfd, 1, waitMs);
        if (ready == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            readFailed = true;
            readError = errno;
            break;
        }
        if (ready == 0)
        {
            timedOut = true;
            break;
        }

        const ssize_t bytesRead = ::read(readEnd.get(), buffer.data(), buffer.size());
        if (bytesRead == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            readFailed = true;
            readError = errno;
            break;
        }
        if (bytesRead == 0)
        {
            break;
        }

        // Keep draining past the cap so the command never dies of SIGPIPE
        const auto count = static_cast<std::size_t>(bytesRead);
        const std::size_t kept = std::min(count, m_MaxOutputBytes - output.size());
        output.append(buffer.data(), kept);
        droppedBytes += count - kept;
    }

    if (timedOut || readFailed)
    {
        killAndReap(pid);
        if (timedOut)
        {
            spdlog::debug("LinuxSensorsCommand: '{}' timed out after {}ms", m_Command, m_Timeout.count());
        }
        else
        {
            spdlog::debug("LinuxSensorsCommand: reading output of '{}' failed: {}", m_Command, std::strerror(readError));
        }
        return std::nullopt;
    }

    const auto status = reapBefore(pid, deadline);
    if (!status)
    {
        spdlog::debug("LinuxSensorsCommand: '{}' closed its output but did not exit within {}ms", m_Command, m_Timeout.count());
        return std::nullopt;
    }
    if (!WIFEXITED(*status) || WEXITSTATUS(*status) != 0)
    {
        // 127 from the shell means the command is not installed.
        spdlog::debug("LinuxSensorsCommand: '{}' failed (status {})", m_Command, *status);
        return std::nullopt;
    }

    if (droppedBytes > 0)
    {
        spdlog::debug("LinuxSensorsCommand: output of '{}' truncated at {} bytes ({} dropped)", m_Command, m_MaxOutputBytes, droppedBytes);
    }
    return output;
}

} // namespace Platform

#endif
