#pragma once

#include "Platform/ISensorsCommand.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace Platform
{

/// Linux implementation of ISensorsCommand.
/// Runs the configured command through /bin/sh with stdin and stderr on /dev/null.
/// The command gets `timeout` to finish; after that its process group is killed
/// and run() reports no output. Output beyond `maxOutputBytes` is read and dropped.
class LinuxSensorsCommand : public ISensorsCommand
{
  public:
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{5000};
    static constexpr std::size_t DEFAULT_MAX_OUTPUT_BYTES = 256 * 1024;

    explicit LinuxSensorsCommand(std::string command = "sensors",
                                 std::chrono::milliseconds timeout = DEFAULT_TIMEOUT,
                                 std::size_t maxOutputBytes = DEFAULT_MAX_OUTPUT_BYTES);
    ~LinuxSensorsCommand() override = default;

    LinuxSensorsCommand(const LinuxSensorsCommand&) = delete;
    LinuxSensorsCommand& operator=(const LinuxSensorsCommand&) = delete;
    LinuxSensorsCommand(LinuxSensorsCommand&&) = default;
    LinuxSensorsCommand& operator=(LinuxSensorsCommand&&) = default;

    [[nodiscard]] std::optional<std::string> run() override;

    [[nodiscard]] const std::string& command() const
    {
        return m_Command;
    }

    [[nodiscard]] std::chrono::milliseconds timeout() const
    {
        return m_Timeout;
    }

  private:
    std::string m_Command;
    std::chrono::milliseconds m_Timeout;
    std::size_t m_MaxOutputBytes;
};

} // namespace Platform
