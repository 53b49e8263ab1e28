#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace App
{

enum class RunMode
{
    Snapshot,
    Monitor,
};

/// Values as given on the command line; unset options fall back to UserSettings.
struct CommandLineOptions
{
    bool once = false;
    std::optional<double> intervalSeconds;
    std::optional<double> durationSeconds;
    std::optional<int> samples;
    std::optional<std::size_t> top;
    std::optional<bool> showTemps; // --show-temps / --no-temps
    bool raw = false;
    std::optional<std::filesystem::path> configPath;
    bool verbose = false;
    bool showVersion = false;
    bool showHelp = false;

    /// Any of --interval, --duration or --samples selects monitor mode, even with --once.
    [[nodiscard]] RunMode mode() const
    {
        return (intervalSeconds || durationSeconds || samples) ? RunMode::Monitor : RunMode::Snapshot;
    }
};

struct CommandLineResult
{
    CommandLineOptions options;
    std::optional<std::string> error; // Set when the arguments are invalid
};

/// Parse arguments (without the program name). Accepts "--flag value" and "--flag=value".
[[nodiscard]] CommandLineResult parseCommandLine(std::span<const std::string_view> args);

/// Convenience overload for main().
[[nodiscard]] CommandLineResult parseCommandLine(int argc, char** argv);

[[nodiscard]] std::string usageText(std::string_view program);

} // namespace App
