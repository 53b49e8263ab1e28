#include "CommandLine.h"

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <limits>
#include <system_error>
#include <vector>

namespace App
{

namespace
{

template<typename T> [[nodiscard]] std::optional<T> parseNumber(std::string_view text)
{
    T value{};
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return value;
}

class ArgumentCursor
{
  public:
    explicit ArgumentCursor(std::span<const std::string_view> args) : m_Args(args)
    {
    }

    [[nodiscard]] bool done() const
    {
        return m_Index >= m_Args.size();
    }

    [[nodiscard]] std::string_view next()
    {
        return m_Args[m_Index++];
    }

    /// Value for an option: inline "=value" if present, else the following argument.
    [[nodiscard]] std::optional<std::string_view> value(std::optional<std::string_view> inlineValue)
    {
        if (inlineValue)
        {
            return inlineValue;
        }
        if (done())
        {
            return std::nullopt;
        }
        return next();
    }

  private:
    std::span<const std::string_view> m_Args;
    std::size_t m_Index = 0;
};

[[nodiscard]] std::optional<std::string> parsePositiveSeconds(std::string_view option,
                                                              std::optional<std::string_view> text,
                                                              std::optional<double>& out)
{
    if (!text)
    {
        return fmt::format("{} requires a value in seconds", option);
    }
    const auto value = parseNumber<double>(*text);
    if (!value || !std::isfinite(*value))
    {
        return fmt::format("{}: '{}' is not a number", option, *text);
    }
    if (*value <= 0.0)
    {
        return fmt::format("{} must be positive", option);
    }
    out = *value;
    return std::nullopt;
}

[[nodiscard]] std::optional<std::string> parsePositiveCount(std::string_view option, std::optional<std::string_view> text, long long& out)
{
    if (!text)
    {
        return fmt::format("{} requires a value", option);
    }
    const auto value = parseNumber<long long>(*text);
    if (!value)
    {
        return fmt::format("{}: '{}' is not an integer", option, *text);
    }
    if (*value <= 0)
    {
        return fmt::format("{} must be positive", option);
    }
    out = *value;
    return std::nullopt;
}

} // namespace

CommandLineResult parseCommandLine(std::span<const std::string_view> args)
{
    CommandLineResult result;
    auto& options = result.options;
    bool sawShowTemps = false;
    bool sawNoTemps = false;

    ArgumentCursor cursor(args);
    while (!cursor.done() && !result.error)
    {
        std::string_view arg = cursor.next();
        std::optional<std::string_view> inlineValue;
        if (arg.starts_with("--"))
        {
            if (const auto eq = arg.find('='); eq != std::string_view::npos)
            {
                inlineValue = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        const auto rejectValue = [&]() -> bool
        {
            if (inlineValue)
            {
                result.error = fmt::format("{} does not take a value", arg);
                return true;
            }
            return false;
        };

        if (arg == "--help" || arg == "-h")
        {
            if (!rejectValue())
            {
                options.showHelp = true;
            }
        }
        else if (arg == "--version")
        {
            if (!rejectValue())
            {
                options.showVersion = true;
            }
        }
        else if (arg == "--once")
        {
            if (!rejectValue())
            {
                options.once = true;
            }
        }
        else if (arg == "--raw")
        {
            if (!rejectValue())
            {
                options.raw = true;
            }
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            if (!rejectValue())
            {
                options.verbose = true;
            }
        }
        else if (arg == "--show-temps")
        {
            if (!rejectValue())
            {
                sawShowTemps = true;
                options.showTemps = true;
            }
        }
        else if (arg == "--no-temps")
        {
            if (!rejectValue())
            {
                sawNoTemps = true;
                options.showTemps = false;
            }
        }
        else if (arg == "--interval")
        {
            result.error = parsePositiveSeconds(arg, cursor.value(inlineValue), options.intervalSeconds);
        }
        else if (arg == "--duration")
        {
            result.error = parsePositiveSeconds(arg, cursor.value(inlineValue), options.durationSeconds);
        }
        else if (arg == "--samples")
        {
            long long count = 0;
            result.error = parsePositiveCount(arg, cursor.value(inlineValue), count);
            if (!result.error)
            {
                if (count > std::numeric_limits<int>::max())
                {
                    result.error = fmt::format("--samples must be at most {}", std::numeric_limits<int>::max());
                }
                else
                {
                    options.samples = static_cast<int>(count);
                }
            }
        }
        else if (arg == "--top")
        {
            long long count = 0;
            result.error = parsePositiveCount(arg, cursor.value(inlineValue), count);
            if (!result.error)
            {
                options.top = static_cast<std::size_t>(count);
            }
        }
        else if (arg == "--config")
        {
            const auto path = cursor.value(inlineValue);
            if (!path || path->empty())
            {
                result.error = "--config requires a path";
            }
            else
            {
                options.configPath = std::filesystem::path(std::string(*path));
            }
        }
        else
        {
            result.error = fmt::format("unrecognized argument '{}'", arg);
        }
    }

    if (!result.error && sawShowTemps && sawNoTemps)
    {
        result.error = "--show-temps and --no-temps are mutually exclusive";
    }

    return result;
}

CommandLineResult parseCommandLine(int argc, char** argv)
{
    std::vector<std::string_view> args;
    args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0U);
    for (int i = 1; i < argc; ++i)
    {
        args.emplace_back(argv[i]);
    }
    return parseCommandLine(std::span<const std::string_view>(args));
}

std::string usageText(std::string_view program)
{
    return fmt::format("Usage: {0} [options]\n"
                       "\n"
                       "Understand why your Linux system fans are spinning up.\n"
                       "\n"
                       "Options:\n"
                       "  --once                 Take a single snapshot (default)\n"
                       "  --interval SECONDS     Per-sample interval in monitor mode (default: 5)\n"
                       "  --duration SECONDS     Total duration of monitor mode\n"
                       "  --samples N            Number of samples in monitor mode (wins over --duration)\n"
                       "  --top N                Number of top processes to show (default: 5)\n"
                       "  --show-temps           Show temperatures (default)\n"
                       "  --no-temps             Do not read or show temperatures\n"
                       "  --raw                  Tab-separated output for scripts\n"
                       "  --config PATH          Read settings from PATH instead of the default location\n"
                       "  -v, --verbose          Debug logging on stderr\n"
                       "  --version              Print version and exit\n"
                       "  -h, --help             Print this help and exit\n"
                       "\n"
                       "Examples:\n"
                       "  {0}                           Single snapshot\n"
                       "  {0} --interval 5 --duration 60  Monitor for 60 seconds, 5 second samples\n"
                       "  {0} --interval 2 --samples 10   Ten 2 second samples\n"
                       "  {0} --top 10 --no-temps         Top 10 processes, no temperatures\n",
                       program);
}

} // namespace App
