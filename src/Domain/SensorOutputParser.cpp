#include "SensorOutputParser.h"

#include <array>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <string>
#include <system_error>
#include <utility>

namespace Domain::SensorOutputParser
{

namespace
{

// UTF-8 degree sign, Latin-1 degree sign, and the masculine ordinal some drivers emit instead.
constexpr std::array<std::string_view, 3> DEGREE_MARKERS{"\xC2\xB0", "\xB0", "\xC2\xBA"};

[[nodiscard]] bool isDigit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool isAlpha(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] std::string_view trim(std::string_view text)
{
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
    {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

[[nodiscard]] std::string_view skipSpaces(std::string_view text)
{
    const auto pos = text.find_first_not_of(" \t");
    return (pos == std::string_view::npos) ? std::string_view{} : text.substr(pos);
}

/// Offset of the first number that starts a token (not glued to a word), or npos.
[[nodiscard]] std::size_t findNumberStart(std::string_view text)
{
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];
        const bool signedNumber = (c == '+' || c == '-') && i + 1 < text.size() && isDigit(text[i + 1]);
        if (!isDigit(c) && !signedNumber)
        {
            continue;
        }
        if (i > 0 && (isAlpha(text[i - 1]) || isDigit(text[i - 1]) || text[i - 1] == '.'))
        {
            continue;
        }
        return i;
    }
    return std::string_view::npos;
}

} // namespace

std::optional<double> parseTemperatureToken(std::string_view text)
{
    if (text.empty())
    {
        return std::nullopt;
    }

    bool negative = false;
    if (text.front() == '+' || text.front() == '-')
    {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text.empty() || !isDigit(text.front()))
    {
        return std::nullopt;
    }

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, std::chars_format::fixed);
    if (ec != std::errc{})
    {
        return std::nullopt;
    }
    text.remove_prefix(static_cast<std::size_t>(ptr - text.data()));
    text = skipSpaces(text);

    bool sawDegree = false;
    for (const auto marker : DEGREE_MARKERS)
    {
        if (text.starts_with(marker))
        {
            text.remove_prefix(marker.size());
            sawDegree = true;
            break;
        }
    }

    if (text.empty())
    {
        return std::nullopt;
    }
    const char unit = text.front();
    if (unit != 'C' && unit != 'F' && !(sawDegree && (unit == 'c' || unit == 'f')))
    {
        return std::nullopt;
    }
    // "45 Cores" is not a temperature.
    if (text.size() > 1 && isAlpha(text[1]))
    {
        return std::nullopt;
    }

    if (negative)
    {
        value = -value;
    }
    if (unit == 'F' || unit == 'f')
    {
        value = (value - 32.0) * 5.0 / 9.0;
    }
    return value;
}

std::optional<SensorTemperature> parseLine(std::string_view line)
{
    std::string_view label;
    std::string_view value = line;

    const auto colon = line.find(':');
    if (colon != std::string_view::npos)
    {
        label = trim(line.substr(0, colon));
        value = line.substr(colon + 1);
    }

    // Threshold annotations: "(high = +80.0°C, crit = +100.0°C)"
    const auto paren = value.find('(');
    if (paren != std::string_view::npos)
    {
        value = value.substr(0, paren);
    }

    const auto numberStart = findNumberStart(value);
    if (numberStart == std::string_view::npos)
    {
        return std::nullopt;
    }

    const auto celsius = parseTemperatureToken(value.substr(numberStart));
    if (!celsius)
    {
        return std::nullopt;
    }

    return SensorTemperature{.label = label.empty() ? std::string("temp") : std::string(label), .celsius = *celsius};
}

std::vector<SensorTemperature> parse(std::string_view output)
{
    std::vector<SensorTemperature> readings;

    while (!output.empty())
    {
        const auto newline = output.find('\n');
        const auto line = output.substr(0, newline);
        if (auto reading = parseLine(line))
        {
            readings.push_back(std::move(*reading));
        }
        if (newline == std::string_view::npos)
        {
            break;
        }
        output.remove_prefix(newline + 1);
    }

    return readings;
}

} // namespace Domain::SensorOutputParser
