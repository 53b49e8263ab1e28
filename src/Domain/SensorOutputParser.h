#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Domain
{

/// One temperature quantity recognised in sensor command output.
struct SensorTemperature
{
    std::string label; // Text before the ':' ("Core 0", "Package id 0", "Tctl")
    double celsius = 0.0;
};

/// Tokenizer for the free-form text printed by lm-sensors' `sensors` command.
///
/// A line yields a reading when the first number after its ':' carries a
/// degree unit ("+45.0°C", "45 C", "113.0°F"). Anything inside parentheses
/// is an annotation (high/crit/hyst thresholds) and is ignored. Lines that
/// do not fit are skipped; nothing here throws.
namespace SensorOutputParser
{

/// Parse a single line. Returns nullopt for adapter names, fan/voltage lines, blanks, etc.
[[nodiscard]] std::optional<SensorTemperature> parseLine(std::string_view line);

/// Parse every line of a command's output, in order.
[[nodiscard]] std::vector<SensorTemperature> parse(std::string_view output);

/// Parse a temperature token such as "+45.0°C" or "-3 C" at the start of text.
/// Fahrenheit values are converted to Celsius.
[[nodiscard]] std::optional<double> parseTemperatureToken(std::string_view text);

} // namespace SensorOutputParser

} // namespace Domain
