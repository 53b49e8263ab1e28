#include "UserConfig.h"

#include "Domain/Numeric.h"
#include "Domain/TemperatureReader.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <toml++/toml.hpp>

#include <pwd.h>
#include <unistd.h>

namespace App
{

namespace
{

[[nodiscard]] auto readEnvVarString(const char* name) -> std::optional<std::string>
{
    const char* value = std::getenv(name); // NOLINT(concurrency-mt-unsafe)
    if (value == nullptr || value[0] == '\0')
    {
        return std::nullopt;
    }
    return std::string(value);
}

[[nodiscard]] double clampThreshold(double value, double low, double high, const char* key)
{
    const double clamped = std::clamp(value, low, high);
    if (clamped != value)
    {
        spdlog::warn("Config value {} = {} out of range, using {}", key, value, clamped);
    }
    return clamped;
}

} // namespace

UserConfig::UserConfig() : UserConfig(defaultConfigPath())
{
}

UserConfig::UserConfig(std::filesystem::path configPath) : m_ConfigPath(std::move(configPath))
{
    spdlog::debug("Config path: {}", m_ConfigPath.string());
}

auto UserConfig::defaultConfigPath() -> std::filesystem::path
{
    return getConfigDirectory() / "config.toml";
}

auto UserConfig::getConfigDirectory() -> std::filesystem::path
{
    // XDG_CONFIG_HOME or ~/.config
    if (auto xdgConfig = readEnvVarString("XDG_CONFIG_HOME"))
    {
        return std::filesystem::path(*xdgConfig) / "fanwhy";
    }

    if (auto homeEnv = readEnvVarString("HOME"))
    {
        return std::filesystem::path(*homeEnv) / ".config" / "fanwhy";
    }

    // Last resort: use passwd entry
    if (const auto* pw = getpwuid(getuid()))
    {
        return std::filesystem::path(pw->pw_dir) / ".config" / "fanwhy";
    }

    return std::filesystem::current_path();
}

void UserConfig::load()
{
    if (m_IsLoaded)
    {
        return;
    }
    m_IsLoaded = true;

    std::error_code ec;
    if (!std::filesystem::exists(m_ConfigPath, ec))
    {
        spdlog::debug("No config file found at {}, using defaults", m_ConfigPath.string());
        return;
    }

    namespace Sampling = Domain::Sampling;
    using Domain::Numeric::narrowOr;

    try
    {
        auto config = toml::parse_file(m_ConfigPath.string());

        if (auto val = config["sampling"]["interval_ms"].value<std::int64_t>())
        {
            m_Settings.sampleIntervalMs = Sampling::clampSampleInterval(narrowOr<int>(*val, Sampling::SAMPLE_INTERVAL_DEFAULT_MS));
        }

        if (auto val = config["monitor"]["interval_ms"].value<std::int64_t>())
        {
            m_Settings.monitorIntervalMs = Sampling::clampSampleInterval(narrowOr<int>(*val, Sampling::MONITOR_INTERVAL_DEFAULT_MS));
        }
        if (auto val = config["monitor"]["spacing_ms"].value<std::int64_t>())
        {
            m_Settings.monitorSpacingMs = std::clamp(narrowOr<int>(*val, 0), 0, Sampling::MONITOR_SPACING_MAX_MS);
        }
        if (auto val = config["monitor"]["default_duration_seconds"].value<std::int64_t>())
        {
            m_Settings.monitorDefaultDurationSeconds =
                std::clamp(narrowOr<int>(*val, Sampling::MONITOR_DURATION_DEFAULT_SECONDS), 1, Sampling::MONITOR_DURATION_MAX_SECONDS);
        }

        if (auto val = config["display"]["top"].value<std::int64_t>())
        {
            m_Settings.topN = Sampling::clampTopN(static_cast<std::size_t>(std::max<std::int64_t>(*val, 1)));
        }

        if (auto val = config["thermal"]["enabled"].value<bool>())
        {
            m_Settings.thermalEnabled = *val;
        }
        if (auto val = config["thermal"]["sensors_command"].value<std::string>())
        {
            if (val->empty())
            {
                spdlog::warn("Config value thermal.sensors_command is empty, keeping '{}'", m_Settings.sensorsCommand);
            }
            else
            {
                m_Settings.sensorsCommand = *val;
            }
        }

        if (auto val = config["thermal"]["sensors_timeout_ms"].value<std::int64_t>())
        {
            m_Settings.sensorsTimeoutMs = std::clamp(narrowOr<int>(*val, Sampling::SENSORS_TIMEOUT_MAX_MS),
                                                     Sampling::SENSORS_TIMEOUT_MIN_MS,
                                                     Sampling::SENSORS_TIMEOUT_MAX_MS);
        }

        auto& diagnosis = m_Settings.diagnosis;
        if (auto val = config["diagnosis"]["process_cpu_percent"].value<double>())
        {
            diagnosis.processCpuPercent = clampThreshold(*val, 0.0, 100.0 * 1024.0, "diagnosis.process_cpu_percent");
        }
        if (auto val = config["diagnosis"]["overall_cpu_percent"].value<double>())
        {
            diagnosis.overallCpuPercent = clampThreshold(*val, 0.0, 100.0, "diagnosis.overall_cpu_percent");
        }
        if (auto val = config["diagnosis"]["temperature_celsius"].value<double>())
        {
            diagnosis.temperatureCelsius =
                clampThreshold(*val, Domain::MIN_PLAUSIBLE_CELSIUS, Domain::MAX_PLAUSIBLE_CELSIUS, "diagnosis.temperature_celsius");
        }

        spdlog::info("Loaded config from {}", m_ConfigPath.string());
    }
    catch (const toml::parse_error& err)
    {
        spdlog::error("Failed to parse config file {}: {}", m_ConfigPath.string(), err.what());
    }
}

} // namespace App
