#pragma once

#include "Domain/Diagnosis.h"
#include "Domain/SamplingConfig.h"

#include <cstddef>
#include <filesystem>
#include <string>

namespace App
{

/// User configuration read at startup. Command-line values override these.
struct UserSettings
{
    // Snapshot measurement interval (milliseconds)
    int sampleIntervalMs = Domain::Sampling::SAMPLE_INTERVAL_DEFAULT_MS;

    // Monitor mode
    int monitorIntervalMs = Domain::Sampling::MONITOR_INTERVAL_DEFAULT_MS;
    int monitorSpacingMs = 0;
    int monitorDefaultDurationSeconds = Domain::Sampling::MONITOR_DURATION_DEFAULT_SECONDS;

    // Rows shown in the process table and counted in the summary
    std::size_t topN = Domain::Sampling::TOP_N_DEFAULT;

    // Temperature sources
    bool thermalEnabled = true;
    std::string sensorsCommand = "sensors";
    int sensorsTimeoutMs = Domain::Sampling::SENSORS_TIMEOUT_DEFAULT_MS;

    Domain::DiagnosisThresholds diagnosis;
};

/**
 * @brief Loads user preferences from a TOML file
 *
 * Default location on Linux:
 * - $XDG_CONFIG_HOME/fanwhy/config.toml
 * - ~/.config/fanwhy/config.toml
 *
 * A missing or malformed file is logged and leaves the defaults in place.
 */
class UserConfig
{
  public:
    /// Use the platform default location.
    UserConfig();

    /// Use an explicit file (e.g. from --config).
    explicit UserConfig(std::filesystem::path configPath);

    /// Load settings from the config file. Safe to call more than once; only the first call reads.
    void load();

    [[nodiscard]] auto settings() const -> const UserSettings&
    {
        return m_Settings;
    }

    [[nodiscard]] auto settings() -> UserSettings&
    {
        return m_Settings;
    }

    [[nodiscard]] auto configPath() const -> const std::filesystem::path&
    {
        return m_ConfigPath;
    }

    [[nodiscard]] static auto defaultConfigPath() -> std::filesystem::path;

  private:
    std::filesystem::path m_ConfigPath;
    UserSettings m_Settings;
    bool m_IsLoaded = false;

    static auto getConfigDirectory() -> std::filesystem::path;
};

} // namespace App
