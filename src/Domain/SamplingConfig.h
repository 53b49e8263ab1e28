#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>

namespace Domain::Sampling
{

// Measurement interval of one sample (milliseconds)
inline constexpr int SAMPLE_INTERVAL_DEFAULT_MS = 1000;
inline constexpr int SAMPLE_INTERVAL_MIN_MS = 100; // Below this elapsed time is mostly scheduler noise
inline constexpr int SAMPLE_INTERVAL_MAX_MS = 3'600'000;

// Monitor mode
inline constexpr int MONITOR_INTERVAL_DEFAULT_MS = 5000;
inline constexpr int MONITOR_SPACING_MAX_MS = 3'600'000;
inline constexpr int MONITOR_DURATION_DEFAULT_SECONDS = 60;
inline constexpr int MONITOR_DURATION_MAX_SECONDS = 7 * 24 * 3600;

// External `sensors` command
inline constexpr int SENSORS_TIMEOUT_DEFAULT_MS = 5000;
inline constexpr int SENSORS_TIMEOUT_MIN_MS = 100;
inline constexpr int SENSORS_TIMEOUT_MAX_MS = 60'000;

// Display
inline constexpr std::size_t TOP_N_DEFAULT = 5;
inline constexpr std::size_t TOP_N_MAX = 1000;

template<typename T> [[nodiscard]] constexpr T clampSampleInterval(T value)
{
    return std::clamp(value, static_cast<T>(SAMPLE_INTERVAL_MIN_MS), static_cast<T>(SAMPLE_INTERVAL_MAX_MS));
}

[[nodiscard]] constexpr std::chrono::milliseconds clampSampleInterval(std::chrono::milliseconds value)
{
    return std::chrono::milliseconds(clampSampleInterval(value.count()));
}

template<typename T> [[nodiscard]] constexpr T clampTopN(T value)
{
    return std::clamp(value, static_cast<T>(1), static_cast<T>(TOP_N_MAX));
}

} // namespace Domain::Sampling
