#pragma once

#include <algorithm>
#include <cmath>
#include <concepts>
#include <limits>
#include <utility>

namespace Domain::Numeric
{

template<typename T>
    requires(std::integral<T> || std::floating_point<T>)
[[nodiscard]] constexpr auto toDouble(T value) noexcept -> double
{
    return static_cast<double>(value);
}

/// Clamp a percentage to [0, maxPercent]; NaN collapses to 0.
[[nodiscard]] inline auto clampPercent(double percent, double maxPercent = 100.0) noexcept -> double
{
    if (std::isnan(percent))
    {
        return 0.0;
    }
    return std::clamp(percent, 0.0, maxPercent);
}

/// Unsigned counter delta that never wraps: a counter that went backwards yields 0.
template<std::unsigned_integral T> [[nodiscard]] constexpr auto saturatingDelta(T current, T previous) noexcept -> T
{
    return (current > previous) ? static_cast<T>(current - previous) : T{0};
}

/// Safe narrowing conversion with fallback value.
/// Returns fallback if value is out of range for target type.
template<std::integral To, std::integral From> [[nodiscard]] constexpr auto narrowOr(From value, To fallback) noexcept -> To
{
    if (!std::in_range<To>(value))
    {
        return fallback;
    }
    return static_cast<To>(value);
}

} // namespace Domain::Numeric
