#pragma once

#include "SamplingConfig.h"

#include <chrono>
#include <functional>
#include <thread>
#include <type_traits>
#include <utility>

namespace Domain
{

/// Blocking wait used between captures. Injected so tests run without real time passing.
using SleepFunction = std::function<void(std::chrono::nanoseconds)>;

[[nodiscard]] inline SleepFunction defaultSleep()
{
    return [](std::chrono::nanoseconds duration) { std::this_thread::sleep_for(duration); };
}

template<typename T> struct CapturePair
{
    T before;
    T after;
};

/// Wait for the (clamped) interval after an existing capture, then capture again.
/// Lets consecutive windows share an edge: the previous `after` becomes the next `before`.
template<typename T, typename Capture>
[[nodiscard]] auto continueAcrossInterval(T before, Capture&& capture, std::chrono::milliseconds interval, const SleepFunction& sleep)
    -> CapturePair<T>
{
    const auto clamped = Sampling::clampSampleInterval(interval);

    if (sleep)
    {
        sleep(clamped);
    }
    return CapturePair<T>{.before = std::move(before), .after = capture()};
}

/// Capture, wait for the (clamped) interval, capture again.
/// Exceptions thrown by either capture propagate unchanged.
template<typename Capture>
[[nodiscard]] auto captureAcrossInterval(Capture&& capture, std::chrono::milliseconds interval, const SleepFunction& sleep)
    -> CapturePair<std::invoke_result_t<Capture&>>
{
    auto before = capture();
    return continueAcrossInterval(std::move(before), capture, interval, sleep);
}

} // namespace Domain
