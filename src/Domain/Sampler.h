#pragma once

#include "DeltaCalculator.h"
#include "Platform/IProcessProbe.h"
#include "Platform/ISystemProbe.h"
#include "Sample.h"
#include "SamplingConfig.h"
#include "TemperatureReader.h"
#include "TimedCapture.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>

namespace Domain
{

struct SamplerConfig
{
    std::chrono::milliseconds interval{Sampling::SAMPLE_INTERVAL_DEFAULT_MS};
    std::size_t retainTopN = 0; // 0 keeps the full ranking
    bool readTemperature = true;
};

/// Produces one Sample per call: capture counters, wait, capture again, compute deltas.
///
/// Probes are borrowed; the caller keeps them alive for the Sampler's lifetime.
/// SourceUnavailableError from either probe propagates out of takeSample().
class Sampler
{
  public:
    Sampler(Platform::ISystemProbe& systemProbe,
            Platform::IProcessProbe& processProbe,
            std::unique_ptr<TemperatureReader> temperatureReader,
            SamplerConfig config = {},
            SleepFunction sleep = defaultSleep());
    ~Sampler() = default;

    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;
    Sampler(Sampler&&) = delete;
    Sampler& operator=(Sampler&&) = delete;

    /// Sample over the configured interval.
    [[nodiscard]] Sample takeSample();

    /// Sample over an explicit interval (clamped to the allowed range).
    /// Always starts from a fresh capture.
    [[nodiscard]] Sample takeSample(std::chrono::milliseconds interval);

    /// Sample whose window starts where the previous sample's window ended.
    /// The previous second capture is reused as this sample's first, so windows
    /// are adjacent and work done between calls is still measured.
    /// Falls back to takeSample() when there is no previous capture.
    [[nodiscard]] Sample takeNextSample(std::chrono::milliseconds interval);

    /// Forget the last capture; the next takeNextSample() starts fresh.
    void resetWindow();

    [[nodiscard]] const SamplerConfig& config() const
    {
        return m_Config;
    }

    [[nodiscard]] const DeltaCalculator& deltaCalculator() const
    {
        return m_Delta;
    }

  private:
    struct Capture
    {
        Platform::SystemCounters system;
        Platform::ProcessSnapshot processes;
    };

    [[nodiscard]] Capture captureCounters();
    [[nodiscard]] Sample buildSample(const CapturePair<Capture>& pair);

    Platform::ISystemProbe& m_SystemProbe;
    Platform::IProcessProbe& m_ProcessProbe;
    std::unique_ptr<TemperatureReader> m_TemperatureReader;
    SamplerConfig m_Config;
    SleepFunction m_Sleep;
    DeltaCalculator m_Delta;

    std::optional<Capture> m_LastCapture; // Second capture of the previous sample
};

} // namespace Domain
