#pragma once

#include "Sample.h"
#include "Sampler.h"
#include "SamplingConfig.h"
#include "Summary.h"
#include "TimedCapture.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace Domain
{

/// When a monitor run ends. sampleCount wins over duration; neither means one sample.
struct StopCondition
{
    std::optional<int> sampleCount;
    std::optional<std::chrono::milliseconds> duration;
};

struct MonitorConfig
{
    std::chrono::milliseconds interval{Sampling::MONITOR_INTERVAL_DEFAULT_MS};
    std::chrono::milliseconds spacing{0}; // Extra wait between samples
    StopCondition stop;
    std::size_t topN = Sampling::TOP_N_DEFAULT;
};

struct MonitorResult
{
    std::vector<Sample> samples;
    Summary summary;
    bool interrupted = false;
};

/// Runs a bounded sequence of samples and reduces them to a Summary.
class Monitor
{
  public:
    /// Called after each completed sample with its 1-based index.
    using SampleCallback = std::function<void(std::size_t index, const Sample& sample)>;

    /// Polled before each sample; returning true ends the run early.
    using StopPredicate = std::function<bool()>;

    Monitor(Sampler& sampler, MonitorConfig config, SleepFunction sleep = defaultSleep());

    void setSampleCallback(SampleCallback callback);

    /// SourceUnavailableError from the sampler propagates; no partial result is returned.
    [[nodiscard]] MonitorResult run(const StopPredicate& stopRequested = {});

    [[nodiscard]] const MonitorConfig& config() const
    {
        return m_Config;
    }

  private:
    [[nodiscard]] bool shouldContinue(const std::vector<Sample>& samples) const;

    Sampler& m_Sampler;
    MonitorConfig m_Config;
    SleepFunction m_Sleep;
    SampleCallback m_Callback;
};

} // namespace Domain
