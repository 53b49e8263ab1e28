#include "Monitor.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace Domain
{

Monitor::Monitor(Sampler& sampler, MonitorConfig config, SleepFunction sleep)
    : m_Sampler(sampler), m_Config(std::move(config)), m_Sleep(std::move(sleep))
{
    m_Config.interval = Sampling::clampSampleInterval(m_Config.interval);
    m_Config.spacing = std::clamp(m_Config.spacing, std::chrono::milliseconds(0), std::chrono::milliseconds(Sampling::MONITOR_SPACING_MAX_MS));
    m_Config.topN = Sampling::clampTopN(m_Config.topN);

    if (m_Config.stop.sampleCount)
    {
        spdlog::debug("Monitor: {} samples of {}ms", *m_Config.stop.sampleCount, m_Config.interval.count());
    }
    else if (m_Config.stop.duration)
    {
        spdlog::debug("Monitor: {}ms of {}ms samples", m_Config.stop.duration->count(), m_Config.interval.count());
    }
    else
    {
        spdlog::debug("Monitor: no stop condition, taking a single sample");
    }
}

void Monitor::setSampleCallback(SampleCallback callback)
{
    m_Callback = std::move(callback);
}

MonitorResult Monitor::run(const StopPredicate& stopRequested)
{
    MonitorResult result;

    while (shouldContinue(result.samples))
    {
        if (stopRequested && stopRequested())
        {
            spdlog::info("Monitor: stop requested after {} samples", result.samples.size());
            result.interrupted = true;
            break;
        }

        if (result.samples.empty())
        {
            result.samples.push_back(m_Sampler.takeSample(m_Config.interval));
        }
        else if (m_Config.spacing.count() > 0)
        {
            // Spaced samples are separate windows; the gap is not measured
            if (m_Sleep)
            {
                m_Sleep(m_Config.spacing);
            }
            result.samples.push_back(m_Sampler.takeSample(m_Config.interval));
        }
        else
        {
            result.samples.push_back(m_Sampler.takeNextSample(m_Config.interval));
        }

        if (m_Callback)
        {
            m_Callback(result.samples.size(), result.samples.back());
        }
    }

    result.summary = summarize(result.samples, m_Config.topN);
    return result;
}

bool Monitor::shouldContinue(const std::vector<Sample>& samples) const
{
    const auto& stop = m_Config.stop;

    if (stop.sampleCount)
    {
        return std::cmp_less(samples.size(), std::max(*stop.sampleCount, 0));
    }

    if (stop.duration)
    {
        if (samples.empty())
        {
            return stop.duration->count() > 0;
        }
        const auto elapsed = samples.back().windowEnd - samples.front().windowStart;
        return elapsed < *stop.duration;
    }

    return samples.empty();
}

} // namespace Domain
