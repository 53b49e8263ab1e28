#include "Sampler.h"

#include "ProcessRanking.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace Domain
{

Sampler::Sampler(Platform::ISystemProbe& systemProbe,
                 Platform::IProcessProbe& processProbe,
                 std::unique_ptr<TemperatureReader> temperatureReader,
                 SamplerConfig config,
                 SleepFunction sleep)
    : m_SystemProbe(systemProbe),
      m_ProcessProbe(processProbe),
      m_TemperatureReader(std::move(temperatureReader)),
      m_Config(config),
      m_Sleep(std::move(sleep)),
      m_Delta(DeltaConfig{.logicalCpuCount = systemProbe.logicalCpuCount(), .ticksPerSecond = processProbe.ticksPerSecond()})
{
    m_Config.interval = Sampling::clampSampleInterval(m_Config.interval);
    spdlog::debug("Sampler: {}ms interval, retain {} processes, temperature {}",
                  m_Config.interval.count(),
                  m_Config.retainTopN,
                  (m_Config.readTemperature && m_TemperatureReader) ? "on" : "off");
}

Sample Sampler::takeSample()
{
    return takeSample(m_Config.interval);
}

Sample Sampler::takeSample(std::chrono::milliseconds interval)
{
    m_LastCapture.reset();
    auto pair = captureAcrossInterval([this] { return captureCounters(); }, interval, m_Sleep);
    auto sample = buildSample(pair);
    m_LastCapture = std::move(pair.after);
    return sample;
}

Sample Sampler::takeNextSample(std::chrono::milliseconds interval)
{
    if (!m_LastCapture)
    {
        return takeSample(interval);
    }

    auto before = std::move(*m_LastCapture);
    m_LastCapture.reset();
    auto pair = continueAcrossInterval(std::move(before), [this] { return captureCounters(); }, interval, m_Sleep);
    auto sample = buildSample(pair);
    m_LastCapture = std::move(pair.after);
    return sample;
}

void Sampler::resetWindow()
{
    m_LastCapture.reset();
}

Sample Sampler::buildSample(const CapturePair<Capture>& pair)
{
    Sample sample;
    sample.timestamp = std::chrono::system_clock::now();
    sample.windowStart = pair.before.system.captureTime;
    sample.windowEnd = pair.after.system.captureTime;
    sample.overallCpuPercent = m_Delta.overallCpuPercent(pair.before.system, pair.after.system);

    const auto perProcess = m_Delta.perProcessPercent(pair.before.processes, pair.after.processes);
    sample.processesCompared = perProcess.size();
    sample.rankedProcesses = rankProcesses(perProcess, pair.after.processes, m_Config.retainTopN);

    if (m_Config.readTemperature && m_TemperatureReader)
    {
        sample.temperature = m_TemperatureReader->capture();
    }

    spdlog::debug("Sampler: cpu {:.1f}%, {} processes compared, {} skipped, {} placeholders",
                  sample.overallCpuPercent,
                  sample.processesCompared,
                  pair.after.processes.skippedCount,
                  pair.after.processes.placeholderCount);
    return sample;
}

Sampler::Capture Sampler::captureCounters()
{
    Capture capture;
    capture.system = m_SystemProbe.read();
    capture.processes = m_ProcessProbe.enumerate();
    return capture;
}

} // namespace Domain
