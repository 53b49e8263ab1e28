#include "Summary.h"

#include "Numeric.h"

#include <algorithm>
#include <map>
#include <unordered_map>

namespace Domain
{

namespace
{

struct FrequencyAccumulator
{
    std::size_t appearances = 0;
    double totalPercent = 0.0;
    double peakPercent = 0.0;
};

} // namespace

Summary summarize(std::span<const Sample> samples, std::size_t topN)
{
    Summary summary;
    summary.sampleCount = samples.size();
    if (samples.empty())
    {
        return summary;
    }

    double cpuTotal = 0.0;
    double celsiusTotal = 0.0;
    std::unordered_map<std::string, FrequencyAccumulator> byName;

    for (const auto& sample : samples)
    {
        cpuTotal += sample.overallCpuPercent;
        summary.maxCpuPercent = std::max(summary.maxCpuPercent, sample.overallCpuPercent);

        if (sample.temperature)
        {
            const double celsius = sample.temperature->celsius;
            celsiusTotal += celsius;
            summary.maxCelsius = summary.maxCelsius ? std::max(*summary.maxCelsius, celsius) : celsius;
            ++summary.temperatureSampleCount;
        }

        // Same-name processes in one sample merge into a single appearance
        std::map<std::string, double> sampleShares;
        const auto count = std::min(topN, sample.rankedProcesses.size());
        for (std::size_t i = 0; i < count; ++i)
        {
            const auto& usage = sample.rankedProcesses[i];
            sampleShares[usage.name] += usage.cpuPercent;
        }

        for (const auto& [name, share] : sampleShares)
        {
            auto& acc = byName[name];
            ++acc.appearances;
            acc.totalPercent += share;
            acc.peakPercent = std::max(acc.peakPercent, share);
        }
    }

    summary.averageCpuPercent = cpuTotal / Numeric::toDouble(samples.size());
    if (summary.temperatureSampleCount > 0)
    {
        summary.averageCelsius = celsiusTotal / Numeric::toDouble(summary.temperatureSampleCount);
    }

    summary.frequentProcesses.reserve(byName.size());
    for (const auto& [name, acc] : byName)
    {
        summary.frequentProcesses.push_back(ProcessFrequency{.name = name,
                                                             .appearances = acc.appearances,
                                                             .averageCpuPercent = acc.totalPercent / Numeric::toDouble(acc.appearances),
                                                             .peakCpuPercent = acc.peakPercent});
    }

    std::sort(summary.frequentProcesses.begin(),
              summary.frequentProcesses.end(),
              [](const ProcessFrequency& lhs, const ProcessFrequency& rhs)
              {
                  if (lhs.appearances != rhs.appearances)
                  {
                      return lhs.appearances > rhs.appearances;
                  }
                  if (lhs.averageCpuPercent != rhs.averageCpuPercent)
                  {
                      return lhs.averageCpuPercent > rhs.averageCpuPercent;
                  }
                  return lhs.name < rhs.name;
              });

    return summary;
}

} // namespace Domain
