#include "Diagnosis.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace Domain
{

namespace
{

struct Candidate
{
    std::string_view name;
    double cpuPercent;
};

// Shared precedence: busy processes, overall CPU, temperature, nothing.
Diagnosis classify(const std::vector<Candidate>& candidates,
                   double overallCpuPercent,
                   std::optional<double> celsius,
                   const DiagnosisThresholds& thresholds)
{
    Diagnosis result;
    result.celsius = celsius;
    result.temperatureAvailable = celsius.has_value();

    for (const auto& candidate : candidates)
    {
        if (result.processNames.size() >= thresholds.maxNamedProcesses)
        {
            break;
        }
        if (candidate.cpuPercent < thresholds.processCpuPercent)
        {
            continue;
        }
        const bool seen = std::find(result.processNames.begin(), result.processNames.end(), candidate.name) != result.processNames.end();
        if (!seen)
        {
            result.processNames.emplace_back(candidate.name);
        }
    }

    if (!result.processNames.empty())
    {
        result.cause = SuspectedCause::BusyProcesses;
    }
    else if (overallCpuPercent >= thresholds.overallCpuPercent)
    {
        result.cause = SuspectedCause::HighOverallCpu;
    }
    else if (celsius && *celsius >= thresholds.temperatureCelsius)
    {
        result.cause = SuspectedCause::HighTemperature;
    }
    else
    {
        result.cause = SuspectedCause::NothingUnusual;
    }
    return result;
}

} // namespace

std::string Diagnosis::sentence() const
{
    switch (cause)
    {
    case SuspectedCause::BusyProcesses:
        return fmt::format("Fan activity is likely driven by: {}.", fmt::join(processNames, ", "));
    case SuspectedCause::HighOverallCpu:
        return "Fan activity is likely driven by high overall CPU load spread across many processes.";
    case SuspectedCause::HighTemperature:
        return fmt::format("CPU load is modest but the system is hot ({:.1f}°C); check airflow and ambient temperature.",
                           celsius.value_or(0.0));
    case SuspectedCause::NothingUnusual:
        break;
    }

    if (!temperatureAvailable)
    {
        return "Nothing unusual found in CPU load; temperature data was unavailable.";
    }
    return "Nothing unusual found; the fan may be reacting to brief spikes or ambient heat.";
}

Diagnosis diagnose(const Sample& sample, std::size_t topN, const DiagnosisThresholds& thresholds)
{
    std::vector<Candidate> candidates;
    const auto count = std::min(topN, sample.rankedProcesses.size());
    candidates.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        const auto& usage = sample.rankedProcesses[i];
        candidates.push_back(Candidate{.name = usage.name, .cpuPercent = usage.cpuPercent});
    }

    std::optional<double> celsius;
    if (sample.temperature)
    {
        celsius = sample.temperature->celsius;
    }
    return classify(candidates, sample.overallCpuPercent, celsius, thresholds);
}

Diagnosis diagnose(const Summary& summary, const DiagnosisThresholds& thresholds)
{
    // Frequency order already favours the names that kept coming back
    std::vector<Candidate> candidates;
    candidates.reserve(summary.frequentProcesses.size());
    for (const auto& frequency : summary.frequentProcesses)
    {
        candidates.push_back(Candidate{.name = frequency.name, .cpuPercent = frequency.averageCpuPercent});
    }
    return classify(candidates, summary.averageCpuPercent, summary.maxCelsius, thresholds);
}

} // namespace Domain
