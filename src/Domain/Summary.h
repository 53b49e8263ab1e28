#pragma once

#include "Sample.h"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace Domain
{

/// How often one process name showed up in the per-sample top-N.
struct ProcessFrequency
{
    std::string name;
    std::size_t appearances = 0;     // Samples in which the name appeared
    double averageCpuPercent = 0.0;  // Mean share over those samples
    double peakCpuPercent = 0.0;
};

/// Aggregate of a sequence of samples.
struct Summary
{
    std::size_t sampleCount = 0;
    double averageCpuPercent = 0.0;
    double maxCpuPercent = 0.0;

    std::size_t temperatureSampleCount = 0;
    std::optional<double> averageCelsius; // Absent when no sample had a temperature
    std::optional<double> maxCelsius;

    // Descending appearances, then descending average, then ascending name.
    std::vector<ProcessFrequency> frequentProcesses;
};

/// Pure reduction over samples; only each sample's first topN ranked processes are counted.
/// Several processes sharing a name in one sample count once with their shares summed.
[[nodiscard]] Summary summarize(std::span<const Sample> samples, std::size_t topN);

} // namespace Domain
