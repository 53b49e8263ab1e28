#pragma once

#include "Sample.h"
#include "Summary.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Domain
{

enum class SuspectedCause
{
    BusyProcesses,
    HighOverallCpu,
    HighTemperature,
    NothingUnusual,
};

[[nodiscard]] constexpr std::string_view toString(SuspectedCause cause) noexcept
{
    switch (cause)
    {
    case SuspectedCause::BusyProcesses:
        return "busy processes";
    case SuspectedCause::HighOverallCpu:
        return "high overall CPU";
    case SuspectedCause::HighTemperature:
        return "high temperature";
    case SuspectedCause::NothingUnusual:
        return "nothing unusual";
    }
    return "unknown";
}

struct DiagnosisThresholds
{
    double processCpuPercent = 5.0;
    double overallCpuPercent = 50.0;
    double temperatureCelsius = 70.0;
    std::size_t maxNamedProcesses = 3;
};

/// Heuristic explanation of fan activity. Always a suspicion, never a verdict.
struct Diagnosis
{
    SuspectedCause cause = SuspectedCause::NothingUnusual;
    std::vector<std::string> processNames; // Only for BusyProcesses
    std::optional<double> celsius;         // Highest temperature considered, if any
    bool temperatureAvailable = false;

    /// One sentence suitable for the end of a report.
    [[nodiscard]] std::string sentence() const;
};

[[nodiscard]] Diagnosis diagnose(const Sample& sample, std::size_t topN, const DiagnosisThresholds& thresholds = {});
[[nodiscard]] Diagnosis diagnose(const Summary& summary, const DiagnosisThresholds& thresholds = {});

} // namespace Domain
