#pragma once

#include "Domain/Diagnosis.h"
#include "Domain/Monitor.h"
#include "Domain/Sample.h"
#include "Domain/Summary.h"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace App
{

struct ReportOptions
{
    std::size_t topN = 5;
    bool showTemperature = true;
    bool raw = false; // Tab-separated lines instead of tables
};

/// "45.3°C", or "unavailable" when there is no reading.
[[nodiscard]] std::string formatTemperature(std::optional<double> celsius);

/// Fixed-width PID / Process / User / CPU % table, one row per process.
[[nodiscard]] std::string formatProcessTable(const std::vector<Domain::ProcessUsage>& processes);

/// Renders samples and summaries as text on stdout (or any stream).
class ReportWriter
{
  public:
    ReportWriter(std::ostream& out, ReportOptions options);

    void writeSnapshot(const Domain::Sample& sample, const Domain::Diagnosis& diagnosis);

    /// One progress line per completed monitor sample.
    void writeSampleLine(std::size_t index, const Domain::Sample& sample);

    void writeSummary(const Domain::MonitorResult& result, const Domain::Diagnosis& diagnosis);

    [[nodiscard]] const ReportOptions& options() const
    {
        return m_Options;
    }

  private:
    [[nodiscard]] std::optional<double> shownCelsius(const Domain::Sample& sample) const;

    std::ostream& m_Out;
    ReportOptions m_Options;
};

} // namespace App
