#include "ReportWriter.h"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>

namespace App
{

namespace
{

constexpr std::size_t PID_MIN_WIDTH = 6;
constexpr std::size_t NAME_MIN_WIDTH = 20;
constexpr std::size_t NAME_MAX_WIDTH = 40;
constexpr std::size_t USER_MIN_WIDTH = 8;

[[nodiscard]] std::string truncateName(const std::string& name, std::size_t width)
{
    if (name.size() <= width)
    {
        return name;
    }
    // Step back to a UTF-8 lead byte so no code point is split
    std::size_t cut = width - 3;
    while (cut > 0 && (static_cast<unsigned char>(name[cut]) & 0xC0U) == 0x80U)
    {
        --cut;
    }
    return name.substr(0, cut) + "...";
}

} // namespace

std::string formatTemperature(std::optional<double> celsius)
{
    if (!celsius)
    {
        return "unavailable";
    }
    return fmt::format("{:.1f}°C", *celsius);
}

std::string formatProcessTable(const std::vector<Domain::ProcessUsage>& processes)
{
    if (processes.empty())
    {
        return "  (no processes found)\n";
    }

    std::size_t pidWidth = PID_MIN_WIDTH;
    std::size_t nameWidth = NAME_MIN_WIDTH;
    std::size_t userWidth = USER_MIN_WIDTH;
    for (const auto& process : processes)
    {
        pidWidth = std::max(pidWidth, fmt::formatted_size("{}", process.pid));
        nameWidth = std::max(nameWidth, std::min(NAME_MAX_WIDTH, process.name.size()));
        userWidth = std::max(userWidth, process.user.size());
    }

    std::string table;
    table += fmt::format("  {:<{}} {:<{}} {:<{}} {:>8}\n", "PID", pidWidth, "Process", nameWidth, "User", userWidth, "CPU %");
    table += fmt::format("  {} {} {} {}\n",
                         std::string(pidWidth, '-'),
                         std::string(nameWidth, '-'),
                         std::string(userWidth, '-'),
                         std::string(8, '-'));

    for (const auto& process : processes)
    {
        table += fmt::format("  {:<{}} {:<{}} {:<{}} {:>7.1f}%\n",
                             process.pid,
                             pidWidth,
                             truncateName(process.name, nameWidth),
                             nameWidth,
                             process.user,
                             userWidth,
                             process.cpuPercent);
    }
    return table;
}

ReportWriter::ReportWriter(std::ostream& out, ReportOptions options) : m_Out(out), m_Options(options)
{
}

std::optional<double> ReportWriter::shownCelsius(const Domain::Sample& sample) const
{
    if (!m_Options.showTemperature || !sample.temperature)
    {
        return std::nullopt;
    }
    return sample.temperature->celsius;
}

void ReportWriter::writeSnapshot(const Domain::Sample& sample, const Domain::Diagnosis& diagnosis)
{
    const auto top = sample.topProcesses(m_Options.topN);
    const auto celsius = shownCelsius(sample);

    if (m_Options.raw)
    {
        m_Out << fmt::format("CPU: {:.1f}%\n", sample.overallCpuPercent);
        if (m_Options.showTemperature)
        {
            m_Out << fmt::format("Temperature: {}\n", formatTemperature(celsius));
        }
        for (const auto& process : top)
        {
            m_Out << fmt::format("{}\t{}\t{}\t{:.1f}\n", process.pid, process.name, process.user, process.cpuPercent);
        }
        return;
    }

    m_Out << "=== System Load Snapshot ===\n\n";
    m_Out << fmt::format("Overall CPU Usage: {:.1f}%\n", sample.overallCpuPercent);
    if (m_Options.showTemperature)
    {
        m_Out << fmt::format("Highest Temperature: {}\n", formatTemperature(celsius));
    }
    m_Out << fmt::format("\nTop {} CPU Processes:\n", top.size());
    m_Out << formatProcessTable(top);
    m_Out << "\n--- Summary ---\n";
    m_Out << diagnosis.sentence() << '\n';
}

void ReportWriter::writeSampleLine(std::size_t index, const Domain::Sample& sample)
{
    const auto celsius = shownCelsius(sample);

    if (m_Options.raw)
    {
        const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(sample.timestamp.time_since_epoch()).count();
        m_Out << fmt::format("{}\t{:.1f}", epoch, sample.overallCpuPercent);
        if (m_Options.showTemperature)
        {
            m_Out << '\t' << (celsius ? fmt::format("{:.1f}", *celsius) : std::string("-"));
        }
        m_Out << '\n';
        m_Out.flush();
        return;
    }

    m_Out << fmt::format("[{}] CPU: {:.1f}%", index, sample.overallCpuPercent);
    if (m_Options.showTemperature)
    {
        m_Out << " | Temp: " << formatTemperature(celsius);
    }
    m_Out << '\n';
    m_Out.flush();
}

void ReportWriter::writeSummary(const Domain::MonitorResult& result, const Domain::Diagnosis& diagnosis)
{
    const auto& summary = result.summary;
    const auto averageCelsius = m_Options.showTemperature ? summary.averageCelsius : std::nullopt;
    const auto maxCelsius = m_Options.showTemperature ? summary.maxCelsius : std::nullopt;
    const auto frequentCount = std::min(m_Options.topN, summary.frequentProcesses.size());

    if (m_Options.raw)
    {
        m_Out << fmt::format("samples\t{}\n", summary.sampleCount);
        m_Out << fmt::format("cpu_avg\t{:.1f}\ncpu_max\t{:.1f}\n", summary.averageCpuPercent, summary.maxCpuPercent);
        if (m_Options.showTemperature)
        {
            m_Out << "temp_avg\t" << (averageCelsius ? fmt::format("{:.1f}", *averageCelsius) : std::string("-")) << '\n';
            m_Out << "temp_max\t" << (maxCelsius ? fmt::format("{:.1f}", *maxCelsius) : std::string("-")) << '\n';
        }
        for (std::size_t i = 0; i < frequentCount; ++i)
        {
            const auto& process = summary.frequentProcesses[i];
            m_Out << fmt::format("{}\t{}\t{:.1f}\t{:.1f}\n", process.name, process.appearances, process.averageCpuPercent, process.peakCpuPercent);
        }
        return;
    }

    if (result.interrupted)
    {
        m_Out << "\nMonitoring interrupted by user.\n";
    }

    m_Out << "\n=== Monitoring Summary ===\n\n";
    m_Out << fmt::format("Samples: {}\n", summary.sampleCount);
    m_Out << fmt::format("Average CPU Usage: {:.1f}%\n", summary.averageCpuPercent);
    m_Out << fmt::format("Maximum CPU Usage: {:.1f}%\n", summary.maxCpuPercent);
    if (m_Options.showTemperature)
    {
        m_Out << fmt::format("Average Temperature: {}\n", formatTemperature(averageCelsius));
        m_Out << fmt::format("Maximum Temperature: {}\n", formatTemperature(maxCelsius));
    }

    if (frequentCount > 0)
    {
        std::size_t nameWidth = NAME_MIN_WIDTH;
        for (std::size_t i = 0; i < frequentCount; ++i)
        {
            nameWidth = std::max(nameWidth, std::min(NAME_MAX_WIDTH, summary.frequentProcesses[i].name.size()));
        }

        m_Out << "\nMost Frequent High-CPU Processes:\n";
        m_Out << fmt::format("  {:<{}} {:>7} {:>9} {:>9}\n", "Process", nameWidth, "Samples", "Avg CPU", "Peak CPU");
        m_Out << fmt::format("  {} {} {} {}\n", std::string(nameWidth, '-'), std::string(7, '-'), std::string(9, '-'), std::string(9, '-'));
        for (std::size_t i = 0; i < frequentCount; ++i)
        {
            const auto& process = summary.frequentProcesses[i];
            m_Out << fmt::format("  {:<{}} {:>7} {:>8.1f}% {:>8.1f}%\n",
                                 truncateName(process.name, nameWidth),
                                 nameWidth,
                                 process.appearances,
                                 process.averageCpuPercent,
                                 process.peakCpuPercent);
        }
    }

    m_Out << "\n--- Summary ---\n";
    m_Out << diagnosis.sentence() << '\n';
}

} // namespace App
