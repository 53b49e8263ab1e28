#include "App/CommandLine.h"
#include "App/ReportWriter.h"
#include "App/UserConfig.h"
#include "Domain/Diagnosis.h"
#include "Domain/Monitor.h"
#include "Domain/Sampler.h"
#include "Domain/SamplingConfig.h"
#include "Domain/TemperatureReader.h"
#include "Platform/Factory.h"
#include "Platform/ProbeError.h"
#include "version.h"

#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

#include <signal.h>

namespace
{

constexpr int EXIT_SOURCE_ERROR = 1;
constexpr int EXIT_USAGE_ERROR = 2;
constexpr int EXIT_INTERRUPTED = 130;

volatile std::sig_atomic_t g_StopRequested = 0;

extern "C" void onStopSignal(int /*signal*/)
{
    g_StopRequested = 1;
}

void installSignalHandlers()
{
    struct sigaction action{};
    action.sa_handler = onStopSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

/// Sleeps in short slices so a stop signal ends the wait early.
void interruptibleSleep(std::chrono::nanoseconds duration)
{
    constexpr auto SLICE = std::chrono::milliseconds(50);
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (g_StopRequested == 0)
    {
        const auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::nanoseconds::zero())
        {
            break;
        }
        std::this_thread::sleep_for(std::min<std::chrono::nanoseconds>(remaining, SLICE));
    }
}

void setupLogging(bool verbose)
{
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("fanwhy", sink);
    spdlog::set_default_logger(logger);

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
#ifndef NDEBUG
    if (verbose)
    {
        spdlog::flush_on(spdlog::level::debug);
    }
#endif
}

[[nodiscard]] std::chrono::milliseconds secondsToMilliseconds(double seconds)
{
    // Oversized values saturate at the allowed ceiling rather than overflow
    const double millis = std::min(std::round(seconds * 1000.0), static_cast<double>(Domain::Sampling::MONITOR_DURATION_MAX_SECONDS) * 1000.0);
    return std::chrono::milliseconds(static_cast<long long>(millis));
}

[[nodiscard]] std::unique_ptr<Domain::TemperatureReader> makeTemperatureReader(const App::UserSettings& settings, bool enabled)
{
    if (!enabled)
    {
        return nullptr;
    }
    return std::make_unique<Domain::TemperatureReader>(Platform::makeThermalProbe(),
                                                       Platform::makeSensorsCommand(settings.sensorsCommand, std::chrono::milliseconds(settings.sensorsTimeoutMs)));
}

auto runSnapshot(Domain::Sampler& sampler, const App::UserSettings& settings, App::ReportWriter& writer) -> int
{
    const auto sample = sampler.takeSample();
    if (g_StopRequested != 0)
    {
        fmt::print(stderr, "\nInterrupted by user.\n");
        return EXIT_INTERRUPTED;
    }
    const auto diagnosis = Domain::diagnose(sample, writer.options().topN, settings.diagnosis);
    writer.writeSnapshot(sample, diagnosis);
    return EXIT_SUCCESS;
}

auto runMonitor(Domain::Sampler& sampler,
                const App::CommandLineOptions& options,
                const App::UserSettings& settings,
                App::ReportWriter& writer) -> int
{
    Domain::MonitorConfig config;
    config.interval = options.intervalSeconds ? secondsToMilliseconds(*options.intervalSeconds)
                                              : std::chrono::milliseconds(settings.monitorIntervalMs);
    config.spacing = std::chrono::milliseconds(settings.monitorSpacingMs);
    config.topN = writer.options().topN;
    config.stop.sampleCount = options.samples;
    if (options.durationSeconds)
    {
        config.stop.duration = secondsToMilliseconds(*options.durationSeconds);
    }
    else if (!options.samples)
    {
        config.stop.duration = std::chrono::seconds(settings.monitorDefaultDurationSeconds);
    }

    if (options.intervalSeconds && config.interval < std::chrono::milliseconds(Domain::Sampling::SAMPLE_INTERVAL_MIN_MS))
    {
        spdlog::warn("Interval raised to the {}ms minimum", Domain::Sampling::SAMPLE_INTERVAL_MIN_MS);
    }

    Domain::Monitor monitor(sampler, config, interruptibleSleep);
    monitor.setSampleCallback([&writer](std::size_t index, const Domain::Sample& sample) { writer.writeSampleLine(index, sample); });

    auto result = monitor.run([] { return g_StopRequested != 0; });
    // A signal during the final sample ends the run without the monitor seeing it
    result.interrupted = result.interrupted || g_StopRequested != 0;
    writer.writeSummary(result, Domain::diagnose(result.summary, settings.diagnosis));

    return result.interrupted ? EXIT_INTERRUPTED : EXIT_SUCCESS;
}

auto runApp(int argc, char** argv) -> int
{
    const auto parsed = App::parseCommandLine(argc, argv);
    const char* program = argc > 0 ? argv[0] : "fanwhy";

    if (parsed.error)
    {
        fmt::print(stderr, "{}: error: {}\nTry '{} --help' for more information.\n", program, *parsed.error, program);
        return EXIT_USAGE_ERROR;
    }

    const auto& options = parsed.options;
    if (options.showHelp)
    {
        fmt::print("{}", App::usageText(program));
        return EXIT_SUCCESS;
    }
    if (options.showVersion)
    {
        fmt::print("{} {}\n", fanwhy::Version::PROJECT_NAME, fanwhy::Version::STRING);
        return EXIT_SUCCESS;
    }

    setupLogging(options.verbose);
    spdlog::debug("{} v{} ({} build)", fanwhy::Version::PROJECT_NAME, fanwhy::Version::STRING, fanwhy::Version::BUILD_TYPE);
    spdlog::debug("Compiler: {} {}", fanwhy::Version::COMPILER_ID, fanwhy::Version::COMPILER_VERSION);

    App::UserConfig userConfig = options.configPath ? App::UserConfig(*options.configPath) : App::UserConfig();
    userConfig.load();
    const auto& settings = userConfig.settings();

    const bool showTemperature = options.showTemps.value_or(settings.thermalEnabled);
    App::ReportOptions reportOptions{
        .topN = Domain::Sampling::clampTopN(options.top.value_or(settings.topN)),
        .showTemperature = showTemperature,
        .raw = options.raw,
    };
    App::ReportWriter writer(std::cout, reportOptions);

    installSignalHandlers();

    try
    {
        auto systemProbe = Platform::makeSystemProbe();
        auto processProbe = Platform::makeProcessProbe();

        Domain::SamplerConfig samplerConfig{
            .interval = std::chrono::milliseconds(settings.sampleIntervalMs),
            .retainTopN = options.mode() == App::RunMode::Monitor ? reportOptions.topN : 0,
            .readTemperature = showTemperature,
        };
        Domain::Sampler sampler(*systemProbe, *processProbe, makeTemperatureReader(settings, showTemperature), samplerConfig, interruptibleSleep);

        if (options.mode() == App::RunMode::Monitor)
        {
            return runMonitor(sampler, options, settings, writer);
        }
        return runSnapshot(sampler, settings, writer);
    }
    catch (const Platform::SourceUnavailableError& err)
    {
        spdlog::error("{}", err.what());
        switch (err.source())
        {
        case Platform::ProbeSource::CpuStatistics:
            fmt::print(stderr, "Error: cannot read CPU statistics from {}\n", err.path());
            break;
        case Platform::ProbeSource::ProcessList:
            fmt::print(stderr, "Error: cannot enumerate processes in {}\n", err.path());
            break;
        }
        return EXIT_SOURCE_ERROR;
    }
}

} // namespace

auto main(int argc, char** argv) -> int
{
    return runApp(argc, argv);
}
