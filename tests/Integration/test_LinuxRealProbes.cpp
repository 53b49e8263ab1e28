/// @file test_LinuxRealProbes.cpp
/// @brief Integration tests for real Linux platform probes
///
/// These tests drive the Sampler and Monitor against the real /proc and
/// /sys/class/thermal, with the shortest allowed interval.

#include <gtest/gtest.h>

#if defined(__linux__) && __has_include(<unistd.h>)

#include "Domain/Monitor.h"
#include "Domain/Sampler.h"
#include "Domain/TemperatureReader.h"
#include "Platform/Factory.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace std::chrono_literals;

// =============================================================================
// Real /proc Filesystem Tests
// =============================================================================

TEST(LinuxRealProbesTest, ProcStatExistsAndIsReadable)
{
    std::ifstream statFile("/proc/stat");
    EXPECT_TRUE(statFile.is_open()) << "/proc/stat should be readable";

    std::string line;
    bool foundCpuLine = false;
    while (std::getline(statFile, line))
    {
        if (line.starts_with("cpu "))
        {
            foundCpuLine = true;
            break;
        }
    }

    EXPECT_TRUE(foundCpuLine) << "/proc/stat should contain CPU aggregate line";
}

TEST(LinuxRealProbesTest, SamplerProducesConsistentSample)
{
    auto systemProbe = Platform::makeSystemProbe();
    auto processProbe = Platform::makeProcessProbe();
    auto reader = std::make_unique<Domain::TemperatureReader>(Platform::makeThermalProbe(), nullptr);
    Domain::Sampler sampler(*systemProbe, *processProbe, std::move(reader), Domain::SamplerConfig{.interval = 100ms});

    const auto sample = sampler.takeSample();

    EXPECT_GE(sample.overallCpuPercent, 0.0);
    EXPECT_LE(sample.overallCpuPercent, 100.0);
    EXPECT_GE(sample.windowLength().count(), 0.1);
    EXPECT_FALSE(sample.rankedProcesses.empty()) << "at least this test process should be ranked";

    const double ceiling = sampler.deltaCalculator().maxProcessPercent();
    for (const auto& process : sample.rankedProcesses)
    {
        EXPECT_GE(process.cpuPercent, 0.0);
        EXPECT_LE(process.cpuPercent, ceiling);
    }
    EXPECT_TRUE(std::is_sorted(sample.rankedProcesses.begin(),
                               sample.rankedProcesses.end(),
                               [](const Domain::ProcessUsage& lhs, const Domain::ProcessUsage& rhs)
                               {
                                   if (lhs.cpuPercent != rhs.cpuPercent)
                                   {
                                       return lhs.cpuPercent > rhs.cpuPercent;
                                   }
                                   return lhs.pid < rhs.pid;
                               }));

    if (sample.temperature)
    {
        EXPECT_TRUE(Domain::isPlausibleCelsius(sample.temperature->celsius));
    }
}

TEST(LinuxRealProbesTest, SelfAppearsInRanking)
{
    auto systemProbe = Platform::makeSystemProbe();
    auto processProbe = Platform::makeProcessProbe();
    Domain::Sampler sampler(*systemProbe, *processProbe, nullptr, Domain::SamplerConfig{.interval = 100ms, .retainTopN = 0, .readTemperature = false});

    const auto sample = sampler.takeSample();
    const auto self = static_cast<std::int32_t>(::getpid());

    const bool found = std::any_of(sample.rankedProcesses.begin(),
                                   sample.rankedProcesses.end(),
                                   [self](const Domain::ProcessUsage& usage) { return usage.pid == self; });
    EXPECT_TRUE(found);
}

TEST(LinuxRealProbesTest, MonitorRunsRequestedSamples)
{
    auto systemProbe = Platform::makeSystemProbe();
    auto processProbe = Platform::makeProcessProbe();
    Domain::Sampler sampler(*systemProbe, *processProbe, nullptr, Domain::SamplerConfig{.interval = 100ms, .retainTopN = 5, .readTemperature = false});

    Domain::MonitorConfig config;
    config.interval = 100ms;
    config.stop.sampleCount = 2;
    Domain::Monitor monitor(sampler, config);

    const auto result = monitor.run();

    ASSERT_EQ(result.samples.size(), 2U);
    EXPECT_FALSE(result.interrupted);
    EXPECT_LE(result.samples[0].windowEnd, result.samples[1].windowStart);
    EXPECT_LE(result.summary.averageCpuPercent, result.summary.maxCpuPercent);
}

#else

TEST(LinuxRealProbesTest, SkippedOnNonLinux)
{
    GTEST_SKIP() << "Real probe tests require Linux";
}

#endif
