/// @file test_Sampler.cpp
/// @brief Tests for Domain::Sampler
///
/// Tests cover:
/// - Capture, wait, capture ordering and window timestamps
/// - Overall and per-process percentages flowing into a Sample
/// - Ranking order (descending CPU, ascending pid on ties)
/// - Interval clamping and retainTopN
/// - Temperature capture and error propagation

#include "Domain/ProcessRanking.h"
#include "Domain/Sampler.h"
#include "Mocks/MockProbes.h"
#include "Platform/ProbeError.h"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

using namespace std::chrono_literals;
using TestMocks::FakeClock;
using TestMocks::makeBusyCpu;
using TestMocks::makeProcessCounters;
using TestMocks::MockProcessProbe;
using TestMocks::MockSensorsCommand;
using TestMocks::MockSystemProbe;
using TestMocks::MockThermalProbe;

namespace
{

class SamplerTest : public ::testing::Test
{
  protected:
    FakeClock m_Clock;
    MockSystemProbe m_System{&m_Clock};
    MockProcessProbe m_Processes{&m_Clock};

    [[nodiscard]] Domain::Sampler makeSampler(Domain::SamplerConfig config = {}, std::unique_ptr<Domain::TemperatureReader> reader = nullptr)
    {
        return Domain::Sampler(m_System, m_Processes, std::move(reader), config, m_Clock.sleeper());
    }
};

} // namespace

// =============================================================================
// Timing
// =============================================================================

TEST_F(SamplerTest, WindowSpansTheInterval)
{
    m_System.withReading(makeBusyCpu(0, 0)).withReading(makeBusyCpu(250, 1000));
    auto sampler = makeSampler();

    const auto start = m_Clock.now();
    const auto sample = sampler.takeSample(2000ms);

    EXPECT_EQ(sample.windowStart, start);
    EXPECT_EQ(sample.windowEnd, start + 2000ms);
    EXPECT_DOUBLE_EQ(sample.windowLength().count(), 2.0);
    EXPECT_EQ(m_System.readCount(), 2);
    EXPECT_EQ(m_Processes.enumerateCount(), 2);
    EXPECT_EQ(m_Clock.sleepCount(), 1);
}

TEST_F(SamplerTest, NextSampleReusesPreviousSecondCapture)
{
    m_System.withReading(makeBusyCpu(0, 0)).withReading(makeBusyCpu(250, 1000)).withReading(makeBusyCpu(1250, 2000));
    auto sampler = makeSampler();

    const auto first = sampler.takeSample(1000ms);
    m_Clock.elapse(200ms);
    const auto second = sampler.takeNextSample(1000ms);

    EXPECT_EQ(second.windowStart, first.windowEnd);
    EXPECT_EQ(second.windowEnd - second.windowStart, 1200ms);
    EXPECT_DOUBLE_EQ(first.overallCpuPercent, 25.0);
    EXPECT_DOUBLE_EQ(second.overallCpuPercent, 100.0);
    EXPECT_EQ(m_System.readCount(), 3);
    EXPECT_EQ(m_Processes.enumerateCount(), 3);
}

TEST_F(SamplerTest, NextSampleWithoutHistoryStartsFresh)
{
    auto sampler = makeSampler();

    const auto start = m_Clock.now();
    const auto sample = sampler.takeNextSample(1000ms);

    EXPECT_EQ(sample.windowStart, start);
    EXPECT_EQ(m_System.readCount(), 2);
}

TEST_F(SamplerTest, ResetWindowForcesFreshCapture)
{
    auto sampler = makeSampler();

    const auto first = sampler.takeSample(1000ms);
    sampler.resetWindow();
    m_Clock.elapse(500ms);
    const auto second = sampler.takeNextSample(1000ms);

    EXPECT_EQ(second.windowStart - first.windowEnd, 500ms);
    EXPECT_EQ(m_System.readCount(), 4);
}

TEST_F(SamplerTest, IntervalBelowFloorIsClamped)
{
    auto sampler = makeSampler(Domain::SamplerConfig{.interval = 5ms});

    EXPECT_EQ(sampler.config().interval, std::chrono::milliseconds(Domain::Sampling::SAMPLE_INTERVAL_MIN_MS));

    const auto sample = sampler.takeSample(1ms);
    EXPECT_EQ(sample.windowEnd - sample.windowStart, std::chrono::milliseconds(Domain::Sampling::SAMPLE_INTERVAL_MIN_MS));
}

TEST_F(SamplerTest, DefaultIntervalFromConfig)
{
    auto sampler = makeSampler(Domain::SamplerConfig{.interval = 1500ms});
    const auto sample = sampler.takeSample();

    EXPECT_EQ(sample.windowEnd - sample.windowStart, 1500ms);
}

// =============================================================================
// Percentages and ranking
// =============================================================================

TEST_F(SamplerTest, OverallCpuFromCounterDelta)
{
    m_System.withReading(makeBusyCpu(1000, 10000)).withReading(makeBusyCpu(1250, 11000));
    auto sampler = makeSampler();

    EXPECT_DOUBLE_EQ(sampler.takeSample(1000ms).overallCpuPercent, 25.0);
}

TEST_F(SamplerTest, RanksProcessesByCpuThenPid)
{
    m_Processes.withProcesses({makeProcessCounters(30, "c", 0), makeProcessCounters(10, "a", 0), makeProcessCounters(20, "b", 0)})
        .withProcesses({makeProcessCounters(30, "c", 20), makeProcessCounters(10, "a", 50), makeProcessCounters(20, "b", 20)});
    auto sampler = makeSampler();

    const auto sample = sampler.takeSample(1000ms);

    ASSERT_EQ(sample.rankedProcesses.size(), 3U);
    EXPECT_EQ(sample.rankedProcesses[0].pid, 10);
    EXPECT_DOUBLE_EQ(sample.rankedProcesses[0].cpuPercent, 50.0);
    EXPECT_EQ(sample.rankedProcesses[1].pid, 20);
    EXPECT_EQ(sample.rankedProcesses[2].pid, 30);
    EXPECT_DOUBLE_EQ(sample.rankedProcesses[1].cpuPercent, sample.rankedProcesses[2].cpuPercent);
    EXPECT_EQ(sample.processesCompared, 3U);
}

TEST_F(SamplerTest, OnlyCommonPidsAreRanked)
{
    m_Processes.withProcesses({makeProcessCounters(10, "worker", 100)})
        .withProcesses({makeProcessCounters(10, "worker", 150), makeProcessCounters(20, "newcomer", 5)});
    auto sampler = makeSampler();

    const auto sample = sampler.takeSample(1000ms);

    ASSERT_EQ(sample.rankedProcesses.size(), 1U);
    EXPECT_EQ(sample.rankedProcesses[0].pid, 10);
    EXPECT_EQ(sample.rankedProcesses[0].name, "worker");
    EXPECT_EQ(sample.rankedProcesses[0].user, "tester");
}

TEST_F(SamplerTest, RetainTopNBoundsTheRanking)
{
    m_Processes.withProcesses({makeProcessCounters(1, "a", 0), makeProcessCounters(2, "b", 0), makeProcessCounters(3, "c", 0)})
        .withProcesses({makeProcessCounters(1, "a", 10), makeProcessCounters(2, "b", 30), makeProcessCounters(3, "c", 20)});
    auto sampler = makeSampler(Domain::SamplerConfig{.interval = 1000ms, .retainTopN = 2, .readTemperature = false});

    const auto sample = sampler.takeSample();

    ASSERT_EQ(sample.rankedProcesses.size(), 2U);
    EXPECT_EQ(sample.rankedProcesses[0].pid, 2);
    EXPECT_EQ(sample.rankedProcesses[1].pid, 3);
    EXPECT_EQ(sample.processesCompared, 3U);
}

TEST_F(SamplerTest, DeltaConfigComesFromProbes)
{
    m_System.setLogicalCpuCount(4);
    m_Processes.setTicksPerSecond(250);
    auto sampler = makeSampler();

    EXPECT_EQ(sampler.deltaCalculator().config().logicalCpuCount, 4);
    EXPECT_EQ(sampler.deltaCalculator().config().ticksPerSecond, 250);
}

TEST(ProcessRankingTest, TopProcessesReturnsPrefix)
{
    Domain::Sample sample;
    sample.rankedProcesses = {{.pid = 1, .cpuPercent = 30.0, .name = "a", .user = "u"}, {.pid = 2, .cpuPercent = 10.0, .name = "b", .user = "u"}};

    EXPECT_EQ(sample.topProcesses(1).size(), 1U);
    EXPECT_EQ(sample.topProcesses(5).size(), 2U);
}

TEST(ProcessRankingTest, MissingIdentityUsesPlaceholders)
{
    const std::unordered_map<std::int32_t, double> percents{{42, 12.5}};
    const Platform::ProcessSnapshot empty;

    const auto ranked = Domain::rankProcesses(percents, empty);

    ASSERT_EQ(ranked.size(), 1U);
    EXPECT_EQ(ranked[0].name, Platform::PLACEHOLDER_PROCESS_NAME);
    EXPECT_EQ(ranked[0].user, Platform::PLACEHOLDER_USER);
}

// =============================================================================
// Temperature
// =============================================================================

TEST_F(SamplerTest, TemperatureIsCapturedWhenEnabled)
{
    auto thermal = std::make_unique<MockThermalProbe>();
    thermal->withZone("x86_pkg_temp", 66.0);
    auto reader = std::make_unique<Domain::TemperatureReader>(std::move(thermal), nullptr);
    auto sampler = makeSampler({}, std::move(reader));

    const auto sample = sampler.takeSample(1000ms);

    ASSERT_TRUE(sample.temperature.has_value());
    EXPECT_DOUBLE_EQ(sample.temperature->celsius, 66.0);
}

TEST_F(SamplerTest, TemperatureSkippedWhenDisabled)
{
    auto thermal = std::make_unique<MockThermalProbe>();
    thermal->withZone("x86_pkg_temp", 66.0);
    auto reader = std::make_unique<Domain::TemperatureReader>(std::move(thermal), nullptr);
    auto sampler = makeSampler(Domain::SamplerConfig{.interval = 1000ms, .retainTopN = 0, .readTemperature = false}, std::move(reader));

    EXPECT_FALSE(sampler.takeSample().temperature.has_value());
}

TEST_F(SamplerTest, NoTemperatureSourceIsAbsent)
{
    auto reader = std::make_unique<Domain::TemperatureReader>(std::make_unique<MockThermalProbe>(),
                                                              std::make_unique<MockSensorsCommand>(std::string("Adapter: ISA adapter\n")));
    auto sampler = makeSampler({}, std::move(reader));

    EXPECT_FALSE(sampler.takeSample(1000ms).temperature.has_value());
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(SamplerTest, CpuStatisticsFailurePropagates)
{
    m_System.failAfter(1);
    auto sampler = makeSampler();

    try
    {
        (void)sampler.takeSample(1000ms);
        FAIL() << "expected SourceUnavailableError";
    }
    catch (const Platform::SourceUnavailableError& err)
    {
        EXPECT_EQ(err.source(), Platform::ProbeSource::CpuStatistics);
    }
}

TEST_F(SamplerTest, ProcessListFailurePropagates)
{
    m_Processes.failAfter(0);
    auto sampler = makeSampler();

    EXPECT_THROW((void)sampler.takeSample(1000ms), Platform::SourceUnavailableError);
}
