/// @file test_Summary.cpp
/// @brief Tests for Domain::summarize
///
/// Tests cover:
/// - CPU mean and maximum
/// - Temperature statistics over samples that have a reading
/// - Frequency table: same-name merging, top-N window, ordering

#include "Domain/Summary.h"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

namespace
{

Domain::Sample makeSample(double cpu, std::optional<double> celsius = std::nullopt, std::vector<Domain::ProcessUsage> ranked = {})
{
    Domain::Sample sample;
    sample.overallCpuPercent = cpu;
    if (celsius)
    {
        sample.temperature = Domain::TemperatureReading{.celsius = *celsius, .source = Domain::TemperatureSource::ThermalZone, .label = "cpu"};
    }
    sample.rankedProcesses = std::move(ranked);
    return sample;
}

Domain::ProcessUsage usage(std::int32_t pid, const std::string& name, double cpu)
{
    return Domain::ProcessUsage{.pid = pid, .cpuPercent = cpu, .name = name, .user = "tester"};
}

} // namespace

// =============================================================================
// CPU statistics
// =============================================================================

TEST(SummaryTest, EmptySequenceIsZero)
{
    const auto summary = Domain::summarize(std::vector<Domain::Sample>{}, 5);

    EXPECT_EQ(summary.sampleCount, 0U);
    EXPECT_DOUBLE_EQ(summary.averageCpuPercent, 0.0);
    EXPECT_DOUBLE_EQ(summary.maxCpuPercent, 0.0);
    EXPECT_FALSE(summary.averageCelsius.has_value());
    EXPECT_FALSE(summary.maxCelsius.has_value());
    EXPECT_TRUE(summary.frequentProcesses.empty());
}

TEST(SummaryTest, AverageAndMaximumCpu)
{
    const std::vector<Domain::Sample> samples{makeSample(10.0), makeSample(50.0), makeSample(30.0)};

    const auto summary = Domain::summarize(samples, 5);

    EXPECT_EQ(summary.sampleCount, 3U);
    EXPECT_DOUBLE_EQ(summary.averageCpuPercent, 30.0);
    EXPECT_DOUBLE_EQ(summary.maxCpuPercent, 50.0);
}

// =============================================================================
// Temperature statistics
// =============================================================================

TEST(SummaryTest, TemperatureOnlyOverSamplesWithReading)
{
    const std::vector<Domain::Sample> samples{makeSample(1.0, 50.0), makeSample(1.0), makeSample(1.0, 60.0)};

    const auto summary = Domain::summarize(samples, 5);

    EXPECT_EQ(summary.temperatureSampleCount, 2U);
    ASSERT_TRUE(summary.averageCelsius.has_value());
    EXPECT_DOUBLE_EQ(*summary.averageCelsius, 55.0);
    ASSERT_TRUE(summary.maxCelsius.has_value());
    EXPECT_DOUBLE_EQ(*summary.maxCelsius, 60.0);
}

TEST(SummaryTest, NoTemperatureAnywhereIsAbsent)
{
    const std::vector<Domain::Sample> samples{makeSample(5.0), makeSample(7.0)};

    const auto summary = Domain::summarize(samples, 5);

    EXPECT_EQ(summary.temperatureSampleCount, 0U);
    EXPECT_FALSE(summary.averageCelsius.has_value());
    EXPECT_FALSE(summary.maxCelsius.has_value());
}

TEST(SummaryTest, NegativeTemperaturesAreNotLostToZeroDefault)
{
    const std::vector<Domain::Sample> samples{makeSample(1.0, -10.0), makeSample(1.0, -4.0)};

    const auto summary = Domain::summarize(samples, 5);

    ASSERT_TRUE(summary.maxCelsius.has_value());
    EXPECT_DOUBLE_EQ(*summary.maxCelsius, -4.0);
}

// =============================================================================
// Frequency table
// =============================================================================

TEST(SummaryTest, CountsAppearancesAcrossSamples)
{
    const std::vector<Domain::Sample> samples{
        makeSample(0.0, std::nullopt, {usage(1, "firefox", 40.0), usage(2, "code", 10.0)}),
        makeSample(0.0, std::nullopt, {usage(1, "firefox", 20.0)}),
        makeSample(0.0, std::nullopt, {usage(2, "code", 30.0), usage(1, "firefox", 30.0)}),
    };

    const auto summary = Domain::summarize(samples, 5);

    ASSERT_EQ(summary.frequentProcesses.size(), 2U);
    EXPECT_EQ(summary.frequentProcesses[0].name, "firefox");
    EXPECT_EQ(summary.frequentProcesses[0].appearances, 3U);
    EXPECT_DOUBLE_EQ(summary.frequentProcesses[0].averageCpuPercent, 30.0);
    EXPECT_DOUBLE_EQ(summary.frequentProcesses[0].peakCpuPercent, 40.0);
    EXPECT_EQ(summary.frequentProcesses[1].name, "code");
    EXPECT_EQ(summary.frequentProcesses[1].appearances, 2U);
    EXPECT_DOUBLE_EQ(summary.frequentProcesses[1].averageCpuPercent, 20.0);
}

TEST(SummaryTest, SameNameInOneSampleCountsOnceWithSharesSummed)
{
    const std::vector<Domain::Sample> samples{
        makeSample(0.0, std::nullopt, {usage(10, "chrome", 25.0), usage(11, "chrome", 15.0), usage(12, "bash", 1.0)}),
    };

    const auto summary = Domain::summarize(samples, 5);

    ASSERT_EQ(summary.frequentProcesses.size(), 2U);
    EXPECT_EQ(summary.frequentProcesses[0].name, "chrome");
    EXPECT_EQ(summary.frequentProcesses[0].appearances, 1U);
    EXPECT_DOUBLE_EQ(summary.frequentProcesses[0].averageCpuPercent, 40.0);
    EXPECT_DOUBLE_EQ(summary.frequentProcesses[0].peakCpuPercent, 40.0);
}

TEST(SummaryTest, OnlyTopNOfEachSampleIsCounted)
{
    const std::vector<Domain::Sample> samples{
        makeSample(0.0, std::nullopt, {usage(1, "a", 30.0), usage(2, "b", 20.0), usage(3, "c", 10.0)}),
    };

    const auto summary = Domain::summarize(samples, 2);

    ASSERT_EQ(summary.frequentProcesses.size(), 2U);
    EXPECT_EQ(summary.frequentProcesses[0].name, "a");
    EXPECT_EQ(summary.frequentProcesses[1].name, "b");
}

TEST(SummaryTest, TiesBreakByAverageThenName)
{
    const std::vector<Domain::Sample> samples{
        makeSample(0.0, std::nullopt, {usage(1, "zeta", 10.0), usage(2, "alpha", 10.0), usage(3, "mid", 20.0)}),
    };

    const auto summary = Domain::summarize(samples, 5);

    ASSERT_EQ(summary.frequentProcesses.size(), 3U);
    EXPECT_EQ(summary.frequentProcesses[0].name, "mid");
    EXPECT_EQ(summary.frequentProcesses[1].name, "alpha");
    EXPECT_EQ(summary.frequentProcesses[2].name, "zeta");
}
