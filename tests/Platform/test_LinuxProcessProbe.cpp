/// @file test_LinuxProcessProbe.cpp
/// @brief Tests for Platform::LinuxProcessProbe
///
/// Fixture-based tests build a fake /proc tree in a temporary directory to cover
/// awkward names, vanished processes and unreadable owners; the remaining tests
/// enumerate the real /proc.

#include <gtest/gtest.h>

// Gate Linux-only tests by header availability + target platform.
#if defined(__linux__) && __has_include(<unistd.h>)
#define FANWHY_HAS_UNISTD 1
#else
#define FANWHY_HAS_UNISTD 0
#endif

#if FANWHY_HAS_UNISTD

#include "Mocks/TempTree.h"
#include "Platform/Linux/LinuxProcessProbe.h"
#include "Platform/ProbeError.h"
#include "Platform/ProcessTypes.h"

#include <string>

#include <unistd.h>

namespace Platform
{
namespace
{

/// A /proc/[pid]/stat line with the given name, utime, stime and starttime.
std::string statLine(int pid, const std::string& name, unsigned utime, unsigned stime, unsigned long long starttime = 5000)
{
    return std::to_string(pid) + " (" + name + ") S 1 " + std::to_string(pid) + " " + std::to_string(pid) +
           " 0 -1 4194560 100 0 0 0 " + std::to_string(utime) + " " + std::to_string(stime) + " 0 0 20 0 1 0 " +
           std::to_string(starttime) + " 10000000 300 18446744073709551615\n";
}

std::string statusWithUid(unsigned uid)
{
    return "Name:\tfixture\nState:\tS (sleeping)\nUid:\t" + std::to_string(uid) + "\t" + std::to_string(uid) + "\t" +
           std::to_string(uid) + "\t" + std::to_string(uid) + "\nGid:\t0\t0\t0\t0\n";
}

// =============================================================================
// Stat line parsing
// =============================================================================

TEST(LinuxProcessProbeTest, ParseStatLineBasic)
{
    ProcessCounters counters;
    ASSERT_TRUE(LinuxProcessProbe::parseStatLine(statLine(42, "bash", 150, 30, 777), counters));

    EXPECT_EQ(counters.pid, 42);
    EXPECT_EQ(counters.name, "bash");
    EXPECT_EQ(counters.state, 'S');
    EXPECT_EQ(counters.userTime, 150U);
    EXPECT_EQ(counters.systemTime, 30U);
    EXPECT_EQ(counters.totalTime(), 180U);
    EXPECT_EQ(counters.startTimeTicks, 777U);
}

TEST(LinuxProcessProbeTest, ParseStatLineNameWithSpacesAndParentheses)
{
    ProcessCounters counters;
    ASSERT_TRUE(LinuxProcessProbe::parseStatLine(statLine(7, "(a) (b)", 1, 2), counters));

    EXPECT_EQ(counters.name, "(a) (b)");
    EXPECT_EQ(counters.userTime, 1U);
    EXPECT_EQ(counters.systemTime, 2U);
}

TEST(LinuxProcessProbeTest, ParseStatLineNameWithClosingParenAndSpace)
{
    ProcessCounters counters;
    ASSERT_TRUE(LinuxProcessProbe::parseStatLine(statLine(8, "evil) S 1 2 3", 11, 22), counters));

    EXPECT_EQ(counters.name, "evil) S 1 2 3");
    EXPECT_EQ(counters.userTime, 11U);
    EXPECT_EQ(counters.systemTime, 22U);
}

TEST(LinuxProcessProbeTest, ParseStatLineTruncatedAfterStime)
{
    ProcessCounters counters;
    ASSERT_TRUE(LinuxProcessProbe::parseStatLine("9 (short) R 1 9 9 0 -1 0 0 0 0 0 40 2", counters));

    EXPECT_EQ(counters.userTime, 40U);
    EXPECT_EQ(counters.startTimeTicks, 0U);
}

TEST(LinuxProcessProbeTest, ParseStatLineRejectsGarbage)
{
    ProcessCounters counters;
    EXPECT_FALSE(LinuxProcessProbe::parseStatLine("", counters));
    EXPECT_FALSE(LinuxProcessProbe::parseStatLine("12 no parens here", counters));
    EXPECT_FALSE(LinuxProcessProbe::parseStatLine("12 (x) R 1 2", counters));
    EXPECT_FALSE(LinuxProcessProbe::parseStatLine("(x) R 1 9 9 0 -1 0 0 0 0 0 40 2", counters));
}

// =============================================================================
// Fixture tree
// =============================================================================

TEST(LinuxProcessProbeTest, EnumeratesNumericDirectoriesOnly)
{
    TestMocks::TempTree tree;
    tree.write("100/stat", statLine(100, "worker", 10, 5));
    tree.write("100/status", statusWithUid(0));
    tree.write("self/stat", statLine(100, "worker", 10, 5));
    tree.write("stat", "cpu 1 2 3 4\n");
    tree.mkdir("sys");
    LinuxProcessProbe probe(tree.root());

    const auto snapshot = probe.enumerate();

    ASSERT_EQ(snapshot.processes.size(), 1U);
    const auto& process = snapshot.processes.at(100);
    EXPECT_EQ(process.name, "worker");
    EXPECT_EQ(process.user, "root");
    EXPECT_EQ(process.totalTime(), 15U);
    EXPECT_EQ(snapshot.skippedCount, 0U);
    EXPECT_EQ(snapshot.placeholderCount, 0U);
}

TEST(LinuxProcessProbeTest, VanishedProcessIsSkippedAndCounted)
{
    TestMocks::TempTree tree;
    tree.write("100/stat", statLine(100, "alive", 1, 1));
    tree.write("100/status", statusWithUid(0));
    tree.mkdir("200"); // Exited between readdir and open
    tree.write("300/stat", statLine(301, "mismatch", 1, 1));
    LinuxProcessProbe probe(tree.root());

    const auto snapshot = probe.enumerate();

    EXPECT_EQ(snapshot.processes.size(), 1U);
    EXPECT_TRUE(snapshot.processes.contains(100));
    EXPECT_EQ(snapshot.skippedCount, 2U);
}

TEST(LinuxProcessProbeTest, MissingStatusGetsPlaceholderUser)
{
    TestMocks::TempTree tree;
    tree.write("55/stat", statLine(55, "orphan", 1, 1));
    LinuxProcessProbe probe(tree.root());

    const auto snapshot = probe.enumerate();

    ASSERT_TRUE(snapshot.processes.contains(55));
    EXPECT_EQ(snapshot.processes.at(55).user, PLACEHOLDER_USER);
    EXPECT_EQ(snapshot.placeholderCount, 1U);
}

TEST(LinuxProcessProbeTest, EmptyNameFallsBackToComm)
{
    TestMocks::TempTree tree;
    tree.write("60/stat", statLine(60, "", 1, 1));
    tree.write("60/comm", "from-comm\n");
    tree.write("60/status", statusWithUid(0));
    tree.write("61/stat", statLine(61, "", 1, 1));
    tree.write("61/status", statusWithUid(0));
    LinuxProcessProbe probe(tree.root());

    const auto snapshot = probe.enumerate();

    EXPECT_EQ(snapshot.processes.at(60).name, "from-comm");
    EXPECT_EQ(snapshot.processes.at(61).name, PLACEHOLDER_PROCESS_NAME);
    EXPECT_EQ(snapshot.placeholderCount, 1U);
}

TEST(LinuxProcessProbeTest, UnknownUidFallsBackToNumber)
{
    TestMocks::TempTree tree;
    tree.write("70/stat", statLine(70, "ghost", 1, 1));
    tree.write("70/status", statusWithUid(3999999));
    LinuxProcessProbe probe(tree.root());

    const auto snapshot = probe.enumerate();

    EXPECT_EQ(snapshot.processes.at(70).user, "3999999");
    EXPECT_EQ(snapshot.placeholderCount, 0U);
}

TEST(LinuxProcessProbeTest, MissingRootThrowsProcessListError)
{
    TestMocks::TempTree tree;
    LinuxProcessProbe probe(tree.root() / "does-not-exist");

    try
    {
        (void)probe.enumerate();
        FAIL() << "expected SourceUnavailableError";
    }
    catch (const SourceUnavailableError& err)
    {
        EXPECT_EQ(err.source(), ProbeSource::ProcessList);
    }
}

// =============================================================================
// Real /proc
// =============================================================================

TEST(LinuxProcessProbeTest, RealProcContainsSelf)
{
    LinuxProcessProbe probe;

    const auto snapshot = probe.enumerate();
    const auto self = static_cast<int32_t>(::getpid());

    ASSERT_TRUE(snapshot.processes.contains(self));
    EXPECT_FALSE(snapshot.processes.at(self).name.empty());
    EXPECT_FALSE(snapshot.processes.at(self).user.empty());
    EXPECT_GT(probe.ticksPerSecond(), 0);
}

} // namespace
} // namespace Platform

#else

TEST(LinuxProcessProbeTest, SkippedOnNonLinux)
{
    GTEST_SKIP() << "LinuxProcessProbe tests require Linux (/proc, unistd.h)";
}

#endif
