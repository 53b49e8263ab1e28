// Benchmarks for the sampling pipeline
//
// These measure the work done between the two captures of a sample (delta
// math and ranking) and the end-of-run summary, using synthetic snapshots so
// results do not depend on the host's process table. One probe benchmark reads
// the real /proc for context.

#include "Domain/DeltaCalculator.h"
#include "Domain/ProcessRanking.h"
#include "Domain/Summary.h"
#include "Platform/Factory.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

namespace
{

[[nodiscard]] Platform::ProcessSnapshot makeSnapshot(std::int64_t count, std::uint64_t tickOffset)
{
    Platform::ProcessSnapshot snapshot;
    snapshot.captureTime = std::chrono::steady_clock::time_point(std::chrono::seconds(10) + std::chrono::seconds(tickOffset));
    snapshot.processes.reserve(static_cast<std::size_t>(count));
    for (std::int64_t i = 1; i <= count; ++i)
    {
        Platform::ProcessCounters counters;
        counters.pid = static_cast<std::int32_t>(i);
        counters.name = "proc" + std::to_string(i % 97);
        counters.user = "bench";
        counters.startTimeTicks = 1000;
        // Spread the load so the ranking has real work to do
        counters.userTime = 10'000 + static_cast<std::uint64_t>(i % 13) * tickOffset;
        counters.systemTime = static_cast<std::uint64_t>(i % 7) * tickOffset;
        snapshot.processes.emplace(counters.pid, std::move(counters));
    }
    return snapshot;
}

// Per-pid delta computation over N processes
static void BM_DeltaCalculator_PerProcess(benchmark::State& state)
{
    const Domain::DeltaCalculator calc(Domain::DeltaConfig{.logicalCpuCount = 8, .ticksPerSecond = 100});
    const auto prev = makeSnapshot(state.range(0), 0);
    const auto curr = makeSnapshot(state.range(0), 1);

    for (auto _ : state)
    {
        auto percents = calc.perProcessPercent(prev, curr);
        benchmark::DoNotOptimize(percents.size());
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DeltaCalculator_PerProcess)->Arg(100)->Arg(500)->Arg(2000)->Arg(10000);

// Full ranking vs. top-N partial sort
static void BM_RankProcesses(benchmark::State& state)
{
    const Domain::DeltaCalculator calc(Domain::DeltaConfig{.logicalCpuCount = 8, .ticksPerSecond = 100});
    const auto prev = makeSnapshot(state.range(0), 0);
    const auto curr = makeSnapshot(state.range(0), 1);
    const auto percents = calc.perProcessPercent(prev, curr);
    const auto limit = static_cast<std::size_t>(state.range(1));

    for (auto _ : state)
    {
        auto ranked = Domain::rankProcesses(percents, curr, limit);
        benchmark::DoNotOptimize(ranked.data());
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_RankProcesses)->Args({500, 0})->Args({500, 5})->Args({5000, 0})->Args({5000, 5});

// Summary over a long monitor run
static void BM_Summarize(benchmark::State& state)
{
    std::vector<Domain::Sample> samples(static_cast<std::size_t>(state.range(0)));
    for (std::size_t i = 0; i < samples.size(); ++i)
    {
        auto& sample = samples[i];
        sample.overallCpuPercent = static_cast<double>(i % 100);
        sample.temperature = Domain::TemperatureReading{.celsius = 40.0 + static_cast<double>(i % 30)};
        for (std::int32_t pid = 1; pid <= 10; ++pid)
        {
            sample.rankedProcesses.push_back(Domain::ProcessUsage{.pid = pid,
                                                                  .cpuPercent = 100.0 / pid,
                                                                  .name = "proc" + std::to_string((pid + i) % 20),
                                                                  .user = "bench"});
        }
    }

    for (auto _ : state)
    {
        auto summary = Domain::summarize(samples, 5);
        benchmark::DoNotOptimize(summary.frequentProcesses.data());
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Summarize)->Arg(12)->Arg(720)->Arg(17280);

// Real process enumeration via platform probe
static void BM_ProcessProbe_Enumerate(benchmark::State& state)
{
    auto probe = Platform::makeProcessProbe();

    for (auto _ : state)
    {
        auto snapshot = probe->enumerate();
        benchmark::DoNotOptimize(snapshot.processes.size());
    }

    const auto finalSnapshot = probe->enumerate();
    state.counters["processes"] = benchmark::Counter(static_cast<double>(finalSnapshot.processes.size()));
}
BENCHMARK(BM_ProcessProbe_Enumerate)->Unit(benchmark::kMillisecond);

} // namespace
