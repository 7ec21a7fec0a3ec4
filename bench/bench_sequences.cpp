/**
 * @file  bench/bench_sequences.cpp
 * @brief Google Benchmark suite for term generation, decomposition and the
 *        cumulative divergence fold.
 *
 * Benchmarks
 * ----------
 *   BM_Fibonacci_Doubling       : single F(n) by fast doubling
 *   BM_SequenceTable_UpToValue  : table build up to 10^k
 *   BM_Decompose_Zeckendorf     : greedy walk against a shared table
 *   BM_Decompose_Lucas          : greedy walk against a shared table
 *   BM_CumulativeProfile_Shards : full fold over [0, 10^5] by shard count
 *
 * Build (CMake):
 *   cmake -DZECK_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_sequences
 *   ./build/bench_sequences --benchmark_format=json
 *
 * Throughput units: items/second (indices processed).
 * Custom counter "Mindices_per_sec" = throughput / 1e6.
 */

#include "benchmark/benchmark.h"

#include "zeck/decomposition.hpp"
#include "zeck/divergence.hpp"
#include "zeck/sequences.hpp"

#include <cstddef>
#include <cstdint>

using namespace zeck;

// ── Terms ──────────────────────────────────────────────────────────────────────

static void BM_Fibonacci_Doubling(benchmark::State& state) {
    const std::int64_t n = state.range(0);
    for (auto _ : state) {
        auto f = sequences::fibonacci(n);
        benchmark::DoNotOptimize(f);
    }
}
BENCHMARK(BM_Fibonacci_Doubling)->RangeMultiplier(8)->Range(64, 1 << 18)->Unit(benchmark::kMicrosecond);

static void BM_SequenceTable_UpToValue(benchmark::State& state) {
    BigInt limit = 1;
    for (std::int64_t k = 0; k < state.range(0); ++k) limit *= 10;
    for (auto _ : state) {
        auto t = sequences::SequenceTable::up_to_value(SequenceKind::Lucas, limit);
        benchmark::DoNotOptimize(t);
    }
}
BENCHMARK(BM_SequenceTable_UpToValue)->DenseRange(10, 100, 30);

// ── Decomposition ──────────────────────────────────────────────────────────────

static void BM_Decompose_Zeckendorf(benchmark::State& state) {
    const std::int64_t n = state.range(0);
    const auto fib = sequences::SequenceTable::up_to_value(SequenceKind::Fibonacci,
                                                           BigInt{static_cast<long>(n)});
    if (!fib) {
        state.SkipWithError("table build failed");
        return;
    }
    std::int64_t v = 0;
    for (auto _ : state) {
        auto rep = decomposition::decompose_zeckendorf(BigInt{static_cast<long>(v)}, *fib);
        benchmark::DoNotOptimize(rep);
        v = v == n ? 0 : v + 1;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Decompose_Zeckendorf)->RangeMultiplier(100)->Range(100, 100'000'000);

static void BM_Decompose_Lucas(benchmark::State& state) {
    const std::int64_t n = state.range(0);
    const auto luc = sequences::SequenceTable::up_to_value(SequenceKind::Lucas,
                                                           BigInt{static_cast<long>(n)});
    if (!luc) {
        state.SkipWithError("table build failed");
        return;
    }
    std::int64_t v = 0;
    for (auto _ : state) {
        auto rep = decomposition::decompose_lucas(BigInt{static_cast<long>(v)}, *luc);
        benchmark::DoNotOptimize(rep);
        v = v == n ? 0 : v + 1;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Decompose_Lucas)->RangeMultiplier(100)->Range(100, 100'000'000);

// ── Cumulative fold ────────────────────────────────────────────────────────────

static void BM_CumulativeProfile_Shards(benchmark::State& state) {
    constexpr std::int64_t N = 100'000;
    const divergence::ProfileConfig cfg{
        .shards  = static_cast<std::size_t>(state.range(0)),
        .verbose = false,
    };
    for (auto _ : state) {
        auto p = divergence::cumulative_profile(N, cfg);
        benchmark::DoNotOptimize(p);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * (N + 1));
    state.counters["Mindices_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(N + 1) / 1e6,
        benchmark::Counter::kIsRate);
}
BENCHMARK(BM_CumulativeProfile_Shards)->RangeMultiplier(2)->Range(1, 16)->Unit(benchmark::kMillisecond);
