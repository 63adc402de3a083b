/**
 * @file  bench/bench_engine.cpp
 * @brief Google Benchmark suite for the analysis pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_Engine_SummaryOnly      summary-only evaluation
 *   BM_Engine_Streams          full evaluation over 1 Hz streams
 *   BM_Intervals_Detect        interval structure detection alone
 *   BM_Preprocess_Prepare      validation and cleaning alone
 *
 * Build (CMake):
 *   cmake -DTSIG_BENCH=ON ..
 *   cmake --build build --target bench_engine
 *   ./build/bench_engine --benchmark_format=json
 *
 * Throughput units: items/second (stream samples processed).
 */

#include "benchmark/benchmark.h"

#include "tsig/engine.hpp"
#include "tsig/intervals.hpp"
#include "tsig/preprocess.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

using namespace tsig;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N seconds of a structured session: 10 min warm-up, then 3 min fast /
/// 2 min easy repeats.
static StreamSet make_session(std::size_t n) {
    Series time, distance, velocity, hr, cadence;
    double d = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const bool   warm = i < 600;
        const bool   fast = !warm && (i - 600) % 300 < 180;
        const double v    = warm ? 2.8 : (fast ? 4.8 : 2.2);
        d += v;
        time.emplace_back(static_cast<double>(i));
        distance.emplace_back(d);
        velocity.emplace_back(v);
        hr.emplace_back((fast ? 168.0 : 138.0) + static_cast<double>(i % 4));
        cadence.emplace_back(fast ? 92.0 : 82.0);
    }
    StreamSet s;
    s.set(Channel::Time, std::move(time));
    s.set(Channel::Distance, std::move(distance));
    s.set(Channel::Velocity, std::move(velocity));
    s.set(Channel::HeartRate, std::move(hr));
    s.set(Channel::Cadence, std::move(cadence));
    return s;
}

static ActivitySummary make_summary(std::size_t n) {
    ActivitySummary s;
    s.type           = SportType::Run;
    s.moving_time_s  = static_cast<double>(n);
    s.elapsed_time_s = static_cast<double>(n);
    s.distance_m     = 3.5 * static_cast<double>(n);
    s.avg_hr         = 150.0;
    return s;
}

// ── Engine benchmarks ──────────────────────────────────────────────────────────

static void BM_Engine_SummaryOnly(benchmark::State& state) {
    const core::Engine engine;
    const core::AnalysisRequest req{.summary = make_summary(3600)};
    for (auto _ : state) {
        auto m = engine.analyze(req);
        benchmark::DoNotOptimize(m.effort_score);
    }
}
BENCHMARK(BM_Engine_SummaryOnly)->Unit(benchmark::kMicrosecond);

static void BM_Engine_Streams(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const core::Engine engine;
    const core::AnalysisRequest req{.summary = make_summary(n), .streams = make_session(n)};
    for (auto _ : state) {
        auto m = engine.analyze(req);
        benchmark::DoNotOptimize(m.effort_score);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Engine_Streams)->RangeMultiplier(2)->Range(1800, 14400)->Unit(benchmark::kMillisecond);

// ── Stage benchmarks ───────────────────────────────────────────────────────────

static void BM_Preprocess_Prepare(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto streams = make_session(n);
    for (auto _ : state) {
        auto p = preprocess::StreamPreprocessor::prepare(streams, SportType::Run);
        benchmark::DoNotOptimize(p.time.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Preprocess_Prepare)->RangeMultiplier(2)->Range(1800, 14400)->Unit(benchmark::kMicrosecond);

static void BM_Intervals_Detect(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const std::optional<preprocess::PreparedStreams> prepared =
        preprocess::StreamPreprocessor::prepare(make_session(n), SportType::Run);
    for (auto _ : state) {
        auto s = intervals::IntervalDetector::detect(prepared);
        benchmark::DoNotOptimize(s.has_value());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Intervals_Detect)->RangeMultiplier(2)->Range(1800, 14400)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
