/**
 * @file  bench/bench_indicators.cpp
 * @brief Google Benchmark suite for indicator and strategy evaluation.
 *
 * Benchmarks
 * ----------
 *   BM_IndicatorRow        one row over a full history (builtin set)
 *   BM_IndicatorSeries     the per-date series strategies consume
 *   BM_StrategyEvaluate    builtin strategies over N instruments
 *   BM_MemoryStoreCommit   normalise + commit one date partition
 *
 * Build (CMake):
 *   cmake -DSIFT_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_indicators
 *   ./build/bench_indicators --benchmark_format=json
 *
 * Custom counter "instruments_per_sec" on the per-date benchmarks.
 */

#include "benchmark/benchmark.h"

#include "sift/constants.hpp"
#include "sift/indicators.hpp"
#include "sift/store.hpp"
#include "sift/strategy.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

using namespace sift;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// A deterministic wavy price path of `n` bars.
static std::vector<Bar> make_history(const std::string& code, std::size_t n, double phase = 0.0) {
    std::vector<Bar> bars;
    bars.reserve(n);
    const auto start = TradingDate::from_ymd(2022, 1, 3);
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i);
        const double close = 20.0 + 0.02 * t + 2.0 * std::sin(0.15 * t + phase);
        bars.push_back(Bar{.code = code, .date = start.plus_days(static_cast<std::int32_t>(i)),
                           .open = close * 0.995, .high = close * 1.01, .low = close * 0.99,
                           .close = close, .volume = 1.0e6 + 1.0e5 * std::cos(t),
                           .amount = close * 1.0e6});
    }
    return bars;
}

static const indicator::IndicatorEngine& engine() {
    static const indicator::IndicatorEngine e(indicator::builtin_indicator_set());
    return e;
}

// ── Indicators ────────────────────────────────────────────────────────────────

static void BM_IndicatorRow(benchmark::State& state) {
    const auto bars = make_history("A", static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto row = engine().compute(bars);
        benchmark::DoNotOptimize(row);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_IndicatorRow)->Arg(60)->Arg(250)->Arg(320)->Unit(benchmark::kMicrosecond);

static void BM_IndicatorSeries(benchmark::State& state) {
    const auto bars = make_history("A", constants::DEFAULT_HISTORY_BARS);
    const auto rows = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        auto series = engine().compute_series(bars, rows);
        benchmark::DoNotOptimize(series);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_IndicatorSeries)->Arg(1)->Arg(constants::DEFAULT_STRATEGY_ROWS)
    ->Unit(benchmark::kMillisecond);

// ── Strategies ────────────────────────────────────────────────────────────────

static void BM_StrategyEvaluate(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    std::vector<strategy::StrategyInput> inputs;
    std::vector<IndicatorRow> day_rows;
    inputs.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const std::string code = std::to_string(600000 + i);
        auto bars = make_history(code, constants::DEFAULT_HISTORY_BARS, static_cast<double>(i));
        auto rows = engine().compute_series(bars, constants::DEFAULT_STRATEGY_ROWS);
        day_rows.push_back(rows.back());
        inputs.push_back(strategy::StrategyInput{
            .instrument = Instrument{.code = code},
            .bars       = std::move(bars),
            .rows       = std::move(rows),
        });
    }
    const TradingDate date = inputs.front().bars.back().date;
    const auto market = strategy::MarketSnapshot::from_rows(date, day_rows);
    const strategy::StrategyEngine strategies(strategy::builtin_strategy_set());

    for (auto _ : state) {
        auto report = strategies.evaluate(date, inputs, market);
        benchmark::DoNotOptimize(report);
    }
    state.counters["instruments_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(n),
        benchmark::Counter::kIsRate);
}
BENCHMARK(BM_StrategyEvaluate)->Arg(16)->Arg(256)->Unit(benchmark::kMillisecond);

// ── Store ─────────────────────────────────────────────────────────────────────

static void BM_MemoryStoreCommit(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const TradingDate date = TradingDate::from_ymd(2024, 1, 2);
    store::DateBatch batch{.date = date};
    for (std::size_t i = 0; i < n; ++i) {
        const std::string code = std::to_string(n - i);
        auto bar = make_history(code, 1).front();
        bar.date = date;
        batch.bars.push_back(bar);
        batch.indicators.push_back(IndicatorRow{.code = code, .date = date,
                                                .values = {{"ma5", bar.close}}});
    }

    store::MemoryStore store;
    for (auto _ : state) {
        auto failure = store.commit(batch);
        benchmark::DoNotOptimize(failure);
    }
    state.counters["instruments_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(n),
        benchmark::Counter::kIsRate);
}
BENCHMARK(BM_MemoryStoreCommit)->Arg(500)->Arg(5000)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
