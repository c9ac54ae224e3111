/**
 * @file  bench/bench_valuation.cpp
 * @brief Google Benchmark suite for the ValueLens formulas.
 *
 * Benchmarks
 * ----------
 *   BM_IntrinsicValue        — DCF accumulator, 1 … 1024 years
 *   BM_ProjectCashFlows      — DCF schedule (allocates three Eigen vectors)
 *   BM_Ratios_All            — all single-period ratios for one statement
 *   BM_Report_Evaluate       — full report, default assumptions
 *
 * Build (CMake):
 *   cmake -DVALUELENS_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_valuation
 *   ./build/bench_valuation --benchmark_format=json
 *
 * Throughput units: items/second (projected years or statements processed).
 */

#include "benchmark/benchmark.h"

#include "valuelens/dcf.hpp"
#include "valuelens/ratios.hpp"
#include "valuelens/report.hpp"

#include <cstdint>

// ── DCF ────────────────────────────────────────────────────────────────────────

static void BM_IntrinsicValue(benchmark::State& state) {
    const auto years = static_cast<std::uint32_t>(state.range(0));
    double v = 1000.0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(v);
        double iv = valuelens::dcf::intrinsic_value(v, 0.05, 0.10, years);
        benchmark::DoNotOptimize(iv);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_IntrinsicValue)->RangeMultiplier(4)->Range(1, 1024);

static void BM_ProjectCashFlows(benchmark::State& state) {
    const auto years = static_cast<std::uint32_t>(state.range(0));
    for (auto _ : state) {
        auto schedule = valuelens::dcf::project_cash_flows(1000.0, 0.05, 0.10, years);
        benchmark::DoNotOptimize(schedule.total);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_ProjectCashFlows)->RangeMultiplier(4)->Range(1, 1024);

// ── Ratios ─────────────────────────────────────────────────────────────────────

static void BM_Ratios_All(benchmark::State& state) {
    double ni = 1000.0, eq = 2000.0, ta = 3000.0, tl = 1000.0, ia = 500.0, sh = 100.0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(ni);
        benchmark::DoNotOptimize(eq);
        auto a = valuelens::ratios::return_on_equity(ni, eq);
        auto b = valuelens::ratios::return_on_net_tangible_assets(ni, ta, tl, ia);
        auto c = valuelens::ratios::debt_to_equity(tl, eq);
        auto d = valuelens::ratios::earnings_per_share(ni, sh);
        benchmark::DoNotOptimize(a);
        benchmark::DoNotOptimize(b);
        benchmark::DoNotOptimize(c);
        benchmark::DoNotOptimize(d);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Ratios_All);

// ── Report ─────────────────────────────────────────────────────────────────────

static void BM_Report_Evaluate(benchmark::State& state) {
    const valuelens::FinancialStatement st{
        .net_income                = 1000.0,
        .depreciation_amortization = 200.0,
        .maintenance_capex         = 150.0,
        .shareholders_equity       = 2000.0,
        .total_assets              = 3000.0,
        .total_liabilities         = 1000.0,
        .intangible_assets         = 500.0,
        .shares_outstanding        = 100.0,
    };
    for (auto _ : state) {
        auto r = valuelens::report::evaluate(st, valuelens::ValuationConfig{}, 60.0);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Report_Evaluate);

BENCHMARK_MAIN();
