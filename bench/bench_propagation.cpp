/**
 * @file  bench/bench_propagation.cpp
 * @brief Google Benchmark suite for error propagation and dispatch.
 *
 * Benchmarks
 * ----------
 *   BM_Add_Operator / BM_Multiply_Operator   : elementwise laws
 *   BM_Add_Dispatch                          : same law through the Dispatcher
 *   BM_Sum_Dispatch                          : closed-form reduction
 *   BM_Reshape_Dispatch                      : pass-through rule
 *   BM_AddInPlace                            : in-place buffer update
 *
 * Build (CMake):
 *   cmake -DAUNC_BENCH=ON ..
 *   cmake --build build --target bench_propagation
 *   ./build/bench_propagation --benchmark_format=json
 *
 * Throughput units: items/second (elements processed).
 */

#include "benchmark/benchmark.h"

#include "aunc/dispatch.hpp"
#include "aunc/registry.hpp"
#include "aunc/uncertainty.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// n values spread over [1, 2] with a 1% error.
static aunc::Uncertainty make_values(std::size_t n) {
    const auto count = static_cast<aunc::Index>(n);
    Eigen::ArrayXd nominal = Eigen::ArrayXd::LinSpaced(count, 1.0, 2.0);
    Eigen::ArrayXd error   = nominal * 0.01;
    return aunc::Uncertainty(aunc::NDArray(aunc::Shape{count}, std::move(nominal)),
                             aunc::NDArray(aunc::Shape{count}, std::move(error)));
}

static void set_throughput(benchmark::State& state, std::size_t n) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

// ── Operators ──────────────────────────────────────────────────────────────────

static void BM_Add_Operator(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto x = make_values(n);
    const auto y = make_values(n);
    for (auto _ : state) {
        auto r = x + y;
        benchmark::DoNotOptimize(r.error().values().data());
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Add_Operator)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

static void BM_Multiply_Operator(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto x = make_values(n);
    const auto y = make_values(n);
    for (auto _ : state) {
        auto r = x * y;
        benchmark::DoNotOptimize(r.error().values().data());
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Multiply_Operator)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

static void BM_AddInPlace(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    auto x = make_values(n);
    const auto y = make_values(n);
    for (auto _ : state) {
        x += y;
        benchmark::ClobberMemory();
    }
    set_throughput(state, n);
}
BENCHMARK(BM_AddInPlace)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

// ── Dispatcher ─────────────────────────────────────────────────────────────────

static void BM_Add_Dispatch(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto registry = aunc::make_default_registry();
    const aunc::Dispatcher dispatcher(registry);
    const auto x = make_values(n);
    const auto y = make_values(n);
    for (auto _ : state) {
        auto r = dispatcher.ufunc("add", {x, y});
        benchmark::DoNotOptimize(r.error().values().data());
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Add_Dispatch)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

static void BM_Sum_Dispatch(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto registry = aunc::make_default_registry();
    const aunc::Dispatcher dispatcher(registry);
    const auto x = make_values(n);
    for (auto _ : state) {
        auto r = dispatcher.function("sum", {x});
        benchmark::DoNotOptimize(r.error().values().data());
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Sum_Dispatch)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

static void BM_Reshape_Dispatch(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto registry = aunc::make_default_registry();
    const aunc::Dispatcher dispatcher(registry);
    const auto x = make_values(n);
    const aunc::Params params{{"shape", aunc::Shape{2, -1}}};
    for (auto _ : state) {
        auto r = dispatcher.function("reshape", {x}, params);
        benchmark::DoNotOptimize(r.error().values().data());
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Reshape_Dispatch)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

// ── Micro: registry lookup ─────────────────────────────────────────────────────

static void BM_Registry_Find(benchmark::State& state) {
    const auto registry = aunc::make_default_registry();
    for (auto _ : state) {
        const aunc::Rule* rule = registry.find(aunc::CallKind::ufunc, "true_divide");
        benchmark::DoNotOptimize(rule);
    }
}
BENCHMARK(BM_Registry_Find);

BENCHMARK_MAIN();
