/**
 * @file  bench/bench_exact_delta.cpp
 * @brief Google Benchmark suite for the curvature analyzer hot paths.
 *
 * Benchmarks
 * ----------
 *   BM_PairwiseDistances   - O(N²·D) distance matrix
 *   BM_FourPointScan       - O(N⁴) subset scan on a precomputed matrix
 *   BM_Analyze_Heuristic   - sampler + heuristic analyzer, 100-point cap
 *   BM_Analyze_Exact       - sampler + exact analyzer, 30-point cap
 *
 * Build (CMake):
 *   cmake -DCHIT_BENCH=ON ..
 *   cmake --build build --target bench_exact_delta
 *   ./build/bench_exact_delta --benchmark_format=json
 *
 * Throughput units: items/second, where an item is one four-point subset
 * for the scan and one input row for the analyze benchmarks.
 */

#include "benchmark/benchmark.h"

// Internal scan header (needs src/ on the include path)
#include "curvature/four_point.hpp"

#include "chit/curvature.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N points drawn from a standard normal in `dim` dimensions (fixed seed).
static std::vector<chit::Point> make_points(std::size_t n, Eigen::Index dim) {
    std::mt19937 rng(1234);
    std::normal_distribution<double> g(0.0, 1.0);
    std::vector<chit::Point> pts;
    pts.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        chit::Point p(dim);
        for (Eigen::Index j = 0; j < dim; ++j) p(j) = g(rng);
        pts.push_back(std::move(p));
    }
    return pts;
}

static chit::EmbeddingSet make_set(std::size_t n, std::size_t dim) {
    std::mt19937 rng(99);
    std::normal_distribution<double> g(0.0, 1.0);
    chit::EmbeddingSet set{"bench", std::vector<chit::RawVector>(n, chit::RawVector(dim))};
    for (auto& r : set.vectors)
        for (auto& v : r) v = g(rng);
    return set;
}

// ── Distance matrix ────────────────────────────────────────────────────────────

static void BM_PairwiseDistances(benchmark::State& state) {
    const auto pts = make_points(static_cast<std::size_t>(state.range(0)), 768);
    for (auto _ : state) {
        auto d = chit::curvature::detail::pairwise_distances(pts);
        benchmark::DoNotOptimize(d.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0) * state.range(0) / 2);
}
BENCHMARK(BM_PairwiseDistances)->Arg(10)->Arg(30)->Arg(60);

// ── Four-point scan ────────────────────────────────────────────────────────────

static void BM_FourPointScan(benchmark::State& state) {
    const auto n    = static_cast<std::size_t>(state.range(0));
    const auto dist = chit::curvature::detail::pairwise_distances(make_points(n, 16));
    for (auto _ : state) {
        const auto r = chit::curvature::detail::four_point_delta(
            dist, std::chrono::steady_clock::time_point::max(), {});
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() *
        static_cast<int64_t>(chit::curvature::CurvatureAnalyzer::tuple_count(n)));
}
BENCHMARK(BM_FourPointScan)->Arg(10)->Arg(20)->Arg(30)->Arg(40)->Unit(benchmark::kMicrosecond);

// ── End-to-end analysis ────────────────────────────────────────────────────────

static void BM_Analyze(benchmark::State& state, chit::AnalysisMode mode) {
    const auto set = make_set(static_cast<std::size_t>(state.range(0)), 384);
    const auto analyze = chit::curvature::make_analyze_function(
        chit::sampling::SamplerLimits{}, chit::curvature::ExactBudget{});
    for (auto _ : state) {
        auto m = analyze(set, mode, {});
        benchmark::DoNotOptimize(m.curvature_k);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_CAPTURE(BM_Analyze, Heuristic, chit::AnalysisMode::Heuristic)
    ->Arg(100)->Arg(1000)->Arg(10000)->Unit(benchmark::kMicrosecond);
BENCHMARK_CAPTURE(BM_Analyze, Exact, chit::AnalysisMode::Exact)
    ->Arg(100)->Arg(1000)->Arg(10000)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
