/**
 * @file  prop_metrics_bounds.cpp
 * @brief Property: every analyzed metric stays inside its documented range.
 *
 * Run with 2,000 random inputs:
 *   RC_PARAMS="max_success=2000" ./prop_metrics_bounds
 *
 * Ranges checked for both modes:
 *   shape_ratio, delta, epsilon ∈ [0, 1]
 *   curvature_k                 ∈ [-5, 5]
 *   sample_size                 ≤ mode cap
 *   sample_size + dropped_count ≤ rows supplied
 *
 * Inputs mix Gaussian clouds at several scales with injected NaN / Inf rows
 * and rows of the wrong dimension.
 */

#include <rapidcheck.h>

#include <cmath>
#include <cstddef>
#include <limits>
#include <random>
#include <vector>

#include "chit/curvature.hpp"

using namespace chit;

namespace {

std::vector<RawVector> random_rows(std::size_t n, std::size_t dim, unsigned seed,
                                   double scale, std::size_t bad_every) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> g(0.0, 1.0);
    std::vector<RawVector> rows;
    rows.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        RawVector r(dim);
        for (auto& v : r) v = scale * g(rng);
        if (bad_every != 0 && i % bad_every == bad_every - 1) {
            switch (i % 3) {
                case 0: r[0] = std::numeric_limits<double>::quiet_NaN(); break;
                case 1: r[0] = std::numeric_limits<double>::infinity(); break;
                default: r.push_back(1.0); break;
            }
        }
        rows.push_back(std::move(r));
    }
    return rows;
}

bool in_unit(double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }

} // anonymous namespace

int main() {
    const sampling::SamplerLimits limits{};
    const auto analyze = curvature::make_analyze_function(limits, curvature::ExactBudget{});

    // ── Property 1: heuristic metrics are bounded ─────────────────────────────
    rc::check(
        "metrics_bounds: heuristic outputs within documented ranges",
        [&] {
            const auto n     = *rc::gen::inRange<std::size_t>(0, 160);
            const auto dim   = *rc::gen::inRange<std::size_t>(1, 9);
            const auto seed  = *rc::gen::arbitrary<unsigned>();
            const auto scale = *rc::gen::element(1e-6, 1.0, 1e3);
            const auto bad   = *rc::gen::inRange<std::size_t>(0, 6);

            const EmbeddingSet set{"p", random_rows(n, dim, seed, scale, bad)};
            const ManifoldMetrics m = analyze(set, AnalysisMode::Heuristic, {});

            RC_ASSERT(in_unit(m.shape_ratio));
            RC_ASSERT(in_unit(m.delta));
            RC_ASSERT(in_unit(m.epsilon));
            RC_ASSERT(std::isfinite(m.curvature_k));
            RC_ASSERT(m.curvature_k >= -5.0 && m.curvature_k <= 5.0);
            RC_ASSERT(m.sample_size <= limits.sample_cap);
            RC_ASSERT(m.sample_size + m.dropped_count <= n);
            RC_ASSERT(!m.exact_used);
        }
    );

    // ── Property 2: exact metrics are bounded ─────────────────────────────────
    rc::check(
        "metrics_bounds: exact outputs within documented ranges",
        [&] {
            const auto n     = *rc::gen::inRange<std::size_t>(0, 50);
            const auto dim   = *rc::gen::inRange<std::size_t>(1, 6);
            const auto seed  = *rc::gen::arbitrary<unsigned>();
            const auto scale = *rc::gen::element(1e-6, 1.0, 1e3);

            const EmbeddingSet set{"p", random_rows(n, dim, seed, scale, 0)};
            const ManifoldMetrics m = analyze(set, AnalysisMode::Exact, {});

            RC_ASSERT(in_unit(m.shape_ratio));
            RC_ASSERT(in_unit(m.delta));
            RC_ASSERT(in_unit(m.epsilon));
            RC_ASSERT(m.curvature_k >= -5.0 && m.curvature_k <= 5.0);
            RC_ASSERT(m.sample_size <= limits.exact_sample_cap);
            RC_ASSERT(m.mode == AnalysisMode::Exact);
        }
    );

    // ── Property 3: fewer than four usable rows is Indeterminate ──────────────
    rc::check(
        "metrics_bounds: under-sampled input yields zeroed Indeterminate",
        [&] {
            const auto n    = *rc::gen::inRange<std::size_t>(0, 4);
            const auto seed = *rc::gen::arbitrary<unsigned>();
            const EmbeddingSet set{"p", random_rows(n, 3, seed, 1.0, 0)};

            for (const auto mode : {AnalysisMode::Heuristic, AnalysisMode::Exact}) {
                const ManifoldMetrics m = analyze(set, mode, {});
                RC_ASSERT(m.classification == Classification::Indeterminate);
                RC_ASSERT(m.curvature_k == 0.0);
                RC_ASSERT(m.epsilon == 0.0);
                RC_ASSERT(m.has(Condition::InsufficientData));
            }
        }
    );

    return 0;
}
