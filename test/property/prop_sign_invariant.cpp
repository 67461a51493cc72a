/**
 * @file  prop_sign_invariant.cpp
 * @brief Property: the sign of curvature_k always agrees with the class.
 *
 *   Hyperbolic    ⇒ k ≤ −1
 *   Spherical     ⇒ k ≥ +1
 *   Euclidean     ⇒ −1 ≤ k ≤ +1
 *   Indeterminate ⇒ k = 0
 *
 * The generated packet always carries the surface of the same class, so a
 * renderer can never draw a sphere for a tree-like document.
 */

#include <rapidcheck.h>

#include <cmath>
#include <cstddef>
#include <random>
#include <vector>

#include "chit/chit_packet.hpp"
#include "chit/curvature.hpp"

using namespace chit;

namespace {

/// Points along a few random rays from the origin: tree-like at small n,
/// blob-like once the rays fill in.
std::vector<RawVector> ray_rows(std::size_t n, std::size_t rays, unsigned seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> g(0.0, 1.0);
    std::uniform_real_distribution<double> t(0.0, 10.0);

    std::vector<RawVector> dirs(rays, RawVector(3));
    for (auto& d : dirs)
        for (auto& v : d) v = g(rng);

    std::vector<RawVector> rows;
    for (std::size_t i = 0; i < n; ++i) {
        const auto& d = dirs[i % rays];
        const double s = t(rng);
        rows.push_back({d[0] * s, d[1] * s, d[2] * s});
    }
    return rows;
}

bool consistent(const ManifoldMetrics& m) {
    switch (m.classification) {
        case Classification::Hyperbolic:    return m.curvature_k <= -1.0;
        case Classification::Spherical:     return m.curvature_k >= 1.0;
        case Classification::Euclidean:     return std::abs(m.curvature_k) <= 1.0;
        case Classification::Indeterminate: return m.curvature_k == 0.0;
    }
    return false;
}

} // anonymous namespace

int main() {
    const auto analyze = curvature::make_analyze_function(sampling::SamplerLimits{},
                                                          curvature::ExactBudget{});

    // ── Property 1: analyzer output ───────────────────────────────────────────
    rc::check(
        "sign_invariant: class and curvature sign agree in both modes",
        [&] {
            const auto n    = *rc::gen::inRange<std::size_t>(4, 60);
            const auto rays = *rc::gen::inRange<std::size_t>(1, 12);
            const auto seed = *rc::gen::arbitrary<unsigned>();
            const EmbeddingSet set{"p", ray_rows(n, rays, seed)};

            for (const auto mode : {AnalysisMode::Heuristic, AnalysisMode::Exact}) {
                const ManifoldMetrics m = analyze(set, mode, {});
                RC_ASSERT(consistent(m));

                const auto packet = render::ChitConfigGenerator::generate(m);
                RC_ASSERT(packet.surface_fn ==
                          render::ChitConfigGenerator::surface_for(
                              render::ChitConfigGenerator::classification_for(m.curvature_k)));
            }
        }
    );

    // ── Property 2: derive_curvature over arbitrary statistics ────────────────
    rc::check(
        "sign_invariant: derive_curvature respects the class band",
        [] {
            const double sr    = *rc::gen::inRange(0, 1001) / 1000.0;
            const double delta = *rc::gen::inRange(0, 1001) / 1000.0;
            const bool   exact = *rc::gen::arbitrary<bool>();

            ManifoldMetrics m;
            m.classification = curvature::CurvatureAnalyzer::classify(sr);
            m.curvature_k = curvature::CurvatureAnalyzer::derive_curvature(
                m.classification, sr, delta, exact);
            RC_ASSERT(consistent(m));
        }
    );

    // ── Property 3: packet normalisation keeps sign and surface in step ───────
    rc::check(
        "sign_invariant: normalize derives the surface from sign(k)",
        [](double k) {
            render::ChitGeometryPacket p;
            p.curvature_k = k;
            p.surface_fn  = render::SurfaceFn::Sphere;
            const auto n = render::ChitConfigGenerator::normalize(p);

            RC_ASSERT(std::isfinite(n.curvature_k));
            if (n.curvature_k < -1.0) RC_ASSERT(n.surface_fn == render::SurfaceFn::Tractrix);
            if (n.curvature_k > 1.0)  RC_ASSERT(n.surface_fn == render::SurfaceFn::Sphere);
        }
    );

    return 0;
}
