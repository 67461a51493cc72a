/**
 * @file  fuzz_analyzer.cpp
 * @brief libFuzzer target for the sampler + curvature analyzer.
 *
 * Build:
 *   cmake -DCHIT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_analyzer
 *
 * Run for 60 seconds:
 *   ./fuzz_analyzer -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception for any doubles including NaN, ±Inf,
 *      ±0.0, subnormals and values near DBL_MAX.
 *   2. Every metric finite and in range; k sign matches the class.
 *   3. Both modes agree on classification when the exact scan was skipped.
 *
 * Fuzzer strategy:
 *   byte 0       → dimension (1..8)
 *   byte 1       → mode
 *   remaining    → doubles, row-major
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include "chit/curvature.hpp"

using namespace chit;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2) return 0;

    const std::size_t dim = 1 + data[0] % 8;
    const AnalysisMode mode = (data[1] & 1) ? AnalysisMode::Exact : AnalysisMode::Heuristic;
    data += 2;
    size -= 2;

    const std::size_t values = size / sizeof(double);
    EmbeddingSet set{"fuzz", {}};
    for (std::size_t i = 0; i + dim <= values && set.vectors.size() < 200; i += dim) {
        RawVector row(dim);
        __builtin_memcpy(row.data(), data + i * sizeof(double), dim * sizeof(double));
        set.vectors.push_back(std::move(row));
    }

    static const auto analyze = curvature::make_analyze_function(
        sampling::SamplerLimits{}, curvature::ExactBudget{});
    const ManifoldMetrics m = analyze(set, mode, {});

    // ── Invariant 2: ranges ───────────────────────────────────────────────────
    assert(std::isfinite(m.curvature_k));
    assert(m.curvature_k >= -5.0 && m.curvature_k <= 5.0);
    assert(m.epsilon >= 0.0 && m.epsilon <= 1.0);
    assert(m.shape_ratio >= 0.0 && m.shape_ratio <= 1.0);
    assert(m.delta >= 0.0 && m.delta <= 1.0);

    switch (m.classification) {
        case Classification::Hyperbolic:    assert(m.curvature_k < 0.0); break;
        case Classification::Spherical:     assert(m.curvature_k > 0.0); break;
        case Classification::Euclidean:     assert(std::abs(m.curvature_k) <= 1.0); break;
        case Classification::Indeterminate: assert(m.curvature_k == 0.0); break;
    }

    // ── Invariant 3: heuristic fallback ───────────────────────────────────────
    if (mode == AnalysisMode::Exact && !m.exact_used &&
        m.classification != Classification::Indeterminate) {
        assert(m.delta == m.shape_ratio);
    }

    return 0;
}
