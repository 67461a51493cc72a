#pragma once

/// @file include/chit/sampler.hpp
/// @brief Embedding Sampler: bounded, deterministic subset selection.
///
/// # Module: Embedding Sampler
///
/// ## Responsibility
/// Reduce an arbitrarily large embedding collection to a bounded, ordered
/// subset the analyzer can afford: at most `sample_cap` points (100) in
/// heuristic mode, at most `exact_sample_cap` points (30) in exact mode.
///
/// ## Selection
/// 1. Drop rows that are empty or contain NaN/±Inf. Among the rest, the
///    dimension shared by the most rows wins (ties go to the dimension seen
///    first); rows of any other dimension are dropped. Dropped rows are
///    counted.
/// 2. If n usable rows ≤ cap, keep them all; otherwise keep the stride
///    indices ⌊i·n/cap⌋ for i ∈ [0, cap).
///
/// ## Guarantees
/// - Same input + same mode ⇒ same sample (no randomness)
/// - Input order is preserved
/// - Never throws; insufficient data is reported via `Sample::sufficient()`

#include "chit/constants.hpp"
#include "chit/types.hpp"

#include <cstddef>
#include <vector>

namespace chit::sampling {

/// Caps applied by the sampler.
struct SamplerLimits {
    std::size_t sample_cap       = constants::DEFAULT_SAMPLE_CAP;
    std::size_t exact_sample_cap = constants::DEFAULT_EXACT_SAMPLE_CAP;

    /// Cap in force for `mode`.
    [[nodiscard]] std::size_t cap_for(AnalysisMode mode) const noexcept;
};

/// The sampled points of one document.
struct Sample {
    std::vector<Point> points;
    std::size_t        source_count  = 0;  ///< rows supplied
    std::size_t        dropped_count = 0;  ///< rows rejected as unusable
    std::size_t        usable_count  = 0;  ///< rows that passed validation

    /// True when at least MIN_SAMPLE_SIZE points were selected.
    [[nodiscard]] bool sufficient() const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return points.size(); }
};

/// Deterministic stride sampler.
class EmbeddingSampler {
public:
    explicit EmbeddingSampler(SamplerLimits limits = SamplerLimits{}) noexcept;

    /// Validate and sub-sample `vectors` for `mode`.
    [[nodiscard]] Sample sample(const std::vector<RawVector>& vectors,
                                AnalysisMode mode) const;

    /// Stride indices selecting `cap` of `n` items, ascending.
    /// Returns [0, n) unchanged when n ≤ cap.
    [[nodiscard]] static std::vector<std::size_t>
    stride_indices(std::size_t n, std::size_t cap);

    [[nodiscard]] const SamplerLimits& limits() const noexcept { return limits_; }

private:
    /// True if every component is finite.
    [[nodiscard]] static bool is_finite_row(const RawVector& row) noexcept;

    SamplerLimits limits_;
};

} // namespace chit::sampling
