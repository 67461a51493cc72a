#pragma once

/// @file include/chit/curvature.hpp
/// @brief Curvature Analyzer: shape classification of embedding samples.
///
/// # Module: Curvature Analyzer
///
/// ## Responsibility
/// Infer whether a sampled embedding cloud is tree-like (Hyperbolic),
/// clustered (Spherical) or flat (Euclidean), and derive the renderer
/// parameters `curvature_k` and `epsilon` from it.
///
/// ## Heuristic path (default)
///   c           = mean(xᵢ)
///   dᵢ          = ‖xᵢ − c‖
///   shape_ratio = std(d) / mean(d)            clamped to [0, 1]
///   delta       = shape_ratio
///
///   shape_ratio > 0.5 → Hyperbolic
///   shape_ratio < 0.2 → Spherical
///   otherwise         → Euclidean
///
/// ## Exact path (opt-in)
/// For every four-point subset {a,b,c,d}:
///   S₁ = d(a,b)+d(c,d),  S₂ = d(a,c)+d(b,d),  S₃ = d(a,d)+d(b,c)
///   δ(a,b,c,d) = (largest − second largest) / 2
/// δ = max over all subsets. Tree metrics have δ = 0, so the reported value
/// is oriented for display: delta = 1 − clamp(2δ / diameter, 0, 1).
/// The scan is bounded by a tuple budget, a wall-clock deadline and an
/// optional stop token; exhausting any of them falls back to the heuristic
/// path with `exact_used = false`.
///
/// ## Parameters
///   Hyperbolic: k = −1 − 4·f(delta)
///   Spherical:  k =  1 + 4·f(1 − shape_ratio)
///   Euclidean:  k linear from +1 (shape_ratio = 0.2) to −1 (shape_ratio = 0.5)
///   epsilon     = std / mean of nearest-neighbour distances, clamped to [0, 1]
/// where f normalises its input band into [MIN_CURVATURE_STRENGTH, 1].
///
/// ## Guarantees
/// - Never throws for any finite or non-finite input
/// - All outputs finite and within their documented ranges
/// - Deterministic: identical samples give identical metrics

#include "chit/constants.hpp"
#include "chit/sampler.hpp"
#include "chit/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <stop_token>
#include <string>

namespace chit::curvature {

// ─── ExactBudget ──────────────────────────────────────────────────────────────

/// Work limits for the O(N⁴) exact path.
struct ExactBudget {
    std::size_t               max_tuples  = constants::DEFAULT_EXACT_MAX_TUPLES;
    std::chrono::milliseconds time_budget{constants::DEFAULT_EXACT_BUDGET_MS};
};

// ─── CurvatureAnalyzer ────────────────────────────────────────────────────────

class CurvatureAnalyzer {
public:
    explicit CurvatureAnalyzer(ExactBudget budget = ExactBudget{}) noexcept;

    /// Compute metrics for an already-sampled document.
    ///
    /// # Arguments
    /// * `document_id` - copied onto the result
    /// * `sample`      - output of EmbeddingSampler
    /// * `mode`        - heuristic or exact
    /// * `stop`        - cancels the exact scan (falls back to heuristic)
    [[nodiscard]] ManifoldMetrics
    analyze(const std::string& document_id,
            const sampling::Sample& sample,
            AnalysisMode mode,
            std::stop_token stop = {}) const;

    /// Normalised, display-oriented four-point delta of `points`.
    ///
    /// # Returns
    /// delta ∈ [0, 1] (1 = perfect tree metric), or `nullopt` if the sample
    /// needs more subsets than `max_tuples`, the deadline passes, or `stop`
    /// is requested.
    [[nodiscard]] std::optional<double>
    exact_delta(std::span<const Point> points,
                std::stop_token stop = {}) const noexcept;

    /// Coefficient of variation of centroid distances, clamped to [0, 1].
    /// NaN if the statistic is not finite.
    [[nodiscard]] static double
    shape_ratio(std::span<const Point> points) noexcept;

    /// Coefficient of variation of nearest-neighbour distances, clamped to
    /// [0, 1]. NaN if not finite.
    [[nodiscard]] static double
    neighbor_dispersion(std::span<const Point> points) noexcept;

    /// Threshold classification of a shape ratio.
    [[nodiscard]] static Classification classify(double shape_ratio) noexcept;

    /// Map a classification and its statistics onto k ∈ [-5, 5].
    [[nodiscard]] static double
    derive_curvature(Classification cls,
                     double shape_ratio,
                     double delta,
                     bool exact_used) noexcept;

    /// Number of four-point subsets of n points, C(n, 4).
    [[nodiscard]] static std::size_t tuple_count(std::size_t n) noexcept;

    [[nodiscard]] const ExactBudget& budget() const noexcept { return budget_; }

private:
    /// Zeroed Indeterminate metrics.
    static void reset_to_indeterminate(ManifoldMetrics& m) noexcept;

    ExactBudget budget_;
};

// ─── Analyze function ─────────────────────────────────────────────────────────

/// Sampler + analyzer as one callable: the unit the query API caches.
using AnalyzeFunction =
    std::function<ManifoldMetrics(const EmbeddingSet&, AnalysisMode, std::stop_token)>;

/// Build the production analyze function.
[[nodiscard]] AnalyzeFunction
make_analyze_function(sampling::SamplerLimits limits, ExactBudget budget);

} // namespace chit::curvature
