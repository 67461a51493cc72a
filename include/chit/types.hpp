#pragma once

/// @file include/chit/types.hpp
/// @brief Shared value types for the geometry engine.
///
/// Embeddings arrive from the ingestion pipeline as plain `double` rows (they
/// may be ragged or contain NaN). Once sampled they are held as Eigen vectors,
/// which is the representation every numeric module works on.

#include <Eigen/Dense>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chit {

// ─── Embeddings ───────────────────────────────────────────────────────────────

/// One embedding row as supplied by the ingestion pipeline.
using RawVector = std::vector<double>;

/// A validated embedding inside a sample.
using Point = Eigen::VectorXd;

/// The embeddings of one document or corpus.
struct EmbeddingSet {
    std::string            document_id;
    std::vector<RawVector> vectors;
};

// ─── Enumerations ─────────────────────────────────────────────────────────────

/// Inferred shape of the embedding manifold.
enum class Classification {
    Hyperbolic,     ///< tree-like, k < -1
    Spherical,      ///< clustered / cyclic, k > 1
    Euclidean,      ///< flat, -1 ≤ k ≤ 1
    Indeterminate,  ///< not enough data, k = 0
};

/// Analysis path, selected once at the API boundary.
enum class AnalysisMode {
    Heuristic,  ///< centroid-distance coefficient of variation
    Exact,      ///< four-point Gromov hyperbolicity on a ≤30 point sample
};

/// Degraded-but-handled conditions raised while computing metrics.
/// None of these abort a request; all but `Publish` are recorded on the
/// result.
enum class Condition {
    InsufficientData,  ///< fewer than 4 usable vectors
    DataIntegrity,     ///< some vectors dropped (NaN / Inf / wrong dimension)
    Computation,       ///< derivation produced a non-finite value
    BudgetExceeded,    ///< exact path over its tuple or time budget
    /// Event bus rejected or failed a publish. Publishing happens after the
    /// response is built, so this only tags publisher log lines and is never
    /// stored in ManifoldMetrics::conditions.
    Publish,
};

/// Where a metrics record came from.
enum class MetricsOrigin {
    Analyzer,  ///< computed from real embeddings
    Override,  ///< synthesised from a caller-supplied packet
};

[[nodiscard]] const char* to_string(Classification c) noexcept;
[[nodiscard]] const char* to_string(AnalysisMode m) noexcept;
[[nodiscard]] const char* to_string(Condition c) noexcept;
[[nodiscard]] const char* to_string(MetricsOrigin o) noexcept;

/// Parse "heuristic" / "exact". Returns nullopt for anything else.
[[nodiscard]] std::optional<AnalysisMode> parse_mode(std::string_view s) noexcept;

// ─── ManifoldMetrics ──────────────────────────────────────────────────────────

/// Shape statistics and derived curvature parameters for one document.
struct ManifoldMetrics {
    std::string    document_id;
    double         shape_ratio    = 0.0;  ///< CV of centroid distances, [0,1]
    double         delta          = 0.0;  ///< hyperbolicity proxy, [0,1]
    double         curvature_k    = 0.0;  ///< [-5,5]
    double         epsilon        = 0.0;  ///< noise / temperature, [0,1]
    Classification classification = Classification::Indeterminate;
    AnalysisMode   mode           = AnalysisMode::Heuristic;
    bool           exact_used     = false;
    std::size_t    sample_size    = 0;
    std::size_t    dropped_count  = 0;
    MetricsOrigin  origin         = MetricsOrigin::Analyzer;
    std::vector<Condition> conditions;
    std::chrono::system_clock::time_point created_at{};

    /// True if `c` was raised while computing this record.
    [[nodiscard]] bool has(Condition c) const noexcept;

    /// Compare every field except `created_at`.
    [[nodiscard]] bool same_geometry(const ManifoldMetrics& other) const noexcept;
};

} // namespace chit
