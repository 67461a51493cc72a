/// @file src/core/types.cpp
/// @brief String conversions and helpers for the shared value types.

#include "chit/types.hpp"

#include <algorithm>

namespace chit {

const char* to_string(Classification c) noexcept {
    switch (c) {
        case Classification::Hyperbolic:    return "Hyperbolic";
        case Classification::Spherical:     return "Spherical";
        case Classification::Euclidean:     return "Euclidean";
        case Classification::Indeterminate: return "Indeterminate";
    }
    return "Indeterminate";
}

const char* to_string(AnalysisMode m) noexcept {
    switch (m) {
        case AnalysisMode::Heuristic: return "heuristic";
        case AnalysisMode::Exact:     return "exact";
    }
    return "heuristic";
}

const char* to_string(Condition c) noexcept {
    switch (c) {
        case Condition::InsufficientData: return "InsufficientDataError";
        case Condition::DataIntegrity:    return "DataIntegrityError";
        case Condition::Computation:      return "ComputationError";
        case Condition::BudgetExceeded:   return "BudgetExceededError";
        case Condition::Publish:          return "PublishError";
    }
    return "ComputationError";
}

const char* to_string(MetricsOrigin o) noexcept {
    switch (o) {
        case MetricsOrigin::Analyzer: return "analyzer";
        case MetricsOrigin::Override: return "override";
    }
    return "analyzer";
}

std::optional<AnalysisMode> parse_mode(std::string_view s) noexcept {
    if (s == "heuristic") return AnalysisMode::Heuristic;
    if (s == "exact")     return AnalysisMode::Exact;
    return std::nullopt;
}

bool ManifoldMetrics::has(Condition c) const noexcept {
    return std::find(conditions.begin(), conditions.end(), c) != conditions.end();
}

bool ManifoldMetrics::same_geometry(const ManifoldMetrics& other) const noexcept {
    return document_id    == other.document_id
        && shape_ratio    == other.shape_ratio
        && delta          == other.delta
        && curvature_k    == other.curvature_k
        && epsilon        == other.epsilon
        && classification == other.classification
        && mode           == other.mode
        && exact_used     == other.exact_used
        && sample_size    == other.sample_size
        && dropped_count  == other.dropped_count
        && origin         == other.origin
        && conditions     == other.conditions;
}

} // namespace chit
