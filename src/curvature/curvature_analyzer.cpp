/// @file src/curvature/curvature_analyzer.cpp
/// @brief Heuristic and exact manifold classification.

#include "chit/curvature.hpp"
#include "chit/logging.hpp"

#include "four_point.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace chit::curvature {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/// Clamp into [MIN_CURVATURE_STRENGTH, 1].
double strength(double x) noexcept {
    return std::clamp(x, constants::MIN_CURVATURE_STRENGTH, 1.0);
}

/// Population coefficient of variation; NaN when not finite.
double coefficient_of_variation(const std::vector<double>& values) noexcept {
    if (values.empty()) {
        return NaN;
    }
    const double n = static_cast<double>(values.size());
    double sum = 0.0;
    for (double v : values) sum += v;
    const double mean = sum / n;

    double sq = 0.0;
    for (double v : values) {
        const double d = v - mean;
        sq += d * d;
    }
    const double stddev = std::sqrt(sq / n);
    const double cv = stddev / (mean + constants::DISTANCE_EPSILON);
    if (!std::isfinite(cv)) {
        return NaN;
    }
    return std::clamp(cv, 0.0, 1.0);
}

} // anonymous namespace

// ─── Construction ─────────────────────────────────────────────────────────────

CurvatureAnalyzer::CurvatureAnalyzer(ExactBudget budget) noexcept
    : budget_(budget) {}

// ─── Statistics ───────────────────────────────────────────────────────────────

double CurvatureAnalyzer::shape_ratio(std::span<const Point> points) noexcept {
    if (points.empty()) {
        return NaN;
    }
    Point centroid = Point::Zero(points.front().size());
    for (const auto& p : points) centroid += p;
    centroid /= static_cast<double>(points.size());

    std::vector<double> dists;
    dists.reserve(points.size());
    for (const auto& p : points) {
        dists.push_back((p - centroid).norm());
    }
    return coefficient_of_variation(dists);
}

double CurvatureAnalyzer::neighbor_dispersion(std::span<const Point> points) noexcept {
    if (points.size() < 2) {
        return NaN;
    }
    const Eigen::MatrixXd dist = detail::pairwise_distances(points);
    const Eigen::Index n = dist.rows();

    std::vector<double> nearest;
    nearest.reserve(points.size());
    for (Eigen::Index i = 0; i < n; ++i) {
        double best = std::numeric_limits<double>::infinity();
        for (Eigen::Index j = 0; j < n; ++j) {
            if (i != j) best = std::min(best, dist(i, j));
        }
        nearest.push_back(best);
    }
    return coefficient_of_variation(nearest);
}

Classification CurvatureAnalyzer::classify(double shape_ratio) noexcept {
    if (shape_ratio > constants::HYPERBOLIC_THRESHOLD) return Classification::Hyperbolic;
    if (shape_ratio < constants::SPHERICAL_THRESHOLD)  return Classification::Spherical;
    return Classification::Euclidean;
}

double CurvatureAnalyzer::derive_curvature(Classification cls,
                                           double shape_ratio,
                                           double delta,
                                           bool exact_used) noexcept {
    using namespace constants;

    switch (cls) {
        case Classification::Hyperbolic: {
            // Heuristic delta lives in (0.5, 1]; the exact delta in [0, 1].
            const double f = exact_used
                ? strength(delta)
                : strength((delta - HYPERBOLIC_THRESHOLD) / (1.0 - HYPERBOLIC_THRESHOLD));
            return -1.0 - CURVATURE_SPAN * f;
        }
        case Classification::Spherical: {
            // 1 − shape_ratio lives in (0.8, 1].
            const double compactness = 1.0 - shape_ratio;
            const double floor       = 1.0 - SPHERICAL_THRESHOLD;
            const double f = strength((compactness - floor) / (1.0 - floor));
            return 1.0 + CURVATURE_SPAN * f;
        }
        case Classification::Euclidean: {
            const double band = HYPERBOLIC_THRESHOLD - SPHERICAL_THRESHOLD;
            const double t = std::clamp((shape_ratio - SPHERICAL_THRESHOLD) / band, 0.0, 1.0);
            return 1.0 - 2.0 * t;
        }
        case Classification::Indeterminate:
            break;
    }
    return 0.0;
}

std::size_t CurvatureAnalyzer::tuple_count(std::size_t n) noexcept {
    if (n < 4) {
        return 0;
    }
    // Divide as we go so intermediate products stay small.
    std::size_t c = n * (n - 1) / 2;
    c = c * (n - 2) / 3;
    c = c * (n - 3) / 4;
    return c;
}

// ─── Exact path ───────────────────────────────────────────────────────────────

std::optional<double>
CurvatureAnalyzer::exact_delta(std::span<const Point> points,
                               std::stop_token stop) const noexcept {
    if (points.size() < constants::MIN_SAMPLE_SIZE) {
        return std::nullopt;
    }
    if (tuple_count(points.size()) > budget_.max_tuples) {
        return std::nullopt;
    }

    const auto deadline = std::chrono::steady_clock::now() + budget_.time_budget;
    const Eigen::MatrixXd dist = detail::pairwise_distances(points);
    const auto scan = detail::four_point_delta(dist, deadline, stop);
    if (!scan) {
        return std::nullopt;
    }

    if (!(scan->diameter > constants::DISTANCE_EPSILON)) {
        // Collapsed sample: no tree structure to speak of.
        return 0.0;
    }
    const double normalized = std::clamp(2.0 * scan->raw_delta / scan->diameter, 0.0, 1.0);
    return 1.0 - normalized;
}

// ─── analyze ──────────────────────────────────────────────────────────────────

void CurvatureAnalyzer::reset_to_indeterminate(ManifoldMetrics& m) noexcept {
    m.shape_ratio    = 0.0;
    m.delta          = 0.0;
    m.curvature_k    = 0.0;
    m.epsilon        = 0.0;
    m.classification = Classification::Indeterminate;
    m.exact_used     = false;
}

ManifoldMetrics
CurvatureAnalyzer::analyze(const std::string& document_id,
                           const sampling::Sample& sample,
                           AnalysisMode mode,
                           std::stop_token stop) const {
    ManifoldMetrics m;
    m.document_id   = document_id;
    m.mode          = mode;
    m.sample_size   = sample.size();
    m.dropped_count = sample.dropped_count;
    m.origin        = MetricsOrigin::Analyzer;
    m.created_at    = std::chrono::system_clock::now();

    auto lg = log::logger();

    if (sample.dropped_count > 0) {
        m.conditions.push_back(Condition::DataIntegrity);
        lg->debug("{}: dropped {} of {} embeddings (non-finite or wrong dimension)",
                  document_id, sample.dropped_count, sample.source_count);
    }

    if (!sample.sufficient()) {
        m.conditions.push_back(Condition::InsufficientData);
        reset_to_indeterminate(m);
        lg->debug("{}: {} usable embeddings, shape is indeterminate",
                  document_id, sample.size());
        return m;
    }

    const std::span<const Point> points(sample.points);

    // ── Step 1: heuristic statistics ──────────────────────────────────────────
    const double ratio = shape_ratio(points);
    const double eps   = neighbor_dispersion(points);

    m.shape_ratio    = ratio;
    m.epsilon        = eps;
    m.classification = classify(ratio);
    m.delta          = ratio;

    // ── Step 2: optional exact delta ──────────────────────────────────────────
    if (mode == AnalysisMode::Exact) {
        const auto exact = exact_delta(points, stop);
        if (exact) {
            m.delta      = *exact;
            m.exact_used = true;
        } else {
            m.conditions.push_back(Condition::BudgetExceeded);
            lg->warn("{}: exact delta over budget for {} points ({} subsets, {} ms), "
                     "using heuristic",
                     document_id, points.size(), tuple_count(points.size()),
                     budget_.time_budget.count());
        }
    }

    // ── Step 3: curvature ─────────────────────────────────────────────────────
    m.curvature_k = derive_curvature(m.classification, m.shape_ratio, m.delta, m.exact_used);

    if (!std::isfinite(m.shape_ratio) || !std::isfinite(m.delta) ||
        !std::isfinite(m.curvature_k) || !std::isfinite(m.epsilon)) {
        m.conditions.push_back(Condition::Computation);
        reset_to_indeterminate(m);
        lg->warn("{}: non-finite shape statistics, falling back to indeterminate",
                 document_id);
        return m;
    }

    m.curvature_k = std::clamp(m.curvature_k, constants::CURVATURE_MIN, constants::CURVATURE_MAX);
    return m;
}

// ─── make_analyze_function ────────────────────────────────────────────────────

AnalyzeFunction make_analyze_function(sampling::SamplerLimits limits, ExactBudget budget) {
    return [sampler = sampling::EmbeddingSampler(limits),
            analyzer = CurvatureAnalyzer(budget)](const EmbeddingSet& set,
                                                  AnalysisMode mode,
                                                  std::stop_token stop) {
        const auto sample = sampler.sample(set.vectors, mode);
        return analyzer.analyze(set.document_id, sample, mode, std::move(stop));
    };
}

} // namespace chit::curvature
