/// @file src/curvature/four_point.cpp
/// @brief Exhaustive four-point hyperbolicity scan.
///
/// Distances are precomputed once (O(N²·D)); the scan itself touches only
/// the matrix, so its cost is O(N⁴) table lookups independent of dimension.

#include "four_point.hpp"

#include "chit/constants.hpp"

#include <algorithm>

namespace chit::curvature::detail {

// ─── pairwise_distances ───────────────────────────────────────────────────────

Eigen::MatrixXd pairwise_distances(std::span<const Point> points) {
    const auto n = static_cast<Eigen::Index>(points.size());
    Eigen::MatrixXd dist = Eigen::MatrixXd::Zero(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = i + 1; j < n; ++j) {
            const double d = (points[static_cast<std::size_t>(i)]
                            - points[static_cast<std::size_t>(j)]).norm();
            dist(i, j) = d;
            dist(j, i) = d;
        }
    }
    return dist;
}

// ─── four_point_gap ───────────────────────────────────────────────────────────

double four_point_gap(double s1, double s2, double s3) noexcept {
    // Sort descending; only the two largest matter.
    if (s1 < s2) std::swap(s1, s2);
    if (s2 < s3) std::swap(s2, s3);
    if (s1 < s2) std::swap(s1, s2);
    return 0.5 * (s1 - s2);
}

// ─── four_point_delta ─────────────────────────────────────────────────────────

std::optional<FourPointResult>
four_point_delta(const Eigen::MatrixXd& dist,
                 std::chrono::steady_clock::time_point deadline,
                 std::stop_token stop) noexcept {
    FourPointResult result;
    result.diameter = dist.size() > 0 ? dist.maxCoeff() : 0.0;

    const Eigen::Index n = dist.rows();
    std::size_t until_poll = constants::EXACT_POLL_INTERVAL;

    for (Eigen::Index a = 0; a < n; ++a) {
        for (Eigen::Index b = a + 1; b < n; ++b) {
            for (Eigen::Index c = b + 1; c < n; ++c) {
                for (Eigen::Index d = c + 1; d < n; ++d) {
                    const double s1 = dist(a, b) + dist(c, d);
                    const double s2 = dist(a, c) + dist(b, d);
                    const double s3 = dist(a, d) + dist(b, c);
                    result.raw_delta = std::max(result.raw_delta,
                                                four_point_gap(s1, s2, s3));
                    ++result.tuples_visited;

                    if (--until_poll == 0) {
                        until_poll = constants::EXACT_POLL_INTERVAL;
                        if (stop.stop_requested() ||
                            std::chrono::steady_clock::now() >= deadline) {
                            return std::nullopt;
                        }
                    }
                }
            }
        }
    }

    return result;
}

} // namespace chit::curvature::detail
