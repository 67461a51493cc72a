#pragma once

/// @file src/curvature/four_point.hpp
/// @brief Four-point Gromov hyperbolicity scan (internal).

#include "chit/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <stop_token>

namespace chit::curvature::detail {

/// Symmetric matrix of Euclidean distances between `points`.
[[nodiscard]] Eigen::MatrixXd pairwise_distances(std::span<const Point> points);

/// Largest four-point gap found and the scale it is measured against.
struct FourPointResult {
    double      raw_delta      = 0.0;  ///< max over subsets of (S_max − S_mid)/2
    double      diameter       = 0.0;  ///< largest pairwise distance
    std::size_t tuples_visited = 0;
};

/// δ for the three pairing sums of one subset.
[[nodiscard]] double four_point_gap(double s1, double s2, double s3) noexcept;

/// Scan every four-point subset of the distance matrix.
///
/// Returns `nullopt` once the deadline has passed or `stop` is requested.
/// The caller is responsible for the tuple budget (checked up front).
[[nodiscard]] std::optional<FourPointResult>
four_point_delta(const Eigen::MatrixXd& dist,
                 std::chrono::steady_clock::time_point deadline,
                 std::stop_token stop) noexcept;

} // namespace chit::curvature::detail
