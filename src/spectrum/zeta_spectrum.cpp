/// @file src/spectrum/zeta_spectrum.cpp
/// @brief Zeta-zero and covariance-eigenvalue spectra.

#include "chit/zeta.hpp"

#include <Eigen/Eigenvalues>

#include <algorithm>
#include <cmath>

namespace chit::spectrum {

namespace {

double finite_or_zero(double v) noexcept {
    return std::isfinite(v) ? v : 0.0;
}

} // anonymous namespace

// ─── generate ─────────────────────────────────────────────────────────────────

ZetaSpectrum ZetaSpectrumGenerator::generate(const ManifoldMetrics& metrics) noexcept {
    return generate(metrics.curvature_k, metrics.epsilon);
}

ZetaSpectrum ZetaSpectrumGenerator::generate(double curvature_k, double epsilon) noexcept {
    using namespace constants;

    const double k   = std::clamp(finite_or_zero(curvature_k), CURVATURE_MIN, CURVATURE_MAX);
    const double eps = std::clamp(finite_or_zero(epsilon), 0.0, 1.0);

    ZetaSpectrum s;
    s.source_curvature_k = k;
    s.source_epsilon     = eps;

    const double shift = SPECTRUM_CURVATURE_SHIFT * (k / CURVATURE_MAX)
                       + SPECTRUM_EPSILON_SHIFT * eps;
    const double gain  = 1.0 - eps * SPECTRUM_DAMPING;

    for (std::size_t i = 0; i < SPECTRUM_SIZE; ++i) {
        s.frequencies[i] = std::clamp(ZETA_ZEROS[i] + shift,
                                      SPECTRUM_FREQ_MIN, SPECTRUM_FREQ_MAX);
        const double envelope = std::exp(-static_cast<double>(i) / SPECTRUM_DECAY);
        s.amplitudes[i] = std::clamp(envelope * gain, 0.0, 1.0);
    }
    return s;
}

// ─── from_points ──────────────────────────────────────────────────────────────

ZetaSpectrum ZetaSpectrumGenerator::from_points(std::span<const Point> points,
                                                double fallback_k,
                                                double fallback_epsilon) {
    using namespace constants;

    if (points.size() < 2 || points.front().size() < 2) {
        return generate(fallback_k, fallback_epsilon);
    }

    const auto n = static_cast<Eigen::Index>(points.size());
    const Eigen::Index dim = points.front().size();
    Eigen::MatrixXd data(n, dim);
    for (Eigen::Index i = 0; i < n; ++i) {
        const Point& p = points[static_cast<std::size_t>(i)];
        if (p.size() != dim || !p.allFinite()) {
            return generate(fallback_k, fallback_epsilon);
        }
        data.row(i) = p.transpose();
    }

    // Sample covariance (n − 1), as numpy.cov.
    const Eigen::MatrixXd centered = data.rowwise() - data.colwise().mean();
    const Eigen::MatrixXd cov =
        (centered.adjoint() * centered) / static_cast<double>(n - 1);

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(cov, Eigen::EigenvaluesOnly);
    if (solver.info() != Eigen::Success) {
        return generate(fallback_k, fallback_epsilon);
    }

    // Eigenvalues ascend; walk from the top.
    const Eigen::VectorXd& ev = solver.eigenvalues();
    std::array<double, SPECTRUM_SIZE> top{};
    for (std::size_t i = 0; i < SPECTRUM_SIZE; ++i) {
        const Eigen::Index idx = ev.size() - 1 - static_cast<Eigen::Index>(i);
        top[i] = idx >= 0 ? std::abs(ev(idx)) : 0.0;
    }
    const double ev_max = *std::max_element(top.begin(), top.end());
    if (!std::isfinite(ev_max) || ev_max <= FLOAT_TOLERANCE) {
        return generate(fallback_k, fallback_epsilon);
    }

    ZetaSpectrum s;
    s.source_curvature_k = std::clamp(std::isfinite(fallback_k) ? fallback_k : 0.0,
                                      CURVATURE_MIN, CURVATURE_MAX);
    s.source_epsilon     = std::clamp(std::isfinite(fallback_epsilon) ? fallback_epsilon : 0.0,
                                      0.0, 1.0);

    for (std::size_t i = 0; i < SPECTRUM_SIZE; ++i) {
        const double norm = std::clamp(top[i] / ev_max, 0.0, 1.0);
        s.frequencies[i] = std::clamp(EIGEN_SPECTRUM_BASE + EIGEN_SPECTRUM_SPREAD * norm,
                                      SPECTRUM_FREQ_MIN, SPECTRUM_FREQ_MAX);
        const double falloff = 1.0 / (1.0 + static_cast<double>(i) * EIGEN_SPECTRUM_FALLOFF);
        s.amplitudes[i] = std::clamp(falloff * (0.5 + 0.5 * norm), 0.0, 1.0);
    }
    return s;
}

} // namespace chit::spectrum
