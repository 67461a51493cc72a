#pragma once

/// @file include/chit/zeta.hpp
/// @brief Zeta Spectrum Generator: deterministic animation spectrum.
///
/// # Module: Zeta Spectrum
///
/// ## Responsibility
/// Produce the 5-component frequency/amplitude set driving the spectral
/// animator. The basis is the imaginary parts of the first five non-trivial
/// Riemann zeta zeros (14.13, 21.02, 25.01, 30.42, 32.94), shifted by the
/// manifold's curvature and noise:
///
///   fᵢ = clamp(γᵢ + 0.5·(k/5) + 0.25·ε, 14, 35)
///   aᵢ = clamp(exp(−i/2.5) · (1 − 0.5·ε), 0, 1)
///
/// Amplitudes are strictly decreasing in index order by construction.
///
/// `from_points` is the data-driven variant used for packets that carry
/// their own point cloud: the top-5 eigenvalues λ of the covariance matrix,
/// normalised by the largest, give
///
///   fᵢ = 14.13 + 20·λ̂ᵢ,   aᵢ = (0.5 + 0.5·λ̂ᵢ) / (1 + 0.3·i)

#include "chit/constants.hpp"
#include "chit/types.hpp"

#include <array>
#include <span>

namespace chit::spectrum {

struct ZetaSpectrum {
    std::array<double, constants::SPECTRUM_SIZE> frequencies{};
    std::array<double, constants::SPECTRUM_SIZE> amplitudes{};
    double source_curvature_k = 0.0;  ///< k that produced the spectrum
    double source_epsilon     = 0.0;  ///< ε that produced the spectrum

    bool operator==(const ZetaSpectrum&) const = default;
};

class ZetaSpectrumGenerator {
public:
    /// Spectrum for a metrics record. Pure.
    [[nodiscard]] static ZetaSpectrum generate(const ManifoldMetrics& metrics) noexcept;

    /// Spectrum for raw (k, ε); non-finite inputs are treated as 0.
    [[nodiscard]] static ZetaSpectrum generate(double curvature_k, double epsilon) noexcept;

    /// Covariance-eigenvalue spectrum of a point cloud. Falls back to
    /// `generate(fallback_k, fallback_epsilon)` with fewer than 2 points,
    /// fewer than 2 dimensions, or a degenerate covariance.
    [[nodiscard]] static ZetaSpectrum
    from_points(std::span<const Point> points,
                double fallback_k,
                double fallback_epsilon);
};

} // namespace chit::spectrum
