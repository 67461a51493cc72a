#pragma once

#include <array>
#include <cstddef>
#include <string_view>

/// @file include/chit/constants.hpp
/// @brief Thresholds, caps and fixed numeric bases for the geometry engine.

namespace chit::constants {

// ─── Sampling ─────────────────────────────────────────────────────────────────

/// Maximum number of embeddings analysed per request (heuristic mode).
static constexpr std::size_t DEFAULT_SAMPLE_CAP = 100;

/// Maximum number of embeddings analysed in exact mode. C(30,4) = 27 405
/// four-point subsets, which keeps the O(N⁴) scan interactive.
static constexpr std::size_t DEFAULT_EXACT_SAMPLE_CAP = 30;

/// Below this many usable vectors the shape is Indeterminate.
static constexpr std::size_t MIN_SAMPLE_SIZE = 4;

// ─── Classification ───────────────────────────────────────────────────────────

/// shape_ratio strictly above this → Hyperbolic.
static constexpr double HYPERBOLIC_THRESHOLD = 0.5;

/// shape_ratio strictly below this → Spherical.
static constexpr double SPHERICAL_THRESHOLD = 0.2;

/// Magnitude of the curvature band beyond |k| = 1.
static constexpr double CURVATURE_SPAN = 4.0;

/// Curvature bounds.
static constexpr double CURVATURE_MIN = -5.0;
static constexpr double CURVATURE_MAX = 5.0;

/// Lower bound of the curvature normalizer output. Keeps k strictly outside
/// [-1, 1] for Hyperbolic and Spherical results.
static constexpr double MIN_CURVATURE_STRENGTH = 0.01;

/// Guard added to denominators of coefficient-of-variation statistics.
static constexpr double DISTANCE_EPSILON = 1e-9;

/// General floating-point comparison tolerance.
static constexpr double FLOAT_TOLERANCE = 1e-12;

// ─── Exact four-point budget ──────────────────────────────────────────────────

/// Default number of four-point subsets the exact path may visit.
static constexpr std::size_t DEFAULT_EXACT_MAX_TUPLES = 27405;

/// Default wall-clock budget for the exact path, milliseconds.
static constexpr long DEFAULT_EXACT_BUDGET_MS = 250;

/// Deadline and stop-token are polled once per this many subsets.
static constexpr std::size_t EXACT_POLL_INTERVAL = 1024;

// ─── CHIT Geometry Packet ─────────────────────────────────────────────────────

/// Version tag carried by every packet.
static constexpr std::string_view CGP_SPEC_VERSION = "chit.cgp.v0.1";

/// Surface tessellation used by the renderers (interactive frame rates).
static constexpr int DEFAULT_SEGMENTS = 50;

/// Half-width of the animated epsilon range.
static constexpr double EPSILON_ANIMATION_SPAN = 0.2;
static constexpr double EPSILON_ANIMATION_STEP = 0.01;
static constexpr double EPSILON_ANIMATION_PERIOD_S = 5.0;

// ─── Zeta Spectrum ────────────────────────────────────────────────────────────

static constexpr std::size_t SPECTRUM_SIZE = 5;

/// Imaginary parts of the first five non-trivial Riemann zeta zeros.
static constexpr std::array<double, SPECTRUM_SIZE> ZETA_ZEROS = {
    14.134725, 21.022040, 25.010858, 30.424876, 32.935062,
};

static constexpr double SPECTRUM_FREQ_MIN = 14.0;
static constexpr double SPECTRUM_FREQ_MAX = 35.0;

/// Frequency shift per unit of normalised curvature (k / 5).
static constexpr double SPECTRUM_CURVATURE_SHIFT = 0.5;

/// Frequency shift per unit of epsilon.
static constexpr double SPECTRUM_EPSILON_SHIFT = 0.25;

/// Envelope: amplitude[i] = exp(-i / DECAY) · (1 − ε · DAMPING).
static constexpr double SPECTRUM_DECAY = 2.5;
static constexpr double SPECTRUM_DAMPING = 0.5;

/// Point-cloud spectrum: f = BASE + SPREAD · λ̂.
static constexpr double EIGEN_SPECTRUM_BASE = 14.13;
static constexpr double EIGEN_SPECTRUM_SPREAD = 20.0;
static constexpr double EIGEN_SPECTRUM_FALLOFF = 0.3;

// ─── Service ──────────────────────────────────────────────────────────────────

/// Well-known bus topic for manifold updates.
static constexpr std::string_view MANIFOLD_UPDATE_TOPIC =
    "geometry.event.manifold_update";

static constexpr long DEFAULT_CACHE_TTL_S = 60;
static constexpr std::size_t DEFAULT_EVENT_QUEUE_CAPACITY = 256;
static constexpr unsigned short DEFAULT_HTTP_PORT = 8088;

/// An HTTP connection with no request in flight is closed after this long.
static constexpr long DEFAULT_HTTP_IDLE_TIMEOUT_S = 30;
/// Connections beyond this many open sessions are refused.
static constexpr std::size_t DEFAULT_HTTP_MAX_SESSIONS = 256;

/// Maximum accepted length of a document id.
static constexpr std::size_t MAX_DOCUMENT_ID_LENGTH = 128;

/// Document id that resolves to the built-in synthetic hyperbolic tree.
static constexpr std::string_view DEMO_DOCUMENT_ID = "demo";

} // namespace chit::constants
