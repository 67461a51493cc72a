#pragma once

/// @file include/chit/chit_packet.hpp
/// @brief CHIT Geometry Packet (CGP): renderer-agnostic surface parameters.
///
/// # Module: CHIT Config Generator
///
/// ## Responsibility
/// Map a `ManifoldMetrics` record onto the packet the 2D navigator and the
/// 3D manifold renderer consume: which parametric surface to draw, how to
/// colour it, how finely to tessellate it, and the curvature / noise
/// uniforms that deform it.
///
/// | Classification       | surface_fn | gradient       |
/// |----------------------|------------|----------------|
/// | Hyperbolic           | tractrix   | purple → cyan  |
/// | Spherical            | sphere     | orange → gold  |
/// | Euclidean / Indet.   | plane      | gray → blue    |
///
/// ## Guarantees
/// - `generate()` is pure and idempotent
/// - Packets never hold non-finite uniforms

#include "chit/constants.hpp"
#include "chit/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace chit::render {

// ─── Surface / colour ─────────────────────────────────────────────────────────

enum class SurfaceFn {
    Tractrix,  ///< pseudosphere, negative curvature
    Sphere,    ///< positive curvature
    Plane,     ///< flat
};

[[nodiscard]] const char* to_string(SurfaceFn s) noexcept;
[[nodiscard]] std::optional<SurfaceFn> parse_surface_fn(const std::string& s) noexcept;

/// One stop of a linear colour gradient.
struct ColorStop {
    double      offset;  ///< [0, 1]
    std::string color;   ///< "#rrggbb"

    bool operator==(const ColorStop&) const = default;
};

/// Oscillation range the renderer animates epsilon over.
struct AnimatedRange {
    double min      = 0.0;
    double max      = 0.0;
    double step     = constants::EPSILON_ANIMATION_STEP;
    double period_s = constants::EPSILON_ANIMATION_PERIOD_S;

    bool operator==(const AnimatedRange&) const = default;
};

// ─── Structural decomposition ─────────────────────────────────────────────────

struct ConstellationPoint {
    std::string id;
    double      x    = 0.0;
    double      y    = 0.0;
    double      proj = 0.0;  ///< projection strength onto the anchor
    double      conf = 0.0;  ///< extraction confidence
    std::string text;        ///< source fragment, may be empty

    bool operator==(const ConstellationPoint&) const = default;
};

struct Constellation {
    std::string                     id;
    std::string                     summary;
    std::vector<double>             anchor;
    std::vector<double>             spectrum;
    std::vector<ConstellationPoint> points;

    bool operator==(const Constellation&) const = default;
};

struct SuperNode {
    std::string                id;
    std::string                label;
    double                     x = 0.0;
    double                     y = 0.0;
    double                     r = 0.0;
    std::vector<Constellation> constellations;

    bool operator==(const SuperNode&) const = default;
};

// ─── Packet ───────────────────────────────────────────────────────────────────

struct ChitGeometryPacket {
    std::string            spec{constants::CGP_SPEC_VERSION};
    double                 curvature_k = 0.0;
    double                 epsilon     = 0.0;
    SurfaceFn              surface_fn  = SurfaceFn::Plane;
    std::vector<ColorStop> color_gradient;
    int                    segments    = constants::DEFAULT_SEGMENTS;
    std::optional<std::vector<SuperNode>> super_nodes;

    std::string   inferred_shape;     ///< human-readable shape label
    AnimatedRange epsilon_animation;
    std::string   source = "analyzer";

    bool operator==(const ChitGeometryPacket&) const = default;
};

/// A text fragment recovered from a packet's constellation points.
struct DecodedItem {
    std::string content;
    double      confidence = 0.0;
    std::string super_node;     ///< label of the owning super node
    std::string constellation;  ///< summary of the owning constellation
};

// ─── ChitConfigGenerator ──────────────────────────────────────────────────────

class ChitConfigGenerator {
public:
    /// Derive the packet for `metrics`.
    [[nodiscard]] static ChitGeometryPacket
    generate(const ManifoldMetrics& metrics);

    /// As `generate`, attaching a structural decomposition.
    [[nodiscard]] static ChitGeometryPacket
    generate(const ManifoldMetrics& metrics, std::vector<SuperNode> super_nodes);

    [[nodiscard]] static SurfaceFn surface_for(Classification c) noexcept;
    [[nodiscard]] static std::vector<ColorStop> gradient_for(Classification c);
    [[nodiscard]] static const char* shape_label(Classification c) noexcept;

    /// Epsilon animation range [ε − 0.2, ε + 0.2] ∩ [0, 1].
    [[nodiscard]] static AnimatedRange animation_for(double epsilon) noexcept;

    /// Classification implied by a curvature value (sign invariant inverse).
    [[nodiscard]] static Classification classification_for(double curvature_k) noexcept;

    /// Clamp uniforms into range, replace non-finite values with 0 and make
    /// surface, gradient, segments and shape label agree with the curvature.
    /// Super nodes are kept as given.
    [[nodiscard]] static ChitGeometryPacket normalize(ChitGeometryPacket packet);
};

/// Extract every non-empty point text, in packet order.
[[nodiscard]] std::vector<DecodedItem> decode_packet(const ChitGeometryPacket& packet);

/// Fixed synthetic packet for UI smoke tests.
[[nodiscard]] ChitGeometryPacket demo_packet();

} // namespace chit::render
