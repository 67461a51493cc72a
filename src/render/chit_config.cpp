/// @file src/render/chit_config.cpp
/// @brief Metrics → CHIT Geometry Packet.

#include "chit/chit_packet.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace chit::render {

namespace {

double finite_or_zero(double v) noexcept {
    return std::isfinite(v) ? v : 0.0;
}

} // anonymous namespace

// ─── SurfaceFn ────────────────────────────────────────────────────────────────

const char* to_string(SurfaceFn s) noexcept {
    switch (s) {
        case SurfaceFn::Tractrix: return "tractrix";
        case SurfaceFn::Sphere:   return "sphere";
        case SurfaceFn::Plane:    return "plane";
    }
    return "plane";
}

std::optional<SurfaceFn> parse_surface_fn(const std::string& s) noexcept {
    if (s == "tractrix") return SurfaceFn::Tractrix;
    if (s == "sphere")   return SurfaceFn::Sphere;
    if (s == "plane")    return SurfaceFn::Plane;
    return std::nullopt;
}

// ─── Lookup tables ────────────────────────────────────────────────────────────

SurfaceFn ChitConfigGenerator::surface_for(Classification c) noexcept {
    switch (c) {
        case Classification::Hyperbolic: return SurfaceFn::Tractrix;
        case Classification::Spherical:  return SurfaceFn::Sphere;
        case Classification::Euclidean:
        case Classification::Indeterminate:
            break;
    }
    return SurfaceFn::Plane;
}

std::vector<ColorStop> ChitConfigGenerator::gradient_for(Classification c) {
    switch (c) {
        case Classification::Hyperbolic:
            return {{0.0, "#7b2ff7"}, {1.0, "#00e5ff"}};
        case Classification::Spherical:
            return {{0.0, "#ff8c00"}, {1.0, "#ffd700"}};
        case Classification::Euclidean:
        case Classification::Indeterminate:
            break;
    }
    return {{0.0, "#808080"}, {1.0, "#1e90ff"}};
}

const char* ChitConfigGenerator::shape_label(Classification c) noexcept {
    switch (c) {
        case Classification::Hyperbolic:    return "Hyperbolic (Pseudosphere)";
        case Classification::Spherical:     return "Spherical";
        case Classification::Euclidean:     return "Flat";
        case Classification::Indeterminate: return "Indeterminate";
    }
    return "Indeterminate";
}

AnimatedRange ChitConfigGenerator::animation_for(double epsilon) noexcept {
    AnimatedRange r;
    r.min = std::max(0.0, epsilon - constants::EPSILON_ANIMATION_SPAN);
    r.max = std::min(1.0, epsilon + constants::EPSILON_ANIMATION_SPAN);
    return r;
}

Classification ChitConfigGenerator::classification_for(double curvature_k) noexcept {
    if (curvature_k < -1.0) return Classification::Hyperbolic;
    if (curvature_k >  1.0) return Classification::Spherical;
    return Classification::Euclidean;
}

// ─── generate ─────────────────────────────────────────────────────────────────

ChitGeometryPacket ChitConfigGenerator::generate(const ManifoldMetrics& metrics) {
    ChitGeometryPacket p;
    p.curvature_k       = finite_or_zero(metrics.curvature_k);
    p.epsilon           = std::clamp(finite_or_zero(metrics.epsilon), 0.0, 1.0);
    p.surface_fn        = surface_for(metrics.classification);
    p.color_gradient    = gradient_for(metrics.classification);
    p.segments          = constants::DEFAULT_SEGMENTS;
    p.inferred_shape    = shape_label(metrics.classification);
    p.epsilon_animation = animation_for(p.epsilon);
    p.source            = to_string(metrics.origin);
    return p;
}

ChitGeometryPacket ChitConfigGenerator::generate(const ManifoldMetrics& metrics,
                                                 std::vector<SuperNode> super_nodes) {
    ChitGeometryPacket p = generate(metrics);
    p.super_nodes = std::move(super_nodes);
    return p;
}

// ─── normalize ────────────────────────────────────────────────────────────────

ChitGeometryPacket ChitConfigGenerator::normalize(ChitGeometryPacket packet) {
    packet.spec        = std::string(constants::CGP_SPEC_VERSION);
    packet.curvature_k = std::clamp(finite_or_zero(packet.curvature_k),
                                    constants::CURVATURE_MIN, constants::CURVATURE_MAX);
    packet.epsilon     = std::clamp(finite_or_zero(packet.epsilon), 0.0, 1.0);

    const Classification cls = classification_for(packet.curvature_k);
    packet.surface_fn        = surface_for(cls);
    packet.color_gradient    = gradient_for(cls);
    packet.segments          = constants::DEFAULT_SEGMENTS;
    packet.inferred_shape    = shape_label(cls);
    packet.epsilon_animation = animation_for(packet.epsilon);
    return packet;
}

// ─── decode_packet ────────────────────────────────────────────────────────────

std::vector<DecodedItem> decode_packet(const ChitGeometryPacket& packet) {
    std::vector<DecodedItem> items;
    if (!packet.super_nodes) {
        return items;
    }
    for (const auto& sn : *packet.super_nodes) {
        for (const auto& c : sn.constellations) {
            for (const auto& pt : c.points) {
                if (pt.text.empty()) continue;
                items.push_back(DecodedItem{
                    .content       = pt.text,
                    .confidence    = pt.conf,
                    .super_node    = sn.label,
                    .constellation = c.summary,
                });
            }
        }
    }
    return items;
}

// ─── demo_packet ──────────────────────────────────────────────────────────────

ChitGeometryPacket demo_packet() {
    ManifoldMetrics m;
    m.document_id    = std::string(constants::DEMO_DOCUMENT_ID);
    m.curvature_k    = -2.5;
    m.epsilon        = 0.3;
    m.classification = Classification::Hyperbolic;
    m.origin         = MetricsOrigin::Override;

    std::vector<SuperNode> nodes{
        SuperNode{
            .id    = "super_0",
            .label = "Resonant Mode 0",
            .x = 0.0, .y = 0.0, .r = 200.0,
            .constellations = {
                Constellation{
                    .id       = "const_0_0",
                    .summary  = "Logistics Cluster",
                    .anchor   = {1.0, 0.0, 0.0},
                    .spectrum = {0.9, 0.2, 0.1, 0.0, 0.0},
                    .points   = {
                        {"p1",  50.0,  50.0, 0.9, 0.95, "St. Maarten Bridge Status: OK"},
                        {"p2", -40.0,  60.0, 0.8, 0.85, "Supply Chain Node A"},
                    },
                },
                Constellation{
                    .id       = "const_0_1",
                    .summary  = "Safety Cluster",
                    .anchor   = {0.0, 1.0, 0.0},
                    .spectrum = {0.1, 0.8, 0.3, 0.1, 0.0},
                    .points   = {
                        {"p3", -20.0, -80.0, 0.7, 0.80, "Emergency Response Protocol"},
                    },
                },
            },
        },
    };

    ChitGeometryPacket p = ChitConfigGenerator::generate(m, std::move(nodes));
    p.source = "demo";
    return p;
}

} // namespace chit::render
