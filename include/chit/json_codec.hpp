#pragma once

/// @file include/chit/json_codec.hpp
/// @brief JSON encoding of metrics, packets, spectra and events (jsoncpp).
///
/// Field names follow the wire format the visualisation clients consume:
/// `curvature_k`, `epsilon`, `surface_fn`, `color_gradient`, `segments`,
/// `super_nodes`, `frequencies`, `amplitudes`, ...
///
/// Decoding is lenient where the packet is "CGP-like": absent fields take
/// their defaults and the result is passed through
/// `ChitConfigGenerator::normalize`. A field present with the wrong JSON type
/// is rejected.

#include "chit/chit_packet.hpp"
#include "chit/events.hpp"
#include "chit/types.hpp"
#include "chit/zeta.hpp"

#include <json/json.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chit::io {

// ─── Text ─────────────────────────────────────────────────────────────────────

/// Parse a JSON document. Returns nullopt (and fills `error` if given) on
/// malformed input.
[[nodiscard]] std::optional<Json::Value>
parse_json(std::string_view text, std::string* error = nullptr);

/// Serialise compactly, or indented with `pretty`.
[[nodiscard]] std::string write_json(const Json::Value& value, bool pretty = false);

/// "2026-01-31T12:00:00.123Z"
[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point tp);

// ─── Encoding ─────────────────────────────────────────────────────────────────

[[nodiscard]] Json::Value to_json(const ManifoldMetrics& metrics);
[[nodiscard]] Json::Value to_json(const render::ChitGeometryPacket& packet);
[[nodiscard]] Json::Value to_json(const render::SuperNode& node);
[[nodiscard]] Json::Value to_json(const spectrum::ZetaSpectrum& spectrum);
[[nodiscard]] Json::Value to_json(const events::VisualizationEvent& event);
[[nodiscard]] Json::Value to_json(const std::vector<render::DecodedItem>& items);

// ─── Decoding ─────────────────────────────────────────────────────────────────

/// Decode a CGP-like object. Returns nullopt if `value` is not an object or
/// a present field has the wrong type.
[[nodiscard]] std::optional<render::ChitGeometryPacket>
packet_from_json(const Json::Value& value);

} // namespace chit::io
