/// @file src/io/json_codec.cpp
/// @brief jsoncpp encode / decode for the wire types.

#include "chit/json_codec.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ctime>
#include <memory>

namespace chit::io {

namespace {

Json::Value to_array(const std::vector<double>& values) {
    Json::Value arr(Json::arrayValue);
    for (double v : values) arr.append(v);
    return arr;
}

template <std::size_t N>
Json::Value to_array(const std::array<double, N>& values) {
    Json::Value arr(Json::arrayValue);
    for (double v : values) arr.append(v);
    return arr;
}

// ─── Field readers ────────────────────────────────────────────────────────────
// Each returns false only when the field is present with the wrong type.

bool read_double(const Json::Value& obj, const char* key, double& out) {
    if (!obj.isMember(key)) return true;
    const Json::Value& v = obj[key];
    if (!v.isNumeric()) return false;
    out = v.asDouble();
    return true;
}

bool read_string(const Json::Value& obj, const char* key, std::string& out) {
    if (!obj.isMember(key)) return true;
    const Json::Value& v = obj[key];
    if (!v.isString()) return false;
    out = v.asString();
    return true;
}

bool read_doubles(const Json::Value& obj, const char* key, std::vector<double>& out) {
    if (!obj.isMember(key)) return true;
    const Json::Value& v = obj[key];
    if (!v.isArray()) return false;
    out.clear();
    out.reserve(v.size());
    for (const auto& e : v) {
        if (!e.isNumeric()) return false;
        out.push_back(e.asDouble());
    }
    return true;
}

std::optional<render::ConstellationPoint> point_from_json(const Json::Value& v) {
    if (!v.isObject()) return std::nullopt;
    render::ConstellationPoint p;
    if (!read_string(v, "id", p.id) || !read_double(v, "x", p.x) ||
        !read_double(v, "y", p.y) || !read_double(v, "proj", p.proj) ||
        !read_double(v, "conf", p.conf) || !read_string(v, "text", p.text)) {
        return std::nullopt;
    }
    return p;
}

std::optional<render::Constellation> constellation_from_json(const Json::Value& v) {
    if (!v.isObject()) return std::nullopt;
    render::Constellation c;
    if (!read_string(v, "id", c.id) || !read_string(v, "summary", c.summary) ||
        !read_doubles(v, "anchor", c.anchor) || !read_doubles(v, "spectrum", c.spectrum)) {
        return std::nullopt;
    }
    if (v.isMember("points")) {
        const Json::Value& pts = v["points"];
        if (!pts.isArray()) return std::nullopt;
        for (const auto& e : pts) {
            auto p = point_from_json(e);
            if (!p) return std::nullopt;
            c.points.push_back(std::move(*p));
        }
    }
    return c;
}

std::optional<render::SuperNode> super_node_from_json(const Json::Value& v) {
    if (!v.isObject()) return std::nullopt;
    render::SuperNode sn;
    if (!read_string(v, "id", sn.id) || !read_string(v, "label", sn.label) ||
        !read_double(v, "x", sn.x) || !read_double(v, "y", sn.y) ||
        !read_double(v, "r", sn.r)) {
        return std::nullopt;
    }
    if (v.isMember("constellations")) {
        const Json::Value& cs = v["constellations"];
        if (!cs.isArray()) return std::nullopt;
        for (const auto& e : cs) {
            auto c = constellation_from_json(e);
            if (!c) return std::nullopt;
            sn.constellations.push_back(std::move(*c));
        }
    }
    return sn;
}

} // anonymous namespace

// ─── Text ─────────────────────────────────────────────────────────────────────

std::optional<Json::Value> parse_json(std::string_view text, std::string* error) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        if (error) *error = std::move(errs);
        return std::nullopt;
    }
    return root;
}

std::string write_json(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    return Json::writeString(builder, value);
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        tp.time_since_epoch()).count() % 1000;
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z",
                       fmt::gmtime(secs), static_cast<int>(ms < 0 ? ms + 1000 : ms));
}

// ─── Encoding ─────────────────────────────────────────────────────────────────

Json::Value to_json(const ManifoldMetrics& m) {
    Json::Value v(Json::objectValue);
    v["document_id"]    = m.document_id;
    v["shape_ratio"]    = m.shape_ratio;
    v["delta"]          = m.delta;
    v["curvature_k"]    = m.curvature_k;
    v["epsilon"]        = m.epsilon;
    v["classification"] = to_string(m.classification);
    v["mode"]           = to_string(m.mode);
    v["exact_used"]     = m.exact_used;
    v["sample_size"]    = static_cast<Json::UInt64>(m.sample_size);
    v["dropped_count"]  = static_cast<Json::UInt64>(m.dropped_count);
    v["origin"]         = to_string(m.origin);

    Json::Value conds(Json::arrayValue);
    for (Condition c : m.conditions) conds.append(to_string(c));
    v["conditions"] = conds;

    v["created_at"] = format_timestamp(m.created_at);
    return v;
}

Json::Value to_json(const render::SuperNode& sn) {
    Json::Value v(Json::objectValue);
    v["id"]    = sn.id;
    v["label"] = sn.label;
    v["x"]     = sn.x;
    v["y"]     = sn.y;
    v["r"]     = sn.r;

    Json::Value cs(Json::arrayValue);
    for (const auto& c : sn.constellations) {
        Json::Value cj(Json::objectValue);
        cj["id"]       = c.id;
        cj["summary"]  = c.summary;
        cj["anchor"]   = to_array(c.anchor);
        cj["spectrum"] = to_array(c.spectrum);

        Json::Value pts(Json::arrayValue);
        for (const auto& p : c.points) {
            Json::Value pj(Json::objectValue);
            pj["id"]   = p.id;
            pj["x"]    = p.x;
            pj["y"]    = p.y;
            pj["proj"] = p.proj;
            pj["conf"] = p.conf;
            if (!p.text.empty()) pj["text"] = p.text;
            pts.append(pj);
        }
        cj["points"] = pts;
        cs.append(cj);
    }
    v["constellations"] = cs;
    return v;
}

Json::Value to_json(const render::ChitGeometryPacket& p) {
    Json::Value v(Json::objectValue);
    v["spec"]        = p.spec;
    v["curvature_k"] = p.curvature_k;
    v["epsilon"]     = p.epsilon;
    v["surface_fn"]  = render::to_string(p.surface_fn);

    Json::Value grad(Json::arrayValue);
    for (const auto& stop : p.color_gradient) {
        Json::Value s(Json::objectValue);
        s["offset"] = stop.offset;
        s["color"]  = stop.color;
        grad.append(s);
    }
    v["color_gradient"] = grad;
    v["segments"]       = p.segments;

    if (p.super_nodes) {
        Json::Value nodes(Json::arrayValue);
        for (const auto& sn : *p.super_nodes) nodes.append(to_json(sn));
        v["super_nodes"] = nodes;
    }

    v["inferred_shape"] = p.inferred_shape;

    Json::Value anim(Json::objectValue);
    anim["min"]      = p.epsilon_animation.min;
    anim["max"]      = p.epsilon_animation.max;
    anim["step"]     = p.epsilon_animation.step;
    anim["period_s"] = p.epsilon_animation.period_s;
    v["epsilon_animation"] = anim;

    v["source"] = p.source;
    return v;
}

Json::Value to_json(const spectrum::ZetaSpectrum& s) {
    Json::Value v(Json::objectValue);
    v["frequencies"] = to_array(s.frequencies);
    v["amplitudes"]  = to_array(s.amplitudes);

    Json::Value src(Json::objectValue);
    src["curvature_k"] = s.source_curvature_k;
    src["epsilon"]     = s.source_epsilon;
    v["source"] = src;
    return v;
}

Json::Value to_json(const events::VisualizationEvent& e) {
    Json::Value payload(Json::objectValue);
    payload["cgp"]         = to_json(e.packet);
    payload["spectrum"]    = to_json(e.spectrum);
    payload["document_id"] = e.document_id;
    payload["timestamp"]   = format_timestamp(e.timestamp);

    Json::Value v(Json::objectValue);
    v["topic"]   = e.topic;
    v["payload"] = payload;
    return v;
}

Json::Value to_json(const std::vector<render::DecodedItem>& items) {
    Json::Value arr(Json::arrayValue);
    for (const auto& it : items) {
        Json::Value v(Json::objectValue);
        v["content"]       = it.content;
        v["confidence"]    = it.confidence;
        v["super_node"]    = it.super_node;
        v["constellation"] = it.constellation;
        arr.append(v);
    }
    return arr;
}

// ─── Decoding ─────────────────────────────────────────────────────────────────

std::optional<render::ChitGeometryPacket> packet_from_json(const Json::Value& value) {
    if (!value.isObject()) return std::nullopt;

    render::ChitGeometryPacket p;
    if (!read_double(value, "curvature_k", p.curvature_k) ||
        !read_double(value, "epsilon", p.epsilon) ||
        !read_string(value, "source", p.source)) {
        return std::nullopt;
    }

    if (value.isMember("surface_fn")) {
        const Json::Value& sf = value["surface_fn"];
        if (!sf.isString() || !render::parse_surface_fn(sf.asString())) {
            return std::nullopt;
        }
    }
    if (value.isMember("segments") && !value["segments"].isIntegral()) {
        return std::nullopt;
    }

    if (value.isMember("super_nodes") && !value["super_nodes"].isNull()) {
        const Json::Value& nodes = value["super_nodes"];
        if (!nodes.isArray()) return std::nullopt;
        std::vector<render::SuperNode> parsed;
        parsed.reserve(nodes.size());
        for (const auto& n : nodes) {
            auto sn = super_node_from_json(n);
            if (!sn) return std::nullopt;
            parsed.push_back(std::move(*sn));
        }
        p.super_nodes = std::move(parsed);
    }

    // Surface, gradient and segments always follow the curvature.
    return render::ChitConfigGenerator::normalize(std::move(p));
}

} // namespace chit::io
