/// @file src/service/geometry_service.cpp
/// @brief Query API: cache lookup, analysis, publication.

#include "chit/service.hpp"

#include "chit/logging.hpp"

#include <fmt/format.h>

#include <utility>

namespace chit::service {

// ─── Helpers ──────────────────────────────────────────────────────────────────

const char* to_string(RequestErrorKind k) noexcept {
    switch (k) {
        case RequestErrorKind::InvalidDocumentId: return "invalid_document_id";
        case RequestErrorKind::UnknownMode:       return "unknown_mode";
        case RequestErrorKind::InvalidOverrides:  return "invalid_overrides";
        case RequestErrorKind::MalformedBody:     return "malformed_body";
    }
    return "malformed_body";
}

bool is_valid_document_id(std::string_view id) noexcept {
    if (id.empty() || id.size() > constants::MAX_DOCUMENT_ID_LENGTH || id.front() == '.') {
        return false;
    }
    for (char c : id) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

// ─── GeometryService ──────────────────────────────────────────────────────────

GeometryService::GeometryService(ServiceOptions options,
                                 io::EmbeddingSource& source,
                                 cache::MetricsStore& cache,
                                 events::EventPublisher& publisher,
                                 WorkerPool& pool,
                                 curvature::AnalyzeFunction analyze)
    : options_(options)
    , source_(source)
    , cache_(cache)
    , publisher_(publisher)
    , pool_(pool)
    , analyze_(std::move(analyze)) {}

ComputeResult GeometryService::compute(const ComputeRequest& request, std::stop_token stop) {
    std::optional<AnalysisMode> mode;
    if (request.mode) {
        mode = parse_mode(*request.mode);
        if (!mode) {
            return RequestError{RequestErrorKind::UnknownMode,
                                fmt::format("unknown mode '{}'", *request.mode)};
        }
    }
    return compute(request.document_id, mode, request.overrides, stop);
}

ComputeResult GeometryService::compute(const std::string& document_id,
                                       std::optional<AnalysisMode> mode,
                                       const std::optional<render::ChitGeometryPacket>& overrides,
                                       std::stop_token stop) {
    if (!is_valid_document_id(document_id)) {
        log::logger()->info("rejected request: invalid document_id");
        return RequestError{RequestErrorKind::InvalidDocumentId,
                            "document_id must be 1-128 characters of [A-Za-z0-9._-]"};
    }

    const AnalysisMode resolved = mode.value_or(options_.default_mode);

    if (overrides) {
        return from_overrides(document_id, resolved, *overrides);
    }

    const cache::CacheKey key{document_id, resolved};
    if (auto cached = cache_.get(key)) {
        log::logger()->debug("cache hit for '{}' ({})", document_id, to_string(resolved));
        return respond(std::move(*cached), true);
    }

    EmbeddingSet set = source_.fetch(document_id).value_or(EmbeddingSet{document_id, {}});
    set.document_id = document_id;

    ManifoldMetrics metrics = analyze_(set, resolved, stop);
    cache_.put(key, metrics, options_.cache_ttl);

    log::logger()->info("computed '{}' ({}): {} k={:.3f} eps={:.3f} n={}",
                        document_id, to_string(resolved), to_string(metrics.classification),
                        metrics.curvature_k, metrics.epsilon, metrics.sample_size);

    ComputeResponse response = respond(std::move(metrics), false);
    publisher_.publish(events::make_manifold_update(document_id, response.packet,
                                                    response.spectrum));
    return response;
}

std::future<ComputeResult> GeometryService::compute_async(ComputeRequest request) {
    return pool_.submit([this, req = std::move(request)] { return compute(req); });
}

std::optional<RequestError> GeometryService::invalidate(const std::string& document_id) {
    if (!is_valid_document_id(document_id)) {
        return RequestError{RequestErrorKind::InvalidDocumentId,
                            "document_id must be 1-128 characters of [A-Za-z0-9._-]"};
    }
    cache_.invalidate(document_id);
    log::logger()->debug("invalidated '{}'", document_id);
    return std::nullopt;
}

SimulateResponse GeometryService::simulate(render::ChitGeometryPacket packet) const {
    SimulateResponse out;
    out.packet        = render::ChitConfigGenerator::normalize(std::move(packet));
    out.packet.source = "simulate";
    out.decoded       = render::decode_packet(out.packet);

    std::vector<Point> points;
    if (out.packet.super_nodes) {
        for (const auto& sn : *out.packet.super_nodes) {
            for (const auto& c : sn.constellations) {
                for (const auto& p : c.points) {
                    Point v(3);
                    v << p.x, p.y, p.proj;
                    points.push_back(std::move(v));
                }
            }
        }
    }
    out.spectrum = spectrum::ZetaSpectrumGenerator::from_points(
        points, out.packet.curvature_k, out.packet.epsilon);
    return out;
}

render::ChitGeometryPacket GeometryService::demo_packet() const {
    return render::demo_packet();
}

events::PublisherStats GeometryService::publisher_stats() const {
    return publisher_.stats();
}

// ─── Private ──────────────────────────────────────────────────────────────────

ComputeResponse GeometryService::from_overrides(const std::string& document_id,
                                                AnalysisMode mode,
                                                const render::ChitGeometryPacket& overrides) const {
    const render::ChitGeometryPacket normalized =
        render::ChitConfigGenerator::normalize(overrides);

    ManifoldMetrics m;
    m.document_id    = document_id;
    m.curvature_k    = normalized.curvature_k;
    m.epsilon        = normalized.epsilon;
    m.classification = render::ChitConfigGenerator::classification_for(normalized.curvature_k);
    m.mode           = mode;
    m.origin         = MetricsOrigin::Override;
    m.created_at     = std::chrono::system_clock::now();

    ComputeResponse response;
    response.packet = normalized.super_nodes
        ? render::ChitConfigGenerator::generate(m, *normalized.super_nodes)
        : render::ChitConfigGenerator::generate(m);
    response.spectrum = spectrum::ZetaSpectrumGenerator::generate(m);
    response.metrics  = std::move(m);
    return response;
}

ComputeResponse GeometryService::respond(ManifoldMetrics metrics, bool cache_hit) {
    ComputeResponse response;
    response.packet    = render::ChitConfigGenerator::generate(metrics);
    response.spectrum  = spectrum::ZetaSpectrumGenerator::generate(metrics);
    response.metrics   = std::move(metrics);
    response.cache_hit = cache_hit;
    return response;
}

} // namespace chit::service
