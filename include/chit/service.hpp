#pragma once

/// @file include/chit/service.hpp
/// @brief Query API: synchronous compute, overrides, simulate, invalidate.
///
/// # Module: GeometryService
///
/// ## Responsibility
/// The single entry point the HTTP layer (and the CLI) talk to. For a
/// document id and mode it returns `{metrics, packet, spectrum}`:
///
/// 1. Validate the request (only malformed requests are errors).
/// 2. Overrides: synthesise metrics from the caller's packet, skip the
///    sampler and analyzer, never cache, never publish.
/// 3. Cache hit: rebuild packet and spectrum from the cached metrics.
/// 4. Cache miss: fetch embeddings, analyze, cache, publish, return.
///
/// `simulate()` is a separate entry point for front-end fixtures: it never
/// touches the analyzer, the cache or the bus.
///
/// ## Collaborators
/// All injected by reference; the service owns none of them.

#include "chit/chit_packet.hpp"
#include "chit/curvature.hpp"
#include "chit/embedding_source.hpp"
#include "chit/events.hpp"
#include "chit/metrics_cache.hpp"
#include "chit/types.hpp"
#include "chit/worker_pool.hpp"
#include "chit/zeta.hpp"

#include <chrono>
#include <future>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chit::service {

// ─── Request / response ───────────────────────────────────────────────────────

struct ComputeRequest {
    std::string                               document_id;
    std::optional<std::string>                mode;       ///< "heuristic" / "exact"
    std::optional<render::ChitGeometryPacket> overrides;
};

struct ComputeResponse {
    ManifoldMetrics              metrics;
    render::ChitGeometryPacket   packet;
    chit::spectrum::ZetaSpectrum spectrum;
    bool                         cache_hit = false;
};

enum class RequestErrorKind {
    InvalidDocumentId,
    UnknownMode,
    InvalidOverrides,
    MalformedBody,
};

[[nodiscard]] const char* to_string(RequestErrorKind k) noexcept;

/// A malformed request: the only hard error of the query API.
struct RequestError {
    RequestErrorKind kind;
    std::string      message;
};

using ComputeResult = std::variant<ComputeResponse, RequestError>;

struct SimulateResponse {
    render::ChitGeometryPacket       packet;
    chit::spectrum::ZetaSpectrum     spectrum;
    std::vector<render::DecodedItem> decoded;
};

/// Non-empty, ≤128 chars of [A-Za-z0-9._-], not starting with '.'.
[[nodiscard]] bool is_valid_document_id(std::string_view id) noexcept;

// ─── GeometryService ──────────────────────────────────────────────────────────

struct ServiceOptions {
    AnalysisMode              default_mode = AnalysisMode::Heuristic;
    std::chrono::milliseconds cache_ttl{std::chrono::seconds(constants::DEFAULT_CACHE_TTL_S)};
};

class GeometryService {
public:
    GeometryService(ServiceOptions options,
                    io::EmbeddingSource& source,
                    cache::MetricsStore& cache,
                    events::EventPublisher& publisher,
                    WorkerPool& pool,
                    curvature::AnalyzeFunction analyze);

    /// Parse `request.mode` and compute.
    [[nodiscard]] ComputeResult compute(const ComputeRequest& request,
                                        std::stop_token stop = {});

    /// Compute for an already-parsed mode (nullopt = configured default).
    [[nodiscard]] ComputeResult
    compute(const std::string& document_id,
            std::optional<AnalysisMode> mode,
            const std::optional<render::ChitGeometryPacket>& overrides = std::nullopt,
            std::stop_token stop = {});

    /// Run `compute(request)` on the worker pool.
    [[nodiscard]] std::future<ComputeResult> compute_async(ComputeRequest request);

    /// Drop cached metrics of `document_id` (both modes).
    [[nodiscard]] std::optional<RequestError> invalidate(const std::string& document_id);

    /// Normalise an arbitrary packet, decode its texts and derive a spectrum
    /// from its constellation points.
    [[nodiscard]] SimulateResponse simulate(render::ChitGeometryPacket packet) const;

    /// Fixed synthetic packet for UI smoke tests.
    [[nodiscard]] render::ChitGeometryPacket demo_packet() const;

    [[nodiscard]] events::PublisherStats publisher_stats() const;

    [[nodiscard]] const ServiceOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] ComputeResponse from_overrides(const std::string& document_id,
                                                 AnalysisMode mode,
                                                 const render::ChitGeometryPacket& overrides) const;

    [[nodiscard]] static ComputeResponse respond(ManifoldMetrics metrics, bool cache_hit);

    ServiceOptions             options_;
    io::EmbeddingSource&       source_;
    cache::MetricsStore&       cache_;
    events::EventPublisher&    publisher_;
    WorkerPool&                pool_;
    curvature::AnalyzeFunction analyze_;
};

} // namespace chit::service
