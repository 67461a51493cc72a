#pragma once

/// @file include/chit/config.hpp
/// @brief Service configuration: defaults, YAML file, environment.
///
/// Precedence, lowest first: built-in defaults, the YAML file, environment
/// variables.
///
/// ```yaml
/// analysis:
///   exact_delta: false        # EXACT_DELTA
///   sample_cap: 100           # CHIT_SAMPLE_CAP
///   exact_sample_cap: 30      # CHIT_EXACT_SAMPLE_CAP
///   exact_budget_ms: 250      # CHIT_EXACT_BUDGET_MS
///   exact_max_tuples: 27405   # CHIT_EXACT_MAX_TUPLES
/// cache:
///   ttl_seconds: 60           # CHIT_CACHE_TTL_S
/// events:
///   queue_capacity: 256       # CHIT_EVENT_QUEUE
///   udp_endpoint: ""          # CHIT_EVENT_UDP   (host:port)
/// server:
///   host: 0.0.0.0             # CHIT_HTTP_HOST
///   port: 8088                # CHIT_HTTP_PORT
///   workers: 0                # CHIT_WORKERS     (0 = hardware threads)
///   idle_timeout_s: 30        # CHIT_HTTP_IDLE_TIMEOUT_S
///   max_sessions: 256         # CHIT_HTTP_MAX_SESSIONS
/// embeddings:
///   dir: ""                   # CHIT_EMBEDDINGS_DIR
/// logging:
///   level: info               # CHIT_LOG_LEVEL
/// ```

#include "chit/constants.hpp"
#include "chit/curvature.hpp"
#include "chit/sampler.hpp"
#include "chit/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chit::config {

struct AnalysisConfig {
    bool        exact_delta      = false;  ///< default mode when a request omits it
    std::size_t sample_cap       = constants::DEFAULT_SAMPLE_CAP;
    std::size_t exact_sample_cap = constants::DEFAULT_EXACT_SAMPLE_CAP;
    long        exact_budget_ms  = constants::DEFAULT_EXACT_BUDGET_MS;
    std::size_t exact_max_tuples = constants::DEFAULT_EXACT_MAX_TUPLES;

    [[nodiscard]] sampling::SamplerLimits sampler_limits() const noexcept;
    [[nodiscard]] curvature::ExactBudget  exact_budget() const noexcept;
    [[nodiscard]] AnalysisMode            default_mode() const noexcept;
};

struct CacheConfig {
    long ttl_seconds = constants::DEFAULT_CACHE_TTL_S;

    [[nodiscard]] std::chrono::milliseconds ttl() const noexcept;
};

struct EventsConfig {
    std::size_t queue_capacity = constants::DEFAULT_EVENT_QUEUE_CAPACITY;
    std::string udp_endpoint;  ///< empty: in-process bus only
};

struct ServerConfig {
    std::string    host    = "0.0.0.0";
    unsigned short port    = constants::DEFAULT_HTTP_PORT;
    std::size_t    workers = 0;
    long           idle_timeout_s = constants::DEFAULT_HTTP_IDLE_TIMEOUT_S;
    std::size_t    max_sessions   = constants::DEFAULT_HTTP_MAX_SESSIONS;

    /// `workers`, or the hardware thread count (at least 1) when 0.
    [[nodiscard]] std::size_t effective_workers() const noexcept;
    [[nodiscard]] std::chrono::milliseconds idle_timeout() const noexcept;
};

struct ServiceConfig {
    AnalysisConfig analysis;
    CacheConfig    cache;
    EventsConfig   events;
    ServerConfig   server;
    std::string    embeddings_dir;
    std::string    log_level = "info";
};

/// Environment accessor; returns nullopt for unset variables.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Reads the real process environment.
[[nodiscard]] EnvLookup process_env();

/// "1"/"true"/"yes" → true, "0"/"false"/"no" → false (case-insensitive).
[[nodiscard]] std::optional<bool> parse_bool(std::string_view text) noexcept;

/// Overlay a YAML document onto `base`. Returns nullopt and fills `error`
/// for malformed YAML or a key with an unconvertible value.
[[nodiscard]] std::optional<ServiceConfig>
parse_config(const std::string& yaml_text, ServiceConfig base = {},
             std::string* error = nullptr);

/// As `parse_config`, reading the file at `path`.
[[nodiscard]] std::optional<ServiceConfig>
load_config(const std::string& path, ServiceConfig base = {},
            std::string* error = nullptr);

/// Overlay environment variables onto `cfg`. Unparseable values are logged
/// and ignored.
[[nodiscard]] ServiceConfig apply_env(ServiceConfig cfg, const EnvLookup& lookup);

/// Human-readable problems; empty when the configuration is usable.
[[nodiscard]] std::vector<std::string> validate(const ServiceConfig& cfg);

} // namespace chit::config
