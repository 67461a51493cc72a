/// @file src/core/config.cpp
/// @brief ServiceConfig loading (yaml-cpp + environment).

#include "chit/config.hpp"

#include "chit/events.hpp"
#include "chit/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>

namespace chit::config {

namespace {

template <typename T>
std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

template <typename T>
void read_yaml(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) out = node[key].as<T>();
}

/// Apply `NAME` through `parse` when set and valid.
template <typename T, typename Parse>
void env_override(const EnvLookup& lookup, const std::string& name, T& out, Parse parse) {
    const auto raw = lookup(name);
    if (!raw) return;
    if (auto v = parse(*raw)) {
        out = static_cast<T>(*v);
    } else {
        log::logger()->warn("ignoring {}='{}': not a valid value", name, *raw);
    }
}

} // anonymous namespace

// ─── Derived settings ─────────────────────────────────────────────────────────

sampling::SamplerLimits AnalysisConfig::sampler_limits() const noexcept {
    return sampling::SamplerLimits{
        .sample_cap       = sample_cap,
        .exact_sample_cap = exact_sample_cap,
    };
}

curvature::ExactBudget AnalysisConfig::exact_budget() const noexcept {
    return curvature::ExactBudget{
        .max_tuples  = exact_max_tuples,
        .time_budget = std::chrono::milliseconds(exact_budget_ms),
    };
}

AnalysisMode AnalysisConfig::default_mode() const noexcept {
    return exact_delta ? AnalysisMode::Exact : AnalysisMode::Heuristic;
}

std::chrono::milliseconds CacheConfig::ttl() const noexcept {
    return std::chrono::seconds(ttl_seconds);
}

std::size_t ServerConfig::effective_workers() const noexcept {
    if (workers > 0) return workers;
    return std::max(1u, std::thread::hardware_concurrency());
}

std::chrono::milliseconds ServerConfig::idle_timeout() const noexcept {
    return std::chrono::seconds(idle_timeout_s);
}

// ─── parse_bool ───────────────────────────────────────────────────────────────

std::optional<bool> parse_bool(std::string_view text) noexcept {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes")  return true;
    if (lower == "0" || lower == "false" || lower == "no") return false;
    return std::nullopt;
}

// ─── YAML ─────────────────────────────────────────────────────────────────────

std::optional<ServiceConfig>
parse_config(const std::string& yaml_text, ServiceConfig base, std::string* error) {
    ServiceConfig cfg = std::move(base);
    try {
        const YAML::Node yaml = YAML::Load(yaml_text);

        if (const auto a = yaml["analysis"]) {
            read_yaml(a, "exact_delta", cfg.analysis.exact_delta);
            read_yaml(a, "sample_cap", cfg.analysis.sample_cap);
            read_yaml(a, "exact_sample_cap", cfg.analysis.exact_sample_cap);
            read_yaml(a, "exact_budget_ms", cfg.analysis.exact_budget_ms);
            read_yaml(a, "exact_max_tuples", cfg.analysis.exact_max_tuples);
        }
        if (const auto c = yaml["cache"]) {
            read_yaml(c, "ttl_seconds", cfg.cache.ttl_seconds);
        }
        if (const auto e = yaml["events"]) {
            read_yaml(e, "queue_capacity", cfg.events.queue_capacity);
            read_yaml(e, "udp_endpoint", cfg.events.udp_endpoint);
        }
        if (const auto s = yaml["server"]) {
            read_yaml(s, "host", cfg.server.host);
            read_yaml(s, "port", cfg.server.port);
            read_yaml(s, "workers", cfg.server.workers);
            read_yaml(s, "idle_timeout_s", cfg.server.idle_timeout_s);
            read_yaml(s, "max_sessions", cfg.server.max_sessions);
        }
        if (const auto em = yaml["embeddings"]) {
            read_yaml(em, "dir", cfg.embeddings_dir);
        }
        if (const auto l = yaml["logging"]) {
            read_yaml(l, "level", cfg.log_level);
        }
    } catch (const YAML::Exception& e) {
        if (error) *error = e.what();
        return std::nullopt;
    }
    return cfg;
}

std::optional<ServiceConfig>
load_config(const std::string& path, ServiceConfig base, std::string* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (error) *error = fmt::format("cannot open {}", path);
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_config(contents.str(), std::move(base), error);
}

// ─── Environment ──────────────────────────────────────────────────────────────

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        if (const char* v = std::getenv(name.c_str())) return std::string(v);
        return std::nullopt;
    };
}

ServiceConfig apply_env(ServiceConfig cfg, const EnvLookup& lookup) {
    const auto as_size  = [](const std::string& s) { return parse_number<std::size_t>(s); };
    const auto as_long  = [](const std::string& s) { return parse_number<long>(s); };
    const auto as_port  = [](const std::string& s) -> std::optional<unsigned short> {
        auto v = parse_number<unsigned int>(s);
        if (!v || *v == 0 || *v > 65535) return std::nullopt;
        return static_cast<unsigned short>(*v);
    };
    const auto as_text  = [](const std::string& s) { return std::optional<std::string>(s); };

    env_override(lookup, "EXACT_DELTA", cfg.analysis.exact_delta,
                 [](const std::string& s) { return parse_bool(s); });
    env_override(lookup, "CHIT_SAMPLE_CAP", cfg.analysis.sample_cap, as_size);
    env_override(lookup, "CHIT_EXACT_SAMPLE_CAP", cfg.analysis.exact_sample_cap, as_size);
    env_override(lookup, "CHIT_EXACT_BUDGET_MS", cfg.analysis.exact_budget_ms, as_long);
    env_override(lookup, "CHIT_EXACT_MAX_TUPLES", cfg.analysis.exact_max_tuples, as_size);
    env_override(lookup, "CHIT_CACHE_TTL_S", cfg.cache.ttl_seconds, as_long);
    env_override(lookup, "CHIT_EVENT_QUEUE", cfg.events.queue_capacity, as_size);
    env_override(lookup, "CHIT_EVENT_UDP", cfg.events.udp_endpoint, as_text);
    env_override(lookup, "CHIT_HTTP_HOST", cfg.server.host, as_text);
    env_override(lookup, "CHIT_HTTP_PORT", cfg.server.port, as_port);
    env_override(lookup, "CHIT_WORKERS", cfg.server.workers, as_size);
    env_override(lookup, "CHIT_HTTP_IDLE_TIMEOUT_S", cfg.server.idle_timeout_s, as_long);
    env_override(lookup, "CHIT_HTTP_MAX_SESSIONS", cfg.server.max_sessions, as_size);
    env_override(lookup, "CHIT_EMBEDDINGS_DIR", cfg.embeddings_dir, as_text);
    env_override(lookup, "CHIT_LOG_LEVEL", cfg.log_level, as_text);
    return cfg;
}

// ─── validate ─────────────────────────────────────────────────────────────────

std::vector<std::string> validate(const ServiceConfig& cfg) {
    std::vector<std::string> problems;
    if (cfg.analysis.sample_cap < constants::MIN_SAMPLE_SIZE) {
        problems.push_back(fmt::format("analysis.sample_cap must be >= {}",
                                       constants::MIN_SAMPLE_SIZE));
    }
    if (cfg.analysis.exact_sample_cap < constants::MIN_SAMPLE_SIZE) {
        problems.push_back(fmt::format("analysis.exact_sample_cap must be >= {}",
                                       constants::MIN_SAMPLE_SIZE));
    }
    if (cfg.analysis.exact_budget_ms <= 0) {
        problems.emplace_back("analysis.exact_budget_ms must be positive");
    }
    if (cfg.cache.ttl_seconds < 0) {
        problems.emplace_back("cache.ttl_seconds must not be negative");
    }
    if (cfg.events.queue_capacity == 0) {
        problems.emplace_back("events.queue_capacity must be positive");
    }
    if (!cfg.events.udp_endpoint.empty() &&
        !events::parse_udp_endpoint(cfg.events.udp_endpoint)) {
        problems.push_back(fmt::format("events.udp_endpoint '{}' is not host:port",
                                       cfg.events.udp_endpoint));
    }
    if (cfg.server.port == 0) {
        problems.emplace_back("server.port must be non-zero");
    }
    if (cfg.server.idle_timeout_s <= 0) {
        problems.emplace_back("server.idle_timeout_s must be positive");
    }
    if (cfg.server.max_sessions == 0) {
        problems.emplace_back("server.max_sessions must be positive");
    }
    if (!log::parse_level(cfg.log_level)) {
        problems.push_back(fmt::format("logging.level '{}' is unknown", cfg.log_level));
    }
    return problems;
}

} // namespace chit::config
