/// @file src/main.cpp
/// @brief chitgeo CLI entry point.
///
/// Usage:
///   chitgeo --serve [config.yaml]       Run the HTTP geometry service
///   chitgeo --analyze <csv> [--exact]   Analyse an embeddings CSV, print JSON
///   chitgeo --demo                      Analyse the built-in demo document
///   chitgeo --help                      Print usage

#include "chit/config.hpp"
#include "chit/curvature.hpp"
#include "chit/embedding_loader.hpp"
#include "chit/embedding_source.hpp"
#include "chit/events.hpp"
#include "chit/http_server.hpp"
#include "chit/json_codec.hpp"
#include "chit/logging.hpp"
#include "chit/metrics_cache.hpp"
#include "chit/service.hpp"
#include "chit/worker_pool.hpp"

#include <fmt/core.h>

#include <chrono>
#include <csignal>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>

namespace {

volatile std::sig_atomic_t g_stop = 0;

void on_signal(int) { g_stop = 1; }

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  chitgeo --serve [config.yaml]       Run the HTTP geometry service\n"
        "  chitgeo --analyze <csv> [--exact]   Analyse an embeddings CSV\n"
        "  chitgeo --demo                      Analyse the built-in demo document\n"
        "  chitgeo --help                      Show this help\n"
        "\n"
        "CSV format: one embedding per row, comma-separated; an optional\n"
        "non-numeric header row and '#' comment lines are skipped.\n"
    );
}

/// Defaults, then the YAML file (if any), then the environment.
std::optional<chit::config::ServiceConfig> resolve_config(const std::string& path) {
    chit::config::ServiceConfig cfg;
    if (!path.empty()) {
        std::string error;
        auto loaded = chit::config::load_config(path, cfg, &error);
        if (!loaded) {
            fmt::print(stderr, "Error: cannot load config '{}': {}\n", path, error);
            return std::nullopt;
        }
        cfg = std::move(*loaded);
    }
    cfg = chit::config::apply_env(std::move(cfg), chit::config::process_env());

    const auto problems = chit::config::validate(cfg);
    for (const auto& p : problems) {
        fmt::print(stderr, "Error: {}\n", p);
    }
    if (!problems.empty()) return std::nullopt;

    chit::log::init(cfg.log_level);
    return cfg;
}

std::shared_ptr<chit::events::EventTransport>
make_transport(const chit::config::ServiceConfig& cfg) {
    if (auto ep = chit::events::parse_udp_endpoint(cfg.events.udp_endpoint)) {
        chit::log::logger()->info("publishing manifold updates to udp {}:{}", ep->host, ep->port);
        return std::make_shared<chit::events::UdpTransport>(*ep);
    }
    return std::make_shared<chit::events::InProcessBus>();
}

/// Everything the service borrows, owned in one place.
struct Runtime {
    explicit Runtime(const chit::config::ServiceConfig& cfg, chit::io::EmbeddingSource& base)
        : demo(base)
        , publisher(make_transport(cfg), cfg.events.queue_capacity)
        , pool(cfg.server.effective_workers())
        , service(chit::service::ServiceOptions{
                      .default_mode = cfg.analysis.default_mode(),
                      .cache_ttl    = cfg.cache.ttl(),
                  },
                  demo, cache, publisher, pool,
                  chit::curvature::make_analyze_function(cfg.analysis.sampler_limits(),
                                                         cfg.analysis.exact_budget())) {}

    chit::io::DemoEmbeddingSource    demo;
    chit::cache::MetricsCache        cache;
    chit::events::EventPublisher     publisher;
    chit::WorkerPool                 pool;
    chit::service::GeometryService   service;
};

/// Print a compute result. Returns 0 on success, 1 on a request error.
int print_result(const chit::service::ComputeResult& result) {
    if (const auto* err = std::get_if<chit::service::RequestError>(&result)) {
        fmt::print(stderr, "Error: {}\n", err->message);
        return 1;
    }
    const auto& r = std::get<chit::service::ComputeResponse>(result);
    Json::Value out(Json::objectValue);
    out["metrics"]  = chit::io::to_json(r.metrics);
    out["cgp"]      = chit::io::to_json(r.packet);
    out["spectrum"] = chit::io::to_json(r.spectrum);
    fmt::print("{}\n", chit::io::write_json(out, true));
    return 0;
}

int run_serve(const std::string& config_path) {
    auto cfg = resolve_config(config_path);
    if (!cfg) return 1;

    chit::io::InMemoryEmbeddingSource empty;
    std::unique_ptr<chit::io::CsvDirectoryEmbeddingSource> dir;
    chit::io::EmbeddingSource* base = &empty;
    if (!cfg->embeddings_dir.empty()) {
        dir = std::make_unique<chit::io::CsvDirectoryEmbeddingSource>(cfg->embeddings_dir);
        base = dir.get();
    }

    Runtime rt(*cfg, *base);
    chit::http::HttpRouter router(rt.service);
    chit::http::HttpServer server(router, rt.pool, cfg->server.host, cfg->server.port,
                                  chit::http::SessionLimits{
                                      .idle_timeout = cfg->server.idle_timeout(),
                                      .max_sessions = cfg->server.max_sessions,
                                  });
    if (!server.start()) return 1;

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.stop();
    if (!rt.publisher.flush(std::chrono::seconds(2))) {
        chit::log::logger()->warn("shutdown with {} unsent events", rt.publisher.stats().pending);
    }
    return 0;
}

int run_analyze(const std::string& filepath, bool exact) {
    auto cfg = resolve_config("");
    if (!cfg) return 1;

    auto loaded = chit::io::EmbeddingLoader::load_csv(filepath);
    if (!loaded) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return 1;
    }
    fmt::print(stderr, "Loaded {} embeddings from '{}' ({} malformed rows skipped)\n",
               loaded->vectors.size(), filepath, loaded->skipped_rows);

    chit::io::InMemoryEmbeddingSource source;
    source.put(chit::EmbeddingSet{"cli", std::move(loaded->vectors)});

    Runtime rt(*cfg, source);
    return print_result(rt.service.compute(
        "cli", exact ? chit::AnalysisMode::Exact : chit::AnalysisMode::Heuristic));
}

int run_demo() {
    auto cfg = resolve_config("");
    if (!cfg) return 1;

    chit::io::InMemoryEmbeddingSource empty;
    Runtime rt(*cfg, empty);
    return print_result(rt.service.compute(std::string(chit::constants::DEMO_DOCUMENT_ID),
                                           std::nullopt));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--serve") {
        return run_serve(argc >= 3 ? std::string(argv[2]) : std::string());
    }

    if (mode == "--analyze") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --analyze requires a CSV file path\n");
            print_usage();
            return 1;
        }
        const bool exact = argc >= 4 && std::string(argv[3]) == "--exact";
        return run_analyze(std::string(argv[2]), exact);
    }

    if (mode == "--demo") {
        return run_demo();
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
