/// @file src/http/http_router.cpp
/// @brief Request routing and JSON request/response mapping.

#include "chit/http_server.hpp"

#include "chit/json_codec.hpp"
#include "chit/logging.hpp"

#include <string_view>

namespace chit::http {

namespace {

std::string_view path_of(const Request& req) {
    const std::string_view target(req.target().data(), req.target().size());
    const auto q = target.find('?');
    return q == std::string_view::npos ? target : target.substr(0, q);
}

/// Parse a JSON object body; nullopt with `error` set otherwise.
std::optional<Json::Value> object_body(const Request& req, std::string& error) {
    auto root = io::parse_json(req.body(), &error);
    if (!root) return std::nullopt;
    if (!root->isObject()) {
        error = "request body must be a JSON object";
        return std::nullopt;
    }
    return root;
}

/// Extract a required string `document_id`.
std::optional<std::string> document_id_of(const Json::Value& body) {
    if (!body.isMember("document_id") || !body["document_id"].isString()) {
        return std::nullopt;
    }
    return body["document_id"].asString();
}

} // anonymous namespace

HttpRouter::HttpRouter(service::GeometryService& service)
    : service_(service) {}

// ─── Dispatch ─────────────────────────────────────────────────────────────────

Response HttpRouter::handle(const Request& req) const {
    const std::string_view path = path_of(req);
    const auto method = req.method();
    log::logger()->debug("{} {}", std::string_view(req.method_string().data(),
                                                   req.method_string().size()), path);

    try {
        if (path == "/cipher/geometry/visualize_manifold") {
            if (method != beast_http::verb::post) {
                return error_response(req, beast_http::status::method_not_allowed,
                                      "method_not_allowed", "use POST");
            }
            return handle_visualize(req);
        }
        if (path == "/cipher/geometry/demo-packet") {
            if (method != beast_http::verb::get) {
                return error_response(req, beast_http::status::method_not_allowed,
                                      "method_not_allowed", "use GET");
            }
            return handle_demo_packet(req);
        }
        if (path == "/cipher/geometry/simulate") {
            if (method != beast_http::verb::post) {
                return error_response(req, beast_http::status::method_not_allowed,
                                      "method_not_allowed", "use POST");
            }
            return handle_simulate(req);
        }
        if (path == "/cipher/geometry/invalidate") {
            if (method != beast_http::verb::post) {
                return error_response(req, beast_http::status::method_not_allowed,
                                      "method_not_allowed", "use POST");
            }
            return handle_invalidate(req);
        }
        if (path == "/health") {
            return handle_health(req);
        }
        return error_response(req, beast_http::status::not_found,
                              "not_found", "endpoint not found");
    } catch (const std::exception& e) {
        log::logger()->error("handler for {} failed: {}", path, e.what());
        return error_response(req, beast_http::status::internal_server_error,
                              "internal_error", "internal server error");
    }
}

// ─── Handlers ─────────────────────────────────────────────────────────────────

Response HttpRouter::handle_visualize(const Request& req) const {
    std::string parse_error;
    const auto body = object_body(req, parse_error);
    if (!body) {
        return error_response(req, beast_http::status::bad_request,
                              service::to_string(service::RequestErrorKind::MalformedBody),
                              parse_error);
    }

    service::ComputeRequest request;
    if (auto id = document_id_of(*body)) {
        request.document_id = std::move(*id);
    } else {
        return error_response(req, beast_http::status::bad_request,
                              service::to_string(service::RequestErrorKind::InvalidDocumentId),
                              "document_id must be a string");
    }

    if (body->isMember("mode") && !(*body)["mode"].isNull()) {
        if (!(*body)["mode"].isString()) {
            return error_response(req, beast_http::status::bad_request,
                                  service::to_string(service::RequestErrorKind::UnknownMode),
                                  "mode must be \"heuristic\" or \"exact\"");
        }
        request.mode = (*body)["mode"].asString();
    }

    if (body->isMember("overrides") && !(*body)["overrides"].isNull()) {
        request.overrides = io::packet_from_json((*body)["overrides"]);
        if (!request.overrides) {
            return error_response(req, beast_http::status::bad_request,
                                  service::to_string(service::RequestErrorKind::InvalidOverrides),
                                  "overrides must be a CGP-shaped object");
        }
    }

    const service::ComputeResult result = service_.compute(request);
    if (const auto* err = std::get_if<service::RequestError>(&result)) {
        return error_response(req, beast_http::status::bad_request,
                              service::to_string(err->kind), err->message);
    }

    const auto& resp = std::get<service::ComputeResponse>(result);
    Json::Value out(Json::objectValue);
    out["status"]    = "ok";
    out["shape"]     = resp.packet.inferred_shape;
    out["metrics"]   = io::to_json(resp.metrics);
    out["cgp"]       = io::to_json(resp.packet);
    out["spectrum"]  = io::to_json(resp.spectrum);
    out["cache_hit"] = resp.cache_hit;
    return json_response(req, beast_http::status::ok, out);
}

Response HttpRouter::handle_demo_packet(const Request& req) const {
    return json_response(req, beast_http::status::ok, io::to_json(service_.demo_packet()));
}

Response HttpRouter::handle_simulate(const Request& req) const {
    std::string parse_error;
    const auto body = object_body(req, parse_error);
    if (!body) {
        return error_response(req, beast_http::status::bad_request,
                              service::to_string(service::RequestErrorKind::MalformedBody),
                              parse_error);
    }

    auto packet = io::packet_from_json(*body);
    if (!packet) {
        return error_response(req, beast_http::status::bad_request,
                              service::to_string(service::RequestErrorKind::InvalidOverrides),
                              "body must be a CGP-shaped object");
    }

    const service::SimulateResponse sim = service_.simulate(std::move(*packet));
    Json::Value out(Json::objectValue);
    out["status"]   = "ok";
    out["cgp"]      = io::to_json(sim.packet);
    out["spectrum"] = io::to_json(sim.spectrum);
    out["decoded"]  = io::to_json(sim.decoded);
    return json_response(req, beast_http::status::ok, out);
}

Response HttpRouter::handle_invalidate(const Request& req) const {
    std::string parse_error;
    const auto body = object_body(req, parse_error);
    if (!body) {
        return error_response(req, beast_http::status::bad_request,
                              service::to_string(service::RequestErrorKind::MalformedBody),
                              parse_error);
    }

    const auto id = document_id_of(*body);
    if (!id) {
        return error_response(req, beast_http::status::bad_request,
                              service::to_string(service::RequestErrorKind::InvalidDocumentId),
                              "document_id must be a string");
    }
    if (auto err = service_.invalidate(*id)) {
        return error_response(req, beast_http::status::bad_request,
                              service::to_string(err->kind), err->message);
    }

    Json::Value out(Json::objectValue);
    out["status"]      = "ok";
    out["document_id"] = *id;
    return json_response(req, beast_http::status::ok, out);
}

Response HttpRouter::handle_health(const Request& req) const {
    const events::PublisherStats stats = service_.publisher_stats();
    Json::Value ev(Json::objectValue);
    ev["published"] = static_cast<Json::UInt64>(stats.published);
    ev["failed"]    = static_cast<Json::UInt64>(stats.failed);
    ev["dropped"]   = static_cast<Json::UInt64>(stats.dropped);
    ev["pending"]   = static_cast<Json::UInt64>(stats.pending);

    Json::Value out(Json::objectValue);
    out["status"] = "ok";
    out["events"] = ev;
    return json_response(req, beast_http::status::ok, out);
}

// ─── Response builders ────────────────────────────────────────────────────────

Response HttpRouter::json_response(const Request& req, beast_http::status status,
                                   const Json::Value& body) {
    Response res{status, req.version()};
    res.set(beast_http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = io::write_json(body);
    res.prepare_payload();
    return res;
}

Response HttpRouter::error_response(const Request& req, beast_http::status status,
                                    const std::string& error, const std::string& message) {
    Json::Value body(Json::objectValue);
    body["status"]  = "error";
    body["error"]   = error;
    body["message"] = message;
    return json_response(req, status, body);
}

} // namespace chit::http
