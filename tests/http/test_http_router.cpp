/// @file tests/http/test_http_router.cpp
/// @brief Socket-free tests for HttpRouter.
///
/// Test categories:
///   - visualize_manifold: success body, 400 per request error kind
///   - Method and path dispatch (405, 404, query strings)
///   - demo-packet, simulate, invalidate, health

#include "chit/http_server.hpp"
#include "chit/json_codec.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

using namespace chit;
using namespace chit::http;
using namespace std::chrono_literals;

namespace {

class NullTransport final : public events::EventTransport {
public:
    bool publish(std::string_view, const std::string&) override { return true; }
};

class HttpRouterTest : public ::testing::Test {
protected:
    HttpRouterTest()
        : publisher_(std::make_shared<NullTransport>(), 16)
        , pool_(1)
        , demo_(source_)
        , service_(service::ServiceOptions{}, demo_, cache_, publisher_, pool_,
                   curvature::make_analyze_function(sampling::SamplerLimits{},
                                                    curvature::ExactBudget{}))
        , router_(service_) {
        source_.put(EmbeddingSet{"tree", {{0.0, 0.0, 0.0}, {10.0, 0.0, 0.0}, {0.0, 8.0, 0.0},
                                          {-5.0, -5.0, -5.0}, {0.1, 0.1, 0.0}}});
    }

    Response call(beast_http::verb verb, const std::string& target,
                  const std::string& body = {}) const {
        Request req{verb, target, 11};
        if (!body.empty()) {
            req.set(beast_http::field::content_type, "application/json");
            req.body() = body;
        }
        req.prepare_payload();
        return router_.handle(req);
    }

    static Json::Value json_of(const Response& res) {
        std::string error;
        auto v = io::parse_json(res.body(), &error);
        EXPECT_TRUE(v.has_value()) << error;
        return v.value_or(Json::Value());
    }

    static std::string error_of(const Response& res) {
        return json_of(res)["error"].asString();
    }

    cache::MetricsCache         cache_;
    events::EventPublisher      publisher_;
    WorkerPool                  pool_;
    io::InMemoryEmbeddingSource source_;
    io::DemoEmbeddingSource     demo_;
    service::GeometryService    service_;
    HttpRouter                  router_;
};

constexpr const char* VISUALIZE = "/cipher/geometry/visualize_manifold";

}  // anonymous namespace

// ─── visualize_manifold ───────────────────────────────────────────────────────

TEST_F(HttpRouterTest, VisualizeReturnsMetricsPacketAndSpectrum) {
    const auto res = call(beast_http::verb::post, VISUALIZE, R"({"document_id": "tree"})");
    ASSERT_EQ(res.result(), beast_http::status::ok);
    EXPECT_EQ(res[beast_http::field::content_type], "application/json");

    const auto body = json_of(res);
    EXPECT_EQ(body["status"].asString(), "ok");
    EXPECT_EQ(body["shape"].asString(), "Hyperbolic (Pseudosphere)");
    EXPECT_EQ(body["metrics"]["classification"].asString(), "Hyperbolic");
    EXPECT_EQ(body["metrics"]["mode"].asString(), "heuristic");
    EXPECT_EQ(body["cgp"]["surface_fn"].asString(), "tractrix");
    EXPECT_EQ(body["spectrum"]["frequencies"].size(), 5u);
    EXPECT_FALSE(body["cache_hit"].asBool());

    const auto again = json_of(call(beast_http::verb::post, VISUALIZE,
                                    R"({"document_id": "tree"})"));
    EXPECT_TRUE(again["cache_hit"].asBool());
}

TEST_F(HttpRouterTest, VisualizeExactMode) {
    const auto body = json_of(call(beast_http::verb::post, VISUALIZE,
                                   R"({"document_id": "tree", "mode": "exact"})"));
    EXPECT_EQ(body["metrics"]["mode"].asString(), "exact");
    EXPECT_TRUE(body["metrics"]["exact_used"].asBool());
}

TEST_F(HttpRouterTest, VisualizeWithOverrides) {
    const auto body = json_of(call(beast_http::verb::post, VISUALIZE,
        R"({"document_id": "tree", "overrides": {"curvature_k": 3.0, "epsilon": 0.2}})"));
    EXPECT_EQ(body["metrics"]["origin"].asString(), "override");
    EXPECT_DOUBLE_EQ(body["cgp"]["curvature_k"].asDouble(), 3.0);
    EXPECT_EQ(body["cgp"]["source"].asString(), "override");
    EXPECT_EQ(body["cgp"]["surface_fn"].asString(), "sphere");
}

TEST_F(HttpRouterTest, VisualizeUnknownDocumentIsIndeterminate) {
    const auto res = call(beast_http::verb::post, VISUALIZE, R"({"document_id": "ghost"})");
    ASSERT_EQ(res.result(), beast_http::status::ok);
    const auto body = json_of(res);
    EXPECT_EQ(body["metrics"]["classification"].asString(), "Indeterminate");
    EXPECT_EQ(body["cgp"]["surface_fn"].asString(), "plane");
}

TEST_F(HttpRouterTest, VisualizeRequestErrors) {
    struct Case {
        const char* body;
        const char* error;
    };
    const Case cases[] = {
        {"not json", "malformed_body"},
        {"[1, 2]", "malformed_body"},
        {"{}", "invalid_document_id"},
        {R"({"document_id": 7})", "invalid_document_id"},
        {R"({"document_id": "../x"})", "invalid_document_id"},
        {R"({"document_id": "tree", "mode": "fast"})", "unknown_mode"},
        {R"({"document_id": "tree", "mode": 1})", "unknown_mode"},
        {R"({"document_id": "tree", "overrides": {"surface_fn": "torus"}})", "invalid_overrides"},
        {R"({"document_id": "tree", "overrides": 5})", "invalid_overrides"},
    };
    for (const auto& c : cases) {
        const auto res = call(beast_http::verb::post, VISUALIZE, c.body);
        EXPECT_EQ(res.result(), beast_http::status::bad_request) << c.body;
        const auto body = json_of(res);
        EXPECT_EQ(body["status"].asString(), "error") << c.body;
        EXPECT_EQ(body["error"].asString(), c.error) << c.body;
        EXPECT_FALSE(body["message"].asString().empty()) << c.body;
    }
}

TEST_F(HttpRouterTest, NullModeUsesDefault) {
    const auto body = json_of(call(beast_http::verb::post, VISUALIZE,
                                   R"({"document_id": "tree", "mode": null})"));
    EXPECT_EQ(body["metrics"]["mode"].asString(), "heuristic");
}

// ─── Dispatch ─────────────────────────────────────────────────────────────────

TEST_F(HttpRouterTest, WrongMethodIs405) {
    EXPECT_EQ(call(beast_http::verb::get, VISUALIZE).result(),
              beast_http::status::method_not_allowed);
    EXPECT_EQ(call(beast_http::verb::post, "/cipher/geometry/demo-packet", "{}").result(),
              beast_http::status::method_not_allowed);
    EXPECT_EQ(call(beast_http::verb::get, "/cipher/geometry/simulate").result(),
              beast_http::status::method_not_allowed);
    EXPECT_EQ(call(beast_http::verb::get, "/cipher/geometry/invalidate").result(),
              beast_http::status::method_not_allowed);
}

TEST_F(HttpRouterTest, UnknownPathIs404) {
    const auto res = call(beast_http::verb::get, "/cipher/geometry/nothing");
    EXPECT_EQ(res.result(), beast_http::status::not_found);
    EXPECT_EQ(error_of(res), "not_found");
}

TEST_F(HttpRouterTest, QueryStringIgnored) {
    EXPECT_EQ(call(beast_http::verb::get, "/cipher/geometry/demo-packet?x=1").result(),
              beast_http::status::ok);
}

// ─── Other endpoints ──────────────────────────────────────────────────────────

TEST_F(HttpRouterTest, DemoPacket) {
    const auto body = json_of(call(beast_http::verb::get, "/cipher/geometry/demo-packet"));
    EXPECT_EQ(body["spec"].asString(), "chit.cgp.v0.1");
    EXPECT_EQ(body["source"].asString(), "demo");
    EXPECT_EQ(body["super_nodes"].size(), 1u);
}

TEST_F(HttpRouterTest, SimulateDecodesDemoPacket) {
    const std::string demo = io::write_json(io::to_json(render::demo_packet()));
    const auto res = call(beast_http::verb::post, "/cipher/geometry/simulate", demo);
    ASSERT_EQ(res.result(), beast_http::status::ok);

    const auto body = json_of(res);
    EXPECT_EQ(body["cgp"]["source"].asString(), "simulate");
    ASSERT_EQ(body["decoded"].size(), 3u);
    EXPECT_EQ(body["decoded"][0]["content"].asString(), "St. Maarten Bridge Status: OK");
    EXPECT_NEAR(body["spectrum"]["frequencies"][0].asDouble(), 34.13, 1e-9);
}

TEST_F(HttpRouterTest, SimulateRejectsBadPacket) {
    EXPECT_EQ(error_of(call(beast_http::verb::post, "/cipher/geometry/simulate", "{")),
              "malformed_body");
    EXPECT_EQ(error_of(call(beast_http::verb::post, "/cipher/geometry/simulate",
                            R"({"segments": "many"})")),
              "invalid_overrides");
}

TEST_F(HttpRouterTest, InvalidateDropsCachedMetrics) {
    (void)call(beast_http::verb::post, VISUALIZE, R"({"document_id": "tree"})");
    const auto res = call(beast_http::verb::post, "/cipher/geometry/invalidate",
                          R"({"document_id": "tree"})");
    ASSERT_EQ(res.result(), beast_http::status::ok);
    EXPECT_EQ(json_of(res)["document_id"].asString(), "tree");

    const auto after = json_of(call(beast_http::verb::post, VISUALIZE,
                                    R"({"document_id": "tree"})"));
    EXPECT_FALSE(after["cache_hit"].asBool());
}

TEST_F(HttpRouterTest, InvalidateRejectsBadId) {
    EXPECT_EQ(error_of(call(beast_http::verb::post, "/cipher/geometry/invalidate",
                            R"({"document_id": ""})")),
              "invalid_document_id");
    EXPECT_EQ(error_of(call(beast_http::verb::post, "/cipher/geometry/invalidate", "{}")),
              "invalid_document_id");
}

TEST_F(HttpRouterTest, HealthReportsEventCounters) {
    (void)call(beast_http::verb::post, VISUALIZE, R"({"document_id": "tree"})");
    ASSERT_TRUE(publisher_.flush(5s));

    const auto body = json_of(call(beast_http::verb::get, "/health"));
    EXPECT_EQ(body["status"].asString(), "ok");
    EXPECT_EQ(body["events"]["published"].asUInt64(), 1u);
    EXPECT_EQ(body["events"]["pending"].asUInt64(), 0u);
}
