/// @file tests/http/test_http_server.cpp
/// @brief HttpServer over real loopback sockets.
///
/// Test categories:
///   - Request/response and keep-alive over a socket
///   - An idle connection never starves other clients (one pool worker)
///   - Idle deadline closes silent connections
///   - stop() closes open sessions and returns promptly
///   - Session cap refuses extra connections

#include "chit/http_server.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

using namespace chit;
using namespace chit::http;
using namespace std::chrono_literals;

namespace asio  = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

namespace {

class NullTransport final : public events::EventTransport {
public:
    bool publish(std::string_view, const std::string&) override { return true; }
};

/// Blocking-style client whose every wait is bounded by a deadline.
class LoopbackClient {
public:
    explicit LoopbackClient(unsigned short port) : stream_(ioc_) {
        stream_.connect(tcp::endpoint(asio::ip::address_v4::loopback(), port));
    }

    /// Send `GET target` and read the response, waiting at most `timeout`.
    boost::system::error_code get(const std::string& target, Response& out,
                                  std::chrono::milliseconds timeout = 3s) {
        Request req{beast_http::verb::get, target, 11};
        req.set(beast_http::field::host, "127.0.0.1");
        req.keep_alive(true);

        boost::system::error_code result;
        stream_.expires_after(timeout);
        beast_http::async_write(stream_, req,
            [&](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    result = ec;
                    return;
                }
                beast_http::async_read(stream_, buffer_, out,
                    [&](boost::system::error_code read_ec, std::size_t) { result = read_ec; });
            });
        ioc_.restart();
        ioc_.run();
        return result;
    }

    /// Wait for the server to close the connection. Returns
    /// beast::error::timeout if it is still open after `timeout`.
    boost::system::error_code wait_closed(std::chrono::milliseconds timeout = 3s) {
        char byte = 0;
        boost::system::error_code result;
        stream_.expires_after(timeout);
        stream_.async_read_some(asio::buffer(&byte, 1),
            [&](boost::system::error_code ec, std::size_t) { result = ec; });
        ioc_.restart();
        ioc_.run();
        return result;
    }

private:
    asio::io_context   ioc_;
    beast::tcp_stream  stream_;
    beast::flat_buffer buffer_;
};

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = 3s) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

class HttpServerTest : public ::testing::Test {
protected:
    HttpServerTest()
        : publisher_(std::make_shared<NullTransport>(), 16)
        , pool_(1)
        , demo_(source_)
        , service_(service::ServiceOptions{}, demo_, cache_, publisher_, pool_,
                   curvature::make_analyze_function(sampling::SamplerLimits{},
                                                    curvature::ExactBudget{}))
        , router_(service_) {}

    HttpServer& start(SessionLimits limits) {
        server_ = std::make_unique<HttpServer>(router_, pool_, "127.0.0.1", 0, limits);
        EXPECT_TRUE(server_->start());
        EXPECT_NE(server_->port(), 0);
        return *server_;
    }

    cache::MetricsCache         cache_;
    events::EventPublisher      publisher_;
    WorkerPool                  pool_;
    io::InMemoryEmbeddingSource source_;
    io::DemoEmbeddingSource     demo_;
    service::GeometryService    service_;
    HttpRouter                  router_;
    std::unique_ptr<HttpServer> server_;
};

}  // anonymous namespace

// ─── Request/response ─────────────────────────────────────────────────────────

TEST_F(HttpServerTest, ServesHealthWithKeepAlive) {
    auto& server = start(SessionLimits{});
    LoopbackClient client(server.port());

    for (int i = 0; i < 2; ++i) {
        Response res;
        ASSERT_FALSE(client.get("/health", res)) << "request " << i;
        EXPECT_EQ(res.result(), beast_http::status::ok);
        EXPECT_NE(res.body().find("\"ok\""), std::string::npos);
    }
    EXPECT_EQ(server.open_sessions(), 1u);
}

TEST_F(HttpServerTest, ServesDemoPacket) {
    auto& server = start(SessionLimits{});
    LoopbackClient client(server.port());

    Response res;
    ASSERT_FALSE(client.get("/cipher/geometry/demo-packet", res));
    EXPECT_EQ(res.result(), beast_http::status::ok);
    EXPECT_NE(res.body().find("chit.cgp.v0.1"), std::string::npos);
}

TEST_F(HttpServerTest, StartFailsOnInvalidAddress) {
    HttpServer server(router_, pool_, "not-an-address", 0);
    EXPECT_FALSE(server.start());
    EXPECT_FALSE(server.is_running());
}

// ─── Idle connections ─────────────────────────────────────────────────────────

TEST_F(HttpServerTest, IdleClientDoesNotBlockOthers) {
    // One pool worker and a long deadline: the silent connection must not
    // occupy the worker the second client needs.
    auto& server = start(SessionLimits{.idle_timeout = 30s});
    LoopbackClient idle(server.port());
    ASSERT_TRUE(eventually([&] { return server.open_sessions() == 1; }));

    LoopbackClient active(server.port());
    Response res;
    ASSERT_FALSE(active.get("/health", res, 3s));
    EXPECT_EQ(res.result(), beast_http::status::ok);
}

TEST_F(HttpServerTest, SilentConnectionClosedAfterIdleTimeout) {
    auto& server = start(SessionLimits{.idle_timeout = 200ms});
    LoopbackClient idle(server.port());

    const auto ec = idle.wait_closed(3s);
    EXPECT_TRUE(ec);
    EXPECT_NE(ec, beast::error::timeout);
    EXPECT_TRUE(eventually([&] { return server.open_sessions() == 0; }));
}

TEST_F(HttpServerTest, KeepAliveConnectionClosedAfterIdleTimeout) {
    auto& server = start(SessionLimits{.idle_timeout = 200ms});
    LoopbackClient client(server.port());

    Response res;
    ASSERT_FALSE(client.get("/health", res));
    const auto ec = client.wait_closed(3s);
    EXPECT_NE(ec, beast::error::timeout);
}

// ─── stop() ───────────────────────────────────────────────────────────────────

TEST_F(HttpServerTest, StopClosesOpenSessions) {
    auto& server = start(SessionLimits{.idle_timeout = 30s});
    LoopbackClient idle(server.port());
    ASSERT_TRUE(eventually([&] { return server.open_sessions() == 1; }));

    auto stopped = std::async(std::launch::async, [&] { server.stop(); });
    ASSERT_EQ(stopped.wait_for(3s), std::future_status::ready);
    EXPECT_FALSE(server.is_running());

    const auto ec = idle.wait_closed(3s);
    EXPECT_NE(ec, beast::error::timeout);
}

TEST_F(HttpServerTest, StopWithoutConnectionsIsPrompt) {
    auto& server = start(SessionLimits{});
    auto stopped = std::async(std::launch::async, [&] { server.stop(); });
    ASSERT_EQ(stopped.wait_for(3s), std::future_status::ready);
    server.stop();
    EXPECT_FALSE(server.is_running());
}

// ─── Session cap ──────────────────────────────────────────────────────────────

TEST_F(HttpServerTest, RefusesConnectionsBeyondCap) {
    auto& server = start(SessionLimits{.idle_timeout = 30s, .max_sessions = 1});
    LoopbackClient first(server.port());
    ASSERT_TRUE(eventually([&] { return server.open_sessions() == 1; }));

    LoopbackClient second(server.port());
    const auto ec = second.wait_closed(3s);
    EXPECT_NE(ec, beast::error::timeout);

    Response res;
    ASSERT_FALSE(first.get("/health", res));
    EXPECT_EQ(res.result(), beast_http::status::ok);
}
