#pragma once

/// @file include/chit/http_server.hpp
/// @brief HTTP surface of the query API (Boost.Beast).
///
/// | Method | Target                                | Handler              |
/// |--------|---------------------------------------|----------------------|
/// | POST   | /cipher/geometry/visualize_manifold   | compute              |
/// | GET    | /cipher/geometry/demo-packet          | demo packet          |
/// | POST   | /cipher/geometry/simulate             | simulate             |
/// | POST   | /cipher/geometry/invalidate           | invalidate           |
/// | GET    | /health                               | status + counters    |
///
/// `HttpRouter` maps a parsed request to a response and is usable without a
/// socket. `HttpServer` runs connection I/O asynchronously on its own threads
/// and hands each parsed request to the worker pool, so idle keep-alive
/// connections never hold a pool worker.

#include "chit/constants.hpp"
#include "chit/service.hpp"
#include "chit/worker_pool.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

#include <json/json.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace chit::http {

namespace beast_http = boost::beast::http;

using Request  = beast_http::request<beast_http::string_body>;
using Response = beast_http::response<beast_http::string_body>;

/// Largest accepted request body.
inline constexpr std::size_t MAX_BODY_BYTES = 1 << 20;

// ─── HttpRouter ───────────────────────────────────────────────────────────────

class HttpRouter {
public:
    explicit HttpRouter(service::GeometryService& service);

    /// Never throws; handler failures become 500 responses.
    [[nodiscard]] Response handle(const Request& req) const;

private:
    [[nodiscard]] Response handle_visualize(const Request& req) const;
    [[nodiscard]] Response handle_demo_packet(const Request& req) const;
    [[nodiscard]] Response handle_simulate(const Request& req) const;
    [[nodiscard]] Response handle_invalidate(const Request& req) const;
    [[nodiscard]] Response handle_health(const Request& req) const;

    [[nodiscard]] static Response json_response(const Request& req,
                                                beast_http::status status,
                                                const Json::Value& body);
    [[nodiscard]] static Response error_response(const Request& req,
                                                 beast_http::status status,
                                                 const std::string& error,
                                                 const std::string& message);

    service::GeometryService& service_;
};

// ─── HttpServer ───────────────────────────────────────────────────────────────

struct SessionLimits {
    /// Deadline for reading a request or writing a response. A connection
    /// that stays silent this long is closed.
    std::chrono::milliseconds idle_timeout{
        std::chrono::seconds(constants::DEFAULT_HTTP_IDLE_TIMEOUT_S)};
    /// Open connections allowed at once; further ones are closed on accept.
    std::size_t max_sessions = constants::DEFAULT_HTTP_MAX_SESSIONS;
    /// Threads running socket I/O. Request handling runs on the pool.
    std::size_t io_threads = 1;
};

class HttpServer {
public:
    HttpServer(const HttpRouter& router, WorkerPool& pool,
               std::string host, unsigned short port,
               SessionLimits limits = {});
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind, listen and start accepting. Returns false (logged) on failure.
    bool start();

    /// Stop accepting, close every open session and join the I/O threads.
    /// Requests already on the pool finish before this returns.
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Bound port (differs from the requested one when that was 0).
    [[nodiscard]] unsigned short port() const noexcept { return bound_port_; }

    /// Sessions currently open.
    [[nodiscard]] std::size_t open_sessions() const;

private:
    class Session;

    void do_accept();
    void on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);
    void close_sessions();

    const HttpRouter&               router_;
    WorkerPool&                     pool_;
    std::string                     host_;
    unsigned short                  port_;
    SessionLimits                   limits_;
    unsigned short                  bound_port_ = 0;

    boost::asio::io_context         io_;
    boost::asio::ip::tcp::acceptor  acceptor_;
    std::vector<std::thread>        io_threads_;
    std::atomic<bool>               running_{false};

    mutable std::mutex                   sessions_mutex_;
    std::vector<std::weak_ptr<Session>>  sessions_;
};

} // namespace chit::http
