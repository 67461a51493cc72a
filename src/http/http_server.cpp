/// @file src/http/http_server.cpp
/// @brief Asynchronous Beast server: I/O threads own the sockets, the pool
///        runs the handlers.

#include "chit/http_server.hpp"

#include "chit/logging.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <algorithm>
#include <optional>
#include <stdexcept>

namespace chit::http {

namespace asio  = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

// ─── Session ──────────────────────────────────────────────────────────────────

/// One connection. Every handler runs on the session's strand; the request
/// itself is handled on the worker pool and the response posted back.
class HttpServer::Session : public std::enable_shared_from_this<Session> {
public:
    Session(HttpServer& server, tcp::socket&& socket)
        : server_(server)
        , stream_(std::move(socket)) {}

    void run() {
        asio::dispatch(stream_.get_executor(),
                       beast::bind_front_handler(&Session::do_read, shared_from_this()));
    }

    /// Safe from any thread.
    void close() {
        asio::post(stream_.get_executor(), [self = shared_from_this()] { self->shutdown(); });
    }

private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(MAX_BODY_BYTES);
        stream_.expires_after(server_.limits_.idle_timeout);
        beast_http::async_read(stream_, buffer_, *parser_,
                               beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == beast_http::error::end_of_stream) return shutdown();
        if (ec == beast::error::timeout) {
            log::logger()->debug("session idle for {} ms, closing",
                                 server_.limits_.idle_timeout.count());
            return shutdown();
        }
        if (ec) {
            log::logger()->debug("session read: {}", ec.message());
            return shutdown();
        }

        // No deadline while the pool works; the I/O threads stay free.
        stream_.expires_never();
        auto req = std::make_shared<Request>(parser_->release());
        auto work = asio::make_work_guard(server_.io_);
        try {
            (void)server_.pool_.submit(
                [self = shared_from_this(), req, work = std::move(work)]() mutable {
                    Response res = self->server_.router_.handle(*req);
                    Session* session = self.get();
                    asio::post(session->stream_.get_executor(),
                               [self = std::move(self), res = std::move(res)]() mutable {
                                   self->do_write(std::move(res));
                               });
                    work.reset();
                });
        } catch (const std::runtime_error& e) {
            log::logger()->warn("dropping request: {}", e.what());
            shutdown();
        }
    }

    void do_write(Response res) {
        res_ = std::move(res);
        const bool keep_alive = res_.keep_alive();
        stream_.expires_after(server_.limits_.idle_timeout);
        beast_http::async_write(stream_, res_,
            [self = shared_from_this(), keep_alive](beast::error_code ec, std::size_t) {
                self->on_write(keep_alive, ec);
            });
    }

    void on_write(bool keep_alive, beast::error_code ec) {
        if (ec) {
            log::logger()->debug("session write: {}", ec.message());
            return shutdown();
        }
        if (!keep_alive || !server_.running_) return shutdown();
        do_read();
    }

    void shutdown() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        stream_.close();
    }

    HttpServer&       server_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<beast_http::request_parser<beast_http::string_body>> parser_;
    Response          res_;
};

// ─── HttpServer ───────────────────────────────────────────────────────────────

HttpServer::HttpServer(const HttpRouter& router, WorkerPool& pool,
                       std::string host, unsigned short port,
                       SessionLimits limits)
    : router_(router)
    , pool_(pool)
    , host_(std::move(host))
    , port_(port)
    , limits_(limits)
    , acceptor_(asio::make_strand(io_)) {
    limits_.io_threads   = std::max<std::size_t>(1, limits_.io_threads);
    limits_.max_sessions = std::max<std::size_t>(1, limits_.max_sessions);
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (running_) return true;

    boost::system::error_code ec;
    const auto address = asio::ip::make_address(host_, ec);
    if (ec) {
        log::logger()->error("invalid listen address '{}': {}", host_, ec.message());
        return false;
    }

    const tcp::endpoint endpoint{address, port_};
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        log::logger()->error("cannot listen on {}:{}: {}", host_, port_, ec.message());
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }

    bound_port_ = acceptor_.local_endpoint().port();
    running_ = true;
    io_.restart();
    do_accept();

    io_threads_.reserve(limits_.io_threads);
    for (std::size_t i = 0; i < limits_.io_threads; ++i) {
        io_threads_.emplace_back([this] { io_.run(); });
    }
    log::logger()->info("http server listening on {}:{} (idle timeout {} ms, max {} sessions)",
                        host_, bound_port_, limits_.idle_timeout.count(),
                        limits_.max_sessions);
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;

    // Closing on the acceptor strand orders this after any accept in flight,
    // so no session registers once the list has been closed.
    asio::post(acceptor_.get_executor(), [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
        close_sessions();
    });

    // run() returns once the sessions unwind and the pool hands back the
    // work guards of requests still in progress.
    for (auto& t : io_threads_) {
        if (t.joinable()) t.join();
    }
    io_threads_.clear();
    log::logger()->info("http server stopped");
}

std::size_t HttpServer::open_sessions() const {
    std::lock_guard lock(sessions_mutex_);
    return static_cast<std::size_t>(std::count_if(
        sessions_.begin(), sessions_.end(), [](const auto& w) { return !w.expired(); }));
}

void HttpServer::do_accept() {
    acceptor_.async_accept(asio::make_strand(io_),
                           beast::bind_front_handler(&HttpServer::on_accept, this));
}

void HttpServer::on_accept(boost::system::error_code ec, tcp::socket socket) {
    if (!running_) return;
    if (ec) {
        log::logger()->warn("accept failed: {}", ec.message());
        return do_accept();
    }

    std::shared_ptr<Session> session;
    {
        std::lock_guard lock(sessions_mutex_);
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                       [](const auto& w) { return w.expired(); }),
                        sessions_.end());
        if (sessions_.size() < limits_.max_sessions) {
            session = std::make_shared<Session>(*this, std::move(socket));
            sessions_.push_back(session);
        }
    }

    if (session) {
        session->run();
    } else {
        log::logger()->warn("refusing connection: {} sessions open", limits_.max_sessions);
        boost::system::error_code ignored;
        socket.shutdown(tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }
    do_accept();
}

void HttpServer::close_sessions() {
    std::vector<std::shared_ptr<Session>> open;
    {
        std::lock_guard lock(sessions_mutex_);
        for (const auto& w : sessions_) {
            if (auto s = w.lock()) open.push_back(std::move(s));
        }
        sessions_.clear();
    }
    if (!open.empty()) {
        log::logger()->info("closing {} open http sessions", open.size());
    }
    for (const auto& s : open) s->close();
}

} // namespace chit::http
