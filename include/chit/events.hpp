#pragma once

/// @file include/chit/events.hpp
/// @brief Event Publisher: best-effort fan-out of manifold updates.
///
/// # Module: Event Publisher
///
/// ## Responsibility
/// After a fresh computation the query API hands the packet and spectrum to
/// the publisher, which serialises them to JSON and sends them on the
/// `geometry.event.manifold_update` topic for live visualisation consumers.
///
/// ## Delivery model
/// `publish()` only enqueues: the request path never waits on the bus. A
/// single background worker drains a bounded FIFO; when the FIFO is full the
/// oldest pending event is dropped. Transport failures (a `false` return or
/// an exception) are logged and counted, never propagated.
///
/// ## Transports
/// - `InProcessBus` - topic subscribe/publish inside the process
/// - `UdpTransport` - one JSON datagram per event to a configured endpoint

#include "chit/chit_packet.hpp"
#include "chit/zeta.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <stop_token>
#include <thread>
#include <utility>

namespace chit::events {

// ─── VisualizationEvent ───────────────────────────────────────────────────────

struct VisualizationEvent {
    std::string                           topic;
    std::string                           document_id;
    render::ChitGeometryPacket            packet;
    chit::spectrum::ZetaSpectrum          spectrum;
    std::chrono::system_clock::time_point timestamp{};
};

/// Build the manifold-update event for one computed document.
[[nodiscard]] VisualizationEvent
make_manifold_update(std::string document_id,
                     render::ChitGeometryPacket packet,
                     spectrum::ZetaSpectrum spectrum);

// ─── EventTransport ───────────────────────────────────────────────────────────

/// One-way message sink. Returns false when the message was not accepted.
class EventTransport {
public:
    virtual ~EventTransport() = default;

    virtual bool publish(std::string_view topic, const std::string& payload) = 0;
};

// ─── InProcessBus ─────────────────────────────────────────────────────────────

class InProcessBus final : public EventTransport {
public:
    using Handler = std::function<void(std::string_view topic, const std::string& payload)>;
    using SubscriptionId = std::size_t;

    /// Register `handler` for `topic`. Handlers run on the publishing thread.
    SubscriptionId subscribe(std::string topic, Handler handler);

    /// Returns false if `id` was not subscribed.
    bool unsubscribe(SubscriptionId id);

    /// Deliver to every subscriber of `topic`. A message with no subscribers
    /// is accepted. Returns false if any handler threw.
    bool publish(std::string_view topic, const std::string& payload) override;

    [[nodiscard]] std::size_t subscriber_count(std::string_view topic) const;

private:
    struct Subscription {
        std::string topic;
        Handler     handler;
    };

    mutable std::mutex mutex_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    SubscriptionId next_id_ = 1;
};

// ─── UdpTransport ─────────────────────────────────────────────────────────────

struct UdpEndpoint {
    std::string    host;
    unsigned short port = 0;

    bool operator==(const UdpEndpoint&) const = default;
};

/// Parse "host:port". Returns nullopt for a missing host, a missing or
/// out-of-range port, or trailing garbage.
[[nodiscard]] std::optional<UdpEndpoint> parse_udp_endpoint(std::string_view text);

/// Sends `{"topic": ..., "event": <payload>}` as a single datagram.
class UdpTransport final : public EventTransport {
public:
    explicit UdpTransport(UdpEndpoint endpoint);
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    /// Throws only boost::system::system_error from the socket layer; the
    /// publisher worker catches it.
    bool publish(std::string_view topic, const std::string& payload) override;

    [[nodiscard]] const UdpEndpoint& endpoint() const noexcept { return endpoint_; }

private:
    struct Impl;

    UdpEndpoint           endpoint_;
    std::unique_ptr<Impl> impl_;
};

// ─── EventPublisher ───────────────────────────────────────────────────────────

struct PublisherStats {
    std::size_t published = 0;  ///< accepted by the transport
    std::size_t failed    = 0;  ///< rejected or threw
    std::size_t dropped   = 0;  ///< evicted from a full queue
    std::size_t pending   = 0;  ///< queued, not yet sent
};

class EventPublisher {
public:
    /// # Arguments
    /// * `transport` - destination; must not be null
    /// * `capacity`  - maximum queued events (at least 1)
    EventPublisher(std::shared_ptr<EventTransport> transport, std::size_t capacity);

    /// Drains what is still queued, then joins the worker.
    ~EventPublisher();

    EventPublisher(const EventPublisher&) = delete;
    EventPublisher& operator=(const EventPublisher&) = delete;

    /// Enqueue `event`. Never blocks on the transport.
    void publish(VisualizationEvent event);

    /// Wait until the queue is empty and no send is in flight.
    /// Returns false on timeout.
    bool flush(std::chrono::milliseconds timeout);

    [[nodiscard]] PublisherStats stats() const;

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    void run(std::stop_token stop);
    void send(const VisualizationEvent& event);

    std::shared_ptr<EventTransport> transport_;
    std::size_t                     capacity_;

    mutable std::mutex              mutex_;
    std::condition_variable_any     wake_;
    std::condition_variable         idle_;
    std::deque<VisualizationEvent>  queue_;
    bool                            in_flight_ = false;

    std::atomic<std::size_t> published_{0};
    std::atomic<std::size_t> failed_{0};
    std::atomic<std::size_t> dropped_{0};

    std::jthread worker_;
};

} // namespace chit::events
