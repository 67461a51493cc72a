/// @file tests/events/test_event_publisher.cpp
/// @brief Tests for the event publisher and its transports.
///
/// Test categories:
///   - InProcessBus subscribe / publish / unsubscribe
///   - EventPublisher delivery, drop-oldest overflow, failure counting
///   - Failed publishes logged under the PublishError tag
///   - Shutdown drains the queue
///   - UDP endpoint parsing and a loopback datagram

#include "chit/events.hpp"
#include "chit/json_codec.hpp"
#include "chit/logging.hpp"
#include "chit/types.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <gtest/gtest.h>

#include <spdlog/sinks/ostream_sink.h>

#include <array>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace chit;
using namespace chit::events;
using namespace std::chrono_literals;

namespace {

VisualizationEvent event_for(const std::string& id) {
    return make_manifold_update(id, render::demo_packet(),
                                spectrum::ZetaSpectrumGenerator::generate(-2.5, 0.3));
}

/// Records every payload it accepts.
class RecordingTransport final : public EventTransport {
public:
    bool publish(std::string_view topic, const std::string& payload) override {
        std::lock_guard lock(mutex_);
        topics_.emplace_back(topic);
        payloads_.push_back(payload);
        return true;
    }
    std::vector<std::string> payloads() const {
        std::lock_guard lock(mutex_);
        return payloads_;
    }
    std::vector<std::string> topics() const {
        std::lock_guard lock(mutex_);
        return topics_;
    }

private:
    mutable std::mutex       mutex_;
    std::vector<std::string> topics_;
    std::vector<std::string> payloads_;
};

/// Holds the first send until released, so the queue can be filled.
class GatedTransport final : public EventTransport {
public:
    bool publish(std::string_view, const std::string& payload) override {
        std::unique_lock lock(mutex_);
        ++entered_;
        cv_.notify_all();
        cv_.wait(lock, [this] { return open_; });
        const auto doc = io::parse_json(payload);
        ids_.push_back(doc ? (*doc)["payload"]["document_id"].asString() : std::string());
        return true;
    }
    void wait_entered() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return entered_ > 0; });
    }
    void open() {
        std::lock_guard lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }
    std::vector<std::string> ids() {
        std::lock_guard lock(mutex_);
        return ids_;
    }

private:
    std::mutex               mutex_;
    std::condition_variable  cv_;
    int                      entered_ = 0;
    bool                     open_    = false;
    std::vector<std::string> ids_;
};

class RejectingTransport final : public EventTransport {
public:
    bool publish(std::string_view, const std::string&) override { return false; }
};

class ThrowingTransport final : public EventTransport {
public:
    bool publish(std::string_view, const std::string&) override {
        throw std::runtime_error("bus unavailable");
    }
};

}  // anonymous namespace

// ─── InProcessBus ─────────────────────────────────────────────────────────────

TEST(InProcessBus, DeliversToMatchingTopicOnly) {
    InProcessBus bus;
    std::vector<std::string> got_a, got_b;
    bus.subscribe("a", [&](std::string_view, const std::string& p) { got_a.push_back(p); });
    bus.subscribe("b", [&](std::string_view, const std::string& p) { got_b.push_back(p); });

    EXPECT_TRUE(bus.publish("a", "one"));
    EXPECT_TRUE(bus.publish("a", "two"));
    EXPECT_TRUE(bus.publish("c", "nobody"));
    ASSERT_EQ(got_a.size(), 2u);
    EXPECT_EQ(got_a[1], "two");
    EXPECT_TRUE(got_b.empty());
}

TEST(InProcessBus, UnsubscribeStopsDelivery) {
    InProcessBus bus;
    int calls = 0;
    const auto id = bus.subscribe("t", [&](std::string_view, const std::string&) { ++calls; });
    EXPECT_EQ(bus.subscriber_count("t"), 1u);
    EXPECT_TRUE(bus.unsubscribe(id));
    EXPECT_FALSE(bus.unsubscribe(id));
    EXPECT_EQ(bus.subscriber_count("t"), 0u);
    EXPECT_TRUE(bus.publish("t", "x"));
    EXPECT_EQ(calls, 0);
}

TEST(InProcessBus, ThrowingHandlerReportsFailureButOthersRun) {
    InProcessBus bus;
    int calls = 0;
    bus.subscribe("t", [](std::string_view, const std::string&) {
        throw std::runtime_error("handler failed");
    });
    bus.subscribe("t", [&](std::string_view, const std::string&) { ++calls; });
    EXPECT_FALSE(bus.publish("t", "x"));
    EXPECT_EQ(calls, 1);
}

// ─── EventPublisher ───────────────────────────────────────────────────────────

TEST(EventPublisher, NullTransportThrows) {
    EXPECT_THROW(EventPublisher(nullptr, 4), std::invalid_argument);
}

TEST(EventPublisher, ZeroCapacityBecomesOne) {
    EventPublisher pub(std::make_shared<RecordingTransport>(), 0);
    EXPECT_EQ(pub.capacity(), 1u);
}

TEST(EventPublisher, DeliversManifoldUpdateJson) {
    auto transport = std::make_shared<RecordingTransport>();
    EventPublisher pub(transport, 16);
    pub.publish(event_for("doc-1"));
    ASSERT_TRUE(pub.flush(5s));

    const auto payloads = transport->payloads();
    ASSERT_EQ(payloads.size(), 1u);
    EXPECT_EQ(transport->topics()[0], "geometry.event.manifold_update");

    const auto doc = io::parse_json(payloads[0]);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ((*doc)["topic"].asString(), "geometry.event.manifold_update");
    const auto& payload = (*doc)["payload"];
    EXPECT_EQ(payload["document_id"].asString(), "doc-1");
    EXPECT_DOUBLE_EQ(payload["cgp"]["curvature_k"].asDouble(), -2.5);
    EXPECT_EQ(payload["spectrum"]["frequencies"].size(), 5u);
    EXPECT_TRUE(payload["timestamp"].isString());

    const auto stats = pub.stats();
    EXPECT_EQ(stats.published, 1u);
    EXPECT_EQ(stats.failed, 0u);
    EXPECT_EQ(stats.pending, 0u);
}

TEST(EventPublisher, PreservesOrder) {
    auto transport = std::make_shared<RecordingTransport>();
    EventPublisher pub(transport, 64);
    for (int i = 0; i < 20; ++i) pub.publish(event_for("d" + std::to_string(i)));
    ASSERT_TRUE(pub.flush(5s));

    const auto payloads = transport->payloads();
    ASSERT_EQ(payloads.size(), 20u);
    for (int i = 0; i < 20; ++i) {
        const auto doc = io::parse_json(payloads[static_cast<std::size_t>(i)]);
        ASSERT_TRUE(doc.has_value());
        EXPECT_EQ((*doc)["payload"]["document_id"].asString(), "d" + std::to_string(i));
    }
}

TEST(EventPublisher, FullQueueDropsOldest) {
    auto transport = std::make_shared<GatedTransport>();
    EventPublisher pub(transport, 2);

    pub.publish(event_for("first"));
    transport->wait_entered();  // worker now holds "first"

    pub.publish(event_for("second"));
    pub.publish(event_for("third"));
    pub.publish(event_for("fourth"));  // evicts "second"

    auto stats = pub.stats();
    EXPECT_EQ(stats.dropped, 1u);
    EXPECT_EQ(stats.pending, 2u);

    transport->open();
    ASSERT_TRUE(pub.flush(5s));

    EXPECT_EQ(transport->ids(), (std::vector<std::string>{"first", "third", "fourth"}));
    stats = pub.stats();
    EXPECT_EQ(stats.published, 3u);
    EXPECT_EQ(stats.dropped, 1u);
}

TEST(EventPublisher, RejectedPublishCountsAsFailed) {
    EventPublisher pub(std::make_shared<RejectingTransport>(), 8);
    pub.publish(event_for("a"));
    pub.publish(event_for("b"));
    ASSERT_TRUE(pub.flush(5s));
    EXPECT_EQ(pub.stats().failed, 2u);
    EXPECT_EQ(pub.stats().published, 0u);
}

TEST(EventPublisher, FailureLogTaggedPublishError) {
    auto logged = std::make_shared<std::ostringstream>();
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(*logged);
    auto logger = chit::log::logger();
    logger->sinks().push_back(sink);

    {
        EventPublisher pub(std::make_shared<RejectingTransport>(), 8);
        pub.publish(event_for("doc-7"));
        ASSERT_TRUE(pub.flush(5s));
    }
    logger->flush();
    logger->sinks().pop_back();

    EXPECT_STREQ(to_string(Condition::Publish), "PublishError");
    const std::string text = logged->str();
    EXPECT_NE(text.find("PublishError"), std::string::npos) << text;
    EXPECT_NE(text.find("doc-7"), std::string::npos) << text;
}

TEST(EventPublisher, ThrowingTransportIsContained) {
    EventPublisher pub(std::make_shared<ThrowingTransport>(), 8);
    pub.publish(event_for("a"));
    ASSERT_TRUE(pub.flush(5s));
    EXPECT_EQ(pub.stats().failed, 1u);

    // The worker survives and keeps draining.
    pub.publish(event_for("b"));
    ASSERT_TRUE(pub.flush(5s));
    EXPECT_EQ(pub.stats().failed, 2u);
}

TEST(EventPublisher, DestructorDrainsQueue) {
    auto transport = std::make_shared<RecordingTransport>();
    {
        EventPublisher pub(transport, 128);
        for (int i = 0; i < 50; ++i) pub.publish(event_for("x"));
    }
    EXPECT_EQ(transport->payloads().size(), 50u);
}

TEST(EventPublisher, FlushOnIdleReturnsImmediately) {
    EventPublisher pub(std::make_shared<RecordingTransport>(), 4);
    EXPECT_TRUE(pub.flush(0ms));
}

// ─── UDP ──────────────────────────────────────────────────────────────────────

TEST(UdpEndpoint, ParsesHostAndPort) {
    const auto ep = parse_udp_endpoint("127.0.0.1:9000");
    ASSERT_TRUE(ep.has_value());
    EXPECT_EQ(ep->host, "127.0.0.1");
    EXPECT_EQ(ep->port, 9000);

    const auto named = parse_udp_endpoint("bus.internal:65535");
    ASSERT_TRUE(named.has_value());
    EXPECT_EQ(named->host, "bus.internal");
}

TEST(UdpEndpoint, RejectsMalformed) {
    EXPECT_FALSE(parse_udp_endpoint("").has_value());
    EXPECT_FALSE(parse_udp_endpoint("localhost").has_value());
    EXPECT_FALSE(parse_udp_endpoint(":9000").has_value());
    EXPECT_FALSE(parse_udp_endpoint("localhost:").has_value());
    EXPECT_FALSE(parse_udp_endpoint("localhost:0").has_value());
    EXPECT_FALSE(parse_udp_endpoint("localhost:70000").has_value());
    EXPECT_FALSE(parse_udp_endpoint("localhost:90a").has_value());
}

TEST(UdpTransport, SendsOneDatagramPerEvent) {
    namespace asio = boost::asio;
    using udp = asio::ip::udp;

    asio::io_context ctx;
    udp::socket receiver(ctx, udp::endpoint(asio::ip::address_v4::loopback(), 0));
    const unsigned short port = receiver.local_endpoint().port();

    UdpTransport transport(UdpEndpoint{"127.0.0.1", port});
    ASSERT_TRUE(transport.publish("geometry.event.manifold_update", R"({"k":-2.5})"));

    std::array<char, 2048> buf{};
    udp::endpoint from;
    const std::size_t n = receiver.receive_from(asio::buffer(buf), from);

    const auto doc = io::parse_json(std::string_view(buf.data(), n));
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ((*doc)["topic"].asString(), "geometry.event.manifold_update");
    EXPECT_DOUBLE_EQ((*doc)["event"]["k"].asDouble(), -2.5);
}
