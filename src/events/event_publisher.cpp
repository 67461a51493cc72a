/// @file src/events/event_publisher.cpp
/// @brief Bounded queue + background worker for visualisation events.

#include "chit/events.hpp"

#include "chit/json_codec.hpp"
#include "chit/logging.hpp"
#include "chit/types.hpp"

#include <stdexcept>

namespace chit::events {

// ─── make_manifold_update ─────────────────────────────────────────────────────

VisualizationEvent make_manifold_update(std::string document_id,
                                        render::ChitGeometryPacket packet,
                                        spectrum::ZetaSpectrum spectrum) {
    return VisualizationEvent{
        .topic       = std::string(constants::MANIFOLD_UPDATE_TOPIC),
        .document_id = std::move(document_id),
        .packet      = std::move(packet),
        .spectrum    = std::move(spectrum),
        .timestamp   = std::chrono::system_clock::now(),
    };
}

// ─── EventPublisher ───────────────────────────────────────────────────────────

EventPublisher::EventPublisher(std::shared_ptr<EventTransport> transport,
                               std::size_t capacity)
    : transport_(std::move(transport))
    , capacity_(capacity == 0 ? 1 : capacity) {
    if (!transport_) {
        throw std::invalid_argument("EventPublisher: transport must not be null");
    }
    worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

EventPublisher::~EventPublisher() {
    worker_.request_stop();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void EventPublisher::publish(VisualizationEvent event) {
    {
        std::lock_guard lock(mutex_);
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
            log::logger()->warn("event queue full ({}), dropped oldest event", capacity_);
        }
        queue_.push_back(std::move(event));
    }
    wake_.notify_one();
}

bool EventPublisher::flush(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idle_.wait_for(lock, timeout, [this] { return queue_.empty() && !in_flight_; });
}

PublisherStats EventPublisher::stats() const {
    std::lock_guard lock(mutex_);
    return PublisherStats{
        .published = published_.load(),
        .failed    = failed_.load(),
        .dropped   = dropped_.load(),
        .pending   = queue_.size(),
    };
}

void EventPublisher::run(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    for (;;) {
        // Returns with an empty queue only once stop is requested; anything
        // still queued at that point is drained first.
        if (!wake_.wait(lock, stop, [this] { return !queue_.empty(); })) {
            break;
        }

        VisualizationEvent event = std::move(queue_.front());
        queue_.pop_front();
        in_flight_ = true;

        lock.unlock();
        send(event);
        lock.lock();

        in_flight_ = false;
        if (queue_.empty()) {
            idle_.notify_all();
        }
    }
    in_flight_ = false;
    idle_.notify_all();
}

void EventPublisher::send(const VisualizationEvent& event) {
    try {
        const std::string payload = io::write_json(io::to_json(event));
        if (transport_->publish(event.topic, payload)) {
            ++published_;
            return;
        }
        ++failed_;
        log::logger()->warn("{}: publish of '{}' for '{}' rejected by transport",
                            to_string(Condition::Publish), event.topic, event.document_id);
    } catch (const std::exception& e) {
        ++failed_;
        log::logger()->error("{}: publish of '{}' for '{}' failed: {}",
                             to_string(Condition::Publish), event.topic, event.document_id,
                             e.what());
    }
}

} // namespace chit::events
