/// @file src/events/in_process_bus.cpp
/// @brief Topic-keyed in-process publish/subscribe.

#include "chit/events.hpp"

#include "chit/logging.hpp"

#include <vector>

namespace chit::events {

InProcessBus::SubscriptionId InProcessBus::subscribe(std::string topic, Handler handler) {
    std::lock_guard lock(mutex_);
    const SubscriptionId id = next_id_++;
    subscriptions_.emplace(id, Subscription{std::move(topic), std::move(handler)});
    return id;
}

bool InProcessBus::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    return subscriptions_.erase(id) > 0;
}

bool InProcessBus::publish(std::string_view topic, const std::string& payload) {
    // Snapshot so handlers may (un)subscribe without deadlocking.
    std::vector<Handler> targets;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, sub] : subscriptions_) {
            if (sub.topic == topic) targets.push_back(sub.handler);
        }
    }

    bool ok = true;
    for (const auto& handler : targets) {
        try {
            handler(topic, payload);
        } catch (const std::exception& e) {
            ok = false;
            log::logger()->warn("subscriber on '{}' threw: {}", topic, e.what());
        }
    }
    return ok;
}

std::size_t InProcessBus::subscriber_count(std::string_view topic) const {
    std::lock_guard lock(mutex_);
    std::size_t n = 0;
    for (const auto& [id, sub] : subscriptions_) {
        if (sub.topic == topic) ++n;
    }
    return n;
}

} // namespace chit::events
