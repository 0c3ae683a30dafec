#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace hybridllm {

using EventHandler = std::function<void(const Event&)>;

class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Subscribe to every event regardless of tag. Called after tag handlers.
    uint64_t subscribe_all(EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Publish an event synchronously. Handlers called in registration order.
    // Mutex is released before calling handlers to avoid deadlocks.
    void publish(const Event& event);

    // Remove all subscriptions.
    void clear();

    // Number of subscriptions for a given tag, excluding catch-all ones.
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    static bool erase_subscription(std::vector<Subscription>& subs, uint64_t id);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    std::vector<Subscription> catch_all_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace hybridllm
