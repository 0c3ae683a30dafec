#include "event_bus.hpp"
#include <algorithm>

namespace hybridllm {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    handlers_[tag].push_back(Subscription{id, std::move(handler)});
    return id;
}

uint64_t EventBus::subscribe_all(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    catch_all_.push_back(Subscription{id, std::move(handler)});
    return id;
}

bool EventBus::erase_subscription(std::vector<Subscription>& subs, uint64_t id) {
    auto it = std::find_if(subs.begin(), subs.end(),
                           [id](const auto& s) { return s.id == id; });
    if (it == subs.end()) return false;
    subs.erase(it);
    return true;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (erase_subscription(catch_all_, id)) return true;
    for (auto& [tag, subs] : handlers_) {
        if (erase_subscription(subs, id)) return true;
    }
    return false;
}

void EventBus::publish(const Event& event) {
    // Copy handlers out under lock, then call without lock held.
    std::vector<EventHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.type_tag);
        if (it != handlers_.end()) {
            for (const auto& sub : it->second) to_call.push_back(sub.handler);
        }
        for (const auto& sub : catch_all_) to_call.push_back(sub.handler);
    }
    for (const auto& handler : to_call) {
        handler(event);
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
    catch_all_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(tag);
    if (it == handlers_.end()) return 0;
    return it->second.size();
}

} // namespace hybridllm
