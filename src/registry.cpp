#include "registry.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace hybridllm {

bool ProviderStatus::is_available(const std::string& name) const {
    for (const auto& p : providers) {
        if (p.name == name) return p.available;
    }
    return false;
}

size_t ProviderStatus::available_count() const {
    return static_cast<size_t>(std::count_if(providers.begin(), providers.end(),
                                             [](const auto& p) { return p.available; }));
}

nlohmann::json ProviderStatus::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& p : providers) {
        j[p.name + "_available"] = p.available;
    }
    j["primary_provider"] = primary;
    j["max_retries"] = max_retries;
    return j;
}

ProviderRegistry::ProviderRegistry(const Config& config, HttpClient& http, EventBus* bus)
    : primary_(config.primary), max_retries_(config.max_retries) {
    if (primary_.empty()) {
        throw std::invalid_argument("ProviderRegistry requires a primary provider");
    }

    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    names.push_back(primary_);
    seen.insert(primary_);
    for (const auto& name : config.order) {
        if (seen.insert(name).second) names.push_back(name);
    }

    for (const auto& name : names) {
        ProviderHandle handle;
        handle.name = name;

        std::string api_key = config.api_key_for(name);
        if (api_key.empty()) {
            handle.reason = "no API key";
        } else {
            try {
                handle.provider = create_provider(name, api_key, http,
                                                  config.base_url_for(name),
                                                  config.model_for(name));
            } catch (const std::exception& e) {
                handle.reason = e.what();
            }
        }

        if (bus) {
            ProviderInitializedEvent ev;
            ev.provider = handle.name;
            ev.available = handle.available();
            ev.reason = handle.reason;
            bus->publish(ev);
        }
        handles_.push_back(std::move(handle));
    }
}

ProviderRegistry::ProviderRegistry(const std::string& primary,
                                   std::vector<ProviderHandle> handles,
                                   uint32_t max_retries)
    : primary_(primary), max_retries_(max_retries), handles_(std::move(handles)) {
    if (handles_.empty()) {
        throw std::invalid_argument("ProviderRegistry requires at least one provider");
    }
    std::unordered_set<std::string> seen;
    for (const auto& h : handles_) {
        if (!seen.insert(h.name).second) {
            throw std::invalid_argument("Duplicate provider: " + h.name);
        }
    }
    if (!seen.count(primary_)) {
        throw std::invalid_argument("Primary provider not configured: " + primary_);
    }
    put_primary_first();
}

void ProviderRegistry::put_primary_first() {
    auto it = std::find_if(handles_.begin(), handles_.end(),
                           [this](const auto& h) { return h.name == primary_; });
    std::rotate(handles_.begin(), it, it + 1);
}

const ProviderHandle* ProviderRegistry::find(const std::string& name) const {
    for (const auto& h : handles_) {
        if (h.name == name) return &h;
    }
    return nullptr;
}

ProviderStatus ProviderRegistry::status() const {
    ProviderStatus s;
    s.primary = primary_;
    s.max_retries = max_retries_;
    s.providers.reserve(handles_.size());
    for (const auto& h : handles_) {
        s.providers.push_back({h.name, h.available(), h.reason});
    }
    return s;
}

} // namespace hybridllm
