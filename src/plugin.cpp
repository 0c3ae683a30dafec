#include "plugin.hpp"
#include <stdexcept>
#include <algorithm>

namespace hybridllm {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_provider(const std::string& name, ProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[name] = std::move(factory);
}

std::unique_ptr<Provider> PluginRegistry::create_provider(const std::string& name,
                                                          const std::string& api_key,
                                                          HttpClient& http,
                                                          const std::string& base_url,
                                                          const std::string& model) const {
    ProviderFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = providers_.find(name);
        if (it == providers_.end()) {
            throw std::invalid_argument("Unknown provider: " + name);
        }
        factory = it->second;
    }
    auto provider = factory(api_key, http, base_url, model);
    if (!provider) {
        throw std::runtime_error("Provider factory returned null: " + name);
    }
    return provider;
}

std::vector<std::string> PluginRegistry::provider_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(providers_.size());
    for (const auto& [name, _] : providers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_provider(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.count(name) > 0;
}

bool PluginRegistry::unregister_provider(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.erase(name) > 0;
}

} // namespace hybridllm
