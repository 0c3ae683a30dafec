#pragma once
#include "provider.hpp"
#include "http.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace hybridllm {

// Builds a provider from its credential. May throw; the registry records
// a throwing factory as an unavailable provider.
using ProviderFactory = std::function<std::unique_ptr<Provider>(
    const std::string& api_key, HttpClient& http, const std::string& base_url,
    const std::string& model)>;

// Central registry for self-registering provider plugins.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_provider(const std::string& name, ProviderFactory factory);

    std::unique_ptr<Provider> create_provider(const std::string& name,
                                              const std::string& api_key,
                                              HttpClient& http,
                                              const std::string& base_url,
                                              const std::string& model) const;

    std::vector<std::string> provider_names() const;
    bool has_provider(const std::string& name) const;

    // Testing support
    bool unregister_provider(const std::string& name);

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProviderFactory> providers_;
};

// Self-registrar helper (used at file scope in each provider .cpp)
struct ProviderRegistrar {
    ProviderRegistrar(const std::string& name, ProviderFactory factory) {
        PluginRegistry::instance().register_provider(name, std::move(factory));
    }
};

} // namespace hybridllm
