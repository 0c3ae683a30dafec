#pragma once
#include "provider.hpp"
#include "config.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace hybridllm {

class HttpClient;
class EventBus;

// One configured provider. provider is null when it failed to initialize;
// reason then says why.
struct ProviderHandle {
    std::string name;
    std::unique_ptr<Provider> provider;
    std::string reason;

    bool available() const { return provider != nullptr; }
};

struct ProviderAvailability {
    std::string name;
    bool available = false;
    std::string reason;
};

// Snapshot of registry state for diagnostics and pre-flight checks.
struct ProviderStatus {
    std::string primary;
    uint32_t max_retries = 0;
    std::vector<ProviderAvailability> providers; // attempt order

    bool is_available(const std::string& name) const;
    size_t available_count() const;

    // {"<name>_available": bool, ..., "primary_provider": name, "max_retries": n}
    nlohmann::json to_json() const;
};

// Immutable set of provider handles, built once. Handles are kept in attempt
// order: primary first, then the remaining providers in declared order.
// Safe for concurrent reads.
class ProviderRegistry {
public:
    // Builds a handle for config.primary and every name in config.order.
    // Never throws for missing credentials or failing factories; those
    // providers are recorded as unavailable. Throws std::invalid_argument
    // if no primary is configured.
    ProviderRegistry(const Config& config, HttpClient& http, EventBus* bus = nullptr);

    // Adopts pre-built handles (declared order). The primary must be one of
    // them; it is moved to the front.
    ProviderRegistry(const std::string& primary,
                     std::vector<ProviderHandle> handles,
                     uint32_t max_retries = 0);

    ProviderRegistry(ProviderRegistry&&) = default;
    ProviderRegistry& operator=(ProviderRegistry&&) = default;

    const std::string& primary() const { return primary_; }
    uint32_t max_retries() const { return max_retries_; }
    const std::vector<ProviderHandle>& handles() const { return handles_; }

    // nullptr if name is not configured
    const ProviderHandle* find(const std::string& name) const;

    ProviderStatus status() const;

private:
    void put_primary_first();

    std::string primary_;
    uint32_t max_retries_ = 0;
    std::vector<ProviderHandle> handles_;
};

} // namespace hybridllm
