#pragma once
#include "provider.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace hybridllm {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;  // empty = provider default
    std::string model;     // empty = provider default
};

struct Config {
    std::string primary = "anthropic";
    // Declared failover order; the primary is moved to the front at registry time.
    std::vector<std::string> order = {"anthropic", "openai", "openrouter"};
    // Accepted and reported; failover never repeats a provider within a call.
    uint32_t max_retries = 2;
    long timeout_seconds = 120;
    double temperature = 0.7;
    uint32_t max_tokens = 1024;

    std::unordered_map<std::string, ProviderEntry> providers;

    // Load from ~/.hybridllm/config.json + env vars
    static Config load();

    // Parse a config document on top of defaults_json(); no file or env access
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply ANTHROPIC_API_KEY, OPENAI_API_KEY, OPENROUTER_API_KEY, HYBRIDLLM_PRIMARY
    void apply_env();

    std::string api_key_for(const std::string& provider) const;
    std::string base_url_for(const std::string& provider) const;
    std::string model_for(const std::string& provider) const;

    // Per-call defaults derived from this config
    CallParameters default_params() const;
};

} // namespace hybridllm
