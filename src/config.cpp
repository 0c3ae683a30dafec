#include "config.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace hybridllm {

nlohmann::json Config::defaults_json() {
    return {
        {"primary", "anthropic"},
        {"order", {"anthropic", "openai", "openrouter"}},
        {"max_retries", 2},
        {"timeout_seconds", 120},
        {"temperature", 0.7},
        {"max_tokens", 1024},
        {"providers", {
            {"anthropic", {{"api_key", ""}, {"base_url", ""}, {"model", ""}}},
            {"openai", {{"api_key", ""}, {"base_url", ""}, {"model", ""}}},
            {"openrouter", {{"api_key", ""}, {"base_url", ""}, {"model", ""}}}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static std::optional<uint32_t> json_u32(const nlohmann::json& v) {
    if (v.is_number_unsigned()) {
        auto n = v.get<uint64_t>();
        if (n <= UINT32_MAX) return static_cast<uint32_t>(n);
    } else if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        if (n >= 0 && n <= static_cast<int64_t>(UINT32_MAX)) return static_cast<uint32_t>(n);
    }
    return std::nullopt;
}

Config Config::from_json(const nlohmann::json& input) {
    Config cfg;
    nlohmann::json j = input.is_object() ? merge_defaults(input, defaults_json())
                                         : defaults_json();

    if (j["primary"].is_string())
        cfg.primary = j["primary"].get<std::string>();
    if (j["order"].is_array()) {
        cfg.order.clear();
        for (const auto& name : j["order"]) {
            if (name.is_string()) cfg.order.push_back(name.get<std::string>());
        }
    }
    if (auto n = json_u32(j["max_retries"]))
        cfg.max_retries = *n;
    if (j["timeout_seconds"].is_number_integer() && j["timeout_seconds"].get<long>() > 0)
        cfg.timeout_seconds = j["timeout_seconds"].get<long>();
    if (j["temperature"].is_number())
        cfg.temperature = j["temperature"].get<double>();
    if (auto n = json_u32(j["max_tokens"]); n && *n > 0)
        cfg.max_tokens = *n;

    if (j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            if (obj.contains("api_key") && obj["api_key"].is_string())
                entry.api_key = obj["api_key"].get<std::string>();
            if (obj.contains("base_url") && obj["base_url"].is_string())
                entry.base_url = obj["base_url"].get<std::string>();
            if (obj.contains("model") && obj["model"].is_string())
                entry.model = obj["model"].get<std::string>();
            cfg.providers[name] = std::move(entry);
        }
    }
    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.hybridllm/config.json");
    nlohmann::json j = nlohmann::json::object();

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = nlohmann::json::parse(file);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = nlohmann::json::object();
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("ANTHROPIC_API_KEY"))
        providers["anthropic"].api_key = v;
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        providers["openai"].api_key = v;
    if (const char* v = std::getenv("OPENROUTER_API_KEY"))
        providers["openrouter"].api_key = v;
    if (const char* v = std::getenv("HYBRIDLLM_PRIMARY")) {
        if (*v) primary = v;
    }
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

std::string Config::model_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.model;
    return {};
}

CallParameters Config::default_params() const {
    CallParameters params;
    params.max_tokens = max_tokens;
    params.temperature = temperature;
    params.timeout_seconds = timeout_seconds;
    return params;
}

} // namespace hybridllm
