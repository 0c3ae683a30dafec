#include "anthropic.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

static hybridllm::ProviderRegistrar reg_anthropic("anthropic",
    [](const std::string& key, hybridllm::HttpClient& http, const std::string& base_url,
       const std::string& model) {
        return std::make_unique<hybridllm::AnthropicProvider>(key, http, base_url, model);
    });

using json = nlohmann::json;

namespace hybridllm {

AnthropicProvider::AnthropicProvider(const std::string& api_key, HttpClient& http,
                                     const std::string& base_url,
                                     const std::string& model)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://api.anthropic.com/v1" : base_url),
      model_(model.empty() ? DEFAULT_MODEL : model) {
    if (api_key_.empty()) {
        throw std::invalid_argument("Anthropic provider requires an API key");
    }
}

json AnthropicProvider::build_request(const std::vector<ChatMessage>& messages,
                                      const CallParameters& params) const {
    json request;
    request["model"] = resolve_model(params);
    request["max_tokens"] = params.max_tokens.value_or(1024);
    request["temperature"] = params.temperature.value_or(0.7);

    // System messages go into the top-level "system" field
    std::string system_text;
    json msgs = json::array();
    for (const auto& msg : messages) {
        if (msg.role == Role::System) {
            if (!system_text.empty()) system_text += "\n";
            system_text += msg.content;
            continue;
        }
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    if (!system_text.empty()) {
        request["system"] = system_text;
    }
    request["messages"] = msgs;

    if (params.extra.is_object()) {
        for (const auto& [key, value] : params.extra.items()) {
            request[key] = value;
        }
    }
    return request;
}

std::string AnthropicProvider::complete(const std::vector<ChatMessage>& messages,
                                        const CallParameters& params) {
    std::string body = build_request(messages, params).dump();

    std::vector<Header> headers = {
        {"x-api-key", api_key_},
        {"anthropic-version", API_VERSION},
        {"content-type", "application/json"}
    };

    auto response = http_.post(base_url_ + "/messages", body, headers, params.timeout_seconds);

    if (response.status_code == 0) {
        throw ProviderError("Anthropic API request failed (no response)");
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw ProviderError("Anthropic API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body,
            response.status_code);
    }

    auto resp = json::parse(response.body);
    std::string text;
    if (resp.contains("content") && resp["content"].is_array()) {
        for (const auto& block : resp["content"]) {
            if (block.value("type", "") == "text") {
                text += block.value("text", "");
            }
        }
    }
    return text;
}

} // namespace hybridllm
