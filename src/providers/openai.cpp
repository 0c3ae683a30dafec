#include "openai.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

static hybridllm::ProviderRegistrar reg_openai("openai",
    [](const std::string& key, hybridllm::HttpClient& http, const std::string& base_url,
       const std::string& model) {
        return std::make_unique<hybridllm::OpenAIProvider>(key, http, base_url, model);
    });

using json = nlohmann::json;

namespace hybridllm {

OpenAIProvider::OpenAIProvider(const std::string& api_key, HttpClient& http,
                               const std::string& base_url,
                               const std::string& model)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://api.openai.com/v1" : base_url),
      model_(model.empty() ? DEFAULT_MODEL : model) {
    if (api_key_.empty()) {
        throw std::invalid_argument("OpenAI-compatible provider requires an API key");
    }
}

json OpenAIProvider::build_request(const std::vector<ChatMessage>& messages,
                                   const CallParameters& params) const {
    json request;
    request["model"] = resolve_model(params);
    request["max_tokens"] = params.max_tokens.value_or(1024);
    request["temperature"] = params.temperature.value_or(0.7);

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    request["messages"] = msgs;

    if (params.extra.is_object()) {
        for (const auto& [key, value] : params.extra.items()) {
            request[key] = value;
        }
    }
    return request;
}

std::vector<Header> OpenAIProvider::build_headers() const {
    return {
        {"Authorization", "Bearer " + api_key_},
        {"Content-Type", "application/json"}
    };
}

std::string OpenAIProvider::complete(const std::vector<ChatMessage>& messages,
                                     const CallParameters& params) {
    std::string body = build_request(messages, params).dump();
    auto response = http_.post(base_url_ + "/chat/completions", body, build_headers(),
                               params.timeout_seconds);

    if (response.status_code == 0) {
        throw ProviderError(display_name() + " API request failed (no response)");
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw ProviderError(display_name() + " API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body,
            response.status_code);
    }

    auto resp = json::parse(response.body);
    if (!resp.contains("choices") || !resp["choices"].is_array() || resp["choices"].empty()) {
        return "";
    }
    const auto& message = resp["choices"][0].value("message", json::object());
    if (message.contains("content") && message["content"].is_string()) {
        return message["content"].get<std::string>();
    }
    return "";
}

} // namespace hybridllm
