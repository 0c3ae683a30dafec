#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace hybridllm {

class AnthropicProvider : public Provider {
public:
    AnthropicProvider(const std::string& api_key, HttpClient& http,
                      const std::string& base_url = "",
                      const std::string& model = "");

    std::string provider_name() const override { return "anthropic"; }
    std::string default_model() const override { return model_; }

    static constexpr const char* DEFAULT_MODEL = "claude-3-5-sonnet-20241022";

protected:
    std::string complete(const std::vector<ChatMessage>& messages,
                         const CallParameters& params) override;

private:
    nlohmann::json build_request(const std::vector<ChatMessage>& messages,
                                 const CallParameters& params) const;

    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    std::string model_;
    static constexpr const char* API_VERSION = "2023-06-01";
};

} // namespace hybridllm
