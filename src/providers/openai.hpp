#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace hybridllm {

// OpenAI Chat Completions API. Also the base for compatible endpoints.
class OpenAIProvider : public Provider {
public:
    OpenAIProvider(const std::string& api_key, HttpClient& http,
                   const std::string& base_url = "",
                   const std::string& model = "");

    std::string provider_name() const override { return "openai"; }
    std::string default_model() const override { return model_; }

    static constexpr const char* DEFAULT_MODEL = "gpt-4o-mini";

protected:
    std::string complete(const std::vector<ChatMessage>& messages,
                         const CallParameters& params) override;

    nlohmann::json build_request(const std::vector<ChatMessage>& messages,
                                 const CallParameters& params) const;
    virtual std::vector<Header> build_headers() const;

    // Vendor label used in error messages
    virtual std::string display_name() const { return "OpenAI"; }

private:
    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    std::string model_;
};

} // namespace hybridllm
