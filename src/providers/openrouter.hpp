#pragma once
#include "openai.hpp"
#include <string>

namespace hybridllm {

// OpenRouter speaks the OpenAI Chat Completions protocol.
class OpenRouterProvider : public OpenAIProvider {
public:
    OpenRouterProvider(const std::string& api_key, HttpClient& http,
                       const std::string& base_url = "",
                       const std::string& model = "");

    std::string provider_name() const override { return "openrouter"; }

    static constexpr const char* DEFAULT_MODEL = "openai/gpt-4o-mini";

protected:
    std::vector<Header> build_headers() const override;
    std::string display_name() const override { return "OpenRouter"; }
};

} // namespace hybridllm
