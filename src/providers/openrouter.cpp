#include "openrouter.hpp"
#include "../plugin.hpp"

static hybridllm::ProviderRegistrar reg_openrouter("openrouter",
    [](const std::string& key, hybridllm::HttpClient& http, const std::string& base_url,
       const std::string& model) {
        return std::make_unique<hybridllm::OpenRouterProvider>(key, http, base_url, model);
    });

namespace hybridllm {

OpenRouterProvider::OpenRouterProvider(const std::string& api_key, HttpClient& http,
                                       const std::string& base_url,
                                       const std::string& model)
    : OpenAIProvider(api_key, http,
                     base_url.empty() ? "https://openrouter.ai/api/v1" : base_url,
                     model.empty() ? DEFAULT_MODEL : model) {}

std::vector<Header> OpenRouterProvider::build_headers() const {
    auto headers = OpenAIProvider::build_headers();
    headers.emplace_back("HTTP-Referer", "https://github.com/hybridllm/hybridllm");
    headers.emplace_back("X-Title", "hybridllm");
    return headers;
}

} // namespace hybridllm
