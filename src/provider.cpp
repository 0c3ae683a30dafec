#include "provider.hpp"
#include "plugin.hpp"
#include "util.hpp"

namespace hybridllm {

Role role_from_string(const std::string& name) {
    if (name == "system") return Role::System;
    if (name == "user") return Role::User;
    if (name == "assistant") return Role::Assistant;
    throw std::invalid_argument("Unknown message role: " + name);
}

std::string CallParameters::model_for(const std::string& provider) const {
    auto it = models.find(provider);
    if (it != models.end() && !it->second.empty()) return it->second;
    if (model && !model->empty()) return *model;
    return {};
}

FailureClass classify_failure(long status_code, const std::string& message) {
    if (status_code == 429) return FailureClass::RateLimited;
    std::string lower = to_lower(message);
    if (lower.find("rate_limit") != std::string::npos ||
        lower.find("rate limit") != std::string::npos) {
        return FailureClass::RateLimited;
    }
    // A bare "429" only counts when there is no HTTP status to trust;
    // response bodies carry arbitrary digits.
    if (status_code == 0 && lower.find("429") != std::string::npos) {
        return FailureClass::RateLimited;
    }
    return FailureClass::Other;
}

InvokeResult Provider::invoke(const std::vector<ChatMessage>& messages,
                              const CallParameters& params) noexcept {
    if (params.cancelled()) {
        return InvokeResult::failed(FailureClass::Other, "cancelled");
    }
    try {
        return InvokeResult::success(complete(messages, params));
    } catch (const ProviderError& e) {
        return InvokeResult::failed(classify_failure(e.status_code(), e.what()), e.what());
    } catch (const std::exception& e) {
        return InvokeResult::failed(classify_failure(0, e.what()), e.what());
    } catch (...) {
        return InvokeResult::failed(FailureClass::Other, "unknown error");
    }
}

std::string Provider::resolve_model(const CallParameters& params) const {
    std::string model = params.model_for(provider_name());
    return model.empty() ? default_model() : model;
}

std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const std::string& api_key,
                                          HttpClient& http,
                                          const std::string& base_url,
                                          const std::string& model) {
    return PluginRegistry::instance().create_provider(name, api_key, http, base_url, model);
}

} // namespace hybridllm
