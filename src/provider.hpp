#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <atomic>
#include <memory>
#include <cstdint>
#include <stdexcept>
#include <unordered_map>

namespace hybridllm {

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

// Throws std::invalid_argument for anything but system/user/assistant.
Role role_from_string(const std::string& name);

struct ChatMessage {
    Role role;
    std::string content;
};

// Per-call options. Unset fields are filled by each provider's defaults.
struct CallParameters {
    std::optional<std::string> model;                     // applies to every provider
    std::unordered_map<std::string, std::string> models;  // per-provider override
    std::optional<uint32_t> max_tokens;
    std::optional<double> temperature;
    nlohmann::json extra = nlohmann::json::object();      // merged into request body
    long timeout_seconds = 120;
    const std::atomic<bool>* cancel = nullptr;

    // Model for a given provider: per-provider override, then global, else empty.
    std::string model_for(const std::string& provider) const;

    bool cancelled() const {
        return cancel && cancel->load(std::memory_order_relaxed);
    }
};

enum class FailureClass { Unavailable, RateLimited, Other };

inline const char* failure_class_to_string(FailureClass fc) {
    switch (fc) {
        case FailureClass::Unavailable: return "unavailable";
        case FailureClass::RateLimited: return "rate limited";
        case FailureClass::Other: return "failed";
    }
    return "failed";
}

struct InvokeResult {
    std::string text;
    std::optional<FailureClass> failure;
    std::string error;

    bool ok() const { return !failure.has_value(); }

    static InvokeResult success(std::string text) {
        InvokeResult r;
        r.text = std::move(text);
        return r;
    }
    static InvokeResult failed(FailureClass fc, std::string error) {
        InvokeResult r;
        r.failure = fc;
        r.error = std::move(error);
        return r;
    }
};

// Thrown by vendor integrations. status_code 0 means the request never got
// an HTTP response (DNS, connect, TLS, timeout, abort).
class ProviderError : public std::runtime_error {
public:
    ProviderError(const std::string& what, long status_code = 0)
        : std::runtime_error(what), status_code_(status_code) {}

    long status_code() const { return status_code_; }

private:
    long status_code_;
};

// Rate limiting is signalled by HTTP 429 or by a "rate_limit"/"rate limit"
// marker in the error text. A bare "429" in the text counts only when
// status_code is 0.
FailureClass classify_failure(long status_code, const std::string& message);

// Abstract base class for LLM providers
class Provider {
public:
    virtual ~Provider() = default;

    // Never throws. Runs complete() and converts any exception into a
    // classified failure.
    InvokeResult invoke(const std::vector<ChatMessage>& messages,
                        const CallParameters& params) noexcept;

    virtual std::string provider_name() const = 0;
    virtual std::string default_model() const = 0;

    // Model this provider would use for params
    std::string resolve_model(const CallParameters& params) const;

protected:
    // Vendor call. Returns the response text (possibly empty) or throws.
    virtual std::string complete(const std::vector<ChatMessage>& messages,
                                 const CallParameters& params) = 0;
};

class HttpClient; // forward declaration

// Factory: create provider by name via the plugin registry
std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const std::string& api_key,
                                          HttpClient& http,
                                          const std::string& base_url = "",
                                          const std::string& model = "");

} // namespace hybridllm
