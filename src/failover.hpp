#pragma once
#include "provider.hpp"
#include "registry.hpp"
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

namespace hybridllm {

class EventBus;
class HttpClient;
struct Event;
struct Config;

struct CallResult {
    std::string text;
    std::string provider;
};

// Outcome of one provider within a failed call. invoked is false for
// providers that were skipped (unavailable or cancelled before their turn).
struct AttemptRecord {
    std::string provider;
    FailureClass failure = FailureClass::Other;
    std::string error;
    bool invoked = false;
};

// Raised when no provider produced a usable response.
class AllProvidersFailed : public std::runtime_error {
public:
    explicit AllProvidersFailed(std::vector<AttemptRecord> attempts);

    const std::vector<AttemptRecord>& attempts() const { return attempts_; }

    // Every configured provider, in attempt order
    std::vector<std::string> providers() const;

    // Providers whose capability was actually invoked
    std::vector<std::string> attempted() const;

private:
    static std::string summarize(const std::vector<AttemptRecord>& attempts);

    std::vector<AttemptRecord> attempts_;
};

// Sends a conversation to the first provider in attempt order that returns
// a non-empty response. Each available provider is tried at most once per
// call, sequentially. Holds no state between calls.
class FailoverDispatcher {
public:
    explicit FailoverDispatcher(ProviderRegistry registry, EventBus* bus = nullptr);

    // Builds the registry from config, publishing init events on bus
    FailoverDispatcher(const Config& config, HttpClient& http, EventBus* bus = nullptr);

    // Throws std::invalid_argument for an empty conversation and
    // AllProvidersFailed when every provider failed or none is available.
    CallResult call(const std::vector<ChatMessage>& messages,
                    const CallParameters& params = {});

    // Same as call() on a background thread. The dispatcher must outlive
    // the returned future.
    std::future<CallResult> call_async(std::vector<ChatMessage> messages,
                                       CallParameters params = {});

    ProviderStatus status() const { return registry_.status(); }
    const ProviderRegistry& registry() const { return registry_; }

private:
    void publish(const Event& event) const;

    ProviderRegistry registry_;
    EventBus* bus_;
};

} // namespace hybridllm
