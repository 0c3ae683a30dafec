#include "failover.hpp"
#include "event_bus.hpp"
#include "config.hpp"
#include "http.hpp"
#include <utility>

namespace hybridllm {

AllProvidersFailed::AllProvidersFailed(std::vector<AttemptRecord> attempts)
    : std::runtime_error(summarize(attempts)), attempts_(std::move(attempts)) {}

std::string AllProvidersFailed::summarize(const std::vector<AttemptRecord>& attempts) {
    if (attempts.empty()) return "All providers failed: no providers configured";
    std::string msg = "All providers failed: ";
    for (size_t i = 0; i < attempts.size(); ++i) {
        const auto& a = attempts[i];
        if (i > 0) msg += ", ";
        msg += a.provider + " (" + failure_class_to_string(a.failure);
        if (!a.error.empty()) msg += ": " + a.error;
        msg += ")";
    }
    return msg;
}

std::vector<std::string> AllProvidersFailed::providers() const {
    std::vector<std::string> names;
    names.reserve(attempts_.size());
    for (const auto& a : attempts_) names.push_back(a.provider);
    return names;
}

std::vector<std::string> AllProvidersFailed::attempted() const {
    std::vector<std::string> names;
    for (const auto& a : attempts_) {
        if (a.invoked) names.push_back(a.provider);
    }
    return names;
}

FailoverDispatcher::FailoverDispatcher(ProviderRegistry registry, EventBus* bus)
    : registry_(std::move(registry)), bus_(bus) {}

FailoverDispatcher::FailoverDispatcher(const Config& config, HttpClient& http, EventBus* bus)
    : registry_(config, http, bus), bus_(bus) {}

void FailoverDispatcher::publish(const Event& event) const {
    if (bus_) bus_->publish(event);
}

CallResult FailoverDispatcher::call(const std::vector<ChatMessage>& messages,
                                    const CallParameters& params) {
    if (messages.empty()) {
        throw std::invalid_argument("call requires at least one message");
    }

    std::vector<AttemptRecord> records;
    size_t position = 0;

    for (const auto& handle : registry_.handles()) {
        if (!handle.available()) {
            records.push_back({handle.name, FailureClass::Unavailable, handle.reason, false});
            continue;
        }
        if (params.cancelled()) {
            records.push_back({handle.name, FailureClass::Other, "cancelled", false});
            continue;
        }

        AttemptStartedEvent started;
        started.provider = handle.name;
        started.model = handle.provider->resolve_model(params);
        started.position = position++;
        publish(started);

        InvokeResult result = handle.provider->invoke(messages, params);
        if (result.ok() && !result.text.empty()) {
            AttemptSucceededEvent done;
            done.provider = handle.name;
            done.response_length = result.text.size();
            publish(done);
            return {std::move(result.text), handle.name};
        }

        // An empty body is indistinguishable from a failure here.
        if (result.ok()) {
            result = InvokeResult::failed(FailureClass::Other, "empty response");
        }

        AttemptFailedEvent failed;
        failed.provider = handle.name;
        failed.failure = *result.failure;
        failed.error = result.error;
        publish(failed);

        records.push_back({handle.name, *result.failure, std::move(result.error), true});
    }

    AllProvidersFailed error(std::move(records));

    DispatchFailedEvent ev;
    ev.summary = error.what();
    ev.attempted = position;
    publish(ev);

    throw error;
}

std::future<CallResult> FailoverDispatcher::call_async(std::vector<ChatMessage> messages,
                                                       CallParameters params) {
    return std::async(std::launch::async,
                      [this, messages = std::move(messages), params = std::move(params)]() {
                          return call(messages, params);
                      });
}

} // namespace hybridllm
