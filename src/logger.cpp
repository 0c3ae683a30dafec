#include "logger.hpp"
#include "util.hpp"
#include <cstring>

namespace hybridllm {

static constexpr size_t MAX_ERROR_LOG = 300;

static bool has_tag(const Event& event, const char* tag) {
    return std::strcmp(event.type_tag, tag) == 0;
}

std::string StderrLogger::format(const Event& event) {
    if (has_tag(event, ProviderInitializedEvent::TAG)) {
        const auto& e = static_cast<const ProviderInitializedEvent&>(event);
        if (e.available) return "[registry] " + e.provider + " initialized";
        return "[registry] " + e.provider + " unavailable: " + e.reason;
    }
    if (has_tag(event, AttemptStartedEvent::TAG)) {
        const auto& e = static_cast<const AttemptStartedEvent&>(event);
        return "[failover] Trying " + e.provider + " (" + e.model + ")";
    }
    if (has_tag(event, AttemptFailedEvent::TAG)) {
        const auto& e = static_cast<const AttemptFailedEvent&>(event);
        return "[failover] " + e.provider + " " + failure_class_to_string(e.failure) +
               ": " + truncate(e.error, MAX_ERROR_LOG);
    }
    if (has_tag(event, AttemptSucceededEvent::TAG)) {
        const auto& e = static_cast<const AttemptSucceededEvent&>(event);
        return "[failover] " + e.provider + " succeeded";
    }
    if (has_tag(event, DispatchFailedEvent::TAG)) {
        const auto& e = static_cast<const DispatchFailedEvent&>(event);
        return "[failover] " + truncate(e.summary, MAX_ERROR_LOG * 2);
    }
    return "";
}

StderrLogger::StderrLogger(EventBus& bus, std::ostream& out)
    : bus_(bus), out_(out) {
    subscription_ = bus_.subscribe_all([this](const Event& event) {
        std::string line = format(event);
        if (line.empty()) return;
        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << line << '\n' << std::flush;
    });
}

StderrLogger::~StderrLogger() {
    bus_.unsubscribe(subscription_);
}

} // namespace hybridllm
