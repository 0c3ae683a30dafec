#pragma once
#include "provider.hpp"
#include <string>
#include <cstddef>

namespace hybridllm {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* ProviderInitialized = "ProviderInitialized";
    constexpr const char* AttemptStarted      = "AttemptStarted";
    constexpr const char* AttemptFailed       = "AttemptFailed";
    constexpr const char* AttemptSucceeded    = "AttemptSucceeded";
    constexpr const char* DispatchFailed      = "DispatchFailed";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

// Published once per configured provider while the registry is built.
struct ProviderInitializedEvent : Event {
    static constexpr const char* TAG = event_tags::ProviderInitialized;
    std::string provider;
    bool available = false;
    std::string reason; // why unavailable

    ProviderInitializedEvent() { type_tag = TAG; }
};

struct AttemptStartedEvent : Event {
    static constexpr const char* TAG = event_tags::AttemptStarted;
    std::string provider;
    std::string model;
    size_t position = 0; // 0 = first attempt of the call

    AttemptStartedEvent() { type_tag = TAG; }
};

struct AttemptFailedEvent : Event {
    static constexpr const char* TAG = event_tags::AttemptFailed;
    std::string provider;
    FailureClass failure = FailureClass::Other;
    std::string error;

    AttemptFailedEvent() { type_tag = TAG; }
};

struct AttemptSucceededEvent : Event {
    static constexpr const char* TAG = event_tags::AttemptSucceeded;
    std::string provider;
    size_t response_length = 0;

    AttemptSucceededEvent() { type_tag = TAG; }
};

struct DispatchFailedEvent : Event {
    static constexpr const char* TAG = event_tags::DispatchFailed;
    std::string summary;
    size_t attempted = 0;

    DispatchFailedEvent() { type_tag = TAG; }
};

} // namespace hybridllm
