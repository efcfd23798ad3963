#pragma once
#include <string>
#include <cstdint>

namespace mtsatori {

// Tag-based event dispatch for in-process lifecycle notifications.
// No RTTI, no dynamic_cast. Events are stack-allocated structs; never
// deleted through base pointer. Gateway events travel through EventStream.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* SessionStateChanged    = "SessionStateChanged";
    constexpr const char* NormalizerStateChanged = "NormalizerStateChanged";
    constexpr const char* UpdateDropped          = "UpdateDropped";
    constexpr const char* ActionFailed           = "ActionFailed";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct SessionStateChangedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionStateChanged;
    std::string from;
    std::string to;
    std::string reason;
    int64_t self_id = 0;

    SessionStateChangedEvent() { type_tag = TAG; }
};

struct NormalizerStateChangedEvent : Event {
    static constexpr const char* TAG = event_tags::NormalizerStateChanged;
    std::string from;
    std::string to;

    NormalizerStateChangedEvent() { type_tag = TAG; }
};

// A native update that produced no gateway event.
struct UpdateDroppedEvent : Event {
    static constexpr const char* TAG = event_tags::UpdateDropped;
    std::string update_id;
    std::string raw_type;
    std::string reason;   // "duplicate", "disconnected", "unsupported", "malformed"

    UpdateDroppedEvent() { type_tag = TAG; }
};

struct ActionFailedEvent : Event {
    static constexpr const char* TAG = event_tags::ActionFailed;
    std::string method;
    std::string kind;
    std::string message;

    ActionFailedEvent() { type_tag = TAG; }
};

} // namespace mtsatori
