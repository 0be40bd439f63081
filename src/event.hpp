#pragma once
#include "stream_display.hpp"
#include <string>
#include <cstdint>
#include <optional>

namespace trickle {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* SessionStarted = "SessionStarted";
    constexpr const char* ContentUpdate  = "ContentUpdate";
    constexpr const char* SlotRemoved    = "SlotRemoved";
    constexpr const char* RenderReady    = "RenderReady";
    constexpr const char* MessageSettled = "MessageSettled";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct SessionStartedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionStarted;
    std::string session_id;
    uint64_t started_ms = 0;

    SessionStartedEvent() { type_tag = TAG; }
};

// Content source output for one message shown in one slot.
// text replaces the message text; delta appends to it.
struct ContentUpdateEvent : Event {
    static constexpr const char* TAG = event_tags::ContentUpdate;
    std::string slot_id;
    std::string session_id;
    std::string message_id;
    std::string role = "assistant";
    uint64_t created_ms = 0;
    std::optional<std::string> text;
    std::optional<std::string> delta;
    bool streaming = true;

    ContentUpdateEvent() { type_tag = TAG; }
};

struct SlotRemovedEvent : Event {
    static constexpr const char* TAG = event_tags::SlotRemoved;
    std::string slot_id;

    SlotRemovedEvent() { type_tag = TAG; }
};

struct RenderReadyEvent : Event {
    static constexpr const char* TAG = event_tags::RenderReady;
    std::string slot_id;
    RenderSnapshot snapshot;

    RenderReadyEvent() { type_tag = TAG; }
};

struct MessageSettledEvent : Event {
    static constexpr const char* TAG = event_tags::MessageSettled;
    std::string message_id;

    MessageSettledEvent() { type_tag = TAG; }
};

} // namespace trickle
