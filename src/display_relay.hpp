#pragma once
#include "config.hpp"
#include "document.hpp"
#include "event_bus.hpp"
#include "freshness.hpp"
#include "stream_display.hpp"
#include "stream_lifecycle.hpp"
#include "timer.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trickle {

// Bridges content events on the bus with per-slot stream displays.
// Owns one StreamDisplay per slot and publishes every render snapshot as a
// RenderReadyEvent.
class DisplayRelay {
public:
    DisplayRelay(EventBus& bus, TimerQueue& timers, const MarkupRenderer& renderer,
                 const Config& config);
    ~DisplayRelay();

    DisplayRelay(const DisplayRelay&) = delete;
    DisplayRelay& operator=(const DisplayRelay&) = delete;

    // Subscribe all event handlers. Call once.
    void subscribe_events();

    size_t slot_count() const { return slots_.size(); }
    // Removed displays waiting to be destroyed
    size_t retired_count() const { return retired_.size(); }
    const StreamDisplay* display(const std::string& slot_id) const;

    MessageFreshness& freshness() { return freshness_; }
    const StreamLifecycle& lifecycle() const { return lifecycle_; }

private:
    struct SlotState {
        std::unique_ptr<StreamDisplay> display;
        std::string message_id;
        std::string text;
        bool animate = true;
    };

    void on_content(const ContentUpdateEvent& ev);
    void on_slot_removed(const SlotRemovedEvent& ev);
    void on_snapshot(const std::string& slot_id, const RenderSnapshot& snap);
    void on_settled(const std::string& message_id);

    bool shows_message(const std::string& message_id) const;
    // Drop the lifecycle entry of a message no slot shows any more
    void release_message(const std::string& message_id);
    // Destroy removed displays once no callback of theirs is on the stack
    void retire(std::unique_ptr<StreamDisplay> display);

    EventBus& bus_;
    TimerQueue& timers_;
    const MarkupRenderer& renderer_;
    RevealConfig reveal_;
    MessageFreshness freshness_;
    StreamLifecycle lifecycle_;
    std::unordered_map<std::string, SlotState> slots_;
    std::vector<std::unique_ptr<StreamDisplay>> retired_;
    std::optional<TimerId> purge_timer_;
    // Declared last: unsubscribed before the slots are destroyed
    std::vector<ScopedSubscription> subscriptions_;
};

} // namespace trickle
