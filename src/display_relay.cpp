#include "display_relay.hpp"
#include "event.hpp"

#include <iostream>

namespace trickle {

DisplayRelay::DisplayRelay(EventBus& bus, TimerQueue& timers,
                           const MarkupRenderer& renderer, const Config& config)
    : bus_(bus), timers_(timers), renderer_(renderer), reveal_(config.reveal),
      freshness_(std::chrono::milliseconds(config.lifecycle.freshness_grace_ms)),
      lifecycle_(timers, std::chrono::milliseconds(config.lifecycle.cooldown_ms))
{
    reveal_.normalize();
    lifecycle_.set_completion_handler([this](const std::string& id) { on_settled(id); });
}

DisplayRelay::~DisplayRelay() {
    if (purge_timer_) timers_.cancel(*purge_timer_);
    subscriptions_.clear();
    for (auto& [slot_id, slot] : slots_) {
        if (slot.display) slot.display->teardown();
    }
}

void DisplayRelay::subscribe_events() {
    subscriptions_.emplace_back(bus_, trickle::subscribe<SessionStartedEvent>(bus_,
        [this](const SessionStartedEvent& ev) {
            freshness_.record_session_start(ev.session_id, ev.started_ms);
        }));

    subscriptions_.emplace_back(bus_, trickle::subscribe<ContentUpdateEvent>(bus_,
        [this](const ContentUpdateEvent& ev) { on_content(ev); }));

    subscriptions_.emplace_back(bus_, trickle::subscribe<SlotRemovedEvent>(bus_,
        [this](const SlotRemovedEvent& ev) { on_slot_removed(ev); }));
}

const StreamDisplay* DisplayRelay::display(const std::string& slot_id) const {
    auto it = slots_.find(slot_id);
    if (it == slots_.end()) return nullptr;
    return it->second.display.get();
}

void DisplayRelay::on_content(const ContentUpdateEvent& ev) {
    if (ev.message_id.empty()) {
        std::cerr << "[relay] Dropping content update without message id\n";
        return;
    }
    std::string slot_id = ev.slot_id.empty() ? "main" : ev.slot_id;

    auto& slot = slots_[slot_id];
    if (!slot.display) {
        slot.display = std::make_unique<StreamDisplay>(
            timers_, renderer_, reveal_,
            [this, slot_id](const RenderSnapshot& snap) { on_snapshot(slot_id, snap); });
    }

    std::string previous;
    if (slot.message_id != ev.message_id) {
        // New message in this slot: the display resets on the identity change
        previous = slot.message_id;
        slot.message_id = ev.message_id;
        slot.text.clear();
        MessageInfo info{ev.message_id, ev.role, ev.created_ms};
        slot.animate = freshness_.should_animate(info, ev.session_id);
    }

    if (ev.text) {
        slot.text = *ev.text;
    } else if (ev.delta) {
        slot.text += *ev.delta;
    }

    if (ev.streaming) {
        lifecycle_.touch(ev.message_id);
    } else {
        if (!lifecycle_.get(ev.message_id)) lifecycle_.touch(ev.message_id);
        lifecycle_.mark_cooldown(ev.message_id);
    }
    if (!previous.empty()) release_message(previous);

    // Subscribers may remove the slot while the display notifies them
    StreamDisplay* display = slot.display.get();
    std::string text = slot.text;
    if (!slot.animate) {
        display->update(text, false, ev.message_id);
        return;
    }
    // The reveal keeps draining through the cooldown; on_settled finishes it
    display->update(text, true, ev.message_id);
    if (!ev.streaming) display->end_stream();
}

void DisplayRelay::on_slot_removed(const SlotRemovedEvent& ev) {
    auto it = slots_.find(ev.slot_id);
    if (it == slots_.end()) return;
    std::unique_ptr<StreamDisplay> display = std::move(it->second.display);
    std::string message_id = it->second.message_id;
    slots_.erase(it);

    if (display) {
        display->teardown();
        retire(std::move(display));
    }
    // The message of a removed slot never settles
    if (!message_id.empty() && !shows_message(message_id)) {
        lifecycle_.remove({message_id});
    }
}

void DisplayRelay::on_snapshot(const std::string& slot_id, const RenderSnapshot& snap) {
    auto it = slots_.find(slot_id);
    if (it != slots_.end() && it->second.animate && it->second.display &&
        it->second.display->scheduler().phase() == RevealPhase::Complete) {
        freshness_.mark_animated(snap.identity_key);
    }

    RenderReadyEvent ready;
    ready.slot_id = slot_id;
    ready.snapshot = snap;
    bus_.publish(ready);
}

void DisplayRelay::on_settled(const std::string& message_id) {
    std::vector<StreamDisplay*> displays;
    for (auto& [slot_id, slot] : slots_) {
        if (slot.message_id == message_id && slot.display) {
            displays.push_back(slot.display.get());
        }
    }
    // Removed displays stay alive in retired_ until the purge timer fires
    for (StreamDisplay* display : displays) {
        display->mark_complete();
    }

    MessageSettledEvent settled;
    settled.message_id = message_id;
    bus_.publish(settled);

    release_message(message_id);
}

bool DisplayRelay::shows_message(const std::string& message_id) const {
    for (const auto& [slot_id, slot] : slots_) {
        if (slot.message_id == message_id) return true;
    }
    return false;
}

void DisplayRelay::release_message(const std::string& message_id) {
    if (shows_message(message_id)) return;
    auto entry = lifecycle_.get(message_id);
    if (!entry) return;
    // Released after it settles
    if (entry->phase == LifecyclePhase::Cooldown) return;
    lifecycle_.remove({message_id});
}

void DisplayRelay::retire(std::unique_ptr<StreamDisplay> display) {
    retired_.push_back(std::move(display));
    if (purge_timer_) return;
    purge_timer_ = timers_.schedule(std::chrono::milliseconds(0), [this]() {
        purge_timer_.reset();
        retired_.clear();
    });
}

} // namespace trickle
