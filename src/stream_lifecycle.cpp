#include "stream_lifecycle.hpp"

namespace trickle {

const char* lifecycle_phase_name(LifecyclePhase phase) {
    switch (phase) {
        case LifecyclePhase::Streaming: return "streaming";
        case LifecyclePhase::Cooldown:  return "cooldown";
        case LifecyclePhase::Completed: return "completed";
    }
    return "unknown";
}

StreamLifecycle::StreamLifecycle(TimerQueue& timers, std::chrono::milliseconds cooldown)
    : timers_(timers), cooldown_(cooldown)
{}

StreamLifecycle::~StreamLifecycle() {
    for (const auto& [id, timer] : completion_timers_) {
        timers_.cancel(timer);
    }
}

void StreamLifecycle::touch(const std::string& message_id) {
    auto now = timers_.now();
    cancel_completion(message_id);

    auto it = entries_.find(message_id);
    if (it == entries_.end()) {
        LifecycleEntry entry;
        entry.started_at = now;
        entry.last_update_at = now;
        entries_.emplace(message_id, entry);
        return;
    }
    it->second.phase = LifecyclePhase::Streaming;
    it->second.last_update_at = now;
    it->second.completed_at.reset();
}

void StreamLifecycle::mark_cooldown(const std::string& message_id) {
    auto it = entries_.find(message_id);
    if (it == entries_.end()) return;
    if (it->second.phase != LifecyclePhase::Streaming) return;

    it->second.phase = LifecyclePhase::Cooldown;
    it->second.completed_at = timers_.now();

    cancel_completion(message_id);
    completion_timers_[message_id] = timers_.schedule(cooldown_, [this, message_id]() {
        completion_timers_.erase(message_id);
        mark_completed(message_id);
    });
}

void StreamLifecycle::mark_completed(const std::string& message_id) {
    auto it = entries_.find(message_id);
    if (it == entries_.end()) return;
    if (it->second.phase == LifecyclePhase::Completed) return;

    cancel_completion(message_id);
    it->second.phase = LifecyclePhase::Completed;
    if (!it->second.completed_at) {
        it->second.completed_at = timers_.now();
    }
    if (on_complete_) on_complete_(message_id);
}

void StreamLifecycle::remove(const std::vector<std::string>& message_ids) {
    for (const auto& id : message_ids) {
        cancel_completion(id);
        entries_.erase(id);
    }
}

std::optional<LifecycleEntry> StreamLifecycle::get(const std::string& message_id) const {
    auto it = entries_.find(message_id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool StreamLifecycle::has_pending_completion(const std::string& message_id) const {
    return completion_timers_.count(message_id) > 0;
}

void StreamLifecycle::cancel_completion(const std::string& message_id) {
    auto it = completion_timers_.find(message_id);
    if (it == completion_timers_.end()) return;
    timers_.cancel(it->second);
    completion_timers_.erase(it);
}

} // namespace trickle
