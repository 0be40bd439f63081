#pragma once
#include "timer.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trickle {

enum class LifecyclePhase { Streaming, Cooldown, Completed };

const char* lifecycle_phase_name(LifecyclePhase phase);

struct LifecycleEntry {
    LifecyclePhase phase = LifecyclePhase::Streaming;
    std::chrono::milliseconds started_at{0};
    std::chrono::milliseconds last_update_at{0};
    std::optional<std::chrono::milliseconds> completed_at;
};

// Per-message streaming state. When the source reports the end of a stream
// the message cools down for cooldown_ms before it counts as completed.
class StreamLifecycle {
public:
    using CompletionHandler = std::function<void(const std::string& message_id)>;

    StreamLifecycle(TimerQueue& timers,
                    std::chrono::milliseconds cooldown = std::chrono::milliseconds(1600));
    ~StreamLifecycle();

    StreamLifecycle(const StreamLifecycle&) = delete;
    StreamLifecycle& operator=(const StreamLifecycle&) = delete;

    // New content arrived for message_id
    void touch(const std::string& message_id);

    // The source finished the stream; completes after the cooldown
    void mark_cooldown(const std::string& message_id);

    void mark_completed(const std::string& message_id);

    void remove(const std::vector<std::string>& message_ids);

    std::optional<LifecycleEntry> get(const std::string& message_id) const;
    bool has_pending_completion(const std::string& message_id) const;
    size_t size() const { return entries_.size(); }

    void set_completion_handler(CompletionHandler handler) { on_complete_ = std::move(handler); }

private:
    void cancel_completion(const std::string& message_id);

    TimerQueue& timers_;
    std::chrono::milliseconds cooldown_;
    std::unordered_map<std::string, LifecycleEntry> entries_;
    std::unordered_map<std::string, TimerId> completion_timers_;
    CompletionHandler on_complete_;
};

} // namespace trickle
