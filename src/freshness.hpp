#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace trickle {

struct MessageInfo {
    std::string id;
    std::string role;        // "assistant", "user", ...
    uint64_t created_ms = 0; // source timestamp, same clock as session starts
};

// Decides whether a message is new enough to be revealed progressively.
// Messages that were already on screen when a session opened, user
// messages, and messages already animated once are shown in full.
class MessageFreshness {
public:
    explicit MessageFreshness(std::chrono::milliseconds grace = std::chrono::milliseconds(5000));

    void record_session_start(const std::string& session_id, uint64_t now_ms);
    bool has_session_timing(const std::string& session_id) const;

    // A stale answer is remembered, so later calls for the same id agree
    bool should_animate(const MessageInfo& message, const std::string& session_id);

    void mark_animated(const std::string& message_id);
    bool has_been_animated(const std::string& message_id) const;

    // Drops the session start only; seen messages stay seen
    void clear_session(const std::string& session_id);
    void clear_all();

    size_t seen_count() const { return seen_.size(); }

private:
    std::chrono::milliseconds grace_;
    std::unordered_map<std::string, uint64_t> session_starts_;
    std::unordered_set<std::string> seen_;
};

} // namespace trickle
