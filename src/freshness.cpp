#include "freshness.hpp"

namespace trickle {

MessageFreshness::MessageFreshness(std::chrono::milliseconds grace)
    : grace_(grace.count() < 0 ? std::chrono::milliseconds(0) : grace)
{}

void MessageFreshness::record_session_start(const std::string& session_id, uint64_t now_ms) {
    session_starts_[session_id] = now_ms;
}

bool MessageFreshness::has_session_timing(const std::string& session_id) const {
    return session_starts_.count(session_id) > 0;
}

bool MessageFreshness::should_animate(const MessageInfo& message,
                                      const std::string& session_id) {
    if (message.role != "assistant") return false;
    if (seen_.count(message.id)) return false;

    auto it = session_starts_.find(session_id);
    if (it == session_starts_.end()) {
        // No baseline yet: treat as history so it never animates later
        seen_.insert(message.id);
        return false;
    }

    uint64_t grace = static_cast<uint64_t>(grace_.count());
    uint64_t threshold = it->second > grace ? it->second - grace : 0;
    bool fresh = message.created_ms > threshold;
    if (!fresh) {
        seen_.insert(message.id);
    }
    return fresh;
}

void MessageFreshness::mark_animated(const std::string& message_id) {
    seen_.insert(message_id);
}

bool MessageFreshness::has_been_animated(const std::string& message_id) const {
    return seen_.count(message_id) > 0;
}

void MessageFreshness::clear_session(const std::string& session_id) {
    session_starts_.erase(session_id);
}

void MessageFreshness::clear_all() {
    session_starts_.clear();
    seen_.clear();
}

} // namespace trickle
