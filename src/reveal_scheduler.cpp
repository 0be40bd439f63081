#include "reveal_scheduler.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>

namespace trickle {

const char* phase_name(RevealPhase phase) {
    switch (phase) {
        case RevealPhase::Idle:      return "idle";
        case RevealPhase::Streaming: return "streaming";
        case RevealPhase::Complete:  return "complete";
    }
    return "unknown";
}

RevealScheduler::RevealScheduler(TimerService& timers, RevealConfig config)
    : timers_(timers), pacing_(std::move(config))
{}

RevealScheduler::~RevealScheduler() {
    teardown();
}

void RevealScheduler::update(const std::string& text, bool streaming,
                             const std::string& identity_key) {
    if (torn_down_) return;

    if (phase_ == RevealPhase::Idle || identity_key != identity_key_) {
        reset(identity_key);
    }

    if (!streaming) {
        finish(text);
        return;
    }

    if (phase_ == RevealPhase::Complete) {
        // A finished message never resumes streaming under the same key
        std::cerr << "[reveal] " << identity_key_
                  << " already complete, showing update without animation\n";
        finish(text);
        return;
    }

    if (text.size() < text_.size()) {
        // Discontinuous replacement, not a rewind of the same stream
        revealed_ = 0;
        drain_chunk_ = 0;
    } else {
        // Keep only what is still shown at the same position
        revealed_ = std::min(revealed_, common_prefix_length(text_, text));
        revealed_ = utf8_floor(text, revealed_);
    }

    text_ = text;
    streaming_ = true;
    source_ended_ = false;
    phase_ = RevealPhase::Streaming;

    if (!pacing_.config().animate) {
        revealed_ = text_.size();
    }

    if (revealed_ < text_.size()) {
        drain_chunk_ = std::max(drain_chunk_, pacing_.chunk_size(backlog()));
        schedule_tick();
    } else {
        drain_chunk_ = 0;
        cancel_tick();
    }
    notify();
}

void RevealScheduler::mark_complete() {
    if (torn_down_ || phase_ != RevealPhase::Streaming) return;
    finish(text_);
}

void RevealScheduler::end_stream() {
    if (torn_down_ || phase_ != RevealPhase::Streaming || source_ended_) return;
    source_ended_ = true;
    // A tick stalled on a partial word is not pending; restart it
    if (revealed_ < text_.size()) schedule_tick();
}

void RevealScheduler::teardown() {
    if (torn_down_) return;
    cancel_tick();
    listener_ = nullptr;
    torn_down_ = true;
}

void RevealScheduler::reset(const std::string& identity_key) {
    cancel_tick();
    identity_key_ = identity_key;
    text_.clear();
    revealed_ = 0;
    drain_chunk_ = 0;
    streaming_ = false;
    source_ended_ = false;
    phase_ = RevealPhase::Idle;
    ++generation_;
}

void RevealScheduler::finish(const std::string& text) {
    cancel_tick();
    text_ = text;
    revealed_ = text_.size();
    drain_chunk_ = 0;
    streaming_ = false;
    phase_ = RevealPhase::Complete;
    notify();
}

void RevealScheduler::tick() {
    pending_.reset();
    if (torn_down_ || !streaming_) return;

    size_t next = pacing_.next_cursor(text_, revealed_, !source_ended_, drain_chunk_);
    if (next == revealed_) {
        // Waiting on a partial word; the next update reschedules
        return;
    }
    revealed_ = next;
    if (revealed_ == text_.size()) drain_chunk_ = 0;
    notify();

    // The listener may have changed the state
    if (!torn_down_ && streaming_ && revealed_ < text_.size()) {
        schedule_tick();
    }
}

void RevealScheduler::schedule_tick() {
    if (pending_ || torn_down_) return;
    pending_ = timers_.schedule(pacing_.interval(), [this]() { tick(); });
}

void RevealScheduler::cancel_tick() {
    if (!pending_) return;
    timers_.cancel(*pending_);
    pending_.reset();
}

void RevealScheduler::notify() {
    if (!listener_) return;
    // Copy: the listener may call teardown() and clear listener_
    ChangeListener listener = listener_;
    listener();
}

} // namespace trickle
