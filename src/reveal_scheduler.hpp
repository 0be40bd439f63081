#pragma once
#include "config.hpp"
#include "pacing.hpp"
#include "timer.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace trickle {

enum class RevealPhase { Idle, Streaming, Complete };

const char* phase_name(RevealPhase phase);

// Reveals the text of one content stream progressively.
//
// Holds the latest authoritative text and a reveal cursor into it. While the
// stream is live the cursor advances on a timer the scheduler owns; at most
// one tick is ever pending. Finished content is shown at once.
//
// Single-threaded: call from the thread that drives the TimerService.
class RevealScheduler {
public:
    // Called after every change of the visible text or streaming state
    using ChangeListener = std::function<void()>;

    RevealScheduler(TimerService& timers, RevealConfig config = {});
    ~RevealScheduler();

    RevealScheduler(const RevealScheduler&) = delete;
    RevealScheduler& operator=(const RevealScheduler&) = delete;

    // Supply the latest full text for identity_key.
    // A new key resets the state first. streaming == false reveals everything
    // immediately. A shorter text under the same key while streaming restarts
    // the reveal from 0.
    void update(const std::string& text, bool streaming, const std::string& identity_key);

    // The source explicitly marked the stream finished
    void mark_complete();

    // The source sent its last update but the reveal keeps its pace until
    // mark_complete(). A trailing partial word is no longer held back.
    void end_stream();

    // Cancel the pending tick and stop all further mutation. Idempotent.
    void teardown();

    std::string visible_text() const { return text_.substr(0, revealed_); }
    bool is_complete() const { return revealed_ == text_.size(); }
    bool is_streaming() const { return streaming_; }
    bool source_ended() const { return source_ended_; }
    // Cursor affordance: streaming and not caught up
    bool is_revealing() const { return streaming_ && !is_complete(); }

    size_t revealed_length() const { return revealed_; }
    size_t backlog() const { return text_.size() - revealed_; }
    const std::string& authoritative_text() const { return text_; }
    const std::string& identity_key() const { return identity_key_; }
    RevealPhase phase() const { return phase_; }
    bool has_pending_tick() const { return pending_.has_value(); }
    bool torn_down() const { return torn_down_; }

    // Incremented on every reset; consumers drop derived state when it changes
    uint64_t generation() const { return generation_; }

    void set_change_listener(ChangeListener listener) { listener_ = std::move(listener); }

    const PacingPolicy& pacing() const { return pacing_; }

private:
    void reset(const std::string& identity_key);
    void finish(const std::string& text);
    void tick();
    void schedule_tick();
    void cancel_tick();
    void notify();

    TimerService& timers_;
    PacingPolicy pacing_;
    ChangeListener listener_;

    std::string identity_key_;
    std::string text_;
    size_t revealed_ = 0;
    bool streaming_ = false;
    bool source_ended_ = false;
    RevealPhase phase_ = RevealPhase::Idle;
    size_t drain_chunk_ = 0; // held until the backlog is empty
    std::optional<TimerId> pending_;
    uint64_t generation_ = 0;
    bool torn_down_ = false;
};

} // namespace trickle
