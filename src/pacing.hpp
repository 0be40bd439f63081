#pragma once
#include "config.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace trickle {

// Decides how far the reveal cursor moves on each tick.
//
// Fixed pacing ticks every speed_ms and reveals 3, 2 or 1 characters for
// speeds of <=2, <=5 and above. Backlog pacing ticks every tick_interval_ms
// and reveals at least interval/speed characters, more when the backlog
// would otherwise take longer than catch_up_window_ms to drain. The caller
// holds the largest chunk seen until its backlog is empty (min_chunk), so a
// burst drains at a constant rate within the window.
class PacingPolicy {
public:
    explicit PacingPolicy(RevealConfig config = {});

    // Delay between ticks
    std::chrono::milliseconds interval() const;

    // Characters (bytes) to reveal for the given backlog, before snapping.
    // Never more than backlog.
    size_t chunk_size(size_t backlog) const;

    // New cursor position after one tick. Applies chunk size (at least
    // min_chunk), word snapping and UTF-8 boundaries. Returns revealed
    // unchanged when nothing may be shown yet (a partial trailing word while
    // streaming).
    size_t next_cursor(const std::string& text, size_t revealed, bool streaming,
                       size_t min_chunk = 0) const;

    const RevealConfig& config() const { return config_; }

private:
    size_t snap_to_word(const std::string& text, size_t revealed, size_t target,
                        bool streaming) const;

    RevealConfig config_;
};

} // namespace trickle
