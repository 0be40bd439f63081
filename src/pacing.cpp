#include "pacing.hpp"
#include "util.hpp"

#include <algorithm>

namespace trickle {

PacingPolicy::PacingPolicy(RevealConfig config)
    : config_(std::move(config)) {
    config_.normalize();
}

std::chrono::milliseconds PacingPolicy::interval() const {
    if (config_.pacing == PacingMode::Fixed) {
        return std::chrono::milliseconds(config_.speed_ms);
    }
    return std::chrono::milliseconds(config_.tick_interval_ms);
}

size_t PacingPolicy::chunk_size(size_t backlog) const {
    if (backlog == 0) return 0;

    size_t chunk;
    if (config_.pacing == PacingMode::Fixed) {
        uint32_t speed = config_.speed_ms;
        chunk = speed <= 2 ? 3 : speed <= 5 ? 2 : 1;
    } else {
        size_t interval = config_.tick_interval_ms;
        size_t nominal = std::max<size_t>(1, interval / config_.speed_ms);
        // ceil(backlog * interval / window): drains the backlog within the window
        size_t window = config_.catch_up_window_ms;
        size_t catch_up = (backlog * interval + window - 1) / window;
        chunk = std::max(nominal, catch_up);
    }
    return std::min(chunk, backlog);
}

size_t PacingPolicy::snap_to_word(const std::string& text, size_t revealed,
                                  size_t target, bool streaming) const {
    if (target >= text.size()) {
        target = text.size();
    } else if (target > 0 && is_break_char(text[target - 1])) {
        // Already sits just after a break
        return target;
    } else {
        size_t next_break = target;
        while (next_break < text.size() && !is_break_char(text[next_break])) {
            ++next_break;
        }
        if (next_break < text.size()) {
            return next_break + 1;
        }
        target = text.size();
    }

    // target is the end of the text. A trailing word may still be growing.
    if (!streaming || is_break_char(text.back())) return target;

    size_t back = target;
    while (back > revealed && !is_break_char(text[back - 1])) {
        --back;
    }
    return back;
}

size_t PacingPolicy::next_cursor(const std::string& text, size_t revealed,
                                 bool streaming, size_t min_chunk) const {
    if (revealed >= text.size()) return text.size();

    size_t backlog = text.size() - revealed;
    size_t chunk = std::min(std::max(chunk_size(backlog), min_chunk), backlog);
    size_t target = revealed + chunk;
    if (config_.granularity == Granularity::Word) {
        target = snap_to_word(text, revealed, target, streaming);
    }
    target = utf8_ceil(text, target);
    return std::max(target, revealed);
}

} // namespace trickle
