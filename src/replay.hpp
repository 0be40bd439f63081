#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace trickle {

// One content update of a recorded stream
struct ReplayStep {
    uint64_t at_ms = 0;
    std::string slot = "main";
    std::string message;
    std::string role = "assistant";
    std::optional<std::string> text;
    std::optional<std::string> delta;
    bool streaming = true;
};

// Parse one JSON line. Throws std::invalid_argument on bad input.
ReplayStep parse_replay_line(const std::string& line);

// Parse a JSON-lines transcript. Blank lines and lines starting with '#'
// are ignored; bad lines are skipped with a warning. Sorted by at_ms,
// keeping file order for equal times.
std::vector<ReplayStep> load_replay(std::istream& in);

// Split text into word-sized deltas spaced interval_ms apart, followed by
// an end-of-stream step.
std::vector<ReplayStep> split_into_tokens(const std::string& text,
                                          const std::string& message_id,
                                          uint64_t interval_ms);

} // namespace trickle
