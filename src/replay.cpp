#include "replay.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace trickle {

ReplayStep parse_replay_line(const std::string& line) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::invalid_argument("expected a JSON object");
    }

    ReplayStep step;
    if (j.contains("at_ms")) {
        if (!j["at_ms"].is_number_unsigned())
            throw std::invalid_argument("at_ms must be a non-negative integer");
        step.at_ms = j["at_ms"].get<uint64_t>();
    }
    if (!j.contains("message") || !j["message"].is_string() ||
        j["message"].get<std::string>().empty()) {
        throw std::invalid_argument("message id is required");
    }
    step.message = j["message"].get<std::string>();

    if (j.contains("slot") && j["slot"].is_string())
        step.slot = j["slot"].get<std::string>();
    if (j.contains("role") && j["role"].is_string())
        step.role = j["role"].get<std::string>();
    if (j.contains("streaming") && j["streaming"].is_boolean())
        step.streaming = j["streaming"].get<bool>();

    bool has_text = j.contains("text");
    bool has_delta = j.contains("delta");
    if (has_text && has_delta) {
        throw std::invalid_argument("text and delta are mutually exclusive");
    }
    if (has_text) {
        if (!j["text"].is_string()) throw std::invalid_argument("text must be a string");
        step.text = j["text"].get<std::string>();
    }
    if (has_delta) {
        if (!j["delta"].is_string()) throw std::invalid_argument("delta must be a string");
        step.delta = j["delta"].get<std::string>();
    }
    if (!has_text && !has_delta && step.streaming) {
        throw std::invalid_argument("text or delta required while streaming");
    }
    return step;
}

std::vector<ReplayStep> load_replay(std::istream& in) {
    std::vector<ReplayStep> steps;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        try {
            steps.push_back(parse_replay_line(t));
        } catch (const std::exception& e) {
            std::cerr << "[replay] line " << line_no << ": " << e.what() << "\n";
        }
    }
    std::stable_sort(steps.begin(), steps.end(),
                     [](const ReplayStep& a, const ReplayStep& b) { return a.at_ms < b.at_ms; });
    return steps;
}

std::vector<ReplayStep> split_into_tokens(const std::string& text,
                                          const std::string& message_id,
                                          uint64_t interval_ms) {
    std::vector<ReplayStep> steps;
    uint64_t at = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = pos;
        // A token is a word plus the whitespace that follows it
        while (end < text.size() && !is_break_char(text[end])) ++end;
        while (end < text.size() && is_break_char(text[end])) ++end;

        ReplayStep step;
        step.at_ms = at;
        step.message = message_id;
        step.delta = text.substr(pos, end - pos);
        steps.push_back(std::move(step));

        at += interval_ms;
        pos = end;
    }

    ReplayStep done;
    done.at_ms = at;
    done.message = message_id;
    done.streaming = false;
    steps.push_back(std::move(done));
    return steps;
}

} // namespace trickle
