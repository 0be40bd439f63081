#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

namespace trickle {

// Trim whitespace
std::string trim(const std::string& s);

// Lowercase ASCII copy
std::string to_lower(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

// Length of the longest common prefix of a and b (bytes)
size_t common_prefix_length(const std::string& a, const std::string& b);

// Space, tab, CR or LF
bool is_break_char(char c);

// True if pos is the start of a UTF-8 code point (or text.size())
bool is_utf8_boundary(const std::string& text, size_t pos);

// Smallest code point boundary >= pos, capped at text.size()
size_t utf8_ceil(const std::string& text, size_t pos);

// Largest code point boundary <= pos
size_t utf8_floor(const std::string& text, size_t pos);

} // namespace trickle
