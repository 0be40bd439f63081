#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace trickle {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool atomic_write_file(const std::string& path, const std::string& content) {
    std::error_code ec;
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) return false;
    }

    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) return false;
        out << content;
        if (!out.good()) {
            out.close();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

size_t common_prefix_length(const std::string& a, const std::string& b) {
    size_t limit = std::min(a.size(), b.size());
    size_t i = 0;
    while (i < limit && a[i] == b[i]) ++i;
    return i;
}

bool is_break_char(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_utf8_boundary(const std::string& text, size_t pos) {
    if (pos >= text.size()) return true;
    // Continuation bytes look like 10xxxxxx
    return (static_cast<unsigned char>(text[pos]) & 0xC0) != 0x80;
}

size_t utf8_ceil(const std::string& text, size_t pos) {
    if (pos >= text.size()) return text.size();
    while (pos < text.size() && !is_utf8_boundary(text, pos)) ++pos;
    return pos;
}

size_t utf8_floor(const std::string& text, size_t pos) {
    if (pos >= text.size()) return text.size();
    while (pos > 0 && !is_utf8_boundary(text, pos)) --pos;
    return pos;
}

} // namespace trickle
