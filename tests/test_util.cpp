#include <catch2/catch.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace trickle;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n  ").empty());
    REQUIRE(trim("").empty());
}

// ── to_lower ─────────────────────────────────────────────────────

TEST_CASE("to_lower: ASCII letters only", "[util]") {
    REQUIRE(to_lower("Word") == "word");
    REQUIRE(to_lower("BACKLOG-1") == "backlog-1");
    REQUIRE(to_lower("\xC3\x89") == "\xC3\x89");
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/usr/local") == "/usr/local");
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    std::string result = expand_home("~/.trickle");
    REQUIRE(result.find('~') == std::string::npos);
    REQUIRE(result.size() > std::string("/.trickle").size());
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parent directories", "[util]") {
    auto dir = std::filesystem::temp_directory_path() / "trickle_util_write";
    std::filesystem::remove_all(dir);
    std::string path = (dir / "nested" / "file.json").string();

    REQUIRE(atomic_write_file(path, "{}\n"));
    REQUIRE(std::filesystem::exists(path));
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::ifstream f(path);
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    REQUIRE(content == "{}\n");

    std::filesystem::remove_all(dir);
}

TEST_CASE("atomic_write_file: replaces existing content", "[util]") {
    auto dir = std::filesystem::temp_directory_path() / "trickle_util_replace";
    std::filesystem::remove_all(dir);
    std::string path = (dir / "file.txt").string();

    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(atomic_write_file(path, "second"));

    std::ifstream f(path);
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    REQUIRE(content == "second");

    std::filesystem::remove_all(dir);
}

// ── common_prefix_length ─────────────────────────────────────────

TEST_CASE("common_prefix_length: shared and disjoint", "[util]") {
    REQUIRE(common_prefix_length("Hello", "Hello world") == 5);
    REQUIRE(common_prefix_length("abc", "xy") == 0);
    REQUIRE(common_prefix_length("", "abc") == 0);
    REQUIRE(common_prefix_length("same", "same") == 4);
    REQUIRE(common_prefix_length("abcd", "abXd") == 2);
}

// ── is_break_char ────────────────────────────────────────────────

TEST_CASE("is_break_char: whitespace only", "[util]") {
    REQUIRE(is_break_char(' '));
    REQUIRE(is_break_char('\n'));
    REQUIRE(is_break_char('\t'));
    REQUIRE(is_break_char('\r'));
    REQUIRE_FALSE(is_break_char('a'));
    REQUIRE_FALSE(is_break_char('-'));
}

// ── UTF-8 boundaries ─────────────────────────────────────────────

TEST_CASE("utf8: boundaries around a two-byte code point", "[util]") {
    std::string s = "a\xC3\xA9" "b"; // a é b
    REQUIRE(is_utf8_boundary(s, 0));
    REQUIRE(is_utf8_boundary(s, 1));
    REQUIRE_FALSE(is_utf8_boundary(s, 2));
    REQUIRE(is_utf8_boundary(s, 3));
    REQUIRE(is_utf8_boundary(s, 4));
}

TEST_CASE("utf8_ceil: moves past continuation bytes", "[util]") {
    std::string s = "\xE2\x96\x8D" "x"; // ▍x
    REQUIRE(utf8_ceil(s, 0) == 0);
    REQUIRE(utf8_ceil(s, 1) == 3);
    REQUIRE(utf8_ceil(s, 2) == 3);
    REQUIRE(utf8_ceil(s, 10) == s.size());
}

TEST_CASE("utf8_floor: moves back to the lead byte", "[util]") {
    std::string s = "x\xE2\x96\x8D";
    REQUIRE(utf8_floor(s, 1) == 1);
    REQUIRE(utf8_floor(s, 2) == 1);
    REQUIRE(utf8_floor(s, 3) == 1);
    REQUIRE(utf8_floor(s, 4) == 4);
}
