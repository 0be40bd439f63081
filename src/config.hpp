#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace trickle {

enum class Granularity { Character, Word };

enum class PacingMode {
    Fixed,   // constant chunk at the nominal speed (typewriter)
    Backlog  // chunk grows with backlog so it drains within the catch-up window
};

constexpr uint32_t kMinSpeedMs = 1;
constexpr uint32_t kMinTickIntervalMs = 1;

struct RevealConfig {
    uint32_t speed_ms = 5;              // nominal time per character
    uint32_t tick_interval_ms = 16;     // frame cadence for backlog pacing
    uint32_t catch_up_window_ms = 1000; // max lag behind authoritative text
    Granularity granularity = Granularity::Character;
    PacingMode pacing = PacingMode::Backlog;
    std::string cursor_marker = "\xE2\x96\x8D"; // U+258D
    bool animate = true;

    // Clamp values into their valid ranges
    void normalize();
};

struct LifecycleConfig {
    uint32_t cooldown_ms = 1600;
    uint32_t freshness_grace_ms = 5000;
};

struct Config {
    RevealConfig reveal;
    LifecycleConfig lifecycle;
    std::string runtime; // empty = detect at startup

    // Load from ~/.trickle/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply the recognized keys of j; wrong types keep the current value
    void apply_json(const nlohmann::json& j);

    // Apply TRICKLE_* environment overrides
    void apply_env();
};

// Throws std::invalid_argument on unknown names
Granularity parse_granularity(const std::string& name);
PacingMode parse_pacing(const std::string& name);

const char* granularity_name(Granularity g);
const char* pacing_name(PacingMode p);

} // namespace trickle
