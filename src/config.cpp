#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace trickle {

void RevealConfig::normalize() {
    speed_ms = std::max(speed_ms, kMinSpeedMs);
    tick_interval_ms = std::max(tick_interval_ms, kMinTickIntervalMs);
    catch_up_window_ms = std::max(catch_up_window_ms, tick_interval_ms);
}

Granularity parse_granularity(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "character" || n == "char") return Granularity::Character;
    if (n == "word") return Granularity::Word;
    throw std::invalid_argument("Unknown granularity: " + name);
}

PacingMode parse_pacing(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "fixed") return PacingMode::Fixed;
    if (n == "backlog") return PacingMode::Backlog;
    throw std::invalid_argument("Unknown pacing mode: " + name);
}

const char* granularity_name(Granularity g) {
    return g == Granularity::Word ? "word" : "character";
}

const char* pacing_name(PacingMode p) {
    return p == PacingMode::Fixed ? "fixed" : "backlog";
}

nlohmann::json Config::defaults_json() {
    RevealConfig r;
    LifecycleConfig l;
    return {
        {"reveal", {
            {"speed_ms", r.speed_ms},
            {"tick_interval_ms", r.tick_interval_ms},
            {"catch_up_window_ms", r.catch_up_window_ms},
            {"granularity", granularity_name(r.granularity)},
            {"pacing", pacing_name(r.pacing)},
            {"cursor_marker", r.cursor_marker},
            {"animate", r.animate}
        }},
        {"lifecycle", {
            {"cooldown_ms", l.cooldown_ms},
            {"freshness_grace_ms", l.freshness_grace_ms}
        }},
        {"runtime", ""}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Signed read so negative values clamp instead of being rejected
static void read_millis(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number()) return;
    double v = obj[key].get<double>();
    if (v < 0) v = 0;
    if (v > 86400000.0) v = 86400000.0;
    out = static_cast<uint32_t>(v);
}

void Config::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) return;

    if (j.contains("reveal") && j["reveal"].is_object()) {
        auto& r = j["reveal"];
        read_millis(r, "speed_ms", reveal.speed_ms);
        read_millis(r, "tick_interval_ms", reveal.tick_interval_ms);
        read_millis(r, "catch_up_window_ms", reveal.catch_up_window_ms);
        if (r.contains("granularity") && r["granularity"].is_string()) {
            try {
                reveal.granularity = parse_granularity(r["granularity"].get<std::string>());
            } catch (const std::exception& e) {
                std::cerr << "[config] " << e.what() << ", keeping "
                          << granularity_name(reveal.granularity) << "\n";
            }
        }
        if (r.contains("pacing") && r["pacing"].is_string()) {
            try {
                reveal.pacing = parse_pacing(r["pacing"].get<std::string>());
            } catch (const std::exception& e) {
                std::cerr << "[config] " << e.what() << ", keeping "
                          << pacing_name(reveal.pacing) << "\n";
            }
        }
        if (r.contains("cursor_marker") && r["cursor_marker"].is_string())
            reveal.cursor_marker = r["cursor_marker"].get<std::string>();
        if (r.contains("animate") && r["animate"].is_boolean())
            reveal.animate = r["animate"].get<bool>();
    }

    if (j.contains("lifecycle") && j["lifecycle"].is_object()) {
        auto& l = j["lifecycle"];
        read_millis(l, "cooldown_ms", lifecycle.cooldown_ms);
        read_millis(l, "freshness_grace_ms", lifecycle.freshness_grace_ms);
    }

    if (j.contains("runtime") && j["runtime"].is_string())
        runtime = j["runtime"].get<std::string>();

    reveal.normalize();
}

static bool env_millis(const char* name, uint32_t& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    char* end = nullptr;
    long parsed = std::strtol(v, &end, 10);
    if (end == v || *end != '\0') {
        std::cerr << "[config] Ignoring " << name << "=" << v << " (not a number)\n";
        return false;
    }
    out = parsed < 0 ? 0u : static_cast<uint32_t>(std::min<long>(parsed, 86400000L));
    return true;
}

void Config::apply_env() {
    env_millis("TRICKLE_SPEED_MS", reveal.speed_ms);
    env_millis("TRICKLE_CATCH_UP_MS", reveal.catch_up_window_ms);

    if (const char* g = std::getenv("TRICKLE_GRANULARITY"); g && *g) {
        try {
            reveal.granularity = parse_granularity(g);
        } catch (const std::exception& e) {
            std::cerr << "[config] " << e.what() << "\n";
        }
    }
    if (const char* p = std::getenv("TRICKLE_PACING"); p && *p) {
        try {
            reveal.pacing = parse_pacing(p);
        } catch (const std::exception& e) {
            std::cerr << "[config] " << e.what() << "\n";
        }
    }
    if (const char* rt = std::getenv("TRICKLE_RUNTIME"); rt && *rt) {
        runtime = rt;
    }

    reveal.normalize();
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.trickle/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    cfg.apply_json(j);
    cfg.apply_env();
    return cfg;
}

} // namespace trickle
