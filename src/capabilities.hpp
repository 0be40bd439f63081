#pragma once
#include "config.hpp"
#include <functional>
#include <string>

namespace trickle {

enum class RuntimeKind { Terminal, Desktop, Web, Mobile, Headless };

// Throws std::invalid_argument on unknown names
RuntimeKind parse_runtime(const std::string& name);
const char* runtime_name(RuntimeKind kind);

// What the host can present. Resolved once at startup and passed down;
// nothing below main() probes the environment again.
struct Capabilities {
    RuntimeKind runtime = RuntimeKind::Terminal;
    bool interactive = true;
    bool color = true;
    bool reduced_motion = false;

    using EnvLookup = std::function<const char*(const char*)>;

    // configured_runtime overrides TRICKLE_RUNTIME; empty means detect
    static Capabilities detect(const EnvLookup& env, bool stdout_is_tty,
                               const std::string& configured_runtime = "");

    bool animations_enabled() const;
};

// Turn off animation where it cannot be shown, pick a plain cursor without color
void apply_capabilities(RevealConfig& reveal, const Capabilities& caps);

} // namespace trickle
