#include "capabilities.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>

namespace trickle {

RuntimeKind parse_runtime(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "terminal") return RuntimeKind::Terminal;
    if (n == "desktop") return RuntimeKind::Desktop;
    if (n == "web") return RuntimeKind::Web;
    if (n == "mobile") return RuntimeKind::Mobile;
    if (n == "headless") return RuntimeKind::Headless;
    throw std::invalid_argument("Unknown runtime: " + name);
}

const char* runtime_name(RuntimeKind kind) {
    switch (kind) {
        case RuntimeKind::Terminal: return "terminal";
        case RuntimeKind::Desktop:  return "desktop";
        case RuntimeKind::Web:      return "web";
        case RuntimeKind::Mobile:   return "mobile";
        case RuntimeKind::Headless: return "headless";
    }
    return "unknown";
}

static bool env_flag(const Capabilities::EnvLookup& env, const char* name) {
    const char* v = env(name);
    if (!v || !*v) return false;
    std::string s = to_lower(v);
    return s != "0" && s != "false" && s != "no";
}

Capabilities Capabilities::detect(const EnvLookup& env, bool stdout_is_tty,
                                  const std::string& configured_runtime) {
    Capabilities caps;
    caps.interactive = stdout_is_tty;
    caps.runtime = stdout_is_tty ? RuntimeKind::Terminal : RuntimeKind::Headless;

    std::string requested = configured_runtime;
    if (requested.empty()) {
        const char* rt = env("TRICKLE_RUNTIME");
        if (rt) requested = rt;
    }
    if (!requested.empty()) {
        try {
            caps.runtime = parse_runtime(requested);
        } catch (const std::exception& e) {
            std::cerr << "[capabilities] " << e.what() << ", using "
                      << runtime_name(caps.runtime) << "\n";
        }
    }
    if (caps.runtime == RuntimeKind::Headless) caps.interactive = false;

    caps.reduced_motion = env_flag(env, "TRICKLE_REDUCED_MOTION");

    const char* term = env("TERM");
    const char* no_color = env("NO_COLOR");
    caps.color = !(no_color && *no_color) &&
                 !(term && std::string(term) == "dumb") &&
                 caps.runtime != RuntimeKind::Headless;
    return caps;
}

bool Capabilities::animations_enabled() const {
    return interactive && !reduced_motion && runtime != RuntimeKind::Headless;
}

void apply_capabilities(RevealConfig& reveal, const Capabilities& caps) {
    if (!caps.animations_enabled()) reveal.animate = false;
    if (!caps.color) reveal.cursor_marker = "_";
}

} // namespace trickle
