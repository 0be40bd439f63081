#include "capabilities.hpp"
#include "config.hpp"
#include "display_relay.hpp"
#include "document.hpp"
#include "event_bus.hpp"
#include "event.hpp"
#include "replay.hpp"
#include "timer.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include <unordered_map>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: trickle [options]\n"
              << "\n"
              << "Options:\n"
              << "  --replay FILE        Replay a JSON-lines transcript\n"
              << "  -m, --message TEXT   Stream TEXT word by word\n"
              << "  --speed MS           Nominal milliseconds per character\n"
              << "  --granularity NAME   Reveal unit (character, word)\n"
              << "  --pacing NAME        Pacing mode (fixed, backlog)\n"
              << "  --window MS          Catch-up window for backlog pacing\n"
              << "  --interval MS        Tick interval for backlog pacing\n"
              << "  --no-animate         Show content immediately\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Without --replay or -m the transcript is read from stdin.\n"
              << "\n"
              << "Environment variables:\n"
              << "  TRICKLE_SPEED_MS         Override reveal.speed_ms\n"
              << "  TRICKLE_GRANULARITY      Override reveal.granularity\n"
              << "  TRICKLE_PACING           Override reveal.pacing\n"
              << "  TRICKLE_CATCH_UP_MS      Override reveal.catch_up_window_ms\n"
              << "  TRICKLE_RUNTIME          terminal, desktop, web, mobile, headless\n"
              << "  TRICKLE_REDUCED_MOTION   Disable animation\n"
              << "  NO_COLOR                 Plain cursor marker\n";
}

static bool parse_millis(const char* arg, uint32_t& out) {
    char* end = nullptr;
    long v = std::strtol(arg, &end, 10);
    if (end == arg || *end != '\0' || v < 0) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

namespace {

// Prints each slot's visible text to a terminal, appending what is new
class TerminalPrinter {
public:
    TerminalPrinter(const trickle::DisplayRelay& relay, std::string cursor_marker)
        : relay_(relay), cursor_marker_(std::move(cursor_marker)) {}

    void on_render(const trickle::RenderReadyEvent& ev) {
        const trickle::StreamDisplay* display = relay_.display(ev.slot_id);
        if (!display) return;
        std::string visible = display->scheduler().visible_text();

        erase_cursor();
        if (ev.slot_id != active_slot_) {
            if (!active_slot_.empty()) std::cout << "\n";
            std::cout << "[" << ev.slot_id << "] ";
            active_slot_ = ev.slot_id;
        }

        auto& shown = shown_[ev.slot_id];
        if (shown.key != ev.snapshot.identity_key ||
            visible.compare(0, shown.text.size(), shown.text) != 0) {
            // Replaced content: start a fresh line
            if (!shown.text.empty()) std::cout << "\n[" << ev.slot_id << "] ";
            shown.key = ev.snapshot.identity_key;
            shown.text.clear();
        }
        std::cout << visible.substr(shown.text.size());
        shown.text = visible;

        if (ev.snapshot.revealing) {
            std::cout << cursor_marker_ << "\b";
            cursor_drawn_ = true;
        }
        std::cout << std::flush;
    }

    void finish() {
        erase_cursor();
        if (!active_slot_.empty()) std::cout << "\n";
        std::cout << std::flush;
    }

private:
    struct Shown {
        std::string key;
        std::string text;
    };

    void erase_cursor() {
        if (!cursor_drawn_) return;
        std::cout << " \b";
        cursor_drawn_ = false;
    }

    const trickle::DisplayRelay& relay_;
    std::string cursor_marker_;
    std::unordered_map<std::string, Shown> shown_;
    std::string active_slot_;
    bool cursor_drawn_ = false;
};

} // namespace

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string replay_path;
    std::string message;
    std::string granularity;
    std::string pacing;
    uint32_t speed_ms = 0, window_ms = 0, interval_ms = 0;
    bool have_speed = false, have_window = false, have_interval = false;
    bool no_animate = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--replay") == 0 && i + 1 < argc) {
            replay_path = argv[++i];
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--speed") == 0 && i + 1 < argc) {
            if (!parse_millis(argv[++i], speed_ms)) {
                std::cerr << "Invalid --speed: " << argv[i] << "\n";
                return 1;
            }
            have_speed = true;
        } else if (std::strcmp(argv[i], "--window") == 0 && i + 1 < argc) {
            if (!parse_millis(argv[++i], window_ms)) {
                std::cerr << "Invalid --window: " << argv[i] << "\n";
                return 1;
            }
            have_window = true;
        } else if (std::strcmp(argv[i], "--interval") == 0 && i + 1 < argc) {
            if (!parse_millis(argv[++i], interval_ms)) {
                std::cerr << "Invalid --interval: " << argv[i] << "\n";
                return 1;
            }
            have_interval = true;
        } else if (std::strcmp(argv[i], "--granularity") == 0 && i + 1 < argc) {
            granularity = argv[++i];
        } else if (std::strcmp(argv[i], "--pacing") == 0 && i + 1 < argc) {
            pacing = argv[++i];
        } else if (std::strcmp(argv[i], "--no-animate") == 0) {
            no_animate = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (!replay_path.empty() && !message.empty()) {
        std::cerr << "--replay and --message are mutually exclusive\n";
        return 1;
    }

    auto config = trickle::Config::load();

    // Override config with CLI args
    if (have_speed) config.reveal.speed_ms = speed_ms;
    if (have_window) config.reveal.catch_up_window_ms = window_ms;
    if (have_interval) config.reveal.tick_interval_ms = interval_ms;
    try {
        if (!granularity.empty()) config.reveal.granularity = trickle::parse_granularity(granularity);
        if (!pacing.empty()) config.reveal.pacing = trickle::parse_pacing(pacing);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    if (no_animate) config.reveal.animate = false;

    auto caps = trickle::Capabilities::detect(
        [](const char* name) { return std::getenv(name); },
        isatty(STDOUT_FILENO) != 0, config.runtime);
    trickle::apply_capabilities(config.reveal, caps);
    config.reveal.normalize();

    // Load the content stream
    std::vector<trickle::ReplayStep> steps;
    if (!message.empty()) {
        steps = trickle::split_into_tokens(message, "m1", 60);
    } else if (!replay_path.empty()) {
        std::ifstream file(replay_path);
        if (!file) {
            std::cerr << "Error: cannot open " << replay_path << "\n";
            return 1;
        }
        steps = trickle::load_replay(file);
    } else {
        steps = trickle::load_replay(std::cin);
    }
    if (steps.empty()) {
        std::cerr << "Nothing to replay.\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    trickle::EventBus bus;
    trickle::TimerQueue timers;
    trickle::PlainRenderer renderer;
    trickle::DisplayRelay relay(bus, timers, renderer, config);
    TerminalPrinter printer(relay, config.reveal.cursor_marker);

    trickle::ScopedSubscription render_sub(bus, trickle::subscribe<trickle::RenderReadyEvent>(bus,
        [&printer](const trickle::RenderReadyEvent& ev) { printer.on_render(ev); }));
    relay.subscribe_events();

    const std::string session_id = "cli";
    trickle::SessionStartedEvent started;
    started.session_id = session_id;
    started.started_ms = static_cast<uint64_t>(timers.now().count());
    bus.publish(started);

    // Publish each step at its offset from now
    for (const auto& step : steps) {
        timers.schedule(std::chrono::milliseconds(step.at_ms), [&bus, &timers, &session_id, step]() {
            trickle::ContentUpdateEvent ev;
            ev.slot_id = step.slot;
            ev.session_id = session_id;
            ev.message_id = step.message;
            ev.role = step.role;
            ev.created_ms = static_cast<uint64_t>(timers.now().count());
            ev.text = step.text;
            ev.delta = step.delta;
            ev.streaming = step.streaming;
            bus.publish(ev);
        });
    }

    timers.run(g_shutdown);
    printer.finish();

    if (g_shutdown.load()) {
        std::cerr << "[trickle] Interrupted.\n";
        return 130;
    }
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
