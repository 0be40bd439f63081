#include <catch2/catch.hpp>
#include "stream_lifecycle.hpp"
#include <vector>

using namespace trickle;
using std::chrono::milliseconds;

TEST_CASE("StreamLifecycle: touch creates a streaming entry", "[lifecycle]") {
    ManualClock clock;
    clock.set(milliseconds(100));
    TimerQueue timers(clock.source());
    StreamLifecycle lc(timers);

    lc.touch("m1");
    auto e = lc.get("m1");
    REQUIRE(e.has_value());
    REQUIRE(e->phase == LifecyclePhase::Streaming);
    REQUIRE(e->started_at == milliseconds(100));
    REQUIRE(e->last_update_at == milliseconds(100));
    REQUIRE_FALSE(e->completed_at.has_value());

    clock.advance(milliseconds(50));
    lc.touch("m1");
    e = lc.get("m1");
    REQUIRE(e->started_at == milliseconds(100));
    REQUIRE(e->last_update_at == milliseconds(150));
    REQUIRE(lc.size() == 1);
}

TEST_CASE("StreamLifecycle: cooldown completes after the delay", "[lifecycle]") {
    ManualClock clock;
    TimerQueue timers(clock.source());
    StreamLifecycle lc(timers); // 1600 ms
    std::vector<std::string> completed;
    lc.set_completion_handler([&](const std::string& id) { completed.push_back(id); });

    lc.touch("m1");
    lc.mark_cooldown("m1");
    REQUIRE(lc.get("m1")->phase == LifecyclePhase::Cooldown);
    REQUIRE(lc.get("m1")->completed_at == milliseconds(0));
    REQUIRE(lc.has_pending_completion("m1"));

    advance_timers(timers, clock, milliseconds(1599));
    REQUIRE(completed.empty());

    advance_timers(timers, clock, milliseconds(1));
    REQUIRE(completed == std::vector<std::string>{"m1"});
    REQUIRE(lc.get("m1")->phase == LifecyclePhase::Completed);
    // Keeps the time the stream ended
    REQUIRE(lc.get("m1")->completed_at == milliseconds(0));
    REQUIRE_FALSE(lc.has_pending_completion("m1"));
}

TEST_CASE("StreamLifecycle: new content during cooldown resumes streaming", "[lifecycle]") {
    ManualClock clock;
    TimerQueue timers(clock.source());
    StreamLifecycle lc(timers, milliseconds(100));
    int completed = 0;
    lc.set_completion_handler([&](const std::string&) { completed++; });

    lc.touch("m1");
    lc.mark_cooldown("m1");
    advance_timers(timers, clock, milliseconds(50));
    lc.touch("m1");

    REQUIRE(lc.get("m1")->phase == LifecyclePhase::Streaming);
    REQUIRE_FALSE(lc.get("m1")->completed_at.has_value());
    REQUIRE_FALSE(lc.has_pending_completion("m1"));

    advance_timers(timers, clock, milliseconds(500));
    REQUIRE(completed == 0);
}

TEST_CASE("StreamLifecycle: mark_cooldown ignores unknown and cooling entries", "[lifecycle]") {
    ManualClock clock;
    TimerQueue timers(clock.source());
    StreamLifecycle lc(timers, milliseconds(100));

    lc.mark_cooldown("missing");
    REQUIRE(lc.size() == 0);
    REQUIRE(timers.pending() == 0);

    lc.touch("m1");
    lc.mark_cooldown("m1");
    clock.advance(milliseconds(60));
    lc.mark_cooldown("m1");
    // The first timer is kept
    REQUIRE(timers.pending() == 1);
    REQUIRE(timers.next_deadline() == milliseconds(100));
}

TEST_CASE("StreamLifecycle: mark_completed fires the handler once", "[lifecycle]") {
    ManualClock clock;
    TimerQueue timers(clock.source());
    StreamLifecycle lc(timers);
    int completed = 0;
    lc.set_completion_handler([&](const std::string&) { completed++; });

    lc.touch("m1");
    lc.mark_cooldown("m1");
    lc.mark_completed("m1");
    REQUIRE(completed == 1);
    REQUIRE(timers.pending() == 0);

    lc.mark_completed("m1");
    advance_timers(timers, clock, milliseconds(5000));
    REQUIRE(completed == 1);
}

TEST_CASE("StreamLifecycle: remove cancels pending completion", "[lifecycle]") {
    ManualClock clock;
    TimerQueue timers(clock.source());
    StreamLifecycle lc(timers);
    int completed = 0;
    lc.set_completion_handler([&](const std::string&) { completed++; });

    lc.touch("m1");
    lc.touch("m2");
    lc.mark_cooldown("m1");
    lc.remove({"m1", "m2", "unknown"});

    REQUIRE(lc.size() == 0);
    REQUIRE(timers.pending() == 0);
    advance_timers(timers, clock, milliseconds(5000));
    REQUIRE(completed == 0);
}

TEST_CASE("StreamLifecycle: destruction cancels completion timers", "[lifecycle]") {
    ManualClock clock;
    TimerQueue timers(clock.source());
    {
        StreamLifecycle lc(timers);
        lc.touch("m1");
        lc.mark_cooldown("m1");
        REQUIRE(timers.pending() == 1);
    }
    REQUIRE(timers.pending() == 0);
}

TEST_CASE("lifecycle_phase_name: names", "[lifecycle]") {
    REQUIRE(std::string(lifecycle_phase_name(LifecyclePhase::Cooldown)) == "cooldown");
    REQUIRE(std::string(lifecycle_phase_name(LifecyclePhase::Completed)) == "completed");
}
