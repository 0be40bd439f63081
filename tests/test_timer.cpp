#include <catch2/catch.hpp>
#include "timer.hpp"
#include <vector>

using namespace trickle;
using std::chrono::milliseconds;

TEST_CASE("TimerQueue: fires once the deadline passes", "[timer]") {
    ManualClock clock;
    TimerQueue timers(clock.source());
    int fired = 0;

    TimerId id = timers.schedule(milliseconds(10), [&]() { fired++; });
    REQUIRE(id != 0);
    REQUIRE(timers.pending() == 1);

    clock.advance(milliseconds(9));
    REQUIRE(timers.poll() == 0);
    REQUIRE(fired == 0);

    clock.advance(milliseconds(1));
    REQUIRE(timers.poll() == 1);
    REQUIRE(fired == 1);
    REQUIRE(timers.pending() == 0);

    // One-shot
    clock.advance(milliseconds(100));
    REQUIRE(timers.poll() == 0);
    REQUIRE(fired == 1);
}

TEST_CASE("TimerQueue: earliest deadline first, ties in schedule order", "[timer]") {
    ManualClock clock;
    TimerQueue timers(clock.source());
    std::vector<int> order;

    timers.schedule(milliseconds(20), [&]() { order.push_back(3); });
    timers.schedule(milliseconds(10), [&]() { order.push_back(1); });
    timers.schedule(milliseconds(10), [&]() { order.push_back(2); });

    clock.advance(milliseconds(20));
    timers.poll();
    REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("TimerQueue: cancel prevents firing", "[timer]") {
    ManualClock clock;
    TimerQueue timers(clock.source());
    int fired = 0;

    TimerId id = timers.schedule(milliseconds(5), [&]() { fired++; });
    REQUIRE(timers.cancel(id));
    REQUIRE_FALSE(timers.cancel(id));
    REQUIRE(timers.pending() == 0);

    clock.advance(milliseconds(10));
    timers.poll();
    REQUIRE(fired == 0);
}

TEST_CASE("TimerQueue: cancel unknown id returns false", "[timer]") {
    TimerQueue timers;
    REQUIRE_FALSE(timers.cancel(12345));
}

TEST_CASE("TimerQueue: callback may schedule another timer", "[timer]") {
    ManualClock clock;
    TimerQueue timers(clock.source());
    int fired = 0;

    timers.schedule(milliseconds(5), [&]() {
        fired++;
        timers.schedule(milliseconds(5), [&]() { fired++; });
    });

    clock.advance(milliseconds(5));
    REQUIRE(timers.poll() == 1);
    REQUIRE(timers.pending() == 1);

    clock.advance(milliseconds(5));
    REQUIRE(timers.poll() == 1);
    REQUIRE(fired == 2);
}

TEST_CASE("TimerQueue: callback may cancel a later timer", "[timer]") {
    ManualClock clock;
    TimerQueue timers(clock.source());
    int later = 0;

    TimerId second = timers.schedule(milliseconds(10), [&]() { later++; });
    timers.schedule(milliseconds(5), [&]() { timers.cancel(second); });

    clock.advance(milliseconds(10));
    timers.poll();
    REQUIRE(later == 0);
    REQUIRE(timers.pending() == 0);
}

TEST_CASE("TimerQueue: negative delay fires on next poll", "[timer]") {
    ManualClock clock;
    TimerQueue timers(clock.source());
    int fired = 0;
    timers.schedule(milliseconds(-5), [&]() { fired++; });
    timers.poll();
    REQUIRE(fired == 1);
}

TEST_CASE("TimerQueue: next_deadline", "[timer]") {
    ManualClock clock;
    clock.set(milliseconds(100));
    TimerQueue timers(clock.source());

    REQUIRE_FALSE(timers.next_deadline().has_value());
    timers.schedule(milliseconds(30), []() {});
    timers.schedule(milliseconds(10), []() {});
    REQUIRE(timers.next_deadline() == milliseconds(110));
}

TEST_CASE("advance_timers: fires chained timers at their own deadlines", "[timer]") {
    ManualClock clock;
    TimerQueue timers(clock.source());
    std::vector<long long> fired_at;

    std::function<void()> tick = [&]() {
        fired_at.push_back(clock.now().count());
        if (fired_at.size() < 3) timers.schedule(milliseconds(4), tick);
    };
    timers.schedule(milliseconds(4), tick);

    size_t fired = advance_timers(timers, clock, milliseconds(20));
    REQUIRE(fired == 3);
    REQUIRE(fired_at == std::vector<long long>{4, 8, 12});
    REQUIRE(clock.now() == milliseconds(20));
}

TEST_CASE("advance_timers: leaves timers beyond the target pending", "[timer]") {
    ManualClock clock;
    TimerQueue timers(clock.source());
    int fired = 0;
    timers.schedule(milliseconds(50), [&]() { fired++; });

    REQUIRE(advance_timers(timers, clock, milliseconds(49)) == 0);
    REQUIRE(timers.pending() == 1);
    REQUIRE(advance_timers(timers, clock, milliseconds(1)) == 1);
    REQUIRE(fired == 1);
}

TEST_CASE("TimerQueue::run: returns when the queue drains", "[timer]") {
    TimerQueue timers;
    std::atomic<bool> stop{false};
    int fired = 0;
    timers.schedule(milliseconds(1), [&]() { fired++; });
    timers.schedule(milliseconds(2), [&]() { fired++; });

    timers.run(stop);
    REQUIRE(fired == 2);
    REQUIRE(timers.pending() == 0);
}

TEST_CASE("TimerQueue::run: stops when the flag is set", "[timer]") {
    TimerQueue timers;
    std::atomic<bool> stop{false};
    timers.schedule(milliseconds(1), [&]() { stop.store(true); });
    timers.schedule(milliseconds(60000), []() {});

    timers.run(stop);
    REQUIRE(timers.pending() == 1);
}
