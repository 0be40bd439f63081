#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

namespace trickle {

using TimerId = uint64_t;
using TimerCallback = std::function<void()>;

// One-shot timers on the host thread. Hosts with their own event loop
// (a UI toolkit's timers) implement this interface directly.
class TimerService {
public:
    virtual ~TimerService() = default;

    // Run callback once after delay. Returns a non-zero id.
    virtual TimerId schedule(std::chrono::milliseconds delay, TimerCallback callback) = 0;

    // Cancel a pending timer. Returns false if it already fired or is unknown.
    virtual bool cancel(TimerId id) = 0;

    // Number of timers not yet fired or cancelled.
    virtual size_t pending() const = 0;
};

// Timer queue driven by poll(). Deadlines come from an injectable clock so
// tests can step time deterministically.
class TimerQueue : public TimerService {
public:
    using Clock = std::function<std::chrono::milliseconds()>;

    TimerQueue();
    explicit TimerQueue(Clock clock);

    TimerId schedule(std::chrono::milliseconds delay, TimerCallback callback) override;
    bool cancel(TimerId id) override;
    size_t pending() const override;

    // Fire every timer whose deadline has passed, earliest first.
    // Callbacks may schedule or cancel timers. Returns the number fired.
    size_t poll();

    // Deadline of the earliest pending timer
    std::optional<std::chrono::milliseconds> next_deadline() const;

    // Sleep until deadlines and fire them until the queue is empty or stop is set.
    void run(const std::atomic<bool>& stop);

    std::chrono::milliseconds now() const { return clock_(); }

private:
    using Key = std::pair<std::chrono::milliseconds, TimerId>;

    Clock clock_;
    std::map<Key, TimerCallback> timers_;
    std::unordered_map<TimerId, Key> index_;
    TimerId next_id_ = 1;
};

// Steady clock reading as milliseconds
std::chrono::milliseconds steady_clock_now();

// Hand-advanced clock for tests and replays
class ManualClock {
public:
    std::chrono::milliseconds now() const { return now_; }
    void advance(std::chrono::milliseconds delta) { now_ += delta; }
    void set(std::chrono::milliseconds t) { now_ = t; }

    TimerQueue::Clock source() const {
        return [this]() { return now_; };
    }

private:
    std::chrono::milliseconds now_{0};
};

// Advance clock by delta, firing due timers at their own deadlines in order.
// Returns the number of callbacks run.
size_t advance_timers(TimerQueue& timers, ManualClock& clock,
                      std::chrono::milliseconds delta);

} // namespace trickle
