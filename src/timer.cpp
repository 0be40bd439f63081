#include "timer.hpp"

#include <thread>

namespace trickle {

std::chrono::milliseconds steady_clock_now() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch());
}

TimerQueue::TimerQueue() : clock_(steady_clock_now) {}

TimerQueue::TimerQueue(Clock clock)
    : clock_(clock ? std::move(clock) : Clock(steady_clock_now)) {}

TimerId TimerQueue::schedule(std::chrono::milliseconds delay, TimerCallback callback) {
    if (delay.count() < 0) delay = std::chrono::milliseconds(0);
    TimerId id = next_id_++;
    Key key{clock_() + delay, id};
    timers_.emplace(key, std::move(callback));
    index_.emplace(id, key);
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    auto it = index_.find(id);
    if (it == index_.end()) return false;
    timers_.erase(it->second);
    index_.erase(it);
    return true;
}

size_t TimerQueue::pending() const {
    return timers_.size();
}

size_t TimerQueue::poll() {
    size_t fired = 0;
    auto now = clock_();
    // Re-read the front each round: callbacks may add or remove timers.
    while (!timers_.empty()) {
        auto it = timers_.begin();
        if (it->first.first > now) break;
        TimerCallback cb = std::move(it->second);
        index_.erase(it->first.second);
        timers_.erase(it);
        if (cb) cb();
        ++fired;
    }
    return fired;
}

std::optional<std::chrono::milliseconds> TimerQueue::next_deadline() const {
    if (timers_.empty()) return std::nullopt;
    return timers_.begin()->first.first;
}

void TimerQueue::run(const std::atomic<bool>& stop) {
    while (!stop.load()) {
        auto next = next_deadline();
        if (!next) return;
        auto wait = *next - clock_();
        if (wait.count() > 0) {
            std::this_thread::sleep_for(wait);
        }
        poll();
    }
}

size_t advance_timers(TimerQueue& timers, ManualClock& clock,
                      std::chrono::milliseconds delta) {
    auto target = clock.now() + delta;
    size_t fired = 0;
    while (true) {
        auto next = timers.next_deadline();
        if (!next || *next > target) break;
        if (*next > clock.now()) clock.set(*next);
        fired += timers.poll();
    }
    clock.set(target);
    return fired;
}

} // namespace trickle
