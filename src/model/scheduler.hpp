#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace viewidget {

/**
 * Cooperative one-shot timer queue driven by the UI frame loop.
 *
 * Callbacks run synchronously inside advanceTo() on the calling thread, so a
 * callback may freely re-arm itself or cancel other timers. Time is in
 * milliseconds on whatever clock the owner feeds in.
 */
class Scheduler {
public:
    typedef uint64_t TimerId;
    typedef std::function<void()> Callback;

    static constexpr TimerId NO_TIMER = 0;

    // Arm a one-shot timer delayMs from now()
    TimerId after(double delayMs, Callback callback);

    // Disarm a pending timer. Unknown or already fired ids are ignored.
    bool cancel(TimerId id);

    // Move the clock forward and run every timer that has come due
    void advanceTo(double nowMs);

    void advanceBy(double deltaMs) {
        advanceTo(nowMs + deltaMs);
    }

    double now() const {
        return nowMs;
    }

    size_t pending() const {
        return timers.size();
    }

    bool isPending(TimerId id) const {
        return timers.count(id) > 0;
    }

private:
    struct Timer {
        double dueMs;
        Callback callback;
    };

    std::map<TimerId, Timer> timers;
    TimerId nextId = 1;
    double nowMs = 0.0;
};

} // namespace viewidget
