#include "scheduler.hpp"
#include <utility>

namespace viewidget {

constexpr Scheduler::TimerId Scheduler::NO_TIMER;

Scheduler::TimerId Scheduler::after(double delayMs, Callback callback) {
    if (delayMs < 0.0) delayMs = 0.0;
    TimerId id = nextId++;
    Timer timer;
    timer.dueMs = nowMs + delayMs;
    timer.callback = std::move(callback);
    timers.emplace(id, std::move(timer));
    return id;
}

bool Scheduler::cancel(TimerId id) {
    return timers.erase(id) > 0;
}

void Scheduler::advanceTo(double targetMs) {
    if (targetMs > nowMs) nowMs = targetMs;

    while (true) {
        // Earliest due timer; ties go to the lower (older) id
        auto next = timers.end();
        for (auto it = timers.begin(); it != timers.end(); ++it) {
            if (it->second.dueMs > nowMs) continue;
            if (next == timers.end() || it->second.dueMs < next->second.dueMs) {
                next = it;
            }
        }
        if (next == timers.end()) break;

        Callback callback = std::move(next->second.callback);
        timers.erase(next);
        callback();
    }
}

} // namespace viewidget
