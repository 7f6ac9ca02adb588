#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>

/**
 * @brief Single-threaded timer scheduler.
 *
 * All correlation state is mutated from callbacks run by this loop, so none
 * of it needs locking. Not thread-safe: create, schedule, cancel and run from
 * one thread.
 */
class EventLoop {
public:
    using TimerId = uint64_t;
    using Callback = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    EventLoop() = default;
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    TimerId setTimeout(std::chrono::milliseconds delay, Callback cb);
    TimerId setInterval(std::chrono::milliseconds interval, Callback cb);

    /** @return false if the timer already fired (one-shot) or was cancelled. */
    bool cancel(TimerId id);

    bool isActive(TimerId id) const { return timers.count(id) > 0; }
    size_t activeTimers() const { return timers.size(); }

    /**
     * @brief Wait for the earliest timer and run everything that is due.
     * @return false when no timer is scheduled (nothing to wait for)
     */
    bool runOnce();

    /** Runs ticks until done() holds or no timer is left. @return done() */
    bool runUntil(const std::function<bool()>& done);

private:
    struct Timer {
        Clock::time_point due;
        std::chrono::milliseconds interval{0};
        bool repeating = false;
        uint64_t sequence = 0;
        Callback cb;
    };

    std::map<TimerId, Timer> timers;
    TimerId nextId = 1;
    uint64_t nextSequence = 0;

    TimerId schedule(std::chrono::milliseconds delay, bool repeating, Callback cb);
};
