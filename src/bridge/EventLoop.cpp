#include "bridge/EventLoop.h"
#include <algorithm>
#include <thread>
#include <tuple>
#include <vector>

EventLoop::TimerId EventLoop::schedule(std::chrono::milliseconds delay, bool repeating, Callback cb) {
    if (delay.count() < 0) delay = std::chrono::milliseconds(0);
    TimerId id = nextId++;
    Timer timer;
    timer.due = Clock::now() + delay;
    timer.interval = delay;
    timer.repeating = repeating;
    timer.sequence = nextSequence++;
    timer.cb = std::move(cb);
    timers.emplace(id, std::move(timer));
    return id;
}

EventLoop::TimerId EventLoop::setTimeout(std::chrono::milliseconds delay, Callback cb) {
    return schedule(delay, false, std::move(cb));
}

EventLoop::TimerId EventLoop::setInterval(std::chrono::milliseconds interval, Callback cb) {
    // a zero interval would spin
    if (interval.count() < 1) interval = std::chrono::milliseconds(1);
    return schedule(interval, true, std::move(cb));
}

bool EventLoop::cancel(TimerId id) {
    return timers.erase(id) > 0;
}

bool EventLoop::runOnce() {
    if (timers.empty()) return false;

    Clock::time_point earliest = Clock::time_point::max();
    for (const auto& [id, timer] : timers) {
        earliest = std::min(earliest, timer.due);
    }
    if (earliest > Clock::now()) {
        std::this_thread::sleep_until(earliest);
    }

    const auto now = Clock::now();
    std::vector<std::tuple<Clock::time_point, uint64_t, TimerId>> due;
    for (const auto& [id, timer] : timers) {
        if (timer.due <= now) {
            due.emplace_back(timer.due, timer.sequence, id);
        }
    }
    std::sort(due.begin(), due.end());

    for (const auto& entry : due) {
        TimerId id = std::get<2>(entry);
        auto it = timers.find(id);
        // cancelled by an earlier callback in this tick
        if (it == timers.end() || it->second.due > now) continue;

        Callback cb = it->second.cb;
        if (it->second.repeating) {
            it->second.due = now + it->second.interval;
            it->second.sequence = nextSequence++;
        } else {
            timers.erase(it);
        }
        cb();
    }
    return true;
}

bool EventLoop::runUntil(const std::function<bool()>& done) {
    while (!done()) {
        if (!runOnce()) break;
    }
    return done();
}
