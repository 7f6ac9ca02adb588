#include "bridge/RateLimiter.h"
#include "core/BridgeError.h"
#include "utils/Logger.h"
#include <chrono>

RateLimiter::RateLimiter(const ActionRegistry& registry, int maxOps, int64_t windowMs, Clock clock)
    : registry(registry), maxOps(maxOps), windowMs(windowMs), clock(std::move(clock)) {}

int64_t RateLimiter::steadyNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

void RateLimiter::checkAndConsume(const std::string& action) {
    if (!registry.isDestructive(action)) {
        return;
    }

    int64_t now = clock();
    auto it = windows.find(action);
    if (it == windows.end() || now >= it->second.resetAt) {
        windows[action] = Window{1, now + windowMs};
        return;
    }

    Window& w = it->second;
    if (w.count >= maxOps) {
        Logger::getInstance().warn("Rate limit hit for " + action + " (" + std::to_string(w.count) +
                                   " ops, resets in " + std::to_string(w.resetAt - now) + "ms)");
        throw BridgeError(ErrorKind::RateLimited,
                          "Rate limit exceeded for " + action + ". Please wait before trying again.");
    }
    ++w.count;
}

const RateLimiter::Window* RateLimiter::window(const std::string& action) const {
    auto it = windows.find(action);
    return it == windows.end() ? nullptr : &it->second;
}
