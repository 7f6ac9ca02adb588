#pragma once
#include <string>
#include <functional>
#include <unordered_map>
#include <cstdint>
#include "bridge/ActionRegistry.h"

/**
 * @brief Fixed-window limiter for destructive actions.
 *
 * A window opens on the first destructive call for an action and lasts
 * windowMs. Up to maxOps calls pass inside it; the next call after
 * windowResetAt replaces the window. Bursts across a boundary may reach
 * twice the nominal rate.
 */
class RateLimiter {
public:
    using Clock = std::function<int64_t()>;  // milliseconds, monotonic

    struct Window {
        int count = 0;
        int64_t resetAt = 0;
    };

    RateLimiter(const ActionRegistry& registry, int maxOps = 10, int64_t windowMs = 60000,
                Clock clock = steadyNowMs);

    /** @throws BridgeError(RateLimited) when the window is exhausted. */
    void checkAndConsume(const std::string& action);

    /** Current window for an action, if one was ever opened. */
    const Window* window(const std::string& action) const;

    static int64_t steadyNowMs();

private:
    const ActionRegistry& registry;
    int maxOps;
    int64_t windowMs;
    Clock clock;
    std::unordered_map<std::string, Window> windows;
};
