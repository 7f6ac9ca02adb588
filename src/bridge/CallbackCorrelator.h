#pragma once
#include <string>
#include <chrono>
#include <functional>
#include <optional>
#include <random>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "bridge/EventLoop.h"
#include "core/BridgeError.h"
#include "store/SecureStore.h"

/**
 * @brief Turns "an artifact may show up in the store" into a resolved or
 *        rejected request.
 *
 * Every registered id is Pending until exactly one of these happens:
 *   - a regular artifact appears        -> resolve(data) or reject(ExternalError)
 *   - the artifact cannot be parsed     -> reject(ArtifactCorruption)
 *   - the store read fails for good     -> reject(Internal)
 *   - the timeout fires                 -> reject(CallbackTimeout)
 *   - cancel() is called                -> no callback at all
 * Whichever comes first removes the registry entry; later ticks for the same
 * id find nothing and do nothing. Removal always cancels both timers and
 * deletes the artifact path.
 */
class CallbackCorrelator {
public:
    using ResolveHandler = std::function<void(const nlohmann::json& data)>;
    using RejectHandler = std::function<void(const BridgeError& error)>;

    CallbackCorrelator(SecureStore& store, EventLoop& loop,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(30000),
                       std::chrono::milliseconds pollInterval = std::chrono::milliseconds(100));
    ~CallbackCorrelator();

    CallbackCorrelator(const CallbackCorrelator&) = delete;
    CallbackCorrelator& operator=(const CallbackCorrelator&) = delete;

    /** `<action>-<monotonic ms>-<9 base36 chars>`, never equal to a pending id. */
    std::string allocateId(const std::string& action);

    /**
     * @brief Start waiting for the artifact of id.
     * @throws BridgeError(Internal) if id is already pending or not store-safe
     */
    void registerPending(const std::string& id, const std::string& action,
                         ResolveHandler onResolve, RejectHandler onReject);

    /** Drop a pending request without calling either handler. @return false if not pending */
    bool cancel(const std::string& id);

    bool isPending(const std::string& id) const { return pending.count(id) > 0; }
    size_t pendingCount() const { return pending.size(); }

    std::chrono::milliseconds getTimeout() const { return timeout; }
    std::chrono::milliseconds getPollInterval() const { return pollInterval; }

    /** Strips store paths, artifact names and token-looking strings from a message. */
    static std::string sanitizeMessage(const std::string& message, const std::string& storeRoot);

private:
    struct PendingRequest {
        std::string id;
        std::string action;
        std::chrono::steady_clock::time_point createdAt;
        ResolveHandler onResolve;
        RejectHandler onReject;
        EventLoop::TimerId timeoutTimer = 0;
        EventLoop::TimerId pollTimer = 0;
    };

    SecureStore& store;
    EventLoop& loop;
    std::chrono::milliseconds timeout;
    std::chrono::milliseconds pollInterval;
    std::unordered_map<std::string, PendingRequest> pending;
    std::mt19937_64 rng;

    void poll(const std::string& id);
    void expire(const std::string& id);

    /** Compare-and-remove: the single cleanup path for every terminal transition. */
    std::optional<PendingRequest> take(const std::string& id);

    void rejectWith(const std::string& id, ErrorKind kind, const std::string& message);
};
