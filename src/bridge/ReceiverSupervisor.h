#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include <sys/types.h>
#include "bridge/EventLoop.h"
#include "core/BridgeError.h"
#include "store/SecureStore.h"

/**
 * @brief Keeps the callback receiver process alive.
 *
 * The receiver announces itself by writing its PID into the store's marker
 * file. ensureRunning() is idempotent: a live marker means ready right away,
 * otherwise the receiver is launched detached and the marker is polled on the
 * event loop for a bounded number of attempts.
 *
 * Liveness covers the daemon that holds the marker only. Callback URLs reach
 * a separate short-lived receiver started by the desktop URL handler
 * (ulysses-bridge-receiver.desktop), which this class does not observe.
 */
class ReceiverSupervisor {
public:
    using ReadyHandler = std::function<void()>;
    using FailureHandler = std::function<void(const BridgeError&)>;

    ReceiverSupervisor(SecureStore& store, EventLoop& loop, const std::vector<std::string>& command,
                       int maxAttempts = 20,
                       std::chrono::milliseconds attemptInterval = std::chrono::milliseconds(100));
    ~ReceiverSupervisor();

    /**
     * @brief Make sure a receiver is alive, starting one if needed.
     *
     * onReady / onFailure run exactly once. Callers arriving while a start is
     * in progress join that start instead of launching a second process.
     */
    void ensureRunning(ReadyHandler onReady, FailureHandler onFailure);

    bool isReceiverAlive() const;
    bool isStarting() const { return startTimer != 0; }

    static bool isProcessAlive(pid_t pid);

    /** Double-fork + setsid so the receiver outlives us. @throws BridgeError(HelperStartFailure) */
    static void launchDetached(const std::vector<std::string>& argv);

private:
    struct Waiter {
        ReadyHandler onReady;
        FailureHandler onFailure;
    };

    SecureStore& store;
    EventLoop& loop;
    std::vector<std::string> command;
    int maxAttempts;
    std::chrono::milliseconds attemptInterval;

    std::vector<Waiter> waiters;
    EventLoop::TimerId startTimer = 0;
    int attempts = 0;

    void onStartupTick();
    void finishStartup(const BridgeError* failure);
};
