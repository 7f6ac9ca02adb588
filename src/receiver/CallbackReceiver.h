#pragma once
#include <string>
#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include "bridge/EventLoop.h"
#include "store/SecureStore.h"

struct CallbackUrl {
    std::string callbackId;
    bool isError = false;
    nlohmann::json data = nlohmann::json::object();
};

/**
 * @brief Receiving end of the side channel.
 *
 * Ulysses answers by opening
 *   <scheme>://x-callback-url/x-success?callbackId=<id>&key=value...
 * (or /x-error). The desktop URL handler, registered for the scheme by the
 * installed ulysses-bridge-receiver.desktop entry, runs the receiver with
 * that URL, which turns it into callback-<id>.json in the store. In daemon mode the
 * receiver instead holds the PID marker and sweeps stale artifacts.
 */
class CallbackReceiver {
public:
    CallbackReceiver(SecureStore& store, const std::string& scheme);

    /**
     * @brief Split a callback URL into id, outcome and decoded query items.
     * @throws BridgeError(InvalidInput) on a foreign scheme, an unknown path, or a missing / unsafe callbackId
     */
    static CallbackUrl parse(const std::string& url, const std::string& scheme);

    /** Parse and persist one callback. @return the callback id */
    std::string handleUrl(const std::string& url);

    /**
     * @brief Hold the PID marker until stopRequested() turns true.
     * @return false if another live receiver already owns the marker
     */
    bool runDaemon(EventLoop& loop, std::chrono::milliseconds sweepInterval, std::chrono::milliseconds retention,
                   const std::function<bool()>& stopRequested);

private:
    SecureStore& store;
    std::string scheme;
};
