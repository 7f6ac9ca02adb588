#include "receiver/CallbackReceiver.h"
#include "bridge/CommandDispatcher.h"
#include "bridge/ReceiverSupervisor.h"
#include "core/BridgeError.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>

#include <unistd.h>

namespace {
constexpr const char* kHost = "x-callback-url/";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}
}

CallbackReceiver::CallbackReceiver(SecureStore& store, const std::string& scheme) : store(store), scheme(scheme) {}

CallbackUrl CallbackReceiver::parse(const std::string& url, const std::string& scheme) {
    const std::string prefix = scheme + "://";
    if (url.size() < prefix.size() || toLower(url.substr(0, prefix.size())) != toLower(prefix)) {
        throw BridgeError(ErrorKind::InvalidInput, "Not a " + scheme + " callback URL");
    }
    std::string rest = url.substr(prefix.size());
    if (rest.compare(0, std::char_traits<char>::length(kHost), kHost) != 0) {
        throw BridgeError(ErrorKind::InvalidInput, "Callback URL host must be x-callback-url");
    }
    rest = rest.substr(std::char_traits<char>::length(kHost));

    size_t fragment = rest.find('#');
    if (fragment != std::string::npos) rest.resize(fragment);

    size_t queryStart = rest.find('?');
    std::string path = rest.substr(0, queryStart);
    std::string query = queryStart == std::string::npos ? "" : rest.substr(queryStart + 1);

    CallbackUrl result;
    if (path == "x-success") {
        result.isError = false;
    } else if (path == "x-error") {
        result.isError = true;
    } else {
        throw BridgeError(ErrorKind::InvalidInput, "Unknown callback path: " + path);
    }

    bool haveId = false;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string item = query.substr(pos, amp - pos);
        pos = amp + 1;
        if (item.empty()) continue;

        size_t eq = item.find('=');
        std::string key = CommandDispatcher::percentDecode(item.substr(0, eq));
        std::string value = eq == std::string::npos ? "" : CommandDispatcher::percentDecode(item.substr(eq + 1));

        if (key == "callbackId") {
            result.callbackId = value;
            haveId = true;
        } else {
            result.data[key] = value;
        }
    }

    if (!haveId || result.callbackId.empty()) {
        throw BridgeError(ErrorKind::InvalidInput, "No callbackId in callback URL");
    }
    if (!SecureStore::isValidId(result.callbackId)) {
        throw BridgeError(ErrorKind::InvalidInput, "Malformed callbackId in callback URL");
    }
    return result;
}

std::string CallbackReceiver::handleUrl(const std::string& url) {
    CallbackUrl callback = parse(url, scheme);

    nlohmann::json artifact = {
        {"callbackId", callback.callbackId},
        {"isError", callback.isError},
        {"data", callback.data}
    };
    store.writeArtifact(callback.callbackId, artifact);
    Logger::getInstance().info("Stored " + std::string(callback.isError ? "error" : "success") +
                               " callback " + callback.callbackId);
    return callback.callbackId;
}

bool CallbackReceiver::runDaemon(EventLoop& loop, std::chrono::milliseconds sweepInterval,
                                 std::chrono::milliseconds retention, const std::function<bool()>& stopRequested) {
    const pid_t self = getpid();
    auto existing = store.readPidMarker();
    if (existing && *existing != self && ReceiverSupervisor::isProcessAlive(*existing)) {
        Logger::getInstance().info("Receiver already running with PID " + std::to_string(*existing));
        return false;
    }

    store.writePidMarker(self);
    Logger::getInstance().success("Callback receiver started, PID " + std::to_string(self));

    store.sweepStale(retention);
    EventLoop::TimerId sweepTimer = loop.setInterval(sweepInterval, [this, retention]() {
        size_t removed = store.sweepStale(retention);
        if (removed > 0) {
            Logger::getInstance().info("Swept " + std::to_string(removed) + " stale callback file(s)");
        }
    });
    // Signals only set a flag; this tick notices it
    EventLoop::TimerId stopTimer = loop.setInterval(std::chrono::milliseconds(100), []() {});

    loop.runUntil(stopRequested);

    loop.cancel(sweepTimer);
    loop.cancel(stopTimer);

    auto marker = store.readPidMarker();
    if (marker && *marker == self) {
        store.removePidMarker();
    }
    Logger::getInstance().info("Callback receiver stopped");
    return true;
}
