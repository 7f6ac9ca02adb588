#include "bridge/CallbackCorrelator.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <regex>

namespace {
constexpr const char* kBase36 = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr size_t kSuffixLength = 9;
constexpr size_t kMaxErrorMessageLength = 1000;
constexpr size_t kMinSecretLength = 32;

void replaceAll(std::string& text, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool isTokenChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '_' || c == '=' || c == '-';
}

// Replaces every run of kMinSecretLength or more token characters in one linear pass.
std::string redactLongRuns(const std::string& text) {
    std::string out;
    out.reserve(std::min(text.size(), kMaxErrorMessageLength * 2));
    size_t i = 0;
    while (i < text.size()) {
        if (!isTokenChar(text[i])) {
            out += text[i++];
            continue;
        }
        size_t end = i;
        while (end < text.size() && isTokenChar(text[end])) ++end;
        if (end - i >= kMinSecretLength) {
            out += "<redacted>";
        } else {
            out.append(text, i, end - i);
        }
        i = end;
    }
    return out;
}
} // namespace

CallbackCorrelator::CallbackCorrelator(SecureStore& store, EventLoop& loop,
                                       std::chrono::milliseconds timeout,
                                       std::chrono::milliseconds pollInterval)
    : store(store), loop(loop), timeout(timeout), pollInterval(pollInterval), rng(std::random_device{}()) {}

CallbackCorrelator::~CallbackCorrelator() {
    for (auto& [id, request] : pending) {
        loop.cancel(request.timeoutTimer);
        loop.cancel(request.pollTimer);
    }
    if (!pending.empty()) {
        Logger::getInstance().warn("Dropping " + std::to_string(pending.size()) + " pending callback(s) on shutdown");
    }
}

std::string CallbackCorrelator::allocateId(const std::string& action) {
    while (true) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
        std::string suffix;
        std::uniform_int_distribution<int> dist(0, 35);
        for (size_t i = 0; i < kSuffixLength; ++i) {
            suffix += kBase36[dist(rng)];
        }
        std::string id = action + "-" + std::to_string(ms) + "-" + suffix;
        if (!pending.count(id)) {
            return id;
        }
    }
}

void CallbackCorrelator::registerPending(const std::string& id, const std::string& action,
                                         ResolveHandler onResolve, RejectHandler onReject) {
    if (!SecureStore::isValidId(id)) {
        throw BridgeError(ErrorKind::Internal, "Correlation id is not store-safe");
    }
    if (pending.count(id)) {
        throw BridgeError(ErrorKind::Internal, "Correlation id already pending: " + id);
    }

    // A leftover file from an earlier run must not answer this request.
    store.deleteArtifact(id);

    PendingRequest request;
    request.id = id;
    request.action = action;
    request.createdAt = std::chrono::steady_clock::now();
    request.onResolve = std::move(onResolve);
    request.onReject = std::move(onReject);
    request.timeoutTimer = loop.setTimeout(timeout, [this, id]() { expire(id); });
    request.pollTimer = loop.setInterval(pollInterval, [this, id]() { poll(id); });
    pending.emplace(id, std::move(request));

    Logger::getInstance().debug("Waiting for callback " + id);
}

std::optional<CallbackCorrelator::PendingRequest> CallbackCorrelator::take(const std::string& id) {
    auto it = pending.find(id);
    if (it == pending.end()) {
        return std::nullopt;
    }
    PendingRequest request = std::move(it->second);
    pending.erase(it);

    loop.cancel(request.timeoutTimer);
    loop.cancel(request.pollTimer);
    store.deleteArtifact(id);
    return request;
}

bool CallbackCorrelator::cancel(const std::string& id) {
    auto request = take(id);
    if (!request) return false;
    Logger::getInstance().debug("Cancelled callback " + id);
    return true;
}

void CallbackCorrelator::rejectWith(const std::string& id, ErrorKind kind, const std::string& message) {
    auto request = take(id);
    if (!request) return;
    request->onReject(BridgeError(kind, message));
}

void CallbackCorrelator::expire(const std::string& id) {
    auto request = take(id);
    if (!request) return;

    Logger::getInstance().warn("Callback " + id + " timed out after " + std::to_string(timeout.count()) + "ms");
    request->onReject(BridgeError(
        ErrorKind::CallbackTimeout,
        "Callback timeout for action: " + request->action +
            ". Ulysses may not be running or may not have called back.\n\n"
            "Troubleshooting:\n"
            "1. Ensure Ulysses is installed and running\n"
            "2. Ensure the callback receiver is running and registered for the callback URL scheme\n"
            "3. Check that Ulysses has permission to use x-callback-url\n"
            "4. Try the command manually"));
}

void CallbackCorrelator::poll(const std::string& id) {
    if (!pending.count(id)) return;
    if (!store.artifactExists(id)) return;

    nlohmann::json artifact;
    try {
        artifact = store.readArtifact(id);
    } catch (const StoreError& e) {
        switch (e.getKind()) {
            case StoreErrorKind::NotFound:
            case StoreErrorKind::SymlinkRejected:
            case StoreErrorKind::NotRegularFile:
                // swapped between lstat and open; keep waiting
                Logger::getInstance().warn("Ignoring callback artifact for " + id + ": " + e.what());
                return;
            case StoreErrorKind::Corrupt:
                Logger::getInstance().error("Corrupt callback artifact for " + id + ": " + e.what());
                rejectWith(id, ErrorKind::ArtifactCorruption, "Received an unreadable callback response");
                return;
            default:
                Logger::getInstance().error("Failed to read callback artifact for " + id + ": " + e.what());
                rejectWith(id, ErrorKind::Internal,
                           "Failed to read callback response: " + sanitizeMessage(e.what(), store.getRoot().string()));
                return;
        }
    }

    bool isError = false;
    nlohmann::json data = nlohmann::json::object();
    try {
        if (artifact.value("callbackId", std::string()) != id) {
            throw std::runtime_error("callbackId does not match");
        }
        isError = artifact.value("isError", false);
        if (artifact.contains("data") && !artifact["data"].is_null()) {
            data = artifact["data"];
            if (!data.is_object()) {
                throw std::runtime_error("data is not an object");
            }
        }
    } catch (const std::exception& e) {
        Logger::getInstance().error("Malformed callback artifact for " + id + ": " + e.what());
        rejectWith(id, ErrorKind::ArtifactCorruption, "Received a malformed callback response");
        return;
    }

    auto request = take(id);
    if (!request) return;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - request->createdAt).count();
    if (isError) {
        std::string message = "Ulysses returned an error";
        if (data.contains("errorMessage") && data["errorMessage"].is_string() &&
            !data["errorMessage"].get<std::string>().empty()) {
            message = data["errorMessage"].get<std::string>();
        }
        Logger::getInstance().warn("Callback " + id + " reported an error after " + std::to_string(elapsed) + "ms");
        request->onReject(BridgeError(ErrorKind::ExternalError, sanitizeMessage(message, store.getRoot().string())));
    } else {
        Logger::getInstance().debug("Callback " + id + " resolved after " + std::to_string(elapsed) + "ms");
        request->onResolve(data);
    }
}

std::string CallbackCorrelator::sanitizeMessage(const std::string& message, const std::string& storeRoot) {
    std::string out = message;
    replaceAll(out, storeRoot, "<store>");
    out = redactLongRuns(out);

    // std::regex recurses per matched character; only bounded input reaches it
    bool truncated = out.size() > kMaxErrorMessageLength;
    if (truncated) {
        out.resize(kMaxErrorMessageLength);
    }

    static const std::regex artifactName(R"(callback-[A-Za-z0-9._-]+\.json)");
    static const std::regex tokenParam(R"((access[-_]?token|token)(["']?\s*[=:]\s*["']?)[^\s&"',;]+)",
                                       std::regex::icase);
    out = std::regex_replace(out, artifactName, "<artifact>");
    out = std::regex_replace(out, tokenParam, "$1$2<redacted>");

    if (truncated) {
        out += "...";
    }
    return out;
}
