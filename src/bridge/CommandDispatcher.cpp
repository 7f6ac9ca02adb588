#include "bridge/CommandDispatcher.h"
#include "core/BridgeError.h"
#include "utils/Logger.h"
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
constexpr char kHex[] = "0123456789ABCDEF";

bool isUnreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
} // namespace

ProcessUrlOpener::ProcessUrlOpener(const std::string& command) : command(command) {}

void ProcessUrlOpener::open(const std::string& url) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(command.c_str()));
    argv.push_back(const_cast<char*>(url.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        throw BridgeError(ErrorKind::InvocationFailure,
                          std::string("Failed to spawn URL opener: ") + std::strerror(errno));
    }

    if (pid == 0) { // Child
        // stdout carries JSON-RPC in the parent; keep the opener off it
        int devNull = ::open("/dev/null", O_RDWR);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            dup2(devNull, STDOUT_FILENO);
            dup2(devNull, STDERR_FILENO);
            if (devNull > STDERR_FILENO) close(devNull);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw BridgeError(ErrorKind::InvocationFailure,
                              std::string("Failed to wait for URL opener: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 0) return;
        if (code == 127) {
            throw BridgeError(ErrorKind::InvocationFailure, "URL opener not found: " + command);
        }
        throw BridgeError(ErrorKind::InvocationFailure,
                          command + " exited with status " + std::to_string(code) +
                              " (is a handler registered for this URL scheme?)");
    }
    throw BridgeError(ErrorKind::InvocationFailure, command + " terminated abnormally");
}

CommandDispatcher::CommandDispatcher(const std::string& appScheme, const std::string& callbackScheme,
                                     IUrlOpener& opener)
    : appScheme(appScheme), callbackScheme(callbackScheme), opener(opener) {}

std::string CommandDispatcher::percentEncode(const std::string& value) {
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (isUnreserved(c)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::string CommandDispatcher::percentDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = hexValue(value[i + 1]);
            int lo = hexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += value[i];
    }
    return out;
}

std::string CommandDispatcher::successAddress(const std::string& correlationId) const {
    return callbackScheme + "://x-callback-url/x-success?callbackId=" + percentEncode(correlationId);
}

std::string CommandDispatcher::errorAddress(const std::string& correlationId) const {
    return callbackScheme + "://x-callback-url/x-error?callbackId=" + percentEncode(correlationId);
}

std::string CommandDispatcher::build(const std::string& action, const ParamList& params,
                                     const std::optional<std::string>& correlationId) const {
    std::string query;
    auto append = [&query](const std::string& key, const std::string& value) {
        if (!query.empty()) query += '&';
        query += percentEncode(key);
        query += '=';
        query += percentEncode(value);
    };

    for (const auto& [key, value] : params) {
        append(key, value);
    }
    if (correlationId) {
        append("x-success", successAddress(*correlationId));
        append("x-error", errorAddress(*correlationId));
    }

    std::string url = appScheme + "://x-callback-url/" + percentEncode(action);
    if (!query.empty()) {
        url += '?';
        url += query;
    }
    return url;
}

void CommandDispatcher::dispatch(const std::string& url) {
    Logger::getInstance().debug("Dispatching " + url.substr(0, url.find('?')));
    opener.open(url);
}
