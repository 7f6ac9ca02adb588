#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Failure taxonomy of the bridge.
 *
 * InvalidInput and RateLimited are surfaced before anything is dispatched;
 * the others can only happen once a command has left the validator.
 */
enum class ErrorKind {
    InvalidInput,
    RateLimited,
    HelperStartFailure,
    InvocationFailure,
    CallbackTimeout,
    ExternalError,
    ArtifactCorruption,
    Internal
};

// JSON-RPC error codes used on the MCP boundary
namespace JsonRpcError {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
}

class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind(kind) {}

    ErrorKind getKind() const { return kind; }

    int rpcCode() const {
        switch (kind) {
            case ErrorKind::InvalidInput: return JsonRpcError::InvalidParams;
            case ErrorKind::RateLimited: return JsonRpcError::InvalidRequest;
            default: return JsonRpcError::InternalError;
        }
    }

    static const char* kindName(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::InvalidInput: return "invalid_input";
            case ErrorKind::RateLimited: return "rate_limited";
            case ErrorKind::HelperStartFailure: return "helper_start_failure";
            case ErrorKind::InvocationFailure: return "invocation_failure";
            case ErrorKind::CallbackTimeout: return "callback_timeout";
            case ErrorKind::ExternalError: return "external_error";
            case ErrorKind::ArtifactCorruption: return "artifact_corruption";
            case ErrorKind::Internal: return "internal";
        }
        return "internal";
    }

private:
    ErrorKind kind;
};
