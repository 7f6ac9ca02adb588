#include "bridge/CommandExecutor.h"
#include "audit/AuditLogger.h"
#include "utils/Logger.h"
#include <optional>

namespace {
std::string paramValue(const ParamList& params, const std::string& key) {
    for (const auto& [name, value] : params) {
        if (name == key) return value;
    }
    return "";
}
}

CommandExecutor::CommandExecutor(const ActionRegistry& registry, RateLimiter& rateLimiter,
                                 CommandDispatcher& dispatcher, CallbackCorrelator& correlator,
                                 ReceiverSupervisor& supervisor, EventLoop& loop, AuditLogger* audit)
    : registry(registry), rateLimiter(rateLimiter), dispatcher(dispatcher), correlator(correlator),
      supervisor(supervisor), loop(loop), audit(audit) {}

nlohmann::json CommandExecutor::successMessage(const std::string& action) {
    return {{"message", "Successfully executed " + action}};
}

nlohmann::json CommandExecutor::auditDetails(const ParamList& params) {
    nlohmann::json details = nlohmann::json::object();
    for (const auto& [key, value] : params) {
        details[key] = value;
    }
    return details;
}

void CommandExecutor::execute(const std::string& action, const ParamList& params,
                              ResultHandler onResult, ErrorHandler onError) {
    const Action* entry = nullptr;
    try {
        entry = &registry.validateAction(action);
        rateLimiter.checkAndConsume(action);
    } catch (const BridgeError& e) {
        if (audit && e.getKind() == ErrorKind::RateLimited) {
            audit->logRateLimitViolation(action, auditDetails(params));
        }
        reportFailure(action, params, e, onError);
        return;
    }

    if (entry->needsResponse) {
        dispatchWithResponse(action, params, std::move(onResult), std::move(onError));
        return;
    }

    try {
        dispatcher.dispatch(dispatcher.build(action, params));
    } catch (const BridgeError& e) {
        reportFailure(action, params, e, onError);
        return;
    }
    reportSuccess(action, params, successMessage(action), onResult);
}

void CommandExecutor::dispatchWithResponse(const std::string& action, const ParamList& params,
                                           ResultHandler onResult, ErrorHandler onError) {
    auto onReady = [this, action, params, onResult, onError]() {
        std::string id = correlator.allocateId(action);
        try {
            correlator.registerPending(
                id, action,
                [this, action, params, onResult](const nlohmann::json& data) {
                    reportSuccess(action, params, data, onResult);
                },
                [this, action, params, onError](const BridgeError& e) {
                    reportFailure(action, params, e, onError);
                });
        } catch (const BridgeError& e) {
            reportFailure(action, params, e, onError);
            return;
        }

        try {
            dispatcher.dispatch(dispatcher.build(action, params, id));
        } catch (const BridgeError& e) {
            // Nothing will ever call back for this id
            correlator.cancel(id);
            reportFailure(action, params, e, onError);
        }
    };

    auto onFailure = [this, action, params, onError](const BridgeError& e) {
        reportFailure(action, params, e, onError);
    };

    supervisor.ensureRunning(std::move(onReady), std::move(onFailure));
}

void CommandExecutor::reportSuccess(const std::string& action, const ParamList& params,
                                    const nlohmann::json& result, const ResultHandler& onResult) {
    if (audit) {
        if (action == "authorize") {
            audit->logAuthorization(paramValue(params, "appname"), true);
        } else if (registry.isDestructive(action)) {
            audit->logDestructiveOperation(action, true, auditDetails(params));
        } else {
            audit->logSuccess(action, auditDetails(params));
        }
    }
    Logger::getInstance().debug("Executed " + action);
    onResult(result);
}

void CommandExecutor::reportFailure(const std::string& action, const ParamList& params, const BridgeError& error,
                                    const ErrorHandler& onError) {
    if (audit) {
        switch (error.getKind()) {
            case ErrorKind::RateLimited:
                break;  // already recorded as a violation
            case ErrorKind::InvalidInput:
                audit->logValidationFailure(action, error.what(), auditDetails(params));
                break;
            default:
                if (action == "authorize") {
                    audit->logAuthorization(paramValue(params, "appname"), false, error.what());
                } else if (registry.isDestructive(action)) {
                    audit->logDestructiveOperation(action, false, auditDetails(params), error.what());
                } else {
                    audit->logFailure(action, error.what(), auditDetails(params));
                }
        }
    }
    Logger::getInstance().warn(std::string("Action ") + action + " failed (" +
                               BridgeError::kindName(error.getKind()) + ")");
    onError(error);
}

nlohmann::json CommandExecutor::executeBlocking(const std::string& action, const ParamList& params) {
    bool done = false;
    std::optional<nlohmann::json> result;
    std::optional<BridgeError> failure;

    execute(
        action, params,
        [&](const nlohmann::json& r) {
            result = r;
            done = true;
        },
        [&](const BridgeError& e) {
            failure = e;
            done = true;
        });

    if (!done && !loop.runUntil([&]() { return done; })) {
        throw BridgeError(ErrorKind::Internal, "Event loop ran dry before " + action + " completed");
    }
    if (failure) {
        throw *failure;
    }
    return *result;
}
