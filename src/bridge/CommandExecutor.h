#pragma once
#include <string>
#include <functional>
#include <nlohmann/json.hpp>
#include "bridge/ActionRegistry.h"
#include "bridge/CallbackCorrelator.h"
#include "bridge/CommandDispatcher.h"
#include "bridge/EventLoop.h"
#include "bridge/RateLimiter.h"
#include "bridge/ReceiverSupervisor.h"
#include "core/BridgeError.h"

class AuditLogger;

/**
 * @brief Caller-facing entry point: one action in, one result or error out.
 *
 * Flow per call:
 *   validateAction -> rate limit -> [needs response: receiver up, register wait]
 *   -> build URL -> dispatch -> [wait for artifact on the event loop]
 *
 * Every call ends in exactly one of onResult / onError. Nothing is retried.
 */
class CommandExecutor {
public:
    using ResultHandler = std::function<void(const nlohmann::json& result)>;
    using ErrorHandler = std::function<void(const BridgeError& error)>;

    CommandExecutor(const ActionRegistry& registry, RateLimiter& rateLimiter, CommandDispatcher& dispatcher,
                    CallbackCorrelator& correlator, ReceiverSupervisor& supervisor, EventLoop& loop,
                    AuditLogger* audit = nullptr);

    /**
     * @brief Asynchronous execution.
     *
     * Validation, rate-limit and dispatch failures are reported through
     * onError before this returns; response actions complete later from
     * the event loop.
     */
    void execute(const std::string& action, const ParamList& params, ResultHandler onResult, ErrorHandler onError);

    /**
     * @brief Runs the event loop until this call completes.
     * @return Callback payload for response actions, otherwise
     *         {"message": "Successfully executed <action>"}
     * @throws BridgeError
     */
    nlohmann::json executeBlocking(const std::string& action, const ParamList& params = {});

    static nlohmann::json successMessage(const std::string& action);

private:
    const ActionRegistry& registry;
    RateLimiter& rateLimiter;
    CommandDispatcher& dispatcher;
    CallbackCorrelator& correlator;
    ReceiverSupervisor& supervisor;
    EventLoop& loop;
    AuditLogger* audit;

    void dispatchWithResponse(const std::string& action, const ParamList& params,
                              ResultHandler onResult, ErrorHandler onError);

    void reportSuccess(const std::string& action, const ParamList& params, const nlohmann::json& result,
                       const ResultHandler& onResult);
    void reportFailure(const std::string& action, const ParamList& params, const BridgeError& error,
                       const ErrorHandler& onError);

    static nlohmann::json auditDetails(const ParamList& params);
};
