#pragma once
#include <string>
#include <mutex>
#include <nlohmann/json.hpp>

enum class AuditEventType {
    AUTHORIZATION,
    DESTRUCTIVE_OPERATION,
    RATE_LIMIT_VIOLATION,
    VALIDATION_FAILURE,
    OPERATION_SUCCESS,
    OPERATION_FAILURE,
    SERVER_START,
    SERVER_ERROR
};

/**
 * @brief Security event log, one JSON object per line.
 *
 * Secrets in details are redacted and bulky text fields truncated before
 * anything reaches disk. Write failures are reported through Logger and
 * otherwise ignored; a disabled logger does nothing.
 */
class AuditLogger {
public:
    /** Empty path or enabled == false gives a no-op logger. */
    AuditLogger(const std::string& logPath, bool enabled = true);

    void log(AuditEventType type, const std::string& action, bool success,
             const nlohmann::json& details = nlohmann::json::object(), const std::string& error = "");

    void logServerStart(const nlohmann::json& details);
    void logAuthorization(const std::string& appname, bool success, const std::string& error = "");
    void logDestructiveOperation(const std::string& action, bool success, const nlohmann::json& details,
                                 const std::string& error = "");
    void logRateLimitViolation(const std::string& action, const nlohmann::json& details);
    void logValidationFailure(const std::string& action, const std::string& error, const nlohmann::json& details);
    void logSuccess(const std::string& action, const nlohmann::json& details);
    void logFailure(const std::string& action, const std::string& error, const nlohmann::json& details);

    static nlohmann::json sanitizeDetails(const nlohmann::json& details);
    static const char* eventTypeName(AuditEventType type);

    const std::string& getLogPath() const { return logPath; }
    bool isEnabled() const { return enabled; }

private:
    std::string logPath;
    bool enabled;
    std::mutex mtx;

    static std::string isoTimestamp();
};
