#include "audit/AuditLogger.h"
#include "utils/Logger.h"
#include <chrono>
#include <ctime>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
const char* kSensitiveFields[] = {
    "access_token", "access-token", "accessToken", "token", "password", "secret", "apiKey", "api_key"
};
constexpr size_t kMaxTextLength = 100;
}

AuditLogger::AuditLogger(const std::string& path, bool enabledFlag)
    : logPath(path), enabled(enabledFlag && !path.empty()) {
    if (!enabled) return;

    std::error_code ec;
    fs::path dir = fs::u8path(logPath).parent_path();
    if (!dir.empty() && !fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            Logger::getInstance().error("Failed to create audit log directory: " + ec.message());
            enabled = false;
            return;
        }
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    }
}

const char* AuditLogger::eventTypeName(AuditEventType type) {
    switch (type) {
        case AuditEventType::AUTHORIZATION: return "authorization";
        case AuditEventType::DESTRUCTIVE_OPERATION: return "destructive_operation";
        case AuditEventType::RATE_LIMIT_VIOLATION: return "rate_limit_violation";
        case AuditEventType::VALIDATION_FAILURE: return "validation_failure";
        case AuditEventType::OPERATION_SUCCESS: return "operation_success";
        case AuditEventType::OPERATION_FAILURE: return "operation_failure";
        case AuditEventType::SERVER_START: return "server_start";
        case AuditEventType::SERVER_ERROR: return "server_error";
    }
    return "unknown";
}

std::string AuditLogger::isoTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

nlohmann::json AuditLogger::sanitizeDetails(const nlohmann::json& details) {
    if (!details.is_object()) {
        return nlohmann::json::object();
    }
    nlohmann::json sanitized = details;

    for (const char* field : kSensitiveFields) {
        if (sanitized.contains(field)) {
            sanitized[field] = "<redacted>";
        }
    }

    for (const char* field : {"text", "note"}) {
        if (sanitized.contains(field) && sanitized[field].is_string()) {
            std::string value = sanitized[field].get<std::string>();
            if (value.size() > kMaxTextLength) {
                sanitized[field] = value.substr(0, kMaxTextLength) + "...[truncated]";
            }
        }
    }

    if (sanitized.contains("image") && sanitized["image"].is_string()) {
        sanitized["image"] = "<base64 data, length: " +
                             std::to_string(sanitized["image"].get<std::string>().size()) + ">";
    }
    return sanitized;
}

void AuditLogger::log(AuditEventType type, const std::string& action, bool success,
                      const nlohmann::json& details, const std::string& error) {
    if (!enabled) return;

    nlohmann::json event;
    event["timestamp"] = isoTimestamp();
    event["event_type"] = eventTypeName(type);
    if (!action.empty()) event["action"] = action;
    event["success"] = success;
    event["details"] = sanitizeDetails(details);
    if (!error.empty()) event["error"] = error;

    // Invalid UTF-8 in caller text is replaced rather than aborting the dump
    std::string line = event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";

    std::lock_guard<std::mutex> lock(mtx);
    int fd = ::open(logPath.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_NOFOLLOW | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        Logger::getInstance().error(std::string("Audit log write failed: ") + std::strerror(errno));
        return;
    }
    ssize_t n = ::write(fd, line.data(), line.size());
    if (n < 0 || static_cast<size_t>(n) != line.size()) {
        Logger::getInstance().error("Audit log write failed: short write");
    }
    ::close(fd);
}

void AuditLogger::logServerStart(const nlohmann::json& details) {
    log(AuditEventType::SERVER_START, "", true, details);
}

void AuditLogger::logAuthorization(const std::string& appname, bool success, const std::string& error) {
    log(AuditEventType::AUTHORIZATION, "authorize", success, {{"appname", appname}}, error);
}

void AuditLogger::logDestructiveOperation(const std::string& action, bool success, const nlohmann::json& details,
                                          const std::string& error) {
    log(AuditEventType::DESTRUCTIVE_OPERATION, action, success, details, error);
}

void AuditLogger::logRateLimitViolation(const std::string& action, const nlohmann::json& details) {
    log(AuditEventType::RATE_LIMIT_VIOLATION, action, false, details);
}

void AuditLogger::logValidationFailure(const std::string& action, const std::string& error,
                                       const nlohmann::json& details) {
    log(AuditEventType::VALIDATION_FAILURE, action, false, details, error);
}

void AuditLogger::logSuccess(const std::string& action, const nlohmann::json& details) {
    log(AuditEventType::OPERATION_SUCCESS, action, true, details);
}

void AuditLogger::logFailure(const std::string& action, const std::string& error, const nlohmann::json& details) {
    log(AuditEventType::OPERATION_FAILURE, action, false, details, error);
}
