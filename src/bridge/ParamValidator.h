#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

/**
 * @brief Caller-input checks run before any URL is built.
 *
 * Every failure throws BridgeError(InvalidInput); nothing here has side effects.
 */
namespace ParamValidator {

    /**
     * @brief Require a present, non-empty value.
     * @param value Raw argument (null / missing is rejected)
     * @param field Name used in the error message
     * @return The value as trimmed text; numbers and booleans are stringified
     */
    std::string validateRequired(const nlohmann::json& value, const std::string& field);

    /** Case-sensitive membership check. An absent value passes through as absent. */
    std::optional<std::string> validateEnum(const std::optional<std::string>& value,
                                            const std::vector<std::string>& allowed,
                                            const std::string& field);

    /** Rejects values longer than maxLength code points; equal is fine. */
    const std::string& validateLength(const std::string& value, size_t maxLength, const std::string& field);

    /** Optional argument as text; null and missing both map to nullopt. */
    std::optional<std::string> optionalString(const nlohmann::json& args, const std::string& key);

    size_t codePointLength(const std::string& utf8);
    std::string trim(const std::string& s);
}
