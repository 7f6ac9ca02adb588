#include "bridge/ParamValidator.h"
#include "core/BridgeError.h"
#include <algorithm>
#include <cctype>

namespace ParamValidator {

namespace {
std::string toText(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    return value.dump();
}

std::string joinAllowed(const std::vector<std::string>& allowed) {
    std::string out;
    for (size_t i = 0; i < allowed.size(); ++i) {
        if (i > 0) out += ", ";
        out += allowed[i];
    }
    return out;
}
} // namespace

std::string trim(const std::string& s) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(s.begin(), s.end(), isSpace);
    auto end = std::find_if_not(s.rbegin(), s.rend(), isSpace).base();
    if (begin >= end) return "";
    return std::string(begin, end);
}

size_t codePointLength(const std::string& utf8) {
    size_t count = 0;
    for (unsigned char c : utf8) {
        // continuation bytes are 10xxxxxx
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

std::string validateRequired(const nlohmann::json& value, const std::string& field) {
    if (value.is_null()) {
        throw BridgeError(ErrorKind::InvalidInput, field + " is required");
    }
    std::string text = trim(toText(value));
    if (text.empty()) {
        throw BridgeError(ErrorKind::InvalidInput, field + " cannot be empty");
    }
    return text;
}

std::optional<std::string> validateEnum(const std::optional<std::string>& value,
                                        const std::vector<std::string>& allowed,
                                        const std::string& field) {
    if (!value) {
        return std::nullopt;
    }
    if (std::find(allowed.begin(), allowed.end(), *value) == allowed.end()) {
        throw BridgeError(ErrorKind::InvalidInput, field + " must be one of: " + joinAllowed(allowed));
    }
    return value;
}

const std::string& validateLength(const std::string& value, size_t maxLength, const std::string& field) {
    if (codePointLength(value) > maxLength) {
        throw BridgeError(ErrorKind::InvalidInput,
                          field + " exceeds maximum length of " + std::to_string(maxLength) + " characters");
    }
    return value;
}

std::optional<std::string> optionalString(const nlohmann::json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key)) return std::nullopt;
    const auto& value = args.at(key);
    if (value.is_null()) return std::nullopt;
    std::string text = toText(value);
    if (text.empty()) return std::nullopt;
    return text;
}

} // namespace ParamValidator
