#pragma once
#include "ITool.h"
#include <string>
#include <vector>

class ActionRegistry;
class CommandExecutor;
class ToolRegistry;

/**
 * @brief One tool argument and how it is checked.
 *
 * maxLength == 0 means unbounded; an empty allowed list means free text.
 * urlKey overrides the URL parameter name (access_token -> access-token).
 */
struct ToolField {
    std::string name;
    std::string description;
    bool required = false;
    size_t maxLength = 0;
    std::vector<std::string> allowed;
    std::string urlKey;
};

struct ToolDefinition {
    std::string name;
    std::string action;
    std::string description;
    std::vector<ToolField> fields;
};

/**
 * @brief Maps one tool call onto one Ulysses x-callback-url action.
 *
 * Required fields go through validateRequired (then length / enum checks);
 * optional fields are sent only when non-empty. URL parameters keep the
 * order of the definition.
 */
class UlyssesActionTool : public ITool {
public:
    UlyssesActionTool(ToolDefinition definition, CommandExecutor& executor, bool returnsData);

    std::string getName() const override { return definition.name; }
    std::string getDescription() const override { return definition.description; }
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

    const ToolDefinition& getDefinition() const { return definition; }

private:
    ToolDefinition definition;
    CommandExecutor& executor;
    bool returnsData;
};

namespace UlyssesTools {
    /** The full Ulysses tool catalog. */
    std::vector<ToolDefinition> definitions();

    /** Registers every catalog tool. @throws std::logic_error if a tool names an unknown action */
    void registerAll(ToolRegistry& tools, CommandExecutor& executor, const ActionRegistry& actions);

    extern const char* const kAuthorizeSecurityNote;
}
