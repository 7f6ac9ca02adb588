#pragma once
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief Owns every tool and routes calls to it by name.
 *
 * Listing order is registration order.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief Register a tool
     * @param tool Tool instance; a later tool with the same name replaces the earlier one
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @brief Look up a tool
     * @return nullptr when no tool has that name
     */
    ITool* getTool(const std::string& name);

    /**
     * @brief Tool definitions in MCP tools/list form
     *
     * [
     *   {"name": "...", "description": "...", "inputSchema": { JSON Schema }}
     * ]
     */
    std::vector<nlohmann::json> listToolSchemas() const;

    /**
     * @brief Run a tool by name
     * @throws std::out_of_range if the tool is unknown; tool errors propagate unchanged
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args);

    size_t getToolCount() const { return order.size(); }

    bool hasTool(const std::string& name) const;

private:
    std::unordered_map<std::string, std::unique_ptr<ITool>> tools;
    std::vector<std::string> order;
};
