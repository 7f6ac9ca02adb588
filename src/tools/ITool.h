#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Tool interface exposed to the MCP client.
 *
 * Tools are thin: they check their arguments, call into the bridge and
 * format the outcome. Policy (whitelist, rate limits, waiting) lives below.
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief Unique tool name as listed in tools/list
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Short description shown to the model
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief JSON Schema of the arguments object
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief Run the tool
     * @param args Arguments object from tools/call
     * @return MCP result:
     * {
     *   "content": [
     *     {"type": "text", "text": "..."}
     *   ]
     * }
     * @throws BridgeError on invalid arguments or a failed command
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;
};
