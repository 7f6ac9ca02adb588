#pragma once
#include <string>
#include <iostream>
#include <optional>
#include <nlohmann/json.hpp>

class ToolRegistry;
class AuditLogger;

/**
 * @brief MCP server over line-delimited JSON-RPC 2.0 on stdio.
 *
 * Handles initialize, notifications/initialized, ping, tools/list and
 * tools/call. Requests are served one at a time; a tools/call that waits
 * for a callback blocks the read loop until it completes.
 */
class McpServer {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";
    static constexpr const char* kServerName = "ulysses-bridge";
    static constexpr const char* kServerVersion = "1.0.0";

    McpServer(ToolRegistry& tools, const std::string& storeRoot, AuditLogger* audit = nullptr);

    /** Reads requests until EOF on in, writing one response line per request to out. */
    void run(std::istream& in, std::ostream& out);

    /** @return The response for one raw line, or nullopt for notifications and blank lines. */
    std::optional<nlohmann::json> handleLine(const std::string& line);

    /** @return The response for one parsed message, or nullopt for notifications. */
    std::optional<nlohmann::json> handleMessage(const nlohmann::json& message);

    static nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result);
    static nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message);

private:
    ToolRegistry& tools;
    std::string storeRoot;
    AuditLogger* audit;

    nlohmann::json handleInitialize(const nlohmann::json& params);
    nlohmann::json handleToolsList();
    nlohmann::json handleToolsCall(const nlohmann::json& id, const nlohmann::json& params);
};
