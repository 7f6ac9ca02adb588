#include "mcp/McpServer.h"
#include "audit/AuditLogger.h"
#include "bridge/CallbackCorrelator.h"
#include "core/BridgeError.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

McpServer::McpServer(ToolRegistry& tools, const std::string& storeRoot, AuditLogger* audit)
    : tools(tools), storeRoot(storeRoot), audit(audit) {}

nlohmann::json McpServer::makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

nlohmann::json McpServer::makeError(const nlohmann::json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

void McpServer::run(std::istream& in, std::ostream& out) {
    Logger::getInstance().info("Ulysses MCP server running on stdio");
    if (audit) {
        audit->logServerStart({{"version", kServerVersion}, {"tools", tools.getToolCount()}});
    }

    std::string line;
    while (std::getline(in, line)) {
        auto response = handleLine(line);
        if (!response) continue;
        out << response->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        out.flush();
    }
    Logger::getInstance().info("stdin closed, shutting down");
}

std::optional<nlohmann::json> McpServer::handleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::getInstance().warn(std::string("Unparseable JSON-RPC line: ") + e.what());
        return makeError(nullptr, JsonRpcError::ParseError, "Parse error");
    }
    return handleMessage(message);
}

std::optional<nlohmann::json> McpServer::handleMessage(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("method") || !message["method"].is_string()) {
        nlohmann::json id = message.is_object() && message.contains("id") ? message["id"] : nlohmann::json();
        return makeError(id, JsonRpcError::InvalidRequest, "Invalid Request");
    }

    const std::string method = message["method"].get<std::string>();
    const bool isNotification = !message.contains("id");
    const nlohmann::json id = isNotification ? nlohmann::json() : message["id"];
    const nlohmann::json params = message.contains("params") ? message["params"] : nlohmann::json::object();

    if (isNotification) {
        Logger::getInstance().debug("Notification: " + method);
        return std::nullopt;
    }

    if (method == "initialize") {
        return makeResult(id, handleInitialize(params));
    }
    if (method == "ping") {
        return makeResult(id, nlohmann::json::object());
    }
    if (method == "tools/list") {
        return makeResult(id, handleToolsList());
    }
    if (method == "tools/call") {
        return handleToolsCall(id, params);
    }

    return makeError(id, JsonRpcError::MethodNotFound, "Method not found: " + method);
}

nlohmann::json McpServer::handleInitialize(const nlohmann::json& params) {
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        Logger::getInstance().info("Client connected: " + params["clientInfo"].value("name", std::string("unknown")));
    }
    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}
    };
}

nlohmann::json McpServer::handleToolsList() {
    return {{"tools", tools.listToolSchemas()}};
}

nlohmann::json McpServer::handleToolsCall(const nlohmann::json& id, const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return makeError(id, JsonRpcError::InvalidParams, "tools/call requires a tool name");
    }
    const std::string name = params["name"].get<std::string>();
    const nlohmann::json args = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();

    if (!tools.hasTool(name)) {
        return makeError(id, JsonRpcError::MethodNotFound, "Unknown tool: " + name);
    }

    try {
        return makeResult(id, tools.executeTool(name, args));
    } catch (const BridgeError& e) {
        std::string message = CallbackCorrelator::sanitizeMessage(e.what(), storeRoot);
        // Executor-level failures are audited there; argument checks fail before it
        if (audit && e.getKind() == ErrorKind::InvalidInput) {
            audit->logValidationFailure(name, message, args.is_object() ? args : nlohmann::json::object());
        }
        if (e.getKind() == ErrorKind::InvalidInput || e.getKind() == ErrorKind::RateLimited) {
            return makeError(id, e.rpcCode(), message);
        }
        return makeError(id, e.rpcCode(), "Tool execution failed: " + message);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Tool " + name + " crashed: " + e.what());
        if (audit) {
            audit->log(AuditEventType::SERVER_ERROR, name, false, nlohmann::json::object(), e.what());
        }
        return makeError(id, JsonRpcError::InternalError,
                         "Tool execution failed: " + CallbackCorrelator::sanitizeMessage(e.what(), storeRoot));
    }
}
