#include <iostream>
#include <string>
#include <memory>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include "core/ConfigManager.h"
#include "core/BridgeError.h"
#include "utils/Logger.h"
#include "audit/AuditLogger.h"
#include "store/SecureStore.h"
#include "bridge/ActionRegistry.h"
#include "bridge/CallbackCorrelator.h"
#include "bridge/CommandDispatcher.h"
#include "bridge/CommandExecutor.h"
#include "bridge/EventLoop.h"
#include "bridge/RateLimiter.h"
#include "bridge/ReceiverSupervisor.h"
#include "mcp/McpServer.h"
#include "tools/ToolRegistry.h"
#include "tools/UlyssesTools.h"

namespace {
void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <path>] [--debug]\n"
              << "Serves the Ulysses tools over MCP (JSON-RPC on stdin/stdout).\n";
}
}

int main(int argc, char* argv[]) {
    std::string configPath;
    bool forceDebug = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--debug") {
            forceDebug = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    // A client that goes away mid-write must not kill us with SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);

    Config cfg;
    try {
        cfg = Config::resolve(configPath);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    if (!configPath.empty()) {
        // The detached receiver has to see the same store
        std::error_code ec;
        auto absolute = std::filesystem::absolute(std::filesystem::u8path(configPath), ec);
        setenv("ULYSSES_BRIDGE_CONFIG", ec ? configPath.c_str() : absolute.u8string().c_str(), 1);
    }

    Logger& logger = Logger::getInstance();
    logger.setDebugEnabled(cfg.log.debug || forceDebug);

    try {
        SecureStore store(cfg.store.directory);
        logger.setLogFile(cfg.log.file);

        AuditLogger audit(cfg.audit.path, cfg.audit.enabled);
        ActionRegistry actions = ActionRegistry::ulysses();
        RateLimiter rateLimiter(actions, cfg.rateLimit.maxDestructiveOps, cfg.rateLimit.windowMs);

        EventLoop loop;
        ProcessUrlOpener opener(cfg.ulysses.openCommand);
        CommandDispatcher dispatcher(cfg.ulysses.scheme, cfg.callback.scheme, opener);
        CallbackCorrelator correlator(store, loop, std::chrono::milliseconds(cfg.callback.timeoutMs),
                                      std::chrono::milliseconds(cfg.callback.pollIntervalMs));
        ReceiverSupervisor supervisor(store, loop, cfg.receiver.command, cfg.receiver.startAttempts,
                                      std::chrono::milliseconds(cfg.receiver.startIntervalMs));
        CommandExecutor executor(actions, rateLimiter, dispatcher, correlator, supervisor, loop, &audit);

        ToolRegistry tools;
        UlyssesTools::registerAll(tools, executor, actions);

        size_t swept = store.sweepStale(std::chrono::milliseconds(cfg.store.retentionMs));
        if (swept > 0) {
            logger.info("Removed " + std::to_string(swept) + " stale callback file(s)");
        }
        logger.debug("Store: " + store.getRoot().string() + ", " + std::to_string(tools.getToolCount()) + " tools");

        McpServer server(tools, store.getRoot().string(), &audit);
        server.run(std::cin, std::cout);
    } catch (const StoreError& e) {
        logger.error(std::string("Store setup failed: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        logger.error(std::string("Server error: ") + e.what());
        return 1;
    }
    return 0;
}
