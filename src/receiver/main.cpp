#include <iostream>
#include <string>
#include <csignal>
#include "core/ConfigManager.h"
#include "core/BridgeError.h"
#include "utils/Logger.h"
#include "store/SecureStore.h"
#include "bridge/EventLoop.h"
#include "receiver/CallbackReceiver.h"

namespace {
volatile std::sig_atomic_t g_stop = 0;

void onSignal(int) {
    g_stop = 1;
}

void printUsage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " [--config <path>] --daemon\n"
              << "  " << program << " [--config <path>] <callback-url>\n";
}

constexpr std::chrono::milliseconds kSweepInterval(60 * 1000);
}

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string url;
    bool daemon = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--daemon") {
            daemon = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (url.empty() && arg.rfind("--", 0) != 0) {
            url = arg;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }
    if (daemon == !url.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    Config cfg;
    try {
        cfg = Config::resolve(configPath);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    Logger& logger = Logger::getInstance();
    logger.setDebugEnabled(cfg.log.debug);

    try {
        SecureStore store(cfg.store.directory);
        logger.setLogFile(cfg.log.file);
        CallbackReceiver receiver(store, cfg.callback.scheme);

        if (!daemon) {
            receiver.handleUrl(url);
            return 0;
        }

        std::signal(SIGTERM, onSignal);
        std::signal(SIGINT, onSignal);
        std::signal(SIGHUP, SIG_IGN);

        EventLoop loop;
        receiver.runDaemon(loop, kSweepInterval, std::chrono::milliseconds(cfg.store.retentionMs),
                           []() { return g_stop != 0; });
    } catch (const BridgeError& e) {
        logger.error(std::string("Rejected callback: ") + e.what());
        return 2;
    } catch (const std::exception& e) {
        logger.error(std::string("Receiver error: ") + e.what());
        return 1;
    }
    return 0;
}
