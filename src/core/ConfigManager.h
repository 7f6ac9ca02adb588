#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <cstdlib>
#include <nlohmann/json.hpp>

struct Config {
    struct Ulysses {
        std::string scheme = "ulysses";
        std::string openCommand;        // xdg-open / open
    } ulysses;

    struct Callback {
        std::string scheme = "ulysses-mcp-callback";
        long long timeoutMs = 30000;
        long long pollIntervalMs = 100;
    } callback;

    struct RateLimit {
        long long windowMs = 60000;
        int maxDestructiveOps = 10;
    } rateLimit;

    struct Store {
        std::string directory;
        long long retentionMs = 60LL * 60 * 1000;
    } store;

    struct Receiver {
        std::vector<std::string> command;
        int startAttempts = 20;
        long long startIntervalMs = 100;
    } receiver;

    struct Audit {
        bool enabled = true;
        std::string path;
    } audit;

    struct Log {
        std::string file;
        bool debug = false;
    } log;

    /** Per-user data directory: ~/Library/Application Support on macOS, XDG state dir elsewhere. */
    static std::filesystem::path dataRoot() {
        const char* home = std::getenv("HOME");
        std::filesystem::path homeDir = home ? std::filesystem::u8path(home) : std::filesystem::temp_directory_path();
#ifdef __APPLE__
        return homeDir / "Library" / "Application Support" / "ulysses-mcp";
#else
        const char* xdgState = std::getenv("XDG_STATE_HOME");
        if (xdgState && *xdgState) {
            return std::filesystem::u8path(xdgState) / "ulysses-bridge";
        }
        return homeDir / ".local" / "state" / "ulysses-bridge";
#endif
    }

    static Config defaults() {
        Config cfg;
#ifdef __APPLE__
        cfg.ulysses.openCommand = "open";
#else
        cfg.ulysses.openCommand = "xdg-open";
#endif
        auto root = dataRoot();
        cfg.store.directory = (root / "tmp").u8string();
        cfg.audit.path = (root / "audit.jsonl").u8string();
        cfg.log.file = (root / "ulysses-bridge.log").u8string();
        cfg.receiver.command = {"ulysses-bridge-receiver", "--daemon"};
        return cfg;
    }

    static Config fromJson(const nlohmann::json& j) {
        Config cfg = defaults();

        if (j.contains("ulysses")) {
            const auto& u = j.at("ulysses");
            cfg.ulysses.scheme = u.value("scheme", cfg.ulysses.scheme);
            cfg.ulysses.openCommand = u.value("open_command", cfg.ulysses.openCommand);
        }
        if (j.contains("callback")) {
            const auto& c = j.at("callback");
            cfg.callback.scheme = c.value("scheme", cfg.callback.scheme);
            cfg.callback.timeoutMs = c.value("timeout_ms", cfg.callback.timeoutMs);
            cfg.callback.pollIntervalMs = c.value("poll_interval_ms", cfg.callback.pollIntervalMs);
        }
        if (j.contains("rate_limit")) {
            const auto& r = j.at("rate_limit");
            cfg.rateLimit.windowMs = r.value("window_ms", cfg.rateLimit.windowMs);
            cfg.rateLimit.maxDestructiveOps = r.value("max_destructive_ops", cfg.rateLimit.maxDestructiveOps);
        }
        if (j.contains("store")) {
            const auto& s = j.at("store");
            cfg.store.directory = s.value("directory", cfg.store.directory);
            cfg.store.retentionMs = s.value("retention_ms", cfg.store.retentionMs);
        }
        if (j.contains("receiver")) {
            const auto& r = j.at("receiver");
            if (r.contains("command")) {
                cfg.receiver.command = r["command"].get<std::vector<std::string>>();
            }
            cfg.receiver.startAttempts = r.value("start_attempts", cfg.receiver.startAttempts);
            cfg.receiver.startIntervalMs = r.value("start_interval_ms", cfg.receiver.startIntervalMs);
        }
        if (j.contains("audit")) {
            const auto& a = j.at("audit");
            cfg.audit.enabled = a.value("enabled", cfg.audit.enabled);
            cfg.audit.path = a.value("path", cfg.audit.path);
        }
        if (j.contains("log")) {
            const auto& l = j.at("log");
            cfg.log.file = l.value("file", cfg.log.file);
            cfg.log.debug = l.value("debug", cfg.log.debug);
        }

        cfg.validate();
        return cfg;
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }

        try {
            return fromJson(j);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
        }
    }

    /**
     * @brief Config for this process: --config path, then $ULYSSES_BRIDGE_CONFIG, then defaults().
     */
    static Config resolve(const std::string& cliPath) {
        if (!cliPath.empty()) {
            return load(cliPath);
        }
        const char* envPath = std::getenv("ULYSSES_BRIDGE_CONFIG");
        if (envPath && *envPath) {
            return load(envPath);
        }
        Config cfg = defaults();
        cfg.validate();
        return cfg;
    }

    void validate() const {
        if (ulysses.scheme.empty() || callback.scheme.empty()) {
            throw std::runtime_error("URL schemes must not be empty");
        }
        if (ulysses.openCommand.empty()) {
            throw std::runtime_error("ulysses.open_command must not be empty");
        }
        if (callback.timeoutMs <= 0 || callback.pollIntervalMs <= 0) {
            throw std::runtime_error("callback.timeout_ms and callback.poll_interval_ms must be positive");
        }
        if (rateLimit.windowMs <= 0 || rateLimit.maxDestructiveOps <= 0) {
            throw std::runtime_error("rate_limit values must be positive");
        }
        if (store.directory.empty()) {
            throw std::runtime_error("store.directory must not be empty");
        }
        if (receiver.command.empty() || receiver.startAttempts <= 0 || receiver.startIntervalMs <= 0) {
            throw std::runtime_error("receiver.command must be set and start limits positive");
        }
    }
};
