#pragma once
#include <string>
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "core/Errors.h"

struct Config {
    struct Server {
        std::string name = "tether";
        std::string version = "1.0.0";
    } server;

    struct Broker {
        long timeoutMs = 30000;
    } broker;

    /** 通道描述: "stderr" | "fd:<n>" | 文件/FIFO 路径; resolve 通道额外支持 "none" */
    struct Channel {
        std::string notify = "stderr";
        std::string resolve = "none";
    } channel;

    struct Http {
        bool enabled = false;
        std::string host = "127.0.0.1";
        int port = 3456;
    } http;

    struct Dialog {
        bool enabled = true;
        std::string backend = "auto";  // auto | zenity | osascript | powershell
    } dialog;

    struct Logging {
        std::string file = "tether.log";
        bool console = false;
        bool debug = false;
    } logging;

    struct History {
        std::string path = ".tether/history.json";
        size_t maxEntries = 100;
    } history;

    static Config defaults() { return Config{}; }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw TetherError(ErrorKind::ConfigError, "Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw TetherError(ErrorKind::ConfigError,
                              "JSON Parse Error in " + path.string() + ": " + e.what());
        }
        return fromJson(j);
    }

    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        if (!j.is_object()) {
            throw TetherError(ErrorKind::ConfigError, "Config root must be an object");
        }
        try {
            if (j.contains("server")) {
                const auto& s = j["server"];
                cfg.server.name = s.value("name", cfg.server.name);
                cfg.server.version = s.value("version", cfg.server.version);
            }
            if (j.contains("broker")) {
                cfg.broker.timeoutMs = j["broker"].value("timeout_ms", cfg.broker.timeoutMs);
            }
            if (j.contains("channel")) {
                cfg.channel.notify = j["channel"].value("notify", cfg.channel.notify);
                cfg.channel.resolve = j["channel"].value("resolve", cfg.channel.resolve);
            }
            if (j.contains("http")) {
                const auto& h = j["http"];
                cfg.http.enabled = h.value("enabled", cfg.http.enabled);
                cfg.http.host = h.value("host", cfg.http.host);
                cfg.http.port = h.value("port", cfg.http.port);
            }
            if (j.contains("dialog")) {
                cfg.dialog.enabled = j["dialog"].value("enabled", cfg.dialog.enabled);
                cfg.dialog.backend = j["dialog"].value("backend", cfg.dialog.backend);
            }
            if (j.contains("logging")) {
                const auto& l = j["logging"];
                cfg.logging.file = l.value("file", cfg.logging.file);
                cfg.logging.console = l.value("console", cfg.logging.console);
                cfg.logging.debug = l.value("debug", cfg.logging.debug);
            }
            if (j.contains("history")) {
                cfg.history.path = j["history"].value("path", cfg.history.path);
                cfg.history.maxEntries = j["history"].value("max_entries", cfg.history.maxEntries);
            }
        } catch (const nlohmann::json::type_error& e) {
            throw TetherError(ErrorKind::ConfigError, std::string("Invalid config value: ") + e.what());
        }
        cfg.validate();
        return cfg;
    }

    // TETHER_DEBUG / TETHER_TIMEOUT_MS / TETHER_HTTP_PORT
    void applyEnvironment() {
        if (const char* debugEnv = std::getenv("TETHER_DEBUG")) {
            if (std::string(debugEnv) == "1") {
                logging.debug = true;
                logging.console = true;
            }
        }
        if (const char* timeoutEnv = std::getenv("TETHER_TIMEOUT_MS")) {
            setTimeout(timeoutEnv);
        }
        if (const char* portEnv = std::getenv("TETHER_HTTP_PORT")) {
            setHttpPort(portEnv);
        }
        validate();
    }

    void setTimeout(const std::string& text) {
        try {
            broker.timeoutMs = std::stol(text);
        } catch (const std::exception&) {
            throw TetherError(ErrorKind::ConfigError, "Invalid timeout: " + text);
        }
    }

    void setHttpPort(const std::string& text) {
        try {
            http.port = std::stoi(text);
            http.enabled = true;
        } catch (const std::exception&) {
            throw TetherError(ErrorKind::ConfigError, "Invalid HTTP port: " + text);
        }
    }

    void validate() const {
        if (broker.timeoutMs <= 0) {
            throw TetherError(ErrorKind::ConfigError, "broker.timeout_ms must be positive");
        }
        if (http.port <= 0 || http.port > 65535) {
            throw TetherError(ErrorKind::ConfigError, "http.port out of range");
        }
        if (dialog.backend != "auto" && dialog.backend != "zenity" &&
            dialog.backend != "osascript" && dialog.backend != "powershell") {
            throw TetherError(ErrorKind::ConfigError, "Unknown dialog backend: " + dialog.backend);
        }
        if (history.maxEntries == 0) {
            throw TetherError(ErrorKind::ConfigError, "history.max_entries must be positive");
        }
    }

    // 通知通道走 stderr 时, 控制台日志会破坏行分帧
    bool consoleLoggingAllowed() const {
        return logging.console && channel.notify != "stderr";
    }
};
