#pragma once
#include <string>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "core/Constants.h"
#include "utils/Logger.h"

/**
 * @brief sidekick 配置
 *
 * 所有字段均可选，缺省值即为内置默认值。配置文件查找顺序:
 * 1. $SIDEKICK_CONFIG
 * 2. $XDG_CONFIG_HOME/sidekick/config.json
 * 3. ~/.config/sidekick/config.json
 */
struct Config {
    struct Rpc {
        int timeoutMs = static_cast<int>(kRpcTimeout.count());
    } rpc;

    struct Discovery {
        std::string socketDir = kDefaultSocketDir;
    } discovery;

    struct Hook {
        bool notifyOnDeny = true;
        std::string denyNotice = kDefaultDenyNotice;
        bool refreshAfterEdit = true;
        bool injectSelection = true;
    } hook;

    struct Log {
        std::string file = defaultLogFile();
        bool enableDebug = false;
    } log;

    static std::string defaultLogFile() {
        std::error_code ec;
        auto dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            return "";
        }
        return (dir / "sidekick.log").string();
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
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be an object: " + path.string());
        }

        Config cfg;
        try {
            if (j.contains("rpc")) {
                cfg.rpc.timeoutMs = j.at("rpc").value("timeout_ms", cfg.rpc.timeoutMs);
            }
            if (j.contains("discovery")) {
                cfg.discovery.socketDir = j.at("discovery").value("socket_dir", cfg.discovery.socketDir);
            }
            if (j.contains("hook")) {
                const auto& h = j.at("hook");
                cfg.hook.notifyOnDeny = h.value("notify_on_deny", cfg.hook.notifyOnDeny);
                cfg.hook.denyNotice = h.value("deny_notice", cfg.hook.denyNotice);
                cfg.hook.refreshAfterEdit = h.value("refresh_after_edit", cfg.hook.refreshAfterEdit);
                cfg.hook.injectSelection = h.value("inject_selection", cfg.hook.injectSelection);
            }
            if (j.contains("log")) {
                cfg.log.file = j.at("log").value("file", cfg.log.file);
                cfg.log.enableDebug = j.at("log").value("enable_debug", cfg.log.enableDebug);
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config value in " + path.string() + ": " + e.what());
        }

        if (cfg.rpc.timeoutMs <= 0) {
            throw std::runtime_error("rpc.timeout_ms must be positive in " + path.string());
        }
        return cfg;
    }

    static std::string defaultConfigPath() {
        if (const char* explicitPath = std::getenv("SIDEKICK_CONFIG")) {
            return explicitPath;
        }
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
            if (*xdg) {
                return (std::filesystem::path(xdg) / "sidekick" / "config.json").string();
            }
        }
        if (const char* home = std::getenv("HOME")) {
            return (std::filesystem::path(home) / ".config" / "sidekick" / "config.json").string();
        }
        return "";
    }

    // 配置文件不存在时静默使用默认值；存在但无法解析时告警后使用默认值
    static Config loadDefault() {
        std::string path = defaultConfigPath();
        std::error_code ec;
        if (path.empty() || !std::filesystem::exists(path, ec)) {
            return Config{};
        }
        try {
            return load(path);
        } catch (const std::exception& e) {
            Logger::getInstance().warn(std::string("Ignoring config: ") + e.what());
            return Config{};
        }
    }
};
