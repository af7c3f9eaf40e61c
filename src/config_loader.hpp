#pragma once
// =============================================================================
// AutoLink Config Loader
// =============================================================================
// Loads settings from autolink.json with nlohmann/json. Every key is optional.
// =============================================================================

#include <string>
#include <fstream>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "autolink_log.hpp"

namespace autolink {
namespace config {

struct NetworkConfig {
    int http_server_port = 10347;        // CommandIngestServer
    int device_client_port = 7347;       // device-side client port (LAN + first forward)
    int device_adb_server_port = 6347;   // device-side bridge-server port (second forward)
    int connect_timeout_ms = 5000;
};

struct AdbConfig {
    std::string adb_path = "adb";
    int handshake_timeout_ms = 5000;
    int exec_timeout_ms = 8000;
    std::string debug_provider_uri = "content://org.autojs.autojs.debug.provider/debug-server";
};

struct PortConfig {
    int lease_window_ms = 15000;
};

struct StorageConfig {
    std::string history_path;            // empty = $HOME/.autolink/state.json
    std::string history_key = "autojs6.devices";
};

struct DispatchConfig {
    int rerun_delay_ms = 1000;
};

struct LogConfig {
    std::string log_path;                // empty = stderr only
    std::string level = "info";
};

struct AppConfig {
    NetworkConfig network;
    AdbConfig adb;
    PortConfig ports;
    StorageConfig storage;
    DispatchConfig dispatch;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    try {
        if (j.contains(section) && j[section].contains(key)) {
            return j[section][key].get<T>();
        }
    } catch (const nlohmann::json::exception& e) {
        ALOG_WARN("config", "%s.%s has wrong type (%s), using default",
                  section.c_str(), key.c_str(), e.what());
    }
    return def;
}

inline std::string defaultHistoryPath() {
    const char* home = std::getenv("HOME");
    std::string base = (home && home[0] != '\0') ? home : "/tmp";
    return base + "/.autolink/state.json";
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = "autolink.json",
                            bool strict = false) {
    AppConfig config;
    config.storage.history_path = defaultHistoryPath();

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("autolink.json");
    }
    if (!file.is_open()) {
        ALOG_INFO("config", "%s not found, using defaults", configPath.c_str());
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        const AppConfig def;

        config.network.http_server_port = jsonGet<int>(j, "network", "http_server_port", def.network.http_server_port);
        config.network.device_client_port = jsonGet<int>(j, "network", "device_client_port", def.network.device_client_port);
        config.network.device_adb_server_port = jsonGet<int>(j, "network", "device_adb_server_port", def.network.device_adb_server_port);
        config.network.connect_timeout_ms = jsonGet<int>(j, "network", "connect_timeout_ms", def.network.connect_timeout_ms);

        config.adb.adb_path = jsonGet<std::string>(j, "adb", "adb_path", def.adb.adb_path);
        config.adb.handshake_timeout_ms = jsonGet<int>(j, "adb", "handshake_timeout_ms", def.adb.handshake_timeout_ms);
        config.adb.exec_timeout_ms = jsonGet<int>(j, "adb", "exec_timeout_ms", def.adb.exec_timeout_ms);
        config.adb.debug_provider_uri = jsonGet<std::string>(j, "adb", "debug_provider_uri", def.adb.debug_provider_uri);

        config.ports.lease_window_ms = jsonGet<int>(j, "ports", "lease_window_ms", def.ports.lease_window_ms);

        config.storage.history_path = jsonGet<std::string>(j, "storage", "history_path", defaultHistoryPath());
        config.storage.history_key = jsonGet<std::string>(j, "storage", "history_key", def.storage.history_key);

        config.dispatch.rerun_delay_ms = jsonGet<int>(j, "dispatch", "rerun_delay_ms", def.dispatch.rerun_delay_ms);

        config.log.log_path = jsonGet<std::string>(j, "log", "log_path", def.log.log_path);
        config.log.level = jsonGet<std::string>(j, "log", "level", def.log.level);

    } catch (const nlohmann::json::exception& e) {
        ALOG_ERROR("config", "JSON parse error: %s", e.what());
        AppConfig fallback;
        fallback.storage.history_path = defaultHistoryPath();
        return fallback;
    }

    if (config.storage.history_path.empty()) {
        config.storage.history_path = defaultHistoryPath();
    }

    ALOG_INFO("config", "Loaded: http_port=%d, client_port=%d, adb_server_port=%d, adb=%s",
              config.network.http_server_port,
              config.network.device_client_port,
              config.network.device_adb_server_port,
              config.adb.adb_path.c_str());

    return config;
}

} // namespace config
} // namespace autolink
