#include "common/config.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>

using json = nlohmann::json;

AppConfig defaultConfig() {
    AppConfig config;
    const char* home = std::getenv("HOME");
    std::filesystem::path base = std::filesystem::path(home ? home : "/tmp") / ".jobpilot";

    config.storagePath = (base / "jobs.json").string();
    config.logDir = (base / "logs").string();
    config.logPath = (base / "logs" / "jobpilot.log").string();
    return config;
}

namespace {

template<typename T>
void readKey(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j.at(key).is_null()) {
        target = j.at(key).get<T>();
    }
}

} // namespace

bool loadConfig(const std::string& path, AppConfig& config, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Failed to open config file: " + path;
        return false;
    }

    try {
        json j;
        file >> j;
        if (!j.is_object()) {
            error = "Config file must contain a JSON object: " + path;
            return false;
        }

        bool logPathSet = j.contains("log_path");
        readKey(j, "storage_path", config.storagePath);
        readKey(j, "log_dir", config.logDir);
        readKey(j, "log_path", config.logPath);
        if (!logPathSet && j.contains("log_dir")) {
            config.logPath = (std::filesystem::path(config.logDir) / "jobpilot.log").string();
        }

        if (j.contains("log_level")) {
            std::string level = j.at("log_level").get<std::string>();
            if (!Logger::parseLevel(level, config.logLevel)) {
                error = "Unknown log level: " + level;
                return false;
            }
        }

        readKey(j, "rsync_binary", config.rsyncBinary);
        readKey(j, "rclone_binary", config.rcloneBinary);
        readKey(j, "max_retry_attempts", config.maxRetryAttempts);
        readKey(j, "initial_backoff_ms", config.initialBackoffMs);
        readKey(j, "max_backoff_ms", config.maxBackoffMs);
        readKey(j, "stop_grace_period_ms", config.stopGracePeriodMs);
        readKey(j, "engine_retention_seconds", config.engineRetentionSeconds);
        readKey(j, "max_retained_engines", config.maxRetainedEngines);
        readKey(j, "persistence_retries", config.persistenceRetries);
        readKey(j, "persistence_backoff_ms", config.persistenceBackoffMs);
        readKey(j, "storage_lock_timeout_ms", config.storageLockTimeoutMs);
        readKey(j, "event_interval_ms", config.eventIntervalMs);
        readKey(j, "progress_persist_interval_ms", config.progressPersistIntervalMs);
        readKey(j, "channel_capacity", config.channelCapacity);
        readKey(j, "default_bandwidth_limit_kbps", config.defaultBandwidthLimitKbps);
    } catch (const json::exception& e) {
        error = "Invalid config file " + path + ": " + e.what();
        return false;
    }

    if (config.maxRetryAttempts < 0 || config.channelCapacity <= 0 ||
        config.maxRetainedEngines < 0 || config.persistenceRetries < 0) {
        error = "Config values must not be negative";
        return false;
    }
    return true;
}
