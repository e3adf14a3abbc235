#pragma once

#include "common/logger.hpp"
#include <string>
#include <cstdint>

// Application settings; every key has a default so the config file is optional
struct AppConfig {
    std::string storagePath;
    std::string logDir;
    std::string logPath;
    LogLevel logLevel = LogLevel::INFO;

    std::string rsyncBinary = "rsync";
    std::string rcloneBinary = "rclone";

    int maxRetryAttempts = 10;
    int initialBackoffMs = 1000;
    int maxBackoffMs = 60000;
    int stopGracePeriodMs = 5000;

    int engineRetentionSeconds = 300;
    int maxRetainedEngines = 16;

    int persistenceRetries = 3;
    int persistenceBackoffMs = 100;
    int storageLockTimeoutMs = 2000;

    int eventIntervalMs = 500;
    int progressPersistIntervalMs = 2000;
    int channelCapacity = 256;

    uint64_t defaultBandwidthLimitKbps = 0;  // 0 = unlimited
};

// Defaults rooted at $HOME/.jobpilot
AppConfig defaultConfig();

// Overlays the keys present in a JSON file on top of the defaults.
// Returns false and fills error when the file cannot be read or parsed.
bool loadConfig(const std::string& path, AppConfig& config, std::string& error);
