#pragma once

#include <string>
#include <mutex>
#include <atomic>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

class Logger {
public:
    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::INFO);
    static void shutdown();
    static void setLogLevel(LogLevel level);
    static void setConsoleOutput(bool enabled);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);
    static bool isInitialized() { return initialized_; }

    // Appends a timestamped line to an auxiliary log (per-job transfer output)
    static bool appendToFile(const std::string& path, const std::string& message);

    static bool parseLevel(const std::string& text, LogLevel& level);
    static std::string levelToString(LogLevel level);

private:
    static void log(LogLevel level, const std::string& message);
    static std::string timestamp();

    static std::mutex mutex_;
    static std::mutex fileMutex_;
    static LogLevel currentLevel_;
    static std::atomic<bool> initialized_;
    static bool consoleOutput_;
    static std::string logPath_;
};
