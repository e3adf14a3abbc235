#pragma once

#include <string>
#include <cstdint>
#include <mutex>

// Per-job audit trail of source deletions: <log_dir>/deletions_<job id>.log
class DeletionLogger {
public:
    DeletionLogger(const std::string& logDir, const std::string& jobId);

    bool logDeletionStart(const std::string& mode, uint64_t totalFiles = 0);
    bool logDeletion(const std::string& path, uint64_t size, const std::string& extraInfo = "");
    bool logVerificationStart();
    bool logMismatch(const std::string& path, const std::string& reason);
    bool logVerificationResult(bool passed, const std::string& details = "");
    bool logError(const std::string& message);
    bool logDeletionComplete(uint64_t filesDeleted, uint64_t bytesDeleted, uint64_t errors = 0);

    // Number of DELETED entries currently in the log
    uint64_t getDeletionCount() const;

    const std::string& getLogPath() const { return logPath_; }

private:
    bool write(const std::string& text) const;

    std::string jobId_;
    std::string logPath_;
    mutable std::mutex mutex_;
};
