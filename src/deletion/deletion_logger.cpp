#include "deletion/deletion_logger.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <fstream>

namespace {
const std::string kSeparator(80, '=');
}

DeletionLogger::DeletionLogger(const std::string& logDir, const std::string& jobId)
    : jobId_(jobId) {
    std::error_code ec;
    std::filesystem::create_directories(logDir, ec);
    if (ec) {
        Logger::warning("Cannot create deletion log directory " + logDir + ": " + ec.message());
    }
    logPath_ = (std::filesystem::path(logDir) / ("deletions_" + jobId + ".log")).string();
}

bool DeletionLogger::write(const std::string& text) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!Logger::appendToFile(logPath_, text)) {
        Logger::warning("Failed to write deletion log " + logPath_);
        return false;
    }
    return true;
}

bool DeletionLogger::logDeletionStart(const std::string& mode, uint64_t totalFiles) {
    std::string entry = "DELETION STARTED\n" + kSeparator + "\nMode: " + mode + "\n";
    if (totalFiles > 0) {
        entry += "Estimated files: " + std::to_string(totalFiles) + "\n";
    }
    entry += "Job ID: " + jobId_ + "\n" + kSeparator;
    return write(entry);
}

bool DeletionLogger::logDeletion(const std::string& path, uint64_t size, const std::string& extraInfo) {
    std::string entry = "DELETED: " + path + " (size: " + utils::formatBytes(size) + ")";
    if (!extraInfo.empty()) {
        entry += " | " + extraInfo;
    }
    return write(entry);
}

bool DeletionLogger::logVerificationStart() {
    return write("VERIFICATION STARTED - Checking backup integrity before deletion");
}

bool DeletionLogger::logMismatch(const std::string& path, const std::string& reason) {
    return write("MISMATCH: " + path + " - " + reason);
}

bool DeletionLogger::logVerificationResult(bool passed, const std::string& details) {
    std::string entry = std::string("VERIFICATION ") + (passed ? "PASSED" : "FAILED");
    if (!details.empty()) {
        entry += " - " + details;
    }
    return write(entry);
}

bool DeletionLogger::logError(const std::string& message) {
    return write("ERROR: " + message);
}

bool DeletionLogger::logDeletionComplete(uint64_t filesDeleted, uint64_t bytesDeleted, uint64_t errors) {
    std::string entry = "DELETION COMPLETED\n" + kSeparator +
                        "\nFiles deleted: " + std::to_string(filesDeleted) +
                        "\nTotal size freed: " + utils::formatBytes(bytesDeleted) + "\n";
    if (errors > 0) {
        entry += "Errors: " + std::to_string(errors) + "\n";
    }
    entry += kSeparator;
    return write(entry);
}

uint64_t DeletionLogger::getDeletionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream file(logPath_);
    if (!file.is_open()) {
        return 0;
    }
    uint64_t count = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (line.find("] DELETED: ") != std::string::npos) {
            ++count;
        }
    }
    return count;
}
