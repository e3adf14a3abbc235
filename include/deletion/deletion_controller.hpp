#pragma once

#include "common/job.hpp"
#include "common/result.hpp"
#include "deletion/file_store.hpp"
#include "deletion/deletion_logger.hpp"
#include <string>
#include <memory>
#include <functional>
#include <map>
#include <mutex>
#include <atomic>
#include <chrono>

// Guards the irreversible removal of a job's source data.
//
// verify_then_delete: verifyThenDelete() runs once after a successful
// transfer. Every source file must exist at the destination with the same
// size (and SHA-256 in checksum mode) before the first file is removed; one
// mismatch blocks all deletion.
//
// per_file: the transfer tool removes sources itself. beginPerFile()
// captures a size manifest, recordRemoval() accounts for each reported
// removal, finishPerFile() closes the phase.
class DeletionController {
public:
    using ProgressCallback = std::function<void(const DeletionProgress&)>;

    DeletionController(const std::string& jobId,
                       std::shared_ptr<FileStore> source,
                       std::shared_ptr<FileStore> destination,
                       DeletionMode mode,
                       VerificationMode verification,
                       std::shared_ptr<DeletionLogger> logger,
                       const DeletionProgress& initial = DeletionProgress());

    DeletionController(const DeletionController&) = delete;
    DeletionController& operator=(const DeletionController&) = delete;

    // Throttled: at most one call per interval unless fileStep files were
    // processed; phase changes and the final state are always reported
    void setProgressCallback(ProgressCallback callback);
    void setProgressThrottle(std::chrono::milliseconds interval, uint64_t fileStep);

    Result verifyThenDelete();

    Result beginPerFile();
    void recordRemoval(const std::string& relativePath);
    Result finishPerFile(bool transferSucceeded);

    // Stops a running verify/delete pass before the next file
    void cancel();

    DeletionProgress getProgress() const;

private:
    void setPhase(DeletionPhase phase, const std::string& error = "");
    void report(bool force);
    Result fail(ErrorCode code, const std::string& message);
    std::string sourcePath(const std::string& relativePath) const;

    std::string jobId_;
    std::shared_ptr<FileStore> source_;
    std::shared_ptr<FileStore> destination_;
    DeletionMode mode_;
    VerificationMode verification_;
    std::shared_ptr<DeletionLogger> logger_;

    DeletionProgress progress_;
    std::map<std::string, uint64_t> manifest_;
    mutable std::mutex mutex_;

    ProgressCallback callback_;
    std::chrono::milliseconds reportInterval_{1000};
    uint64_t reportFileStep_{50};
    std::chrono::steady_clock::time_point lastReport_;
    uint64_t filesAtLastReport_{0};
    std::mutex reportMutex_;

    std::atomic<bool> cancelled_{false};
};
