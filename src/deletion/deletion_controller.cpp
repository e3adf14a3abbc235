#include "deletion/deletion_controller.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <unordered_map>

DeletionController::DeletionController(const std::string& jobId,
                                       std::shared_ptr<FileStore> source,
                                       std::shared_ptr<FileStore> destination,
                                       DeletionMode mode,
                                       VerificationMode verification,
                                       std::shared_ptr<DeletionLogger> logger,
                                       const DeletionProgress& initial)
    : jobId_(jobId)
    , source_(std::move(source))
    , destination_(std::move(destination))
    , mode_(mode)
    , verification_(verification)
    , logger_(std::move(logger))
    , progress_(initial) {
    progress_.errors = 0;
    progress_.lastError.clear();
}

void DeletionController::setProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(reportMutex_);
    callback_ = std::move(callback);
}

void DeletionController::setProgressThrottle(std::chrono::milliseconds interval, uint64_t fileStep) {
    std::lock_guard<std::mutex> lock(reportMutex_);
    reportInterval_ = interval;
    reportFileStep_ = fileStep == 0 ? 1 : fileStep;
}

DeletionProgress DeletionController::getProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

void DeletionController::cancel() {
    cancelled_ = true;
}

std::string DeletionController::sourcePath(const std::string& relativePath) const {
    std::string root = source_->root();
    if (root.empty() || root.back() == '/' || root.back() == ':') {
        return root + relativePath;
    }
    return root + "/" + relativePath;
}

void DeletionController::setPhase(DeletionPhase phase, const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        progress_.phase = phase;
        if (!error.empty()) {
            progress_.lastError = error;
        }
    }
    Logger::info("Job " + jobId_ + ": deletion phase " + toString(phase));
    report(true);
}

void DeletionController::report(bool force) {
    DeletionProgress snapshot = getProgress();

    std::lock_guard<std::mutex> lock(reportMutex_);
    if (!callback_) {
        return;
    }
    auto now = std::chrono::steady_clock::now();
    if (!force && now - lastReport_ < reportInterval_ &&
        snapshot.filesDeleted - filesAtLastReport_ < reportFileStep_) {
        return;
    }
    lastReport_ = now;
    filesAtLastReport_ = snapshot.filesDeleted;
    callback_(snapshot);
}

Result DeletionController::fail(ErrorCode code, const std::string& message) {
    Logger::error("Job " + jobId_ + ": " + message);
    logger_->logError(message);
    setPhase(DeletionPhase::FAILED, message);
    return Result::failure(code, message);
}

Result DeletionController::verifyThenDelete() {
    if (mode_ != DeletionMode::VERIFY_THEN_DELETE) {
        return Result::failure(ErrorCode::VALIDATION, "Deletion controller is not in verify_then_delete mode");
    }

    setPhase(DeletionPhase::VERIFYING);
    logger_->logVerificationStart();

    std::vector<FileEntry> sourceFiles;
    if (!source_->listFiles(sourceFiles)) {
        return fail(ErrorCode::VERIFICATION, "Failed to list source: " + source_->getLastError());
    }
    std::vector<FileEntry> destinationFiles;
    if (!destination_->listFiles(destinationFiles)) {
        return fail(ErrorCode::VERIFICATION, "Failed to list destination: " + destination_->getLastError());
    }

    std::unordered_map<std::string, uint64_t> destinationSizes;
    for (const auto& entry : destinationFiles) {
        destinationSizes[entry.relativePath] = entry.size;
    }

    uint64_t mismatches = 0;
    for (const auto& entry : sourceFiles) {
        if (cancelled_) {
            logger_->logVerificationResult(false, "cancelled");
            return fail(ErrorCode::CONCURRENCY, "Deletion cancelled during verification");
        }

        std::string reason;
        auto it = destinationSizes.find(entry.relativePath);
        if (it == destinationSizes.end()) {
            reason = "missing in destination";
        } else if (it->second != entry.size) {
            reason = "size mismatch (source " + std::to_string(entry.size) +
                     " bytes, destination " + std::to_string(it->second) + " bytes)";
        } else if (verification_ == VerificationMode::CHECKSUM) {
            std::string sourceHash;
            std::string destinationHash;
            if (!source_->checksum(entry.relativePath, sourceHash)) {
                reason = "source checksum unavailable: " + source_->getLastError();
            } else if (!destination_->checksum(entry.relativePath, destinationHash)) {
                reason = "destination checksum unavailable: " + destination_->getLastError();
            } else if (sourceHash != destinationHash) {
                reason = "checksum mismatch";
            }
        }

        if (!reason.empty()) {
            ++mismatches;
            logger_->logMismatch(entry.relativePath, reason);
            Logger::error("Job " + jobId_ + ": verification mismatch for " +
                          entry.relativePath + ": " + reason);
        }
    }

    if (mismatches > 0) {
        std::string message = "Verification failed: " + std::to_string(mismatches) + " of " +
                              std::to_string(sourceFiles.size()) +
                              " files missing or mismatched in destination; no files deleted";
        logger_->logVerificationResult(false, message);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            progress_.errors = mismatches;
        }
        return fail(ErrorCode::VERIFICATION, message);
    }

    logger_->logVerificationResult(true, std::to_string(sourceFiles.size()) + " files verified");
    logger_->logDeletionStart(toString(mode_), sourceFiles.size());
    setPhase(DeletionPhase::DELETING);

    for (const auto& entry : sourceFiles) {
        if (cancelled_) {
            break;
        }
        if (source_->removeFile(entry.relativePath)) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                progress_.filesDeleted++;
                progress_.bytesDeleted += entry.size;
            }
            logger_->logDeletion(sourcePath(entry.relativePath), entry.size);
        } else {
            std::string error = source_->getLastError();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                progress_.errors++;
                progress_.lastError = error;
            }
            logger_->logError(error);
            Logger::error("Job " + jobId_ + ": " + error);
        }
        report(false);
    }

    if (!source_->removeEmptyDirectories()) {
        Logger::warning("Job " + jobId_ + ": empty directory cleanup failed: " + source_->getLastError());
    }

    DeletionProgress summary = getProgress();
    logger_->logDeletionComplete(summary.filesDeleted, summary.bytesDeleted, summary.errors);

    if (cancelled_) {
        return fail(ErrorCode::CONCURRENCY, "Deletion cancelled after " +
                    std::to_string(summary.filesDeleted) + " files");
    }
    if (summary.errors > 0) {
        return fail(ErrorCode::VERIFICATION, std::to_string(summary.errors) + " files could not be removed");
    }

    Logger::info("Job " + jobId_ + ": deleted " + std::to_string(summary.filesDeleted) +
                 " source files (" + utils::formatBytes(summary.bytesDeleted) + ")");
    setPhase(DeletionPhase::COMPLETED);
    return Result::success();
}

Result DeletionController::beginPerFile() {
    if (mode_ != DeletionMode::PER_FILE) {
        return Result::failure(ErrorCode::VALIDATION, "Deletion controller is not in per_file mode");
    }

    std::vector<FileEntry> files;
    if (source_->listFiles(files)) {
        std::lock_guard<std::mutex> lock(mutex_);
        manifest_.clear();
        for (const auto& entry : files) {
            manifest_[entry.relativePath] = entry.size;
        }
    } else {
        Logger::warning("Job " + jobId_ + ": cannot capture source manifest, deleted sizes unknown: " +
                        source_->getLastError());
    }

    uint64_t estimated = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        estimated = manifest_.size();
    }
    logger_->logDeletionStart(toString(mode_), estimated);
    setPhase(DeletionPhase::TRANSFERRING);
    return Result::success();
}

void DeletionController::recordRemoval(const std::string& relativePath) {
    uint64_t size = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = manifest_.find(relativePath);
        if (it != manifest_.end()) {
            size = it->second;
            manifest_.erase(it);
        }
        progress_.filesDeleted++;
        progress_.bytesDeleted += size;
    }
    logger_->logDeletion(sourcePath(relativePath), size, "removed after transfer");
    report(false);
}

Result DeletionController::finishPerFile(bool transferSucceeded) {
    if (!transferSucceeded) {
        DeletionProgress current = getProgress();
        logger_->logDeletionComplete(current.filesDeleted, current.bytesDeleted, current.errors);
        return fail(ErrorCode::FATAL_ENGINE, "Transfer failed after " +
                    std::to_string(current.filesDeleted) + " source files were removed");
    }

    if (source_->isRemote() && !source_->removeEmptyDirectories()) {
        // Leftover empty directories never fail the job
        std::string error = "Empty directory cleanup failed: " + source_->getLastError();
        Logger::warning("Job " + jobId_ + ": " + error);
        logger_->logError(error);
    }

    DeletionProgress summary = getProgress();
    logger_->logDeletionComplete(summary.filesDeleted, summary.bytesDeleted, summary.errors);
    setPhase(DeletionPhase::COMPLETED);
    return Result::success();
}
