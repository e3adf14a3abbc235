#include "transfer/transfer_engine_factory.hpp"
#include "transfer/rsync_engine.hpp"
#include "transfer/rclone_engine.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

TransferEngineFactory::TransferEngineFactory(const AppConfig& config)
    : config_(config) {
}

EngineOptions TransferEngineFactory::engineOptions(JobKind kind) const {
    EngineOptions options;
    options.binary = kind == JobKind::RSYNC ? config_.rsyncBinary : config_.rcloneBinary;
    options.retry.maxRetries = config_.maxRetryAttempts;
    options.retry.initialBackoff = std::chrono::milliseconds(config_.initialBackoffMs);
    options.retry.maxBackoff = std::chrono::milliseconds(config_.maxBackoffMs);
    options.stopGracePeriod = std::chrono::milliseconds(config_.stopGracePeriodMs);
    options.logDir = config_.logDir;
    return options;
}

std::shared_ptr<TransferEngine> TransferEngineFactory::createEngine(JobKind kind,
                                                                    const TransferRequest& request,
                                                                    EventSink sink) const {
    Logger::debug("Creating " + toString(kind) + " engine for job " + request.jobId +
                  " (" + toString(request.mode) + ")");

    switch (kind) {
        case JobKind::RSYNC:
            return std::make_shared<RsyncEngine>(request, engineOptions(kind), std::move(sink));
        case JobKind::RCLONE:
            return std::make_shared<RcloneEngine>(request, engineOptions(kind), std::move(sink));
    }
    Logger::error("Unsupported job kind for job " + request.jobId);
    return nullptr;
}

std::shared_ptr<FileStore> TransferEngineFactory::createFileStore(const std::string& path) const {
    if (utils::isRemotePath(path)) {
        return std::make_shared<RcloneFileStore>(config_.rcloneBinary, path);
    }
    return std::make_shared<LocalFileStore>(path);
}
