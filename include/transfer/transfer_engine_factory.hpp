#pragma once

#include "common/config.hpp"
#include "common/job.hpp"
#include "transfer/transfer_engine.hpp"
#include "deletion/file_store.hpp"
#include <memory>
#include <string>

// Builds the engine and file stores for a job kind. Virtual so callers can
// substitute tool binaries or stores.
class TransferEngineFactory {
public:
    explicit TransferEngineFactory(const AppConfig& config);
    virtual ~TransferEngineFactory() = default;

    virtual std::shared_ptr<TransferEngine> createEngine(JobKind kind,
                                                         const TransferRequest& request,
                                                         EventSink sink) const;

    // LocalFileStore for local paths, RcloneFileStore for remotes
    virtual std::shared_ptr<FileStore> createFileStore(const std::string& path) const;

    EngineOptions engineOptions(JobKind kind) const;

protected:
    AppConfig config_;
};
