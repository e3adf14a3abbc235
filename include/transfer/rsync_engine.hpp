#pragma once

#include "transfer/transfer_engine.hpp"

// rsync family: local and ssh paths, progress from --info=progress2
class RsyncEngine : public TransferEngine {
public:
    RsyncEngine(TransferRequest request, EngineOptions options, EventSink sink);
    ~RsyncEngine() override;

    std::string toolName() const override { return "rsync"; }
    std::vector<std::string> buildCommand() const override;
    bool parseProgress(const std::string& line, ProgressSample& sample) const override;
    bool parseRemoval(const std::string& line, std::string& relativePath) const override;
    ExitClass classifyExit(int exitCode, const std::vector<std::string>& recentOutput) const override;
    std::string destinationRoot() const override;

    // "10.50MB/s" style rate with 1024-based units
    static uint64_t parseRate(const std::string& value, const std::string& unit);
};
