#pragma once

#include "transfer/transfer_engine.hpp"

// rclone family: cloud remotes in "remote:path" notation, one-line stats every second
class RcloneEngine : public TransferEngine {
public:
    RcloneEngine(TransferRequest request, EngineOptions options, EventSink sink);
    ~RcloneEngine() override;

    std::string toolName() const override { return "rclone"; }
    std::vector<std::string> buildCommand() const override;
    bool parseProgress(const std::string& line, ProgressSample& sample) const override;
    bool parseRemoval(const std::string& line, std::string& relativePath) const override;
    ExitClass classifyExit(int exitCode, const std::vector<std::string>& recentOutput) const override;
    std::string destinationRoot() const override { return request_.destination; }

    // "1.234 MiB" style sizes; binary (KiB) and decimal (KB) units
    static uint64_t parseSize(const std::string& value, const std::string& unit);
    // "1h2m3s"; "-" and empty mean unknown
    static bool parseEta(const std::string& text, uint64_t& seconds);
};
