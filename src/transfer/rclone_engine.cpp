#include "transfer/rclone_engine.hpp"
#include <regex>
#include <algorithm>
#include <cmath>
#include <cctype>

namespace {

// rclone exit 5: temporary error, more retries might fix it
const int kTemporaryExitCode = 5;

// Usage, missing paths, fatal and limit errors
const std::vector<int> kFatalExitCodes = {1, 3, 4, 6, 7, 8, 9, 126, 127};

const std::vector<std::string> kNetworkPatterns = {
    "connection refused",
    "connection reset",
    "connection timed out",
    "network is unreachable",
    "no route to host",
    "temporary failure",
    "timeout",
    "broken pipe",
    "i/o timeout",
    "tls handshake",
    "too many open files"
};

const std::vector<std::string> kFatalPatterns = {
    "permission denied",
    "no space left on device",
    "disk quota exceeded",
    "read-only file system",
    "didn't find section in config file",
    "access denied"
};

} // namespace

RcloneEngine::RcloneEngine(TransferRequest request, EngineOptions options, EventSink sink)
    : TransferEngine(std::move(request), std::move(options), std::move(sink)) {
}

RcloneEngine::~RcloneEngine() {
    halt();
}

std::vector<std::string> RcloneEngine::buildCommand() const {
    std::vector<std::string> command = {
        options_.binary.empty() ? "rclone" : options_.binary,
        request_.mode == OperationMode::MOVE ? "move" : "copy",
        "--stats", "1s",
        "--stats-one-line",
        "-v",
        // retries are driven by the engine, not by rclone
        "--retries", "1",
        "--low-level-retries", "3"
    };

    if (request_.compareChecksums) {
        command.push_back("--checksum");
    }
    if (request_.bandwidthLimitKbps && *request_.bandwidthLimitKbps > 0) {
        command.push_back("--bwlimit");
        command.push_back(std::to_string(*request_.bandwidthLimitKbps) + "k");
    }

    command.push_back(request_.source);
    command.push_back(request_.destination);
    return command;
}

uint64_t RcloneEngine::parseSize(const std::string& value, const std::string& unit) {
    double size = 0;
    try {
        size = std::stod(value);
    } catch (const std::exception&) {
        return 0;
    }

    double multiplier = 1.0;
    if (unit.size() >= 2 && unit != "Bytes") {
        bool binary = unit.find('i') != std::string::npos;
        double base = binary ? 1024.0 : 1000.0;
        switch (std::toupper(static_cast<unsigned char>(unit[0]))) {
            case 'K': multiplier = base; break;
            case 'M': multiplier = base * base; break;
            case 'G': multiplier = base * base * base; break;
            case 'T': multiplier = base * base * base * base; break;
            case 'P': multiplier = base * base * base * base * base; break;
            default: break;
        }
    }
    return static_cast<uint64_t>(std::llround(size * multiplier));
}

bool RcloneEngine::parseEta(const std::string& text, uint64_t& seconds) {
    static const std::regex component(R"((\d+)([dhms]))");
    if (text.empty() || text == "-") {
        return false;
    }

    uint64_t total = 0;
    bool found = false;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), component);
         it != std::sregex_iterator(); ++it) {
        uint64_t value = std::stoull((*it)[1].str());
        switch ((*it)[2].str()[0]) {
            case 'd': total += value * 86400; break;
            case 'h': total += value * 3600; break;
            case 'm': total += value * 60; break;
            default:  total += value; break;
        }
        found = true;
    }
    if (found) {
        seconds = total;
    }
    return found;
}

// "Transferred:   1.234 MiB / 10.234 MiB, 12%, 2.456 MiB/s, ETA 3s"
bool RcloneEngine::parseProgress(const std::string& line, ProgressSample& sample) const {
    static const std::regex pattern(
        R"(([\d.]+)\s*([KMGTP]?i?B|Bytes)\s*/\s*([\d.]+)\s*([KMGTP]?i?B|Bytes),\s*(\d+)%)"
        R"((?:,\s*([\d.]+)\s*([KMGTP]?i?B|Bytes)/s)?(?:,\s*ETA\s+(\S+))?)");

    std::smatch match;
    if (!std::regex_search(line, match, pattern)) {
        return false;
    }

    try {
        sample.bytesTransferred = parseSize(match[1].str(), match[2].str());
        uint64_t total = parseSize(match[3].str(), match[4].str());
        if (total > 0) {
            sample.totalBytes = total;
        }
        sample.percent = std::stoi(match[5].str());
        if (match[6].matched) {
            sample.speedBytes = parseSize(match[6].str(), match[7].str());
        }
        uint64_t eta = 0;
        if (match[8].matched && parseEta(match[8].str(), eta)) {
            sample.etaSeconds = eta;
        }
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

// "INFO  : dir/file.txt: Deleted" after a move, or a server-side move
bool RcloneEngine::parseRemoval(const std::string& line, std::string& relativePath) const {
    static const std::regex pattern(R"(INFO\s+:\s+(.+?):\s+(Deleted|Moved \(server-side\).*)$)");

    std::smatch match;
    if (!std::regex_search(line, match, pattern)) {
        return false;
    }
    relativePath = match[1].str();
    return !relativePath.empty();
}

ExitClass RcloneEngine::classifyExit(int exitCode, const std::vector<std::string>& recentOutput) const {
    if (exitCode == 0) {
        return ExitClass::SUCCESS;
    }
    if (outputContains(recentOutput, kFatalPatterns)) {
        return ExitClass::FATAL;
    }
    if (exitCode == kTemporaryExitCode || outputContains(recentOutput, kNetworkPatterns)) {
        return ExitClass::TRANSIENT;
    }
    if (std::find(kFatalExitCodes.begin(), kFatalExitCodes.end(), exitCode) != kFatalExitCodes.end()) {
        return ExitClass::FATAL;
    }
    // 2 (uncategorized) and unknown codes: retried until the cap
    return ExitClass::TRANSIENT;
}
