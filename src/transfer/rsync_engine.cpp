#include "transfer/rsync_engine.hpp"
#include <regex>
#include <filesystem>
#include <algorithm>

namespace {

// rsync exit codes that indicate a broken connection
const std::vector<int> kNetworkExitCodes = {10, 12, 30, 35, 255};

// Configuration, protocol and local resource errors; retrying cannot help
const std::vector<int> kFatalExitCodes = {1, 2, 3, 4, 6, 11, 13, 14, 21, 22, 25, 126, 127};

const std::vector<std::string> kNetworkPatterns = {
    "connection refused",
    "connection reset",
    "connection timed out",
    "network is unreachable",
    "no route to host",
    "temporary failure",
    "timeout",
    "broken pipe",
    "connection unexpectedly closed",
    "too many open files"
};

const std::vector<std::string> kFatalPatterns = {
    "permission denied",
    "no space left on device",
    "disk quota exceeded",
    "read-only file system"
};

bool contains(const std::vector<int>& codes, int code) {
    return std::find(codes.begin(), codes.end(), code) != codes.end();
}

uint64_t parseGroupedNumber(const std::string& text) {
    std::string digits;
    for (char c : text) {
        if (c != ',') {
            digits += c;
        }
    }
    return digits.empty() ? 0 : std::stoull(digits);
}

} // namespace

RsyncEngine::RsyncEngine(TransferRequest request, EngineOptions options, EventSink sink)
    : TransferEngine(std::move(request), std::move(options), std::move(sink)) {
}

RsyncEngine::~RsyncEngine() {
    halt();
}

std::vector<std::string> RsyncEngine::buildCommand() const {
    std::vector<std::string> command = {
        options_.binary.empty() ? "rsync" : options_.binary,
        "-a",
        "--partial",
        "--no-inc-recursive"
    };

    if (request_.mode == OperationMode::MOVE) {
        command.push_back("--info=progress2,remove1");
        command.push_back("--remove-source-files");
    } else {
        command.push_back("--info=progress2");
    }
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

uint64_t RsyncEngine::parseRate(const std::string& value, const std::string& unit) {
    double rate = 0;
    try {
        rate = std::stod(value);
    } catch (const std::exception&) {
        return 0;
    }

    std::string u = unit;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    if (u == "KB") {
        rate *= 1024.0;
    } else if (u == "MB") {
        rate *= 1024.0 * 1024.0;
    } else if (u == "GB") {
        rate *= 1024.0 * 1024.0 * 1024.0;
    } else if (u == "TB") {
        rate *= 1024.0 * 1024.0 * 1024.0 * 1024.0;
    }
    return static_cast<uint64_t>(rate);
}

// "    1,234,567  45%   10.50MB/s    0:00:05 (xfr#3, to-chk=2/10)"
bool RsyncEngine::parseProgress(const std::string& line, ProgressSample& sample) const {
    static const std::regex pattern(
        R"(^\s*([\d,]+)\s+(\d+)%\s+([\d.]+)([kKMGT]?B)/s\s+(\d+):(\d{2}):(\d{2}))");

    std::smatch match;
    if (!std::regex_search(line, match, pattern)) {
        return false;
    }

    try {
        sample.bytesTransferred = parseGroupedNumber(match[1].str());
        sample.percent = std::stoi(match[2].str());
        sample.speedBytes = parseRate(match[3].str(), match[4].str());
        sample.etaSeconds = std::stoull(match[5].str()) * 3600 +
                            std::stoull(match[6].str()) * 60 +
                            std::stoull(match[7].str());
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

// "sender removed dir/file.txt"; paths are relative to the transfer root,
// which includes the source directory name when the source has no trailing slash
bool RsyncEngine::parseRemoval(const std::string& line, std::string& relativePath) const {
    static const std::string marker = "sender removed ";
    auto pos = line.find(marker);
    if (pos == std::string::npos) {
        return false;
    }

    std::string path = line.substr(pos + marker.size());
    while (!path.empty() && (path.back() == ' ' || path.back() == '\t')) {
        path.pop_back();
    }
    if (path.empty()) {
        return false;
    }

    const std::string& source = request_.source;
    if (!source.empty() && source.back() != '/') {
        std::string prefix = std::filesystem::path(source).filename().string() + "/";
        if (path.compare(0, prefix.size(), prefix) == 0) {
            path = path.substr(prefix.size());
        }
    }
    relativePath = path;
    return true;
}

ExitClass RsyncEngine::classifyExit(int exitCode, const std::vector<std::string>& recentOutput) const {
    if (exitCode == 0) {
        return ExitClass::SUCCESS;
    }
    if (outputContains(recentOutput, kFatalPatterns)) {
        return ExitClass::FATAL;
    }
    if (contains(kNetworkExitCodes, exitCode) || outputContains(recentOutput, kNetworkPatterns)) {
        return ExitClass::TRANSIENT;
    }
    if (contains(kFatalExitCodes, exitCode)) {
        return ExitClass::FATAL;
    }
    // 23, 24 and unknown codes: retried until the cap
    return ExitClass::TRANSIENT;
}

std::string RsyncEngine::destinationRoot() const {
    const std::string& source = request_.source;
    if (!source.empty() && source.back() == '/') {
        return request_.destination;
    }
    auto name = std::filesystem::path(source).filename().string();
    return (std::filesystem::path(request_.destination) / name).string();
}
