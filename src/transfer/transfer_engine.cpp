#include "transfer/transfer_engine.hpp"
#include "common/logger.hpp"
#include "common/thread_utils.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <algorithm>

namespace {
const size_t kRecentOutputLines = 50;
}

std::string toString(OperationMode mode) {
    switch (mode) {
        case OperationMode::COPY: return "copy";
        case OperationMode::MOVE: return "move";
    }
    return "unknown";
}

std::string toString(EngineEventType type) {
    switch (type) {
        case EngineEventType::PROGRESS:     return "progress";
        case EngineEventType::FILE_REMOVED: return "file_removed";
        case EngineEventType::RETRYING:     return "retrying";
        case EngineEventType::COMPLETED:    return "completed";
        case EngineEventType::FAILED:       return "failed";
        case EngineEventType::STOPPED:      return "stopped";
    }
    return "unknown";
}

TransferEngine::TransferEngine(TransferRequest request, EngineOptions options, EventSink sink)
    : request_(std::move(request))
    , options_(std::move(options))
    , sink_(std::move(sink)) {
}

TransferEngine::~TransferEngine() {
    // Tool family overrides are gone by now; only the process is torn down here
    stopRequested_ = true;
    stateChanged_.notify_all();
    auto process = currentProcess();
    if (process) {
        process->kill();
    }
    joinMonitor();
}

void TransferEngine::halt() {
    if (isRunning()) {
        stop();
    }
    joinMonitor();
}

bool TransferEngine::start() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (outcome_ != EngineOutcome::IDLE) {
            lastError_ = "Engine already started";
            return false;
        }
    }

    toolName_ = toolName();
    if (!options_.logDir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(options_.logDir, ec);
        if (ec) {
            Logger::warning("Cannot create transfer log directory " + options_.logDir + ": " + ec.message());
        } else {
            logPath_ = (std::filesystem::path(options_.logDir) /
                        (toolName_ + "_" + request_.jobId + ".log")).string();
        }
    }

    if (!launch()) {
        std::lock_guard<std::mutex> lock(stateMutex_);
        outcome_ = EngineOutcome::FAILED;
        exited_ = true;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        outcome_ = EngineOutcome::RUNNING;
    }
    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        progress_.lastError.clear();
    }

    monitorThread_ = std::thread(&TransferEngine::monitorLoop, this);
    return true;
}

bool TransferEngine::launch() {
    std::lock_guard<std::mutex> lock(processMutex_);
    if (stopRequested_) {
        return false;
    }

    auto command = buildCommand();
    launches_.push_back(command);
    logLine("Starting " + toolName_ + ": " + utils::joinCommand(command));
    Logger::info("Job " + request_.jobId + ": launching " + utils::joinCommand(command));

    auto process = std::make_shared<ChildProcess>();
    if (!process->spawn(command)) {
        std::string error = process->getLastError();
        logLine("Error starting " + toolName_ + ": " + error);
        Logger::error("Job " + request_.jobId + ": " + error);
        std::lock_guard<std::mutex> stateLock(stateMutex_);
        lastError_ = error;
        return false;
    }
    process_ = process;
    return true;
}

void TransferEngine::monitorLoop() {
    int retryCount = 0;

    while (true) {
        auto process = currentProcess();
        std::string line;
        while (process->readLine(line)) {
            if (line.empty()) {
                continue;
            }
            logLine(line);

            ProgressSample sample;
            if (parseProgress(line, sample) && !sample.empty()) {
                applySample(sample);
                emit(EngineEventType::PROGRESS);
            }

            std::string removed;
            if (request_.mode == OperationMode::MOVE && parseRemoval(line, removed)) {
                emit(EngineEventType::FILE_REMOVED, removed);
            }

            std::lock_guard<std::mutex> lock(progressMutex_);
            recentOutput_.push_back(utils::toLower(line));
            if (recentOutput_.size() > kRecentOutputLines) {
                recentOutput_.pop_front();
            }
        }

        int exitCode = process->wait();

        if (exitCode == 0) {
            {
                std::lock_guard<std::mutex> lock(progressMutex_);
                progress_.percent = 100;
                progress_.etaSeconds = 0;
                if (!progress_.totalBytes) {
                    progress_.totalBytes = progress_.bytesTransferred;
                }
            }
            logLine(toolName_ + " completed successfully");
            finish(EngineOutcome::COMPLETED, "");
            emit(EngineEventType::COMPLETED, "", "", exitCode);
            return;
        }

        if (stopRequested_) {
            logLine(toolName_ + " stopped by request (code " + std::to_string(exitCode) + ")");
            finish(EngineOutcome::STOPPED, "");
            emit(EngineEventType::STOPPED, "", "", exitCode);
            return;
        }

        std::vector<std::string> recent;
        {
            std::lock_guard<std::mutex> lock(progressMutex_);
            recent.assign(recentOutput_.begin(), recentOutput_.end());
        }

        ExitClass exitClass = classifyExit(exitCode, recent);
        if (exitClass == ExitClass::SUCCESS) {
            logLine(toolName_ + " finished with code " + std::to_string(exitCode) + " treated as success");
            finish(EngineOutcome::COMPLETED, "");
            emit(EngineEventType::COMPLETED, "", "", exitCode);
            return;
        }

        std::string reason = toolName_ + " exited with code " + std::to_string(exitCode);
        if (!recent.empty()) {
            reason += ": " + recent.back();
        }

        if (exitClass == ExitClass::FATAL) {
            logLine(reason);
            Logger::error("Job " + request_.jobId + ": fatal transfer error, " + reason);
            finish(EngineOutcome::FAILED, reason);
            emit(EngineEventType::FAILED, "", reason, exitCode);
            return;
        }

        if (retryCount >= options_.retry.maxRetries) {
            std::string message = reason + " (max retries " +
                std::to_string(options_.retry.maxRetries) + " exceeded)";
            logLine(message);
            Logger::error("Job " + request_.jobId + ": " + message);
            finish(EngineOutcome::FAILED, message);
            emit(EngineEventType::FAILED, "", message, exitCode);
            return;
        }

        auto delay = ThreadUtils::backoffDelay(retryCount, options_.retry.initialBackoff,
                                               options_.retry.maxBackoff);
        ++retryCount;
        {
            std::lock_guard<std::mutex> lock(progressMutex_);
            progress_.retryCount = retryCount;
            progress_.lastError = reason;
            recentOutput_.clear();
        }
        logLine("Network error (" + reason + "), retrying in " + std::to_string(delay.count()) +
                "ms (attempt " + std::to_string(retryCount) + "/" +
                std::to_string(options_.retry.maxRetries) + ")");
        Logger::warning("Job " + request_.jobId + ": transient failure, retry " +
                        std::to_string(retryCount) + "/" + std::to_string(options_.retry.maxRetries));
        emit(EngineEventType::RETRYING, "", reason, exitCode);

        if (!waitForBackoff(delay)) {
            logLine(toolName_ + " retry cancelled by stop request");
            finish(EngineOutcome::STOPPED, "");
            emit(EngineEventType::STOPPED, "", "", exitCode);
            return;
        }

        if (!launch()) {
            if (stopRequested_) {
                finish(EngineOutcome::STOPPED, "");
                emit(EngineEventType::STOPPED);
                return;
            }
            std::string message = "Failed to restart " + toolName_ + ": " + getLastError();
            finish(EngineOutcome::FAILED, message);
            emit(EngineEventType::FAILED, "", message, exitCode);
            return;
        }
    }
}

void TransferEngine::applySample(const ProgressSample& sample) {
    std::lock_guard<std::mutex> lock(progressMutex_);

    if (sample.bytesTransferred) {
        progress_.bytesTransferred = *sample.bytesTransferred;
    }
    if (sample.percent) {
        progress_.percent = std::max(0, std::min(100, *sample.percent));
    }
    if (sample.speedBytes) {
        progress_.speedBytes = *sample.speedBytes;
    }
    if (sample.etaSeconds) {
        progress_.etaSeconds = *sample.etaSeconds;
    }

    // The total is fixed the first time it becomes known and never recomputed
    if (!progress_.totalBytes) {
        if (sample.totalBytes && *sample.totalBytes > 0) {
            progress_.totalBytes = *sample.totalBytes;
        } else if (progress_.percent > 0 && progress_.bytesTransferred > 0) {
            progress_.totalBytes = progress_.bytesTransferred * 100 / static_cast<uint64_t>(progress_.percent);
        }
    }
}

void TransferEngine::emit(EngineEventType type, const std::string& path,
                          const std::string& message, int exitCode) {
    if (!sink_) {
        return;
    }
    EngineEvent event;
    event.type = type;
    event.jobId = request_.jobId;
    event.runId = request_.runId;
    event.progress = getProgress();
    event.path = path;
    event.message = message;
    event.exitCode = exitCode;
    sink_(std::move(event));
}

void TransferEngine::finish(EngineOutcome outcome, const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        if (!error.empty()) {
            progress_.lastError = error;
        }
        progress_.speedBytes = 0;
    }
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        outcome_ = outcome;
        exited_ = true;
        if (!error.empty()) {
            lastError_ = error;
        }
    }
    stateChanged_.notify_all();
}

bool TransferEngine::waitForBackoff(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(stateMutex_);
    stateChanged_.wait_for(lock, delay, [this] { return stopRequested_.load(); });
    return !stopRequested_;
}

bool TransferEngine::stop() {
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        running = outcome_ == EngineOutcome::RUNNING;
        if (running) {
            stopRequested_ = true;
        }
    }
    if (!running) {
        joinMonitor();
        return false;
    }
    stateChanged_.notify_all();

    Logger::info("Job " + request_.jobId + ": stopping " + toolName_);
    auto process = currentProcess();
    if (process) {
        process->terminate();
    }

    std::unique_lock<std::mutex> lock(stateMutex_);
    if (!stateChanged_.wait_for(lock, options_.stopGracePeriod, [this] { return exited_; })) {
        lock.unlock();
        Logger::warning("Job " + request_.jobId + ": " + toolName_ +
                        " did not exit within grace period, killing");
        process = currentProcess();
        if (process) {
            process->kill();
        }
        lock.lock();
        if (!stateChanged_.wait_for(lock, options_.stopGracePeriod, [this] { return exited_; })) {
            Logger::error("Job " + request_.jobId + ": " + toolName_ +
                          " still not reaped after SIGKILL");
        }
    }
    lock.unlock();

    joinMonitor();
    return true;
}

bool TransferEngine::isRunning() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return outcome_ == EngineOutcome::RUNNING;
}

bool TransferEngine::hasExited() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return exited_;
}

EngineOutcome TransferEngine::getOutcome() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return outcome_;
}

JobProgress TransferEngine::getProgress() const {
    std::lock_guard<std::mutex> lock(progressMutex_);
    return progress_;
}

std::vector<std::vector<std::string>> TransferEngine::getLaunchHistory() const {
    std::lock_guard<std::mutex> lock(processMutex_);
    return launches_;
}

std::string TransferEngine::getLastError() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastError_;
}

bool TransferEngine::outputContains(const std::vector<std::string>& recentOutput,
                                    const std::vector<std::string>& patterns) {
    for (const auto& line : recentOutput) {
        for (const auto& pattern : patterns) {
            if (line.find(pattern) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

void TransferEngine::logLine(const std::string& line) {
    if (!logPath_.empty()) {
        Logger::appendToFile(logPath_, line);
    }
}

void TransferEngine::joinMonitor() {
    std::lock_guard<std::mutex> lock(joinMutex_);
    if (!monitorThread_.joinable()) {
        return;
    }
    if (monitorThread_.get_id() == std::this_thread::get_id()) {
        monitorThread_.detach();
    } else {
        monitorThread_.join();
    }
}

std::shared_ptr<ChildProcess> TransferEngine::currentProcess() const {
    std::lock_guard<std::mutex> lock(processMutex_);
    return process_;
}
