#pragma once

#include "common/job.hpp"
#include "transfer/child_process.hpp"
#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <optional>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <cstdint>

enum class OperationMode {
    COPY,
    MOVE   // source files are removed by the tool once transferred
};

enum class ExitClass {
    SUCCESS,
    TRANSIENT,
    FATAL
};

enum class EngineOutcome {
    IDLE,
    RUNNING,
    COMPLETED,
    FAILED,
    STOPPED
};

struct TransferRequest {
    std::string jobId;
    uint64_t runId{0};
    std::string source;
    std::string destination;
    std::optional<uint64_t> bandwidthLimitKbps;
    OperationMode mode{OperationMode::COPY};
    bool compareChecksums{false};
};

struct RetryPolicy {
    int maxRetries = 10;
    std::chrono::milliseconds initialBackoff{1000};
    std::chrono::milliseconds maxBackoff{60000};
};

struct EngineOptions {
    std::string binary;
    RetryPolicy retry;
    std::chrono::milliseconds stopGracePeriod{5000};
    std::string logDir;  // per-job transfer logs; empty disables them
};

// Fields recognised in one line of tool output
struct ProgressSample {
    std::optional<uint64_t> bytesTransferred;
    std::optional<uint64_t> totalBytes;
    std::optional<int> percent;
    std::optional<uint64_t> speedBytes;
    std::optional<uint64_t> etaSeconds;

    bool empty() const {
        return !bytesTransferred && !totalBytes && !percent && !speedBytes && !etaSeconds;
    }
};

enum class EngineEventType {
    PROGRESS,
    FILE_REMOVED,
    RETRYING,
    COMPLETED,
    FAILED,
    STOPPED
};

struct EngineEvent {
    EngineEventType type{EngineEventType::PROGRESS};
    std::string jobId;
    uint64_t runId{0};
    JobProgress progress;   // engine snapshot at emission time
    std::string path;       // FILE_REMOVED: path relative to the source root
    std::string message;
    int exitCode{0};
};

using EventSink = std::function<void(EngineEvent)>;

std::string toString(OperationMode mode);
std::string toString(EngineEventType type);

// Supervises one external transfer process for one job run.
//
// The monitor thread consumes the merged output stream, turns recognised
// lines into PROGRESS and FILE_REMOVED events, and on exit either finishes
// the run or relaunches the identical command after a backoff delay when the
// failure is transient. Tool families supply the command line, the output
// grammar and the exit-code classification.
class TransferEngine {
public:
    TransferEngine(TransferRequest request, EngineOptions options, EventSink sink);
    virtual ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // Launches the first attempt and the monitor thread
    bool start();

    // SIGTERM, grace period, then SIGKILL. Returns after the monitor thread
    // has finished; false if the run had already ended.
    bool stop();

    bool isRunning() const;
    bool hasExited() const;
    EngineOutcome getOutcome() const;
    JobProgress getProgress() const;
    const TransferRequest& getRequest() const { return request_; }
    std::vector<std::vector<std::string>> getLaunchHistory() const;
    std::string getLastError() const;

    // Tool family capabilities
    virtual std::string toolName() const = 0;
    virtual std::vector<std::string> buildCommand() const = 0;
    virtual bool parseProgress(const std::string& line, ProgressSample& sample) const = 0;
    virtual bool parseRemoval(const std::string& line, std::string& relativePath) const = 0;
    virtual ExitClass classifyExit(int exitCode, const std::vector<std::string>& recentOutput) const = 0;
    // Directory that mirrors the source tree once the transfer is done
    virtual std::string destinationRoot() const = 0;

protected:
    // Stops the run and joins the monitor thread. Tool families call this from
    // their destructors while their overrides are still reachable.
    void halt();

    static bool outputContains(const std::vector<std::string>& recentOutput,
                               const std::vector<std::string>& patterns);

    const TransferRequest request_;
    const EngineOptions options_;

private:
    void monitorLoop();
    bool launch();
    void applySample(const ProgressSample& sample);
    void emit(EngineEventType type, const std::string& path = "",
              const std::string& message = "", int exitCode = 0);
    void finish(EngineOutcome outcome, const std::string& error);
    bool waitForBackoff(std::chrono::milliseconds delay);
    void logLine(const std::string& line);
    void joinMonitor();
    std::shared_ptr<ChildProcess> currentProcess() const;

    EventSink sink_;
    std::string toolName_;
    std::string logPath_;

    std::shared_ptr<ChildProcess> process_;
    std::vector<std::vector<std::string>> launches_;
    mutable std::mutex processMutex_;

    std::thread monitorThread_;
    std::mutex joinMutex_;
    std::atomic<bool> stopRequested_{false};

    EngineOutcome outcome_{EngineOutcome::IDLE};
    bool exited_{false};
    std::string lastError_;
    mutable std::mutex stateMutex_;
    std::condition_variable stateChanged_;

    JobProgress progress_;
    std::deque<std::string> recentOutput_;
    mutable std::mutex progressMutex_;
};
