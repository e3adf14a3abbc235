#pragma once

#include "common/config.hpp"
#include "common/event_channel.hpp"
#include "common/job.hpp"
#include "common/result.hpp"
#include "deletion/deletion_controller.hpp"
#include "storage/job_storage.hpp"
#include "transfer/transfer_engine.hpp"
#include "transfer/transfer_engine_factory.hpp"
#include <memory>
#include <string>
#include <vector>
#include <list>
#include <set>
#include <unordered_map>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <atomic>
#include <chrono>

enum class JobEventType {
    PROGRESS,
    STATUS
};

struct JobEvent {
    JobEventType type{JobEventType::PROGRESS};
    std::string jobId;
    JobStatus status{JobStatus::PENDING};
    JobProgress progress;
};

using JobEventListener = std::function<void(const JobEvent&)>;

std::string toString(JobEventType type);

// Owns the job registry and the engine registry.
//
// Commands on one job id are serialized by a per-job operation mutex. Locks
// are taken in the order: job operation mutex, job registry, engine
// registry; none is held across subprocess or persistence I/O. Readers get
// immutable snapshots and hold the registry lock only to copy a pointer.
class JobOrchestrator {
public:
    JobOrchestrator(const AppConfig& config,
                    std::shared_ptr<JobStorage> storage,
                    std::shared_ptr<TransferEngineFactory> factory);
    ~JobOrchestrator();

    JobOrchestrator(const JobOrchestrator&) = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    // Loads persisted jobs and starts the event dispatcher
    bool initialize();
    // Pauses running jobs, cancels deletion workers and drains pending events
    void shutdown();

    // Command surface
    Result createJob(const JobConfig& config, JobView& job);
    Result startJob(const std::string& jobId);
    Result pauseJob(const std::string& jobId);
    Result deleteJob(const std::string& jobId);

    JobView getJob(const std::string& jobId) const;
    std::vector<JobView> listJobs() const;

    // Jobs persisted as running by a process that did not shut down cleanly
    std::vector<JobView> recoverInterruptedJobs() const;
    Result resolveRecovery(bool markPaused);

    // Write path for engine events; normally fed by the dispatcher thread
    void updateJobFromEngine(const EngineEvent& event);

    // Listeners run on orchestrator threads and must not issue commands
    uint64_t subscribe(JobEventListener listener);
    void unsubscribe(uint64_t subscriptionId);

    // Evicts exited engines past the retention window or beyond the cap
    size_t reapEngines();
    size_t engineCount() const;
    std::shared_ptr<TransferEngine> getEngine(const std::string& jobId) const;

    std::string getLastError() const;

private:
    struct JobEntry {
        JobView job;
        uint64_t activeRun{0};     // run whose engine events are accepted
        uint64_t deletionRun{0};   // run whose deletion controller may report
        std::chrono::steady_clock::time_point lastPersist;
    };

    struct EngineSlot {
        std::shared_ptr<TransferEngine> engine;
        std::shared_ptr<DeletionController> deletion;
        uint64_t runId{0};
        bool finalPersisted{false};
        bool exitSeen{false};
        std::chrono::steady_clock::time_point exitedAt;
    };

    struct DeletionWorker {
        std::string jobId;
        std::shared_ptr<DeletionController> controller;
        std::shared_ptr<std::atomic<bool>> done;
        std::thread thread;
    };

    using Mutation = std::function<bool(JobEntry&, Job&)>;

    Result validateConfig(const JobConfig& config) const;
    Result validatePaths(const std::string& source, const std::string& destination, JobKind kind) const;
    Result validateDeletionSafety(const JobConfig& config) const;

    std::shared_ptr<std::mutex> operationMutex(const std::string& jobId);

    // Applies a change to a copy of the job and installs it as the new
    // snapshot; nullptr when the job is gone or the mutation declined
    JobView mutateJob(const std::string& jobId, const Mutation& mutation);
    // Saves with bounded retries and backoff
    Result writeJob(const Job& job);
    // Saves the current snapshot; exhaustion is recorded in the job's last_error
    Result persistJob(const std::string& jobId);

    void dispatchLoop();
    void onEngineEvent(EngineEvent event, const std::shared_ptr<DeletionController>& deletion);
    void onDeletionProgress(const std::string& jobId, uint64_t runId, const DeletionProgress& progress);

    // Terminal transitions; callers hold the job's operation mutex.
    // requireActiveRun=false when the caller already detached the run.
    void completeRun(const std::string& jobId, uint64_t runId, const JobProgress& progress,
                     bool requireActiveRun);
    void failRun(const std::string& jobId, uint64_t runId, const JobProgress& progress,
                 const std::string& reason, bool requireActiveRun);

    std::shared_ptr<DeletionController> createDeletionController(const Job& job, const std::string& destinationRoot,
                                                                 uint64_t runId);
    void startDeletionWorker(const std::string& jobId, std::shared_ptr<DeletionController> controller,
                             uint64_t runId, std::function<Result()> work);
    bool hasActiveWorker(const std::string& jobId);
    void joinFinishedWorkers();

    EngineSlot* findSlot(const std::string& jobId);
    void markFinalPersisted(const std::string& jobId, uint64_t runId);

    void notify(const JobEvent& event, bool force);
    void notifyStatus(const JobView& job);
    void notifyProgress(const JobView& job, bool force);

    void setLastError(const std::string& error);

    AppConfig config_;
    std::shared_ptr<JobStorage> storage_;
    std::shared_ptr<TransferEngineFactory> factory_;

    std::unordered_map<std::string, JobEntry> jobs_;
    mutable std::shared_mutex jobsMutex_;

    std::unordered_map<std::string, EngineSlot> engines_;
    mutable std::mutex enginesMutex_;

    std::unordered_map<std::string, std::shared_ptr<std::mutex>> operationMutexes_;
    std::mutex operationMutexesMutex_;

    std::set<std::string> recovered_;
    mutable std::mutex recoveredMutex_;

    std::list<DeletionWorker> workers_;
    std::mutex workersMutex_;

    std::unordered_map<uint64_t, JobEventListener> listeners_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> lastProgressEvent_;
    uint64_t nextListenerId_{1};
    std::mutex listenersMutex_;

    EventChannel<EngineEvent> channel_;
    std::thread dispatcher_;
    std::atomic<uint64_t> nextRunId_{1};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> stopping_{false};

    std::string lastError_;
    mutable std::mutex errorMutex_;
};
