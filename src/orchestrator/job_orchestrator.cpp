#include "orchestrator/job_orchestrator.hpp"
#include "common/logger.hpp"
#include "common/thread_utils.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Engine snapshots carry no deletion sub-record; that part is owned by the
// deletion controller
void applyEngineProgress(JobProgress& target, const JobProgress& source) {
    target.bytesTransferred = source.bytesTransferred;
    if (source.totalBytes) {
        target.totalBytes = source.totalBytes;
    }
    target.percent = source.percent;
    target.speedBytes = source.speedBytes;
    target.etaSeconds = source.etaSeconds;
    target.retryCount = source.retryCount;
    target.lastError = source.lastError;
}

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

fs::path normalizedPath(const std::string& path) {
    std::string stripped = path;
    while (stripped.size() > 1 && stripped.back() == '/') {
        stripped.pop_back();
    }
    std::error_code ec;
    fs::path result = fs::weakly_canonical(fs::absolute(stripped, ec), ec);
    if (ec) {
        return fs::path(stripped).lexically_normal();
    }
    return result;
}

const std::chrono::milliseconds kDispatchPollInterval(200);
const std::chrono::milliseconds kReapInterval(1000);

} // namespace

std::string toString(JobEventType type) {
    switch (type) {
        case JobEventType::PROGRESS: return "progress";
        case JobEventType::STATUS:   return "status";
    }
    return "unknown";
}

JobOrchestrator::JobOrchestrator(const AppConfig& config,
                                 std::shared_ptr<JobStorage> storage,
                                 std::shared_ptr<TransferEngineFactory> factory)
    : config_(config)
    , storage_(std::move(storage))
    , factory_(std::move(factory))
    , channel_(static_cast<size_t>(std::max(1, config.channelCapacity)),
               [](const EngineEvent& event) { return event.jobId; },
               [](const EngineEvent& event) { return event.type == EngineEventType::PROGRESS; }) {
    if (!factory_) {
        factory_ = std::make_shared<TransferEngineFactory>(config_);
    }
}

JobOrchestrator::~JobOrchestrator() {
    try {
        shutdown();
    } catch (const std::exception& e) {
        Logger::error("Error during JobOrchestrator cleanup: " + std::string(e.what()));
    }
}

bool JobOrchestrator::initialize() {
    if (initialized_) {
        return true;
    }
    if (stopping_) {
        setLastError("Orchestrator has been shut down");
        return false;
    }
    if (!storage_ || !storage_->initialize()) {
        setLastError("Failed to initialize job storage: " +
                     (storage_ ? storage_->getLastError() : std::string("no storage")));
        Logger::error(getLastError());
        return false;
    }

    std::vector<Job> loaded;
    if (!storage_->loadJobs(loaded)) {
        Logger::error("Starting with an empty job registry: " + storage_->getLastError());
    }

    std::vector<std::string> interruptedDeletions;
    std::vector<std::string> interruptedRuns;
    {
        std::unique_lock<std::shared_mutex> lock(jobsMutex_);
        for (auto& job : loaded) {
            if (job.isDeleting()) {
                job.progress.deletion.phase = DeletionPhase::FAILED;
                job.progress.deletion.lastError = "interrupted by unclean shutdown";
                job.touch();
                interruptedDeletions.push_back(job.id);
            }
            if (job.status == JobStatus::RUNNING) {
                interruptedRuns.push_back(job.id);
            }
            JobEntry entry;
            entry.job = std::make_shared<const Job>(std::move(job));
            jobs_[entry.job->id] = entry;
        }
    }

    for (const auto& id : interruptedDeletions) {
        Logger::warning("Job " + id + ": source deletion was interrupted, marked failed");
        Result persisted = persistJob(id);
        if (!persisted) {
            Logger::error("Job " + id + ": " + persisted.message());
        }
    }

    if (!interruptedRuns.empty()) {
        std::lock_guard<std::mutex> lock(recoveredMutex_);
        recovered_.insert(interruptedRuns.begin(), interruptedRuns.end());
        Logger::warning(std::to_string(interruptedRuns.size()) +
                        " jobs were running when the previous process stopped");
    }

    dispatcher_ = std::thread(&JobOrchestrator::dispatchLoop, this);
    initialized_ = true;
    Logger::info("Job orchestrator initialized with " + std::to_string(loaded.size()) + " jobs");
    return true;
}

void JobOrchestrator::shutdown() {
    if (stopping_.exchange(true)) {
        return;
    }
    Logger::info("Shutting down job orchestrator");

    std::vector<std::string> running;
    if (initialized_) {
        std::shared_lock<std::shared_mutex> lock(jobsMutex_);
        for (const auto& pair : jobs_) {
            if (pair.second.job->status == JobStatus::RUNNING && pair.second.activeRun != 0) {
                running.push_back(pair.first);
            }
        }
    }
    for (const auto& id : running) {
        Result paused = pauseJob(id);
        if (!paused) {
            Logger::warning("Job " + id + " not paused during shutdown: " + paused.message());
        }
    }

    channel_.close();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }

    std::list<DeletionWorker> workers;
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        for (auto& worker : workers_) {
            worker.controller->cancel();
        }
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    std::unordered_map<std::string, EngineSlot> engines;
    {
        std::lock_guard<std::mutex> lock(enginesMutex_);
        engines.swap(engines_);
    }
    engines.clear();

    initialized_ = false;
    Logger::info("Job orchestrator stopped");
}

Result JobOrchestrator::createJob(const JobConfig& config, JobView& view) {
    if (stopping_ || !initialized_) {
        return Result::failure(ErrorCode::CONCURRENCY, "Orchestrator is not accepting commands");
    }

    Result valid = validateConfig(config);
    if (!valid) {
        Logger::warning("Rejected job '" + config.name + "': " + valid.message());
        return valid;
    }

    Job job;
    job.id = generateJobId();
    job.name = trim(config.name);
    job.source = trim(config.source);
    job.destination = trim(config.destination);
    job.kind = config.kind;
    job.status = JobStatus::PENDING;
    job.settings = config.settings;
    if (!job.settings.bandwidthLimitKbps && config_.defaultBandwidthLimitKbps > 0) {
        job.settings.bandwidthLimitKbps = config_.defaultBandwidthLimitKbps;
    }
    job.createdAt = currentTimestamp();
    job.updatedAt = job.createdAt;
    job.revision = 1;

    Result persisted = writeJob(job);
    if (!persisted) {
        return persisted;
    }

    {
        std::unique_lock<std::shared_mutex> lock(jobsMutex_);
        JobEntry entry;
        entry.job = std::make_shared<const Job>(std::move(job));
        view = entry.job;
        jobs_[view->id] = entry;
    }

    Logger::info("Created " + toString(view->kind) + " job " + view->id + " (" + view->name + "): " +
                 view->source + " -> " + view->destination);
    if (view->settings.deleteSourceAfter) {
        Logger::warning("Job " + view->id + " will delete source files (" +
                        toString(view->settings.deletionMode) + ")");
    }
    notifyStatus(view);
    return Result::success("Job created");
}

Result JobOrchestrator::startJob(const std::string& jobId) {
    if (stopping_ || !initialized_) {
        return Result::failure(ErrorCode::CONCURRENCY, "Orchestrator is not accepting commands");
    }

    auto opMutex = operationMutex(jobId);
    std::lock_guard<std::mutex> opLock(*opMutex);

    JobView job = getJob(jobId);
    if (!job) {
        return Result::failure(ErrorCode::NOT_FOUND, "Job not found: " + jobId);
    }
    if (job->status == JobStatus::RUNNING) {
        return Result::failure(ErrorCode::CONCURRENCY, "Job is already running");
    }
    if (job->status == JobStatus::COMPLETED) {
        return Result::failure(ErrorCode::CONCURRENCY, "Job already completed");
    }
    if (job->isDeleting() || hasActiveWorker(jobId)) {
        return Result::failure(ErrorCode::CONCURRENCY, "Source deletion in progress for job " + jobId);
    }

    Result valid = validatePaths(job->source, job->destination, job->kind);
    if (!valid) {
        return valid;
    }

    uint64_t runId = nextRunId_++;

    TransferRequest request;
    request.jobId = job->id;
    request.runId = runId;
    request.source = job->source;
    request.destination = job->destination;
    request.bandwidthLimitKbps = job->settings.bandwidthLimitKbps;
    request.mode = job->usesMoveMode() ? OperationMode::MOVE : OperationMode::COPY;
    request.compareChecksums = job->settings.verificationMode == VerificationMode::CHECKSUM;

    std::shared_ptr<DeletionController> deletion;
    if (job->usesMoveMode()) {
        deletion = createDeletionController(*job, job->destination, runId);
        Result begun = deletion->beginPerFile();
        if (!begun) {
            return begun;
        }
    }

    auto engine = factory_->createEngine(job->kind, request,
        [this, deletion](EngineEvent event) { onEngineEvent(std::move(event), deletion); });
    if (!engine) {
        return Result::failure(ErrorCode::FATAL_ENGINE, "No transfer engine for kind " + toString(job->kind));
    }

    JobView previous = job;
    job = mutateJob(jobId, [&](JobEntry& entry, Job& j) {
        if (j.status == JobStatus::RUNNING) {
            return false;
        }
        DeletionProgress carried = j.progress.deletion;
        j.status = JobStatus::RUNNING;
        j.progress = JobProgress();
        if (j.settings.deleteSourceAfter) {
            j.progress.deletion.phase = DeletionPhase::TRANSFERRING;
            if (j.settings.deletionMode == DeletionMode::PER_FILE) {
                // files already removed by earlier runs stay counted
                j.progress.deletion.filesDeleted = carried.filesDeleted;
                j.progress.deletion.bytesDeleted = carried.bytesDeleted;
            }
        }
        entry.activeRun = runId;
        entry.deletionRun = deletion ? runId : 0;
        entry.lastPersist = std::chrono::steady_clock::now();
        return true;
    });
    if (!job) {
        return Result::failure(ErrorCode::CONCURRENCY, "Job state changed during start");
    }

    std::shared_ptr<TransferEngine> replaced;
    {
        std::lock_guard<std::mutex> lock(enginesMutex_);
        auto it = engines_.find(jobId);
        if (it != engines_.end()) {
            replaced = it->second.engine;
        }
        EngineSlot slot;
        slot.engine = engine;
        slot.deletion = deletion;
        slot.runId = runId;
        engines_[jobId] = slot;
    }
    replaced.reset();

    Result persisted = persistJob(jobId);
    if (!persisted) {
        mutateJob(jobId, [&](JobEntry& entry, Job& j) {
            j.status = previous->status;
            j.progress = previous->progress;
            j.progress.lastError = persisted.message();
            entry.activeRun = 0;
            entry.deletionRun = 0;
            return true;
        });
        std::lock_guard<std::mutex> lock(enginesMutex_);
        engines_.erase(jobId);
        return persisted;
    }

    if (!engine->start()) {
        std::string reason = "Failed to start " + engine->toolName() + ": " + engine->getLastError();
        Logger::error("Job " + jobId + ": " + reason);
        failRun(jobId, runId, engine->getProgress(), reason, true);
        return Result::failure(ErrorCode::FATAL_ENGINE, reason);
    }

    {
        std::lock_guard<std::mutex> lock(recoveredMutex_);
        recovered_.erase(jobId);
    }

    Logger::info("Started job " + jobId + " (run " + std::to_string(runId) + ", " +
                 toString(request.mode) + " mode)");
    notifyStatus(job);
    return Result::success("Job started");
}

Result JobOrchestrator::pauseJob(const std::string& jobId) {
    auto opMutex = operationMutex(jobId);
    std::lock_guard<std::mutex> opLock(*opMutex);

    JobView job = getJob(jobId);
    if (!job) {
        return Result::failure(ErrorCode::NOT_FOUND, "Job not found: " + jobId);
    }
    if (job->status != JobStatus::RUNNING) {
        return Result::failure(ErrorCode::CONCURRENCY, "Job is not running (status: " + toString(job->status) + ")");
    }

    // From here on no event of this run is applied
    uint64_t runId = 0;
    mutateJob(jobId, [&](JobEntry& entry, Job&) {
        runId = entry.activeRun;
        entry.activeRun = 0;
        return false;
    });

    std::shared_ptr<TransferEngine> engine;
    std::shared_ptr<DeletionController> deletion;
    {
        std::lock_guard<std::mutex> lock(enginesMutex_);
        EngineSlot* slot = findSlot(jobId);
        if (slot && runId != 0 && slot->runId == runId) {
            engine = slot->engine;
            deletion = slot->deletion;
        }
    }

    if (!engine) {
        // Interrupted run from a previous process; nothing to stop
        job = mutateJob(jobId, [](JobEntry& entry, Job& j) {
            if (j.status != JobStatus::RUNNING) {
                return false;
            }
            j.status = JobStatus::PAUSED;
            j.progress.speedBytes = 0;
            entry.deletionRun = 0;
            return true;
        });
        {
            std::lock_guard<std::mutex> lock(recoveredMutex_);
            recovered_.erase(jobId);
        }
        if (!job) {
            return Result::failure(ErrorCode::CONCURRENCY, "Job state changed during pause");
        }
        Result persisted = persistJob(jobId);
        notifyStatus(job);
        return persisted.ok() ? Result::success("Job paused") : persisted;
    }

    Logger::info("Pausing job " + jobId);
    engine->stop();

    EngineOutcome outcome = engine->getOutcome();
    JobProgress progress = engine->getProgress();

    if (outcome == EngineOutcome::COMPLETED) {
        completeRun(jobId, runId, progress, false);
        return Result::failure(ErrorCode::CONCURRENCY, "Transfer completed before it could be paused");
    }
    if (outcome == EngineOutcome::FAILED) {
        std::string reason = engine->getLastError();
        failRun(jobId, runId, progress, reason, false);
        return Result::failure(ErrorCode::CONCURRENCY, "Transfer failed before it could be paused: " + reason);
    }

    bool hasDeletion = deletion != nullptr;
    DeletionProgress deletionProgress;
    if (hasDeletion) {
        deletionProgress = deletion->getProgress();
    }

    job = mutateJob(jobId, [&](JobEntry& entry, Job& j) {
        if (j.status != JobStatus::RUNNING) {
            return false;
        }
        applyEngineProgress(j.progress, progress);
        j.progress.speedBytes = 0;
        j.progress.etaSeconds = 0;
        if (hasDeletion) {
            j.progress.deletion = deletionProgress;
        }
        entry.deletionRun = 0;
        entry.lastPersist = std::chrono::steady_clock::now();
        return true;
    });
    if (!job) {
        return Result::failure(ErrorCode::CONCURRENCY, "Job state changed during pause");
    }
    Result progressPersisted = persistJob(jobId);

    job = mutateJob(jobId, [](JobEntry&, Job& j) {
        if (j.status != JobStatus::RUNNING) {
            return false;
        }
        j.status = JobStatus::PAUSED;
        return true;
    });
    Result statusPersisted = persistJob(jobId);
    markFinalPersisted(jobId, runId);

    if (job) {
        Logger::info("Paused job " + jobId + " at " + utils::formatBytes(job->progress.bytesTransferred) +
                     " (" + std::to_string(job->progress.percent) + "%)");
        notifyStatus(job);
    }

    if (!progressPersisted) {
        return progressPersisted;
    }
    if (!statusPersisted) {
        return statusPersisted;
    }
    return Result::success("Job paused");
}

Result JobOrchestrator::deleteJob(const std::string& jobId) {
    auto opMutex = operationMutex(jobId);
    std::lock_guard<std::mutex> opLock(*opMutex);

    JobView job = getJob(jobId);
    if (!job) {
        return Result::failure(ErrorCode::NOT_FOUND, "Job not found: " + jobId);
    }
    if (job->status == JobStatus::RUNNING) {
        return Result::failure(ErrorCode::CONCURRENCY, "Cannot delete a running job; pause it first");
    }
    if (job->isDeleting() || hasActiveWorker(jobId)) {
        return Result::failure(ErrorCode::CONCURRENCY, "Cannot delete a job while its source deletion is in progress");
    }

    int attempts = std::max(1, config_.persistenceRetries);
    bool removed = false;
    std::string error;
    for (int attempt = 0; attempt < attempts && !removed; ++attempt) {
        if (attempt > 0) {
            ThreadUtils::sleepFor(ThreadUtils::backoffDelay(attempt - 1,
                std::chrono::milliseconds(config_.persistenceBackoffMs),
                std::chrono::milliseconds(config_.persistenceBackoffMs * 16)));
        }
        removed = storage_->deleteJob(jobId);
        if (!removed) {
            error = storage_->getLastError();
            Logger::warning("Removing job " + jobId + " from storage failed (attempt " +
                            std::to_string(attempt + 1) + "/" + std::to_string(attempts) + "): " + error);
        }
    }
    if (!removed) {
        std::string message = "Failed to delete job " + jobId + " from storage: " + error;
        Logger::fatal(message);
        setLastError(message);
        return Result::failure(ErrorCode::PERSISTENCE, message);
    }

    {
        std::unique_lock<std::shared_mutex> lock(jobsMutex_);
        jobs_.erase(jobId);
    }
    std::shared_ptr<TransferEngine> engine;
    {
        std::lock_guard<std::mutex> lock(enginesMutex_);
        auto it = engines_.find(jobId);
        if (it != engines_.end()) {
            engine = it->second.engine;
            engines_.erase(it);
        }
    }
    engine.reset();
    {
        std::lock_guard<std::mutex> lock(recoveredMutex_);
        recovered_.erase(jobId);
    }
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        lastProgressEvent_.erase(jobId);
    }
    {
        std::lock_guard<std::mutex> lock(operationMutexesMutex_);
        operationMutexes_.erase(jobId);
    }

    Logger::info("Deleted job " + jobId + " (" + job->name + ")");
    return Result::success("Job deleted");
}

JobView JobOrchestrator::getJob(const std::string& jobId) const {
    std::shared_lock<std::shared_mutex> lock(jobsMutex_);
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        return nullptr;
    }
    return it->second.job;
}

std::vector<JobView> JobOrchestrator::listJobs() const {
    std::vector<JobView> result;
    {
        std::shared_lock<std::shared_mutex> lock(jobsMutex_);
        result.reserve(jobs_.size());
        for (const auto& pair : jobs_) {
            result.push_back(pair.second.job);
        }
    }
    std::sort(result.begin(), result.end(), [](const JobView& a, const JobView& b) {
        return a->createdAt != b->createdAt ? a->createdAt < b->createdAt : a->id < b->id;
    });
    return result;
}

std::vector<JobView> JobOrchestrator::recoverInterruptedJobs() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(recoveredMutex_);
        ids.assign(recovered_.begin(), recovered_.end());
    }

    std::vector<JobView> result;
    for (const auto& id : ids) {
        JobView job = getJob(id);
        if (job && job->status == JobStatus::RUNNING) {
            result.push_back(job);
        }
    }
    return result;
}

Result JobOrchestrator::resolveRecovery(bool markPaused) {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(recoveredMutex_);
        ids.assign(recovered_.begin(), recovered_.end());
    }

    if (!markPaused) {
        Logger::info("Leaving " + std::to_string(ids.size()) + " interrupted jobs unchanged");
        return Result::success("Interrupted jobs left unchanged");
    }

    size_t marked = 0;
    Result failure = Result::success();
    for (const auto& id : ids) {
        auto opMutex = operationMutex(id);
        std::lock_guard<std::mutex> opLock(*opMutex);

        JobView job = mutateJob(id, [](JobEntry& entry, Job& j) {
            if (j.status != JobStatus::RUNNING || entry.activeRun != 0) {
                return false;
            }
            j.status = JobStatus::PAUSED;
            j.progress.speedBytes = 0;
            return true;
        });
        {
            std::lock_guard<std::mutex> lock(recoveredMutex_);
            recovered_.erase(id);
        }
        if (!job) {
            continue;
        }

        Result persisted = persistJob(id);
        if (!persisted && failure.ok()) {
            failure = persisted;
        }
        ++marked;
        Logger::info("Recovered job " + id + " marked paused at " +
                     std::to_string(job->progress.percent) + "%");
        notifyStatus(job);
    }

    if (!failure) {
        return failure;
    }
    return Result::success("Marked " + std::to_string(marked) + " jobs paused");
}

void JobOrchestrator::onEngineEvent(EngineEvent event, const std::shared_ptr<DeletionController>& deletion) {
    // Removals are accounted immediately so a pause snapshot includes them
    if (event.type == EngineEventType::FILE_REMOVED) {
        if (deletion) {
            deletion->recordRemoval(event.path);
        }
        return;
    }

    EngineEventType type = event.type;
    std::string jobId = event.jobId;
    if (!channel_.push(std::move(event)) && type != EngineEventType::PROGRESS) {
        Logger::warning("Job " + jobId + ": " + toString(type) + " event dropped, channel closed");
    }
}

void JobOrchestrator::dispatchLoop() {
    auto lastReap = std::chrono::steady_clock::now();

    while (true) {
        EngineEvent event;
        if (channel_.pop(event, kDispatchPollInterval)) {
            try {
                updateJobFromEngine(event);
            } catch (const std::exception& e) {
                Logger::error("Job " + event.jobId + ": failed to apply " + toString(event.type) +
                              " event: " + e.what());
            }
        } else if (channel_.isClosed() && channel_.size() == 0) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now - lastReap >= kReapInterval) {
            reapEngines();
            joinFinishedWorkers();
            lastReap = now;
        }
    }
    Logger::debug("Event dispatcher stopped");
}

void JobOrchestrator::updateJobFromEngine(const EngineEvent& event) {
    const std::string& jobId = event.jobId;

    switch (event.type) {
        case EngineEventType::PROGRESS: {
            bool persistDue = false;
            JobView job = mutateJob(jobId, [&](JobEntry& entry, Job& j) {
                if (entry.activeRun != event.runId || j.status != JobStatus::RUNNING) {
                    return false;
                }
                applyEngineProgress(j.progress, event.progress);
                auto now = std::chrono::steady_clock::now();
                if (now - entry.lastPersist >= std::chrono::milliseconds(config_.progressPersistIntervalMs)) {
                    entry.lastPersist = now;
                    persistDue = true;
                }
                return true;
            });
            if (!job) {
                return;
            }
            if (persistDue) {
                persistJob(jobId);
            }
            notifyProgress(job, false);
            return;
        }

        case EngineEventType::RETRYING: {
            JobView job = mutateJob(jobId, [&](JobEntry& entry, Job& j) {
                if (entry.activeRun != event.runId || j.status != JobStatus::RUNNING) {
                    return false;
                }
                applyEngineProgress(j.progress, event.progress);
                entry.lastPersist = std::chrono::steady_clock::now();
                return true;
            });
            if (!job) {
                return;
            }
            Logger::warning("Job " + jobId + ": retry " + std::to_string(job->progress.retryCount) +
                            " after transient failure: " + event.message);
            persistJob(jobId);
            notifyProgress(job, true);
            return;
        }

        case EngineEventType::FILE_REMOVED: {
            std::shared_ptr<DeletionController> deletion;
            {
                std::lock_guard<std::mutex> lock(enginesMutex_);
                EngineSlot* slot = findSlot(jobId);
                if (slot && slot->runId == event.runId) {
                    deletion = slot->deletion;
                }
            }
            if (deletion) {
                deletion->recordRemoval(event.path);
            }
            return;
        }

        case EngineEventType::COMPLETED: {
            auto opMutex = operationMutex(jobId);
            std::lock_guard<std::mutex> opLock(*opMutex);
            completeRun(jobId, event.runId, event.progress, true);
            return;
        }

        case EngineEventType::FAILED: {
            auto opMutex = operationMutex(jobId);
            std::lock_guard<std::mutex> opLock(*opMutex);
            failRun(jobId, event.runId, event.progress, event.message, true);
            return;
        }

        case EngineEventType::STOPPED: {
            // Only a stop nobody asked for reaches an active run
            auto opMutex = operationMutex(jobId);
            std::lock_guard<std::mutex> opLock(*opMutex);
            failRun(jobId, event.runId, event.progress, "Transfer stopped unexpectedly", true);
            return;
        }
    }
}

void JobOrchestrator::completeRun(const std::string& jobId, uint64_t runId, const JobProgress& progress,
                                  bool requireActiveRun) {
    // Final progress goes to disk before the terminal status
    JobView job = mutateJob(jobId, [&](JobEntry& entry, Job& j) {
        if ((requireActiveRun && entry.activeRun != runId) || j.status != JobStatus::RUNNING) {
            return false;
        }
        applyEngineProgress(j.progress, progress);
        j.progress.lastError.clear();
        entry.lastPersist = std::chrono::steady_clock::now();
        return true;
    });
    if (!job) {
        Logger::debug("Job " + jobId + ": ignoring completion of run " + std::to_string(runId));
        return;
    }
    persistJob(jobId);

    std::shared_ptr<DeletionController> perFile;
    std::string destinationRoot = job->destination;
    {
        std::lock_guard<std::mutex> lock(enginesMutex_);
        EngineSlot* slot = findSlot(jobId);
        if (slot && slot->runId == runId) {
            perFile = slot->deletion;
            destinationRoot = slot->engine->destinationRoot();
        }
    }

    bool verify = false;
    job = mutateJob(jobId, [&](JobEntry& entry, Job& j) {
        if (j.status != JobStatus::RUNNING) {
            return false;
        }
        j.status = JobStatus::COMPLETED;
        j.progress.speedBytes = 0;
        j.progress.etaSeconds = 0;
        entry.activeRun = 0;
        if (j.settings.deleteSourceAfter && j.settings.deletionMode == DeletionMode::VERIFY_THEN_DELETE) {
            j.progress.deletion.phase = DeletionPhase::VERIFYING;
            entry.deletionRun = runId;
            verify = true;
        }
        return true;
    });
    if (!job) {
        return;
    }
    persistJob(jobId);
    markFinalPersisted(jobId, runId);

    Logger::info("Job " + jobId + " completed: " + utils::formatBytes(job->progress.bytesTransferred) +
                 " transferred, " + std::to_string(job->progress.retryCount) + " retries");
    notifyStatus(job);

    if (verify) {
        auto controller = createDeletionController(*job, destinationRoot, runId);
        startDeletionWorker(jobId, controller, runId, [controller]() { return controller->verifyThenDelete(); });
    } else if (perFile) {
        startDeletionWorker(jobId, perFile, runId, [perFile]() { return perFile->finishPerFile(true); });
    }
}

void JobOrchestrator::failRun(const std::string& jobId, uint64_t runId, const JobProgress& progress,
                              const std::string& reason, bool requireActiveRun) {
    JobView job = mutateJob(jobId, [&](JobEntry& entry, Job& j) {
        if ((requireActiveRun && entry.activeRun != runId) || j.status != JobStatus::RUNNING) {
            return false;
        }
        applyEngineProgress(j.progress, progress);
        entry.lastPersist = std::chrono::steady_clock::now();
        return true;
    });
    if (!job) {
        Logger::debug("Job " + jobId + ": ignoring failure of run " + std::to_string(runId));
        return;
    }
    persistJob(jobId);

    std::shared_ptr<DeletionController> perFile;
    {
        std::lock_guard<std::mutex> lock(enginesMutex_);
        EngineSlot* slot = findSlot(jobId);
        if (slot && slot->runId == runId) {
            perFile = slot->deletion;
        }
    }
    if (perFile) {
        // Keeps the counts of files the tool already removed
        Result closed = perFile->finishPerFile(false);
        Logger::warning("Job " + jobId + ": " + closed.message());
    }

    job = mutateJob(jobId, [&](JobEntry& entry, Job& j) {
        if (j.status != JobStatus::RUNNING) {
            return false;
        }
        j.status = JobStatus::FAILED;
        j.progress.lastError = reason;
        j.progress.speedBytes = 0;
        j.progress.etaSeconds = 0;
        if (!perFile && j.progress.deletion.phase == DeletionPhase::TRANSFERRING) {
            j.progress.deletion.phase = DeletionPhase::NONE;
        }
        entry.activeRun = 0;
        entry.deletionRun = 0;
        return true;
    });
    if (!job) {
        return;
    }
    persistJob(jobId);
    markFinalPersisted(jobId, runId);

    Logger::error("Job " + jobId + " failed: " + reason);
    notifyStatus(job);
}

void JobOrchestrator::onDeletionProgress(const std::string& jobId, uint64_t runId,
                                         const DeletionProgress& progress) {
    bool phaseChanged = false;
    JobView job = mutateJob(jobId, [&](JobEntry& entry, Job& j) {
        if (runId == 0 || entry.deletionRun != runId) {
            return false;
        }
        phaseChanged = j.progress.deletion.phase != progress.phase;
        j.progress.deletion = progress;
        return true;
    });
    if (!job) {
        return;
    }
    persistJob(jobId);
    notifyProgress(job, phaseChanged);
}

std::shared_ptr<DeletionController> JobOrchestrator::createDeletionController(const Job& job,
                                                                              const std::string& destinationRoot,
                                                                              uint64_t runId) {
    DeletionProgress initial = job.progress.deletion;
    if (job.settings.deletionMode == DeletionMode::VERIFY_THEN_DELETE) {
        initial.filesDeleted = 0;
        initial.bytesDeleted = 0;
    }

    auto controller = std::make_shared<DeletionController>(
        job.id,
        factory_->createFileStore(job.source),
        factory_->createFileStore(destinationRoot),
        job.settings.deletionMode,
        job.settings.verificationMode,
        std::make_shared<DeletionLogger>(config_.logDir, job.id),
        initial);

    std::string jobId = job.id;
    controller->setProgressCallback([this, jobId, runId](const DeletionProgress& progress) {
        onDeletionProgress(jobId, runId, progress);
    });
    return controller;
}

void JobOrchestrator::startDeletionWorker(const std::string& jobId, std::shared_ptr<DeletionController> controller,
                                          uint64_t runId, std::function<Result()> work) {
    auto done = std::make_shared<std::atomic<bool>>(false);

    DeletionWorker worker;
    worker.jobId = jobId;
    worker.controller = controller;
    worker.done = done;

    std::lock_guard<std::mutex> lock(workersMutex_);
    worker.thread = std::thread([this, jobId, controller, runId, work, done]() {
        Result result = work();
        if (result) {
            Logger::info("Job " + jobId + ": source deletion finished");
        } else {
            Logger::error("Job " + jobId + ": source deletion failed (" + toString(result.code()) + "): " +
                          result.message());
        }

        // Final state is persisted regardless of throttling, then the
        // controller is detached from the job
        onDeletionProgress(jobId, runId, controller->getProgress());
        mutateJob(jobId, [runId](JobEntry& entry, Job&) {
            if (entry.deletionRun == runId) {
                entry.deletionRun = 0;
            }
            return false;
        });
        *done = true;
    });
    workers_.push_back(std::move(worker));
}

bool JobOrchestrator::hasActiveWorker(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(workersMutex_);
    for (const auto& worker : workers_) {
        if (worker.jobId == jobId && !*worker.done) {
            return true;
        }
    }
    return false;
}

void JobOrchestrator::joinFinishedWorkers() {
    std::list<DeletionWorker> finished;
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (*it->done) {
                finished.splice(finished.end(), workers_, it++);
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : finished) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

JobOrchestrator::EngineSlot* JobOrchestrator::findSlot(const std::string& jobId) {
    auto it = engines_.find(jobId);
    return it == engines_.end() ? nullptr : &it->second;
}

void JobOrchestrator::markFinalPersisted(const std::string& jobId, uint64_t runId) {
    std::lock_guard<std::mutex> lock(enginesMutex_);
    EngineSlot* slot = findSlot(jobId);
    if (slot && slot->runId == runId) {
        slot->finalPersisted = true;
        slot->exitSeen = true;
        slot->exitedAt = std::chrono::steady_clock::now();
    }
}

size_t JobOrchestrator::reapEngines() {
    std::vector<std::shared_ptr<TransferEngine>> evicted;
    auto now = std::chrono::steady_clock::now();
    auto retention = std::chrono::seconds(config_.engineRetentionSeconds);

    {
        std::lock_guard<std::mutex> lock(enginesMutex_);
        for (auto it = engines_.begin(); it != engines_.end();) {
            const EngineSlot& slot = it->second;
            if (slot.exitSeen && slot.engine->hasExited() && now - slot.exitedAt >= retention) {
                evicted.push_back(slot.engine);
                it = engines_.erase(it);
            } else {
                ++it;
            }
        }

        // Beyond the cap, oldest exited engines go first; running ones stay
        while (true) {
            size_t exited = 0;
            auto oldest = engines_.end();
            for (auto it = engines_.begin(); it != engines_.end(); ++it) {
                if (!it->second.exitSeen || !it->second.engine->hasExited()) {
                    continue;
                }
                ++exited;
                if (oldest == engines_.end() || it->second.exitedAt < oldest->second.exitedAt) {
                    oldest = it;
                }
            }
            if (exited <= static_cast<size_t>(std::max(0, config_.maxRetainedEngines)) ||
                oldest == engines_.end()) {
                break;
            }
            evicted.push_back(oldest->second.engine);
            engines_.erase(oldest);
        }
    }

    if (!evicted.empty()) {
        Logger::debug("Reaped " + std::to_string(evicted.size()) + " exited engines");
    }
    return evicted.size();
}

size_t JobOrchestrator::engineCount() const {
    std::lock_guard<std::mutex> lock(enginesMutex_);
    return engines_.size();
}

std::shared_ptr<TransferEngine> JobOrchestrator::getEngine(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(enginesMutex_);
    auto it = engines_.find(jobId);
    return it == engines_.end() ? nullptr : it->second.engine;
}

std::shared_ptr<std::mutex> JobOrchestrator::operationMutex(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(operationMutexesMutex_);
    auto& mutex = operationMutexes_[jobId];
    if (!mutex) {
        mutex = std::make_shared<std::mutex>();
    }
    return mutex;
}

JobView JobOrchestrator::mutateJob(const std::string& jobId, const Mutation& mutation) {
    std::unique_lock<std::shared_mutex> lock(jobsMutex_);
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        return nullptr;
    }

    Job copy = *it->second.job;
    if (!mutation(it->second, copy)) {
        return nullptr;
    }
    copy.touch();
    it->second.job = std::make_shared<const Job>(std::move(copy));
    return it->second.job;
}

Result JobOrchestrator::writeJob(const Job& job) {
    int attempts = std::max(1, config_.persistenceRetries);
    std::string error;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (attempt > 0) {
            ThreadUtils::sleepFor(ThreadUtils::backoffDelay(attempt - 1,
                std::chrono::milliseconds(config_.persistenceBackoffMs),
                std::chrono::milliseconds(config_.persistenceBackoffMs * 16)));
        }
        if (storage_->saveJob(job)) {
            return Result::success();
        }
        error = storage_->getLastError();
        Logger::warning("Persisting job " + job.id + " failed (attempt " + std::to_string(attempt + 1) +
                        "/" + std::to_string(attempts) + "): " + error);
    }

    std::string message = "Failed to persist job " + job.id + ": " + error;
    Logger::fatal(message);
    setLastError(message);
    return Result::failure(ErrorCode::PERSISTENCE, message);
}

Result JobOrchestrator::persistJob(const std::string& jobId) {
    JobView job = getJob(jobId);
    if (!job) {
        return Result::failure(ErrorCode::NOT_FOUND, "Job not found: " + jobId);
    }

    Result result = writeJob(*job);
    if (!result) {
        // The disk keeps the last good state; memory records why it is behind
        std::string message = result.message();
        mutateJob(jobId, [&message](JobEntry&, Job& j) {
            j.progress.lastError = message;
            return true;
        });
    }
    return result;
}

uint64_t JobOrchestrator::subscribe(JobEventListener listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    uint64_t id = nextListenerId_++;
    listeners_[id] = std::move(listener);
    return id;
}

void JobOrchestrator::unsubscribe(uint64_t subscriptionId) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.erase(subscriptionId);
}

void JobOrchestrator::notify(const JobEvent& event, bool force) {
    std::vector<JobEventListener> targets;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        if (listeners_.empty()) {
            return;
        }
        if (event.type == JobEventType::PROGRESS) {
            auto now = std::chrono::steady_clock::now();
            auto it = lastProgressEvent_.find(event.jobId);
            if (!force && it != lastProgressEvent_.end() &&
                now - it->second < std::chrono::milliseconds(config_.eventIntervalMs)) {
                return;
            }
            lastProgressEvent_[event.jobId] = now;
        }
        targets.reserve(listeners_.size());
        for (const auto& pair : listeners_) {
            targets.push_back(pair.second);
        }
    }

    for (const auto& listener : targets) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            Logger::error("Job event listener failed: " + std::string(e.what()));
        }
    }
}

void JobOrchestrator::notifyStatus(const JobView& job) {
    JobEvent event;
    event.type = JobEventType::STATUS;
    event.jobId = job->id;
    event.status = job->status;
    event.progress = job->progress;
    notify(event, true);
}

void JobOrchestrator::notifyProgress(const JobView& job, bool force) {
    JobEvent event;
    event.type = JobEventType::PROGRESS;
    event.jobId = job->id;
    event.status = job->status;
    event.progress = job->progress;
    notify(event, force);
}

Result JobOrchestrator::validateConfig(const JobConfig& config) const {
    if (trim(config.name).empty()) {
        return Result::failure(ErrorCode::VALIDATION, "Job name is required");
    }
    if (trim(config.source).empty()) {
        return Result::failure(ErrorCode::VALIDATION, "Source path is required");
    }
    if (trim(config.destination).empty()) {
        return Result::failure(ErrorCode::VALIDATION, "Destination path is required");
    }
    if (config.settings.bandwidthLimitKbps && *config.settings.bandwidthLimitKbps == 0) {
        return Result::failure(ErrorCode::VALIDATION, "Bandwidth limit must be greater than zero");
    }
    if (config.settings.deleteSourceAfter && !config.settings.deletionConfirmed) {
        return Result::failure(ErrorCode::VALIDATION,
                               "Deleting the source requires explicit confirmation");
    }

    Result paths = validatePaths(trim(config.source), trim(config.destination), config.kind);
    if (!paths) {
        return paths;
    }
    if (config.settings.deleteSourceAfter) {
        return validateDeletionSafety(config);
    }
    return Result::success();
}

Result JobOrchestrator::validatePaths(const std::string& source, const std::string& destination,
                                      JobKind kind) const {
    bool sourceRemote = utils::isRemotePath(source);
    bool destinationRemote = utils::isRemotePath(destination);

    if (kind == JobKind::RCLONE && !sourceRemote && !destinationRemote) {
        return Result::failure(ErrorCode::VALIDATION,
                               "rclone jobs need a remote path (remote:path) as source or destination");
    }

    std::error_code ec;
    if (!sourceRemote) {
        if (!fs::exists(source, ec)) {
            return Result::failure(ErrorCode::VALIDATION, "Source path does not exist: " + source);
        }
        if (access(source.c_str(), R_OK) != 0) {
            return Result::failure(ErrorCode::VALIDATION, "Source path is not readable: " + source);
        }
    }

    if (!destinationRemote) {
        fs::path target(destination);
        if (fs::exists(target, ec)) {
            if (!fs::is_directory(target, ec)) {
                return Result::failure(ErrorCode::VALIDATION,
                                       "Destination exists and is not a directory: " + destination);
            }
            if (access(destination.c_str(), W_OK) != 0) {
                return Result::failure(ErrorCode::VALIDATION, "Destination is not writable: " + destination);
            }
        } else {
            fs::path parent = fs::absolute(target, ec).parent_path();
            if (!fs::is_directory(parent, ec)) {
                return Result::failure(ErrorCode::VALIDATION,
                                       "Destination parent directory does not exist: " + parent.string());
            }
            if (access(parent.c_str(), W_OK) != 0) {
                return Result::failure(ErrorCode::VALIDATION,
                                       "Destination parent directory is not writable: " + parent.string());
            }
        }
    }
    return Result::success();
}

Result JobOrchestrator::validateDeletionSafety(const JobConfig& config) const {
    std::string source = trim(config.source);
    std::string destination = trim(config.destination);
    bool sourceRemote = utils::isRemotePath(source);
    bool destinationRemote = utils::isRemotePath(destination);

    if (config.kind == JobKind::RSYNC && config.settings.deletionMode == DeletionMode::PER_FILE && sourceRemote) {
        return Result::failure(ErrorCode::VALIDATION, "Per-file deletion with rsync requires a local source");
    }

    if (sourceRemote || destinationRemote) {
        if (source == destination) {
            return Result::failure(ErrorCode::VALIDATION, "Source and destination must be different");
        }
        return Result::success();
    }

    fs::path sourcePath = normalizedPath(source);
    fs::path destinationPath = normalizedPath(destination);
    if (sourcePath == destinationPath) {
        return Result::failure(ErrorCode::VALIDATION, "Source and destination must be different");
    }

    fs::path relative = destinationPath.lexically_relative(sourcePath);
    if (!relative.empty() && relative.native() != "." && relative.begin()->string() != "..") {
        return Result::failure(ErrorCode::VALIDATION, "Destination must not be inside the source");
    }
    return Result::success();
}

std::string JobOrchestrator::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

void JobOrchestrator::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = error;
}
