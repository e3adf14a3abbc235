#include <gtest/gtest.h>
#include "orchestrator/job_orchestrator.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;

namespace {

const char* kCompletingTool =
    "echo 'sending incremental file list'\n"
    "echo '            500  50%    1.00kB/s    0:00:01'\n"
    "sleep 0.1\n"
    "echo '          1,000 100%    1.00kB/s    0:00:00 (xfr#2, to-chk=0/2)'\n"
    "exit 0\n";

const char* kSlowTool =
    "echo '            300  30%    1.00kB/s    0:00:10'\n"
    "sleep 30\n";

} // namespace

class JobOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = dir_.path() / "source";
        destination_ = dir_.path() / "destination";
        writeFile(source_ / "a.txt", "alpha");
        writeFile(source_ / "sub" / "b.txt", "bravo!");
        fs::create_directories(destination_);

        config_ = defaultConfig();
        config_.storagePath = dir_.file("state/jobs.json");
        config_.logDir = dir_.file("logs");
        config_.logPath = dir_.file("logs/jobpilot.log");
        config_.initialBackoffMs = 10;
        config_.maxBackoffMs = 50;
        config_.maxRetryAttempts = 2;
        config_.stopGracePeriodMs = 2000;
        config_.eventIntervalMs = 0;
        config_.progressPersistIntervalMs = 0;
        config_.persistenceBackoffMs = 5;
        useTool(kCompletingTool);
    }

    void TearDown() override {
        if (orchestrator_) {
            orchestrator_->shutdown();
        }
    }

    void useTool(const std::string& script) {
        config_.rsyncBinary = writeScript(dir_.path() / ("tool" + std::to_string(++tools_)), script);
    }

    std::shared_ptr<JobOrchestrator> launch() {
        storage_ = std::make_shared<JobStorage>(config_.storagePath);
        orchestrator_ = std::make_shared<JobOrchestrator>(
            config_, storage_, std::make_shared<TransferEngineFactory>(config_));
        EXPECT_TRUE(orchestrator_->initialize());
        return orchestrator_;
    }

    JobConfig makeConfig(const std::string& name = "photos") {
        JobConfig config;
        config.name = name;
        config.source = source_.string() + "/";
        config.destination = destination_.string();
        config.kind = JobKind::RSYNC;
        return config;
    }

    JobView create(const JobConfig& config) {
        JobView job;
        Result result = orchestrator_->createJob(config, job);
        EXPECT_TRUE(result) << result.message();
        return job;
    }

    bool waitForJob(const std::string& id, const std::function<bool(const Job&)>& condition) {
        return waitUntil([&]() {
            JobView job = orchestrator_->getJob(id);
            return job && condition(*job);
        });
    }

    Job stored(const std::string& id) {
        JobStorage reader(config_.storagePath);
        Job job;
        EXPECT_TRUE(reader.getJob(id, job)) << reader.getLastError();
        return job;
    }

    TempDir dir_;
    fs::path source_;
    fs::path destination_;
    AppConfig config_;
    int tools_{0};
    std::shared_ptr<JobStorage> storage_;
    std::shared_ptr<JobOrchestrator> orchestrator_;
};

TEST_F(JobOrchestratorTest, CompletedRunKeepsDerivedTotal) {
    launch();
    JobView job = create(makeConfig());
    ASSERT_TRUE(job);
    EXPECT_EQ(job->status, JobStatus::PENDING);
    EXPECT_EQ(stored(job->id).status, JobStatus::PENDING);

    ASSERT_TRUE(orchestrator_->startJob(job->id));
    ASSERT_TRUE(waitForJob(job->id, [](const Job& j) { return j.status == JobStatus::COMPLETED; }));

    JobView done = orchestrator_->getJob(job->id);
    EXPECT_EQ(done->progress.percent, 100);
    ASSERT_TRUE(done->progress.totalBytes.has_value());
    EXPECT_EQ(*done->progress.totalBytes, 1000u);
    EXPECT_EQ(done->progress.deletion.phase, DeletionPhase::NONE);

    Job persisted = stored(job->id);
    EXPECT_EQ(persisted.status, JobStatus::COMPLETED);
    ASSERT_TRUE(persisted.progress.totalBytes.has_value());
    EXPECT_EQ(*persisted.progress.totalBytes, 1000u);

    Result again = orchestrator_->startJob(job->id);
    EXPECT_EQ(again.code(), ErrorCode::CONCURRENCY);
}

TEST_F(JobOrchestratorTest, VerificationMismatchBlocksSourceDeletion) {
    writeFile(destination_ / "a.txt", "alpha");
    writeFile(destination_ / "sub" / "b.txt", "bra");
    launch();

    JobConfig config = makeConfig();
    config.settings.deleteSourceAfter = true;
    config.settings.deletionMode = DeletionMode::VERIFY_THEN_DELETE;
    config.settings.deletionConfirmed = true;
    JobView job = create(config);
    ASSERT_TRUE(job);

    ASSERT_TRUE(orchestrator_->startJob(job->id));
    ASSERT_TRUE(waitForJob(job->id, [](const Job& j) {
        return j.progress.deletion.phase == DeletionPhase::FAILED;
    }));

    JobView done = orchestrator_->getJob(job->id);
    EXPECT_EQ(done->status, JobStatus::COMPLETED);
    EXPECT_EQ(done->progress.deletion.filesDeleted, 0u);
    EXPECT_EQ(done->progress.deletion.errors, 1u);
    EXPECT_TRUE(fs::exists(source_ / "a.txt"));
    EXPECT_TRUE(fs::exists(source_ / "sub" / "b.txt"));

    ASSERT_TRUE(waitUntil([&]() {
        return stored(job->id).progress.deletion.phase == DeletionPhase::FAILED;
    }));
    EXPECT_EQ(stored(job->id).status, JobStatus::COMPLETED);
}

TEST_F(JobOrchestratorTest, VerifiedTransferDeletesSource) {
    writeFile(destination_ / "a.txt", "alpha");
    writeFile(destination_ / "sub" / "b.txt", "bravo!");
    launch();

    JobConfig config = makeConfig();
    config.settings.deleteSourceAfter = true;
    config.settings.deletionConfirmed = true;
    config.settings.verificationMode = VerificationMode::CHECKSUM;
    JobView job = create(config);
    ASSERT_TRUE(job);

    ASSERT_TRUE(orchestrator_->startJob(job->id));
    ASSERT_TRUE(waitForJob(job->id, [](const Job& j) {
        return j.progress.deletion.phase == DeletionPhase::COMPLETED;
    }));

    JobView done = orchestrator_->getJob(job->id);
    EXPECT_EQ(done->progress.deletion.filesDeleted, 2u);
    EXPECT_EQ(done->progress.deletion.bytesDeleted, 11u);
    EXPECT_FALSE(fs::exists(source_ / "a.txt"));
    EXPECT_TRUE(fs::exists(destination_ / "a.txt"));
    EXPECT_TRUE(fs::exists(dir_.path() / "logs" / ("deletions_" + job->id + ".log")));
}

TEST_F(JobOrchestratorTest, PerFileRunUsesMoveModeAndCountsRemovals) {
    useTool(
        "echo 'sender removed a.txt'\n"
        "echo 'sender removed sub/b.txt'\n"
        "echo '             11 100%    1.00kB/s    0:00:00'\n"
        "exit 0\n");
    launch();

    JobConfig config = makeConfig();
    config.settings.deleteSourceAfter = true;
    config.settings.deletionMode = DeletionMode::PER_FILE;
    config.settings.deletionConfirmed = true;
    JobView job = create(config);
    ASSERT_TRUE(job);

    ASSERT_TRUE(orchestrator_->startJob(job->id));
    ASSERT_TRUE(waitForJob(job->id, [](const Job& j) {
        return j.status == JobStatus::COMPLETED && j.progress.deletion.phase == DeletionPhase::COMPLETED;
    }));

    JobView done = orchestrator_->getJob(job->id);
    EXPECT_EQ(done->progress.deletion.filesDeleted, 2u);
    EXPECT_EQ(done->progress.deletion.bytesDeleted, 11u);

    auto engine = orchestrator_->getEngine(job->id);
    ASSERT_TRUE(engine);
    auto launches = engine->getLaunchHistory();
    ASSERT_EQ(launches.size(), 1u);
    EXPECT_NE(std::find(launches[0].begin(), launches[0].end(), "--remove-source-files"), launches[0].end());
}

TEST_F(JobOrchestratorTest, InterruptedRunsAreRecoveredAsPaused) {
    Job running;
    running.id = "job-c";
    running.name = "crashed";
    running.source = source_.string();
    running.destination = destination_.string();
    running.status = JobStatus::RUNNING;
    running.progress.bytesTransferred = 400;
    running.progress.totalBytes = 1000;
    running.progress.percent = 40;
    running.revision = 3;

    Job deleting = running;
    deleting.id = "job-e";
    deleting.status = JobStatus::COMPLETED;
    deleting.settings.deleteSourceAfter = true;
    deleting.settings.deletionConfirmed = true;
    deleting.progress.deletion.phase = DeletionPhase::DELETING;
    deleting.progress.deletion.filesDeleted = 4;
    {
        JobStorage writer(config_.storagePath);
        ASSERT_TRUE(writer.initialize());
        ASSERT_TRUE(writer.saveJob(running));
        ASSERT_TRUE(writer.saveJob(deleting));
    }

    launch();
    auto interrupted = orchestrator_->recoverInterruptedJobs();
    ASSERT_EQ(interrupted.size(), 1u);
    EXPECT_EQ(interrupted[0]->id, "job-c");
    EXPECT_EQ(orchestrator_->getJob("job-c")->status, JobStatus::RUNNING);

    JobView unfinished = orchestrator_->getJob("job-e");
    EXPECT_EQ(unfinished->progress.deletion.phase, DeletionPhase::FAILED);
    EXPECT_EQ(unfinished->progress.deletion.filesDeleted, 4u);
    EXPECT_EQ(unfinished->progress.deletion.lastError, "interrupted by unclean shutdown");

    ASSERT_TRUE(orchestrator_->resolveRecovery(true));
    JobView paused = orchestrator_->getJob("job-c");
    EXPECT_EQ(paused->status, JobStatus::PAUSED);
    EXPECT_EQ(paused->progress.percent, 40);
    EXPECT_EQ(paused->progress.bytesTransferred, 400u);
    EXPECT_EQ(stored("job-c").status, JobStatus::PAUSED);
    EXPECT_TRUE(orchestrator_->recoverInterruptedJobs().empty());
}

TEST_F(JobOrchestratorTest, LeavingRecoveredRunsUntouched) {
    Job running;
    running.id = "job-c";
    running.name = "crashed";
    running.source = source_.string();
    running.destination = destination_.string();
    running.status = JobStatus::RUNNING;
    running.revision = 1;
    {
        JobStorage writer(config_.storagePath);
        ASSERT_TRUE(writer.initialize());
        ASSERT_TRUE(writer.saveJob(running));
    }

    launch();
    ASSERT_TRUE(orchestrator_->resolveRecovery(false));
    EXPECT_EQ(orchestrator_->getJob("job-c")->status, JobStatus::RUNNING);
    EXPECT_EQ(orchestrator_->recoverInterruptedJobs().size(), 1u);

    // a recovered run has no engine; pausing just records the state
    ASSERT_TRUE(orchestrator_->pauseJob("job-c"));
    EXPECT_EQ(stored("job-c").status, JobStatus::PAUSED);
}

TEST_F(JobOrchestratorTest, PauseCapturesProgressAndAllowsRestart) {
    useTool(kSlowTool);
    launch();
    JobView job = create(makeConfig());
    ASSERT_TRUE(job);

    ASSERT_TRUE(orchestrator_->startJob(job->id));
    EXPECT_EQ(orchestrator_->startJob(job->id).code(), ErrorCode::CONCURRENCY);
    EXPECT_EQ(orchestrator_->deleteJob(job->id).code(), ErrorCode::CONCURRENCY);
    ASSERT_TRUE(waitForJob(job->id, [](const Job& j) { return j.progress.bytesTransferred == 300; }));

    Result paused = orchestrator_->pauseJob(job->id);
    ASSERT_TRUE(paused) << paused.message();

    JobView snapshot = orchestrator_->getJob(job->id);
    EXPECT_EQ(snapshot->status, JobStatus::PAUSED);
    EXPECT_EQ(snapshot->progress.bytesTransferred, 300u);
    EXPECT_EQ(snapshot->progress.speedBytes, 0u);
    EXPECT_EQ(stored(job->id).status, JobStatus::PAUSED);
    EXPECT_EQ(stored(job->id).progress.bytesTransferred, 300u);

    auto engine = orchestrator_->getEngine(job->id);
    ASSERT_TRUE(engine);
    EXPECT_TRUE(engine->hasExited());
    EXPECT_EQ(orchestrator_->pauseJob(job->id).code(), ErrorCode::CONCURRENCY);

    // the stop event of the old run must not fail the job
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(orchestrator_->getJob(job->id)->status, JobStatus::PAUSED);

    ASSERT_TRUE(orchestrator_->startJob(job->id));
    EXPECT_EQ(orchestrator_->getJob(job->id)->status, JobStatus::RUNNING);
    EXPECT_NE(orchestrator_->getEngine(job->id), engine);
    ASSERT_TRUE(orchestrator_->pauseJob(job->id));
}

TEST_F(JobOrchestratorTest, FatalToolErrorFailsJob) {
    useTool("echo 'rsync: change_dir \"/x\" failed: Permission denied (13)'\nexit 23\n");
    launch();
    JobView job = create(makeConfig());
    ASSERT_TRUE(job);

    ASSERT_TRUE(orchestrator_->startJob(job->id));
    ASSERT_TRUE(waitForJob(job->id, [](const Job& j) { return j.status == JobStatus::FAILED; }));
    JobView failed = orchestrator_->getJob(job->id);
    EXPECT_NE(failed->progress.lastError.find("code 23"), std::string::npos);
    EXPECT_EQ(stored(job->id).status, JobStatus::FAILED);

    // failed jobs may be retried
    ASSERT_TRUE(orchestrator_->startJob(job->id));
    ASSERT_TRUE(waitForJob(job->id, [](const Job& j) { return j.status == JobStatus::FAILED; }));
    EXPECT_EQ(orchestrator_->getEngine(job->id)->getLaunchHistory().size(), 1u);
}

TEST_F(JobOrchestratorTest, UnstartableToolFailsJob) {
    config_.rsyncBinary = dir_.file("missing-rsync");
    launch();
    JobView job = create(makeConfig());
    ASSERT_TRUE(job);

    Result result = orchestrator_->startJob(job->id);
    EXPECT_EQ(result.code(), ErrorCode::FATAL_ENGINE);
    JobView failed = orchestrator_->getJob(job->id);
    EXPECT_EQ(failed->status, JobStatus::FAILED);
    EXPECT_NE(failed->progress.lastError.find("Failed to start rsync"), std::string::npos);
}

TEST_F(JobOrchestratorTest, RejectsInvalidJobs) {
    launch();
    JobView job;

    JobConfig unconfirmed = makeConfig();
    unconfirmed.settings.deleteSourceAfter = true;
    Result result = orchestrator_->createJob(unconfirmed, job);
    EXPECT_EQ(result.code(), ErrorCode::VALIDATION);
    EXPECT_NE(result.message().find("confirmation"), std::string::npos);

    JobConfig unnamed = makeConfig("  ");
    EXPECT_EQ(orchestrator_->createJob(unnamed, job).code(), ErrorCode::VALIDATION);

    JobConfig missing = makeConfig();
    missing.source = dir_.file("nowhere");
    EXPECT_EQ(orchestrator_->createJob(missing, job).code(), ErrorCode::VALIDATION);

    JobConfig nested = makeConfig();
    nested.destination = (source_ / "copy").string();
    nested.settings.deleteSourceAfter = true;
    nested.settings.deletionConfirmed = true;
    EXPECT_EQ(orchestrator_->createJob(nested, job).code(), ErrorCode::VALIDATION);

    JobConfig same = makeConfig();
    same.destination = source_.string();
    same.settings.deleteSourceAfter = true;
    same.settings.deletionConfirmed = true;
    EXPECT_EQ(orchestrator_->createJob(same, job).code(), ErrorCode::VALIDATION);

    JobConfig localRclone = makeConfig();
    localRclone.kind = JobKind::RCLONE;
    EXPECT_EQ(orchestrator_->createJob(localRclone, job).code(), ErrorCode::VALIDATION);

    JobConfig remotePerFile = makeConfig();
    remotePerFile.source = "gdrive:photos";
    remotePerFile.settings.deleteSourceAfter = true;
    remotePerFile.settings.deletionMode = DeletionMode::PER_FILE;
    remotePerFile.settings.deletionConfirmed = true;
    EXPECT_EQ(orchestrator_->createJob(remotePerFile, job).code(), ErrorCode::VALIDATION);

    JobConfig zeroLimit = makeConfig();
    zeroLimit.settings.bandwidthLimitKbps = 0;
    EXPECT_EQ(orchestrator_->createJob(zeroLimit, job).code(), ErrorCode::VALIDATION);

    EXPECT_TRUE(orchestrator_->listJobs().empty());
    EXPECT_EQ(storage_->countJobs(), 0u);
}

TEST_F(JobOrchestratorTest, DeleteRemovesJobEverywhere) {
    launch();
    JobView job = create(makeConfig());
    ASSERT_TRUE(job);

    EXPECT_EQ(orchestrator_->deleteJob("unknown").code(), ErrorCode::NOT_FOUND);
    ASSERT_TRUE(orchestrator_->deleteJob(job->id));
    EXPECT_FALSE(orchestrator_->getJob(job->id));
    EXPECT_EQ(storage_->countJobs(), 0u);
    EXPECT_EQ(orchestrator_->startJob(job->id).code(), ErrorCode::NOT_FOUND);
}

TEST_F(JobOrchestratorTest, DefaultBandwidthLimitApplies) {
    config_.defaultBandwidthLimitKbps = 750;
    launch();
    JobView job = create(makeConfig());
    ASSERT_TRUE(job);
    ASSERT_TRUE(job->settings.bandwidthLimitKbps.has_value());
    EXPECT_EQ(*job->settings.bandwidthLimitKbps, 750u);
}

TEST_F(JobOrchestratorTest, ListenersSeeStatusTransitions) {
    launch();
    std::mutex mutex;
    std::vector<JobStatus> statuses;
    std::atomic<int> progressEvents{0};
    uint64_t id = orchestrator_->subscribe([&](const JobEvent& event) {
        if (event.type == JobEventType::STATUS) {
            std::lock_guard<std::mutex> lock(mutex);
            statuses.push_back(event.status);
        } else {
            ++progressEvents;
        }
    });

    JobView job = create(makeConfig());
    ASSERT_TRUE(job);
    ASSERT_TRUE(orchestrator_->startJob(job->id));
    ASSERT_TRUE(waitForJob(job->id, [](const Job& j) { return j.status == JobStatus::COMPLETED; }));
    orchestrator_->unsubscribe(id);

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(statuses, (std::vector<JobStatus>{JobStatus::PENDING, JobStatus::RUNNING, JobStatus::COMPLETED}));
    EXPECT_GE(progressEvents.load(), 1);
}

TEST_F(JobOrchestratorTest, ReadersNeverSeeTornSnapshots) {
    launch();
    std::vector<JobView> jobs;
    for (int i = 0; i < 4; ++i) {
        jobs.push_back(create(makeConfig("job" + std::to_string(i))));
        ASSERT_TRUE(jobs.back());
    }

    std::atomic<bool> reading{true};
    std::atomic<int> violations{0};
    std::thread reader([&]() {
        std::map<std::string, uint64_t> lastRevision;
        while (reading) {
            for (const auto& job : orchestrator_->listJobs()) {
                uint64_t& last = lastRevision[job->id];
                if (job->revision < last) {
                    ++violations;
                }
                last = job->revision;
                if (job->status == JobStatus::COMPLETED && job->progress.percent != 100) {
                    ++violations;
                }
                if (job->progress.totalBytes && job->progress.bytesTransferred > *job->progress.totalBytes) {
                    ++violations;
                }
            }
        }
    });

    for (const auto& job : jobs) {
        ASSERT_TRUE(orchestrator_->startJob(job->id));
    }
    for (const auto& job : jobs) {
        EXPECT_TRUE(waitForJob(job->id, [](const Job& j) { return j.status == JobStatus::COMPLETED; }));
    }
    reading = false;
    reader.join();
    EXPECT_EQ(violations.load(), 0);
}

TEST_F(JobOrchestratorTest, ExitedEnginesAreReaped) {
    config_.engineRetentionSeconds = 0;
    launch();
    JobView job = create(makeConfig());
    ASSERT_TRUE(job);
    ASSERT_TRUE(orchestrator_->startJob(job->id));
    ASSERT_TRUE(waitForJob(job->id, [](const Job& j) { return j.status == JobStatus::COMPLETED; }));

    EXPECT_TRUE(waitUntil([&]() {
        orchestrator_->reapEngines();
        return orchestrator_->engineCount() == 0;
    }));
}

TEST_F(JobOrchestratorTest, RetainedEnginesAreCappedOldestFirst) {
    config_.engineRetentionSeconds = 3600;
    config_.maxRetainedEngines = 1;
    launch();

    std::vector<std::string> ids;
    for (const char* name : {"first", "second", "third"}) {
        JobView job = create(makeConfig(name));
        ASSERT_TRUE(job);
        ASSERT_TRUE(orchestrator_->startJob(job->id));
        ASSERT_TRUE(waitForJob(job->id, [](const Job& j) { return j.status == JobStatus::COMPLETED; }));
        ids.push_back(job->id);
    }

    EXPECT_TRUE(waitUntil([&]() {
        orchestrator_->reapEngines();
        return orchestrator_->engineCount() == 1 && orchestrator_->getEngine(ids[2]) != nullptr;
    }));
    EXPECT_EQ(orchestrator_->getEngine(ids[0]), nullptr);
    EXPECT_EQ(orchestrator_->getEngine(ids[1]), nullptr);
}

TEST_F(JobOrchestratorTest, PersistenceFailureRollsBackCommands) {
    config_.persistenceRetries = 3;
    launch();
    JobView job = create(makeConfig());
    ASSERT_TRUE(job);

    // Every write goes through the temp file, so a directory in its place fails them all
    std::string tmpPath = config_.storagePath + ".tmp";
    fs::create_directories(tmpPath);

    Result started = orchestrator_->startJob(job->id);
    EXPECT_EQ(started.code(), ErrorCode::PERSISTENCE);
    EXPECT_EQ(orchestrator_->getJob(job->id)->status, JobStatus::PENDING);
    EXPECT_EQ(orchestrator_->engineCount(), 0u);
    EXPECT_EQ(stored(job->id).status, JobStatus::PENDING);

    JobView rejected;
    EXPECT_EQ(orchestrator_->createJob(makeConfig("other"), rejected).code(), ErrorCode::PERSISTENCE);
    EXPECT_FALSE(rejected);
    EXPECT_EQ(orchestrator_->listJobs().size(), 1u);

    fs::remove_all(tmpPath);
    ASSERT_TRUE(orchestrator_->startJob(job->id));
    EXPECT_TRUE(waitForJob(job->id, [](const Job& j) { return j.status == JobStatus::COMPLETED; }));
}

TEST_F(JobOrchestratorTest, ShutdownPausesRunningJobs) {
    useTool(kSlowTool);
    launch();
    JobView job = create(makeConfig());
    ASSERT_TRUE(job);
    ASSERT_TRUE(orchestrator_->startJob(job->id));
    ASSERT_TRUE(waitForJob(job->id, [](const Job& j) { return j.progress.bytesTransferred == 300; }));

    orchestrator_->shutdown();
    EXPECT_EQ(stored(job->id).status, JobStatus::PAUSED);
    EXPECT_EQ(orchestrator_->startJob(job->id).code(), ErrorCode::CONCURRENCY);
}
