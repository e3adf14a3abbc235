#pragma once

#include "common/job.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <mutex>
#include <chrono>

// Durable job records in a single versioned JSON document:
//   {"version": 1, "jobs": {"<id>": {...}}}
//
// Every write is a locked read-modify-write: the new document goes to
// <path>.tmp and is fsynced, the current file is kept as <path>.bak, then the
// temp file is renamed over the live one. A process-local timed mutex and
// an flock on <path>.lock guard the cycle.
class JobStorage {
public:
    static constexpr int kFormatVersion = 1;

    explicit JobStorage(const std::string& path,
                        std::chrono::milliseconds lockTimeout = std::chrono::milliseconds(2000));
    ~JobStorage();

    JobStorage(const JobStorage&) = delete;
    JobStorage& operator=(const JobStorage&) = delete;

    bool initialize();

    // Falls back to the backup when the live file is corrupt; false when
    // neither can be read (jobs is left empty)
    bool loadJobs(std::vector<Job>& jobs);

    // Insert or replace. A record older than the stored revision is skipped.
    bool saveJob(const Job& job);
    // Removing an absent record succeeds
    bool deleteJob(const std::string& jobId);
    bool getJob(const std::string& jobId, Job& job);
    bool clearAll();
    size_t countJobs();

    const std::string& getPath() const { return path_; }
    std::string getLastError() const;
    uint64_t getSkippedWrites() const;

private:
    class Lock;

    bool readDocument(const std::string& path, nlohmann::json& document);
    bool readCurrent(nlohmann::json& document, bool& liveReadable);
    bool writeDocument(const nlohmann::json& document, bool backupLive);
    void setError(const std::string& error);

    std::string path_;
    std::string tmpPath_;
    std::string backupPath_;
    std::string lockPath_;
    std::chrono::milliseconds lockTimeout_;

    std::timed_mutex ioMutex_;
    std::string lastError_;
    uint64_t skippedWrites_{0};
    mutable std::mutex errorMutex_;
};
