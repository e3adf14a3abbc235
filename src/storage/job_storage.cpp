#include "storage/job_storage.hpp"
#include "common/logger.hpp"
#include "common/thread_utils.hpp"
#include <filesystem>
#include <fstream>
#include <cerrno>
#include <cstring>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

// Holds the process-local mutex and the advisory file lock for one cycle
class JobStorage::Lock {
public:
    explicit Lock(JobStorage& storage)
        : storage_(storage) {
        auto deadline = std::chrono::steady_clock::now() + storage_.lockTimeout_;
        if (!storage_.ioMutex_.try_lock_until(deadline)) {
            error_ = "Timed out waiting for storage lock";
            return;
        }
        mutexHeld_ = true;

        fd_ = open(storage_.lockPath_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            error_ = "Failed to open lock file " + storage_.lockPath_ + ": " + strerror(errno);
            return;
        }
        while (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
            if (errno != EWOULDBLOCK && errno != EINTR) {
                error_ = "Failed to lock " + storage_.lockPath_ + ": " + strerror(errno);
                return;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                error_ = "Timed out waiting for file lock " + storage_.lockPath_;
                return;
            }
            ThreadUtils::sleepFor(std::chrono::milliseconds(10));
        }
        locked_ = true;
    }

    ~Lock() {
        if (fd_ >= 0) {
            if (locked_) {
                flock(fd_, LOCK_UN);
            }
            close(fd_);
        }
        if (mutexHeld_) {
            storage_.ioMutex_.unlock();
        }
    }

    Lock(const Lock&) = delete;
    Lock& operator=(const Lock&) = delete;

    bool acquired() const { return locked_; }
    const std::string& error() const { return error_; }

private:
    JobStorage& storage_;
    int fd_{-1};
    bool mutexHeld_{false};
    bool locked_{false};
    std::string error_;
};

JobStorage::JobStorage(const std::string& path, std::chrono::milliseconds lockTimeout)
    : path_(path)
    , tmpPath_(path + ".tmp")
    , backupPath_(path + ".bak")
    , lockPath_(path + ".lock")
    , lockTimeout_(lockTimeout) {
}

JobStorage::~JobStorage() = default;

bool JobStorage::initialize() {
    try {
        fs::path parent = fs::path(path_).parent_path();
        if (!parent.empty() && !fs::exists(parent)) {
            fs::create_directories(parent);
        }
    } catch (const fs::filesystem_error& e) {
        setError(std::string("Failed to create storage directory: ") + e.what());
        return false;
    }
    return true;
}

void JobStorage::setError(const std::string& error) {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = error;
}

std::string JobStorage::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

uint64_t JobStorage::getSkippedWrites() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return skippedWrites_;
}

bool JobStorage::readDocument(const std::string& path, json& document) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    try {
        file >> document;
    } catch (const json::exception& e) {
        Logger::warning("Failed to parse " + path + ": " + e.what());
        return false;
    }
    if (!document.is_object() || !document.contains("jobs") || !document.at("jobs").is_object()) {
        Logger::warning("Unexpected document layout in " + path);
        return false;
    }
    int version = document.value("version", 0);
    if (version != kFormatVersion) {
        Logger::warning("Unsupported storage version " + std::to_string(version) + " in " + path);
        return false;
    }
    return true;
}

bool JobStorage::readCurrent(json& document, bool& liveReadable) {
    liveReadable = false;
    std::error_code ec;
    bool liveExists = fs::exists(path_, ec);

    if (liveExists && readDocument(path_, document)) {
        liveReadable = true;
        return true;
    }
    if (fs::exists(backupPath_, ec) && readDocument(backupPath_, document)) {
        if (liveExists) {
            Logger::warning("Storage file " + path_ + " is corrupt, recovered state from " + backupPath_);
        }
        return true;
    }
    document = json{{"version", kFormatVersion}, {"jobs", json::object()}};
    return !liveExists;
}

bool JobStorage::writeDocument(const json& document, bool backupLive) {
    std::string content = document.dump(2);

    int fd = open(tmpPath_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        setError("Failed to open " + tmpPath_ + ": " + strerror(errno));
        return false;
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            setError("Failed to write " + tmpPath_ + ": " + strerror(errno));
            close(fd);
            unlink(tmpPath_.c_str());
            return false;
        }
        written += static_cast<size_t>(n);
    }
    if (fsync(fd) != 0) {
        setError("Failed to sync " + tmpPath_ + ": " + strerror(errno));
        close(fd);
        unlink(tmpPath_.c_str());
        return false;
    }
    close(fd);

    std::error_code ec;
    if (backupLive) {
        fs::copy_file(path_, backupPath_, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            Logger::warning("Failed to refresh storage backup " + backupPath_ + ": " + ec.message());
        }
    }

    if (rename(tmpPath_.c_str(), path_.c_str()) != 0) {
        setError("Failed to replace " + path_ + ": " + strerror(errno));
        unlink(tmpPath_.c_str());
        return false;
    }

    // Persist the rename itself
    fs::path parent = fs::path(path_).parent_path();
    int dirFd = open(parent.empty() ? "." : parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dirFd >= 0) {
        if (fsync(dirFd) != 0) {
            Logger::debug("Directory sync failed for " + path_ + ": " + strerror(errno));
        }
        close(dirFd);
    }
    return true;
}

bool JobStorage::loadJobs(std::vector<Job>& jobs) {
    jobs.clear();
    Lock lock(*this);
    if (!lock.acquired()) {
        setError(lock.error());
        return false;
    }

    json document;
    bool liveReadable = false;
    if (!readCurrent(document, liveReadable)) {
        std::string preserved = path_ + ".corrupt";
        std::error_code ec;
        fs::copy_file(path_, preserved, fs::copy_options::overwrite_existing, ec);
        setError("Storage file " + path_ + " and its backup are unreadable; copy kept at " + preserved);
        Logger::error(getLastError());
        return false;
    }

    for (const auto& item : document.at("jobs").items()) {
        try {
            jobs.push_back(item.value().get<Job>());
        } catch (const std::exception& e) {
            Logger::error("Skipping unreadable job record " + item.key() + ": " + e.what());
        }
    }
    Logger::info("Loaded " + std::to_string(jobs.size()) + " jobs from " + path_);
    return true;
}

bool JobStorage::saveJob(const Job& job) {
    Lock lock(*this);
    if (!lock.acquired()) {
        setError(lock.error());
        return false;
    }

    json document;
    bool liveReadable = false;
    if (!readCurrent(document, liveReadable)) {
        Logger::error("Storage file " + path_ + " unreadable, rewriting from current state");
    }

    auto& jobs = document["jobs"];
    if (jobs.contains(job.id)) {
        uint64_t stored = jobs.at(job.id).value("revision", static_cast<uint64_t>(0));
        if (stored > job.revision) {
            Logger::debug("Skipping stale write for job " + job.id + " (revision " +
                          std::to_string(job.revision) + " < " + std::to_string(stored) + ")");
            std::lock_guard<std::mutex> errorLock(errorMutex_);
            ++skippedWrites_;
            return true;
        }
    }

    try {
        jobs[job.id] = job;
    } catch (const json::exception& e) {
        setError(std::string("Failed to serialize job ") + job.id + ": " + e.what());
        return false;
    }
    return writeDocument(document, liveReadable);
}

bool JobStorage::deleteJob(const std::string& jobId) {
    Lock lock(*this);
    if (!lock.acquired()) {
        setError(lock.error());
        return false;
    }

    json document;
    bool liveReadable = false;
    if (!readCurrent(document, liveReadable)) {
        setError("Storage file " + path_ + " and its backup are unreadable");
        return false;
    }

    auto& jobs = document["jobs"];
    if (!jobs.contains(jobId)) {
        Logger::debug("Job " + jobId + " not present in storage, nothing to delete");
        return true;
    }
    jobs.erase(jobId);
    return writeDocument(document, liveReadable);
}

bool JobStorage::getJob(const std::string& jobId, Job& job) {
    Lock lock(*this);
    if (!lock.acquired()) {
        setError(lock.error());
        return false;
    }

    json document;
    bool liveReadable = false;
    if (!readCurrent(document, liveReadable)) {
        setError("Storage file " + path_ + " and its backup are unreadable");
        return false;
    }

    const auto& jobs = document.at("jobs");
    auto it = jobs.find(jobId);
    if (it == jobs.end()) {
        setError("Job not found in storage: " + jobId);
        return false;
    }
    try {
        job = it->get<Job>();
    } catch (const std::exception& e) {
        setError("Unreadable job record " + jobId + ": " + e.what());
        return false;
    }
    return true;
}

bool JobStorage::clearAll() {
    Lock lock(*this);
    if (!lock.acquired()) {
        setError(lock.error());
        return false;
    }

    json document;
    bool liveReadable = false;
    if (!readCurrent(document, liveReadable)) {
        Logger::warning("Clearing unreadable storage file " + path_);
    }
    return writeDocument(json{{"version", kFormatVersion}, {"jobs", json::object()}}, liveReadable);
}

size_t JobStorage::countJobs() {
    Lock lock(*this);
    if (!lock.acquired()) {
        setError(lock.error());
        return 0;
    }

    json document;
    bool liveReadable = false;
    if (!readCurrent(document, liveReadable)) {
        setError("Storage file " + path_ + " and its backup are unreadable");
        return 0;
    }
    return document.at("jobs").size();
}
