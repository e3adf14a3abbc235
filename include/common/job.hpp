#pragma once

#include <string>
#include <memory>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

enum class JobStatus {
    PENDING,
    RUNNING,
    PAUSED,
    COMPLETED,
    FAILED
};

// Transfer tool family that runs the job
enum class JobKind {
    RSYNC,
    RCLONE
};

enum class DeletionMode {
    VERIFY_THEN_DELETE,
    PER_FILE
};

enum class VerificationMode {
    SIZE,
    CHECKSUM
};

enum class DeletionPhase {
    NONE,
    TRANSFERRING,
    VERIFYING,
    DELETING,
    COMPLETED,
    FAILED
};

struct JobSettings {
    std::optional<uint64_t> bandwidthLimitKbps;
    bool deleteSourceAfter{false};
    DeletionMode deletionMode{DeletionMode::VERIFY_THEN_DELETE};
    bool deletionConfirmed{false};
    VerificationMode verificationMode{VerificationMode::SIZE};
};

struct DeletionProgress {
    DeletionPhase phase{DeletionPhase::NONE};
    uint64_t filesDeleted{0};
    uint64_t bytesDeleted{0};
    uint64_t errors{0};
    std::string lastError;
};

struct JobProgress {
    uint64_t bytesTransferred{0};
    std::optional<uint64_t> totalBytes;  // unset until first derivable
    int percent{0};
    uint64_t speedBytes{0};
    uint64_t etaSeconds{0};
    int retryCount{0};
    std::string lastError;
    DeletionProgress deletion;
};

// User-supplied part of a job, validated by the orchestrator on creation
struct JobConfig {
    std::string name;
    std::string source;
    std::string destination;
    JobKind kind{JobKind::RSYNC};
    JobSettings settings;
};

struct Job {
    std::string id;
    std::string name;
    std::string source;
    std::string destination;
    JobKind kind{JobKind::RSYNC};
    JobStatus status{JobStatus::PENDING};
    JobSettings settings;
    JobProgress progress;
    std::string createdAt;
    std::string updatedAt;
    uint64_t revision{0};

    // Bumps updatedAt and the revision; called on every mutation
    void touch();

    bool isDeleting() const;
    bool usesMoveMode() const;
};

// Immutable snapshot handed to readers
using JobView = std::shared_ptr<const Job>;

std::string generateJobId();
std::string currentTimestamp();

std::string toString(JobStatus status);
std::string toString(JobKind kind);
std::string toString(DeletionMode mode);
std::string toString(VerificationMode mode);
std::string toString(DeletionPhase phase);

bool parseJobStatus(const std::string& text, JobStatus& status);
bool parseJobKind(const std::string& text, JobKind& kind);
bool parseDeletionMode(const std::string& text, DeletionMode& mode);
bool parseVerificationMode(const std::string& text, VerificationMode& mode);
bool parseDeletionPhase(const std::string& text, DeletionPhase& phase);

// JSON mapping used by JobStorage; from_json throws nlohmann::json::exception
// or std::invalid_argument on malformed records
void to_json(nlohmann::json& j, const JobSettings& settings);
void from_json(const nlohmann::json& j, JobSettings& settings);
void to_json(nlohmann::json& j, const DeletionProgress& deletion);
void from_json(const nlohmann::json& j, DeletionProgress& deletion);
void to_json(nlohmann::json& j, const JobProgress& progress);
void from_json(const nlohmann::json& j, JobProgress& progress);
void to_json(nlohmann::json& j, const Job& job);
void from_json(const nlohmann::json& j, Job& job);
