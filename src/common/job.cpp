#include "common/job.hpp"
#include <chrono>
#include <ctime>
#include <random>
#include <sstream>
#include <iomanip>
#include <stdexcept>

using json = nlohmann::json;

void Job::touch() {
    updatedAt = currentTimestamp();
    ++revision;
}

bool Job::isDeleting() const {
    return progress.deletion.phase == DeletionPhase::VERIFYING ||
           progress.deletion.phase == DeletionPhase::DELETING;
}

bool Job::usesMoveMode() const {
    return settings.deleteSourceAfter && settings.deletionMode == DeletionMode::PER_FILE;
}

std::string generateJobId() {
    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch());

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << std::hex << now_ms.count();
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }

    return ss.str();
}

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << ms;
    return ss.str();
}

std::string toString(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING:   return "pending";
        case JobStatus::RUNNING:   return "running";
        case JobStatus::PAUSED:    return "paused";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::FAILED:    return "failed";
    }
    return "unknown";
}

std::string toString(JobKind kind) {
    switch (kind) {
        case JobKind::RSYNC:  return "rsync";
        case JobKind::RCLONE: return "rclone";
    }
    return "unknown";
}

std::string toString(DeletionMode mode) {
    switch (mode) {
        case DeletionMode::VERIFY_THEN_DELETE: return "verify_then_delete";
        case DeletionMode::PER_FILE:           return "per_file";
    }
    return "unknown";
}

std::string toString(VerificationMode mode) {
    switch (mode) {
        case VerificationMode::SIZE:     return "size";
        case VerificationMode::CHECKSUM: return "checksum";
    }
    return "unknown";
}

std::string toString(DeletionPhase phase) {
    switch (phase) {
        case DeletionPhase::NONE:         return "none";
        case DeletionPhase::TRANSFERRING: return "transferring";
        case DeletionPhase::VERIFYING:    return "verifying";
        case DeletionPhase::DELETING:     return "deleting";
        case DeletionPhase::COMPLETED:    return "completed";
        case DeletionPhase::FAILED:       return "failed";
    }
    return "unknown";
}

bool parseJobStatus(const std::string& text, JobStatus& status) {
    for (auto candidate : {JobStatus::PENDING, JobStatus::RUNNING, JobStatus::PAUSED,
                           JobStatus::COMPLETED, JobStatus::FAILED}) {
        if (toString(candidate) == text) {
            status = candidate;
            return true;
        }
    }
    return false;
}

bool parseJobKind(const std::string& text, JobKind& kind) {
    for (auto candidate : {JobKind::RSYNC, JobKind::RCLONE}) {
        if (toString(candidate) == text) {
            kind = candidate;
            return true;
        }
    }
    return false;
}

bool parseDeletionMode(const std::string& text, DeletionMode& mode) {
    for (auto candidate : {DeletionMode::VERIFY_THEN_DELETE, DeletionMode::PER_FILE}) {
        if (toString(candidate) == text) {
            mode = candidate;
            return true;
        }
    }
    return false;
}

bool parseVerificationMode(const std::string& text, VerificationMode& mode) {
    for (auto candidate : {VerificationMode::SIZE, VerificationMode::CHECKSUM}) {
        if (toString(candidate) == text) {
            mode = candidate;
            return true;
        }
    }
    return false;
}

bool parseDeletionPhase(const std::string& text, DeletionPhase& phase) {
    for (auto candidate : {DeletionPhase::NONE, DeletionPhase::TRANSFERRING,
                           DeletionPhase::VERIFYING, DeletionPhase::DELETING,
                           DeletionPhase::COMPLETED, DeletionPhase::FAILED}) {
        if (toString(candidate) == text) {
            phase = candidate;
            return true;
        }
    }
    return false;
}

namespace {

template<typename Enum>
Enum enumField(const json& j, const char* key, Enum fallback,
               bool (*parse)(const std::string&, Enum&)) {
    if (!j.contains(key)) {
        return fallback;
    }
    Enum value = fallback;
    const std::string text = j.at(key).get<std::string>();
    if (!parse(text, value)) {
        throw std::invalid_argument(std::string("Invalid value for ") + key + ": " + text);
    }
    return value;
}

} // namespace

void to_json(json& j, const JobSettings& settings) {
    j = json{
        {"bandwidth_limit_kbps", settings.bandwidthLimitKbps ? json(*settings.bandwidthLimitKbps) : json(nullptr)},
        {"delete_source_after", settings.deleteSourceAfter},
        {"deletion_mode", toString(settings.deletionMode)},
        {"deletion_confirmed", settings.deletionConfirmed},
        {"verification_mode", toString(settings.verificationMode)}
    };
}

void from_json(const json& j, JobSettings& settings) {
    settings = JobSettings{};
    if (j.contains("bandwidth_limit_kbps") && !j.at("bandwidth_limit_kbps").is_null()) {
        settings.bandwidthLimitKbps = j.at("bandwidth_limit_kbps").get<uint64_t>();
    }
    settings.deleteSourceAfter = j.value("delete_source_after", false);
    settings.deletionMode = enumField(j, "deletion_mode", DeletionMode::VERIFY_THEN_DELETE, parseDeletionMode);
    settings.deletionConfirmed = j.value("deletion_confirmed", false);
    settings.verificationMode = enumField(j, "verification_mode", VerificationMode::SIZE, parseVerificationMode);
}

void to_json(json& j, const DeletionProgress& deletion) {
    j = json{
        {"phase", toString(deletion.phase)},
        {"files_deleted", deletion.filesDeleted},
        {"bytes_deleted", deletion.bytesDeleted},
        {"errors", deletion.errors},
        {"last_error", deletion.lastError}
    };
}

void from_json(const json& j, DeletionProgress& deletion) {
    deletion = DeletionProgress{};
    deletion.phase = enumField(j, "phase", DeletionPhase::NONE, parseDeletionPhase);
    deletion.filesDeleted = j.value("files_deleted", uint64_t{0});
    deletion.bytesDeleted = j.value("bytes_deleted", uint64_t{0});
    deletion.errors = j.value("errors", uint64_t{0});
    deletion.lastError = j.value("last_error", std::string());
}

void to_json(json& j, const JobProgress& progress) {
    j = json{
        {"bytes_transferred", progress.bytesTransferred},
        {"total_bytes", progress.totalBytes ? json(*progress.totalBytes) : json(nullptr)},
        {"percent", progress.percent},
        {"speed_bytes", progress.speedBytes},
        {"eta_seconds", progress.etaSeconds},
        {"retry_count", progress.retryCount},
        {"last_error", progress.lastError},
        {"deletion", progress.deletion}
    };
}

void from_json(const json& j, JobProgress& progress) {
    progress = JobProgress{};
    progress.bytesTransferred = j.value("bytes_transferred", uint64_t{0});
    if (j.contains("total_bytes") && !j.at("total_bytes").is_null()) {
        progress.totalBytes = j.at("total_bytes").get<uint64_t>();
    }
    progress.percent = j.value("percent", 0);
    progress.speedBytes = j.value("speed_bytes", uint64_t{0});
    progress.etaSeconds = j.value("eta_seconds", uint64_t{0});
    progress.retryCount = j.value("retry_count", 0);
    progress.lastError = j.value("last_error", std::string());
    if (j.contains("deletion")) {
        progress.deletion = j.at("deletion").get<DeletionProgress>();
    }
}

void to_json(json& j, const Job& job) {
    j = json{
        {"id", job.id},
        {"name", job.name},
        {"source", job.source},
        {"dest", job.destination},
        {"type", toString(job.kind)},
        {"status", toString(job.status)},
        {"settings", job.settings},
        {"progress", job.progress},
        {"created_at", job.createdAt},
        {"updated_at", job.updatedAt},
        {"revision", job.revision}
    };
}

void from_json(const json& j, Job& job) {
    job = Job{};
    job.id = j.at("id").get<std::string>();
    job.name = j.at("name").get<std::string>();
    job.source = j.at("source").get<std::string>();
    job.destination = j.at("dest").get<std::string>();
    job.kind = enumField(j, "type", JobKind::RSYNC, parseJobKind);
    job.status = enumField(j, "status", JobStatus::PENDING, parseJobStatus);
    if (j.contains("settings")) {
        job.settings = j.at("settings").get<JobSettings>();
    }
    if (j.contains("progress")) {
        job.progress = j.at("progress").get<JobProgress>();
    }
    job.createdAt = j.value("created_at", std::string());
    job.updatedAt = j.value("updated_at", std::string());
    job.revision = j.value("revision", uint64_t{0});

    if (job.id.empty()) {
        throw std::invalid_argument("Job record without id");
    }
}
