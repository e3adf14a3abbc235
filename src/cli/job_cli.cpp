#include "cli/job_cli.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "common/thread_utils.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <csignal>

using json = nlohmann::json;

namespace {

volatile std::sig_atomic_t interruptRequested = 0;

void handleInterrupt(int) {
    interruptRequested = 1;
}

bool deletionSettled(const Job& job) {
    switch (job.progress.deletion.phase) {
        case DeletionPhase::NONE:
        case DeletionPhase::COMPLETED:
        case DeletionPhase::FAILED:
            return true;
        case DeletionPhase::TRANSFERRING:
            return job.status != JobStatus::COMPLETED;
        case DeletionPhase::VERIFYING:
        case DeletionPhase::DELETING:
            return false;
    }
    return true;
}

} // namespace

JobCLI::JobCLI(std::shared_ptr<JobOrchestrator> orchestrator)
    : orchestrator_(orchestrator) {
}

JobCLI::~JobCLI() {
}

int JobCLI::run(int argc, char* argv[]) {
    if (argc < 1) {
        printUsage();
        return 1;
    }

    std::string command = argv[0];
    if (command == "create") {
        return handleCreateCommand(argc - 1, argv + 1);
    } else if (command == "start") {
        return handleStartCommand(argc - 1, argv + 1);
    } else if (command == "list") {
        return handleListCommand(argc - 1, argv + 1);
    } else if (command == "show") {
        return handleShowCommand(argc - 1, argv + 1);
    } else if (command == "delete") {
        return handleDeleteCommand(argc - 1, argv + 1);
    } else if (command == "recover") {
        return handleRecoverCommand(argc - 1, argv + 1);
    }

    std::cerr << "Error: Unknown command: " << command << std::endl;
    printUsage();
    return 1;
}

void JobCLI::printUsage() const {
    std::cout << "Usage: jobpilot [--config FILE] [--verbose] <command> [options]\n"
              << "Commands:\n"
              << "  create    Create a transfer job\n"
              << "              --name NAME --source PATH --dest PATH [--kind rsync|rclone]\n"
              << "              [--bwlimit KBPS] [--checksum]\n"
              << "              [--delete-source verify|per-file --confirm-deletion]\n"
              << "  start ID  Run a job in the foreground (Ctrl-C pauses it)\n"
              << "  list      List jobs\n"
              << "  show ID   Print a job record as JSON\n"
              << "  delete ID Delete a job that is not running\n"
              << "  recover   List jobs interrupted by an unclean shutdown\n"
              << "              [--mark-paused | --leave]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help    Show this help message\n"
              << "  -v, --version Show version information\n";
}

int JobCLI::reportFailure(const Result& result) const {
    std::cerr << "Error (" << toString(result.code()) << "): " << result.message() << std::endl;
    return result.code() == ErrorCode::NOT_FOUND ? 2 : 1;
}

int JobCLI::handleCreateCommand(int argc, char* argv[]) {
    JobConfig config;
    std::string deletionMode;

    for (int i = 0; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (arg == "--name" && i + 1 < argc) {
            config.name = argv[++i];
        } else if (arg == "--source" && i + 1 < argc) {
            config.source = argv[++i];
        } else if (arg == "--dest" && i + 1 < argc) {
            config.destination = argv[++i];
        } else if (arg == "--kind" && i + 1 < argc) {
            std::string kind = argv[++i];
            if (!parseJobKind(kind, config.kind)) {
                std::cerr << "Error: Unknown job kind: " << kind << std::endl;
                return 1;
            }
        } else if (arg == "--bwlimit" && i + 1 < argc) {
            uint64_t limit = 0;
            if (!utils::parseUnsigned(argv[++i], limit)) {
                std::cerr << "Error: Invalid bandwidth limit: " << argv[i] << std::endl;
                return 1;
            }
            config.settings.bandwidthLimitKbps = limit;
        } else if (arg == "--checksum") {
            config.settings.verificationMode = VerificationMode::CHECKSUM;
        } else if (arg == "--delete-source" && i + 1 < argc) {
            deletionMode = argv[++i];
        } else if (arg == "--confirm-deletion") {
            config.settings.deletionConfirmed = true;
        } else {
            std::cerr << "Error: Unknown or incomplete option: " << arg << std::endl;
            return 1;
        }
    }

    if (!deletionMode.empty()) {
        config.settings.deleteSourceAfter = true;
        if (deletionMode == "verify") {
            config.settings.deletionMode = DeletionMode::VERIFY_THEN_DELETE;
        } else if (deletionMode == "per-file") {
            config.settings.deletionMode = DeletionMode::PER_FILE;
        } else {
            std::cerr << "Error: Unknown deletion mode: " << deletionMode << std::endl;
            return 1;
        }
    }

    JobView job;
    Result result = orchestrator_->createJob(config, job);
    if (!result) {
        return reportFailure(result);
    }
    std::cout << "Created job " << job->id << std::endl;
    return 0;
}

int JobCLI::handleStartCommand(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Error: Missing job id" << std::endl;
        return 1;
    }
    std::string jobId = argv[0];

    Result result = orchestrator_->startJob(jobId);
    if (!result) {
        return reportFailure(result);
    }
    std::cout << "Started job " << jobId << std::endl;
    return waitForJob(jobId);
}

std::string JobCLI::formatProgress(const JobProgress& progress) const {
    std::stringstream ss;
    ss << "Progress: " << std::setw(3) << progress.percent << "% "
       << utils::formatBytes(progress.bytesTransferred);
    if (progress.totalBytes) {
        ss << " / " << utils::formatBytes(*progress.totalBytes);
    }
    ss << ", " << utils::formatBytes(progress.speedBytes) << "/s";
    if (progress.etaSeconds > 0) {
        ss << ", ETA " << progress.etaSeconds << "s";
    }
    if (progress.retryCount > 0) {
        ss << ", retries " << progress.retryCount;
    }
    if (progress.deletion.phase != DeletionPhase::NONE) {
        ss << " [deletion " << toString(progress.deletion.phase) << ": "
           << progress.deletion.filesDeleted << " files]";
    }
    return ss.str();
}

int JobCLI::waitForJob(const std::string& jobId) {
    interruptRequested = 0;
    auto previous = std::signal(SIGINT, handleInterrupt);

    uint64_t subscription = orchestrator_->subscribe([this, jobId](const JobEvent& event) {
        if (event.jobId != jobId) {
            return;
        }
        if (event.type == JobEventType::PROGRESS) {
            std::cout << "\r" << formatProgress(event.progress) << std::flush;
        } else {
            std::cout << "\nStatus: " << toString(event.status) << std::endl;
        }
    });

    bool pauseRequested = false;
    JobView job = orchestrator_->getJob(jobId);
    while (job && (job->status == JobStatus::RUNNING || !deletionSettled(*job))) {
        if (interruptRequested && !pauseRequested) {
            pauseRequested = true;
            std::cout << "\nPausing job " << jobId << "..." << std::endl;
            Result paused = orchestrator_->pauseJob(jobId);
            if (!paused) {
                std::cerr << "Pause: " << paused.message() << std::endl;
            }
        }
        ThreadUtils::sleepFor(std::chrono::milliseconds(200));
        job = orchestrator_->getJob(jobId);
    }

    orchestrator_->unsubscribe(subscription);
    std::signal(SIGINT, previous);

    if (!job) {
        std::cerr << "\nJob " << jobId << " disappeared" << std::endl;
        return 1;
    }

    std::cout << "\n" << formatProgress(job->progress) << std::endl;
    std::cout << "Job " << jobId << " " << toString(job->status) << std::endl;
    if (!job->progress.lastError.empty()) {
        std::cout << "Last error: " << job->progress.lastError << std::endl;
    }
    if (job->progress.deletion.phase == DeletionPhase::FAILED) {
        std::cout << "Source deletion failed: " << job->progress.deletion.lastError << std::endl;
        return 1;
    }
    return job->status == JobStatus::COMPLETED || job->status == JobStatus::PAUSED ? 0 : 1;
}

int JobCLI::handleListCommand(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    auto jobs = orchestrator_->listJobs();
    if (jobs.empty()) {
        std::cout << "No jobs\n";
        return 0;
    }

    std::cout << std::left << std::setw(22) << "ID" << std::setw(20) << "NAME"
              << std::setw(8) << "KIND" << std::setw(11) << "STATUS" << "PROGRESS\n";
    for (const auto& job : jobs) {
        std::cout << std::left << std::setw(22) << job->id << std::setw(20) << job->name.substr(0, 19)
                  << std::setw(8) << toString(job->kind) << std::setw(11) << toString(job->status)
                  << job->progress.percent << "%";
        if (job->progress.deletion.phase != DeletionPhase::NONE) {
            std::cout << " (deletion " << toString(job->progress.deletion.phase) << ")";
        }
        std::cout << "\n";
    }
    return 0;
}

int JobCLI::handleShowCommand(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Error: Missing job id" << std::endl;
        return 1;
    }
    JobView job = orchestrator_->getJob(argv[0]);
    if (!job) {
        return reportFailure(Result::failure(ErrorCode::NOT_FOUND, std::string("Job not found: ") + argv[0]));
    }
    json j = *job;
    std::cout << j.dump(2) << std::endl;
    return 0;
}

int JobCLI::handleDeleteCommand(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Error: Missing job id" << std::endl;
        return 1;
    }
    Result result = orchestrator_->deleteJob(argv[0]);
    if (!result) {
        return reportFailure(result);
    }
    std::cout << "Deleted job " << argv[0] << std::endl;
    return 0;
}

int JobCLI::handleRecoverCommand(int argc, char* argv[]) {
    bool markPaused = false;
    bool leave = false;
    for (int i = 0; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--mark-paused") {
            markPaused = true;
        } else if (arg == "--leave") {
            leave = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            return 1;
        }
    }
    if (markPaused && leave) {
        std::cerr << "Error: --mark-paused and --leave are exclusive" << std::endl;
        return 1;
    }

    auto interrupted = orchestrator_->recoverInterruptedJobs();
    if (interrupted.empty()) {
        std::cout << "No interrupted jobs\n";
        return 0;
    }
    std::cout << interrupted.size() << " jobs were interrupted by an unclean shutdown:\n";
    for (const auto& job : interrupted) {
        std::cout << "  " << job->id << "  " << job->name << "  " << job->progress.percent << "%\n";
    }

    if (!markPaused && !leave) {
        std::cout << "Run 'jobpilot recover --mark-paused' to pause them or '--leave' to keep them as is\n";
        return 0;
    }

    Result result = orchestrator_->resolveRecovery(markPaused);
    if (!result) {
        return reportFailure(result);
    }
    std::cout << result.message() << std::endl;
    return 0;
}
