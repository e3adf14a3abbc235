#pragma once

#include "orchestrator/job_orchestrator.hpp"
#include <memory>
#include <string>

class JobCLI {
public:
    explicit JobCLI(std::shared_ptr<JobOrchestrator> orchestrator);
    ~JobCLI();

    // argv[0] is the command name; returns the process exit code
    int run(int argc, char* argv[]);
    void printUsage() const;

private:
    int handleCreateCommand(int argc, char* argv[]);
    int handleStartCommand(int argc, char* argv[]);
    int handleListCommand(int argc, char* argv[]);
    int handleShowCommand(int argc, char* argv[]);
    int handleDeleteCommand(int argc, char* argv[]);
    int handleRecoverCommand(int argc, char* argv[]);

    // Runs until the job and its source deletion settle; SIGINT pauses it
    int waitForJob(const std::string& jobId);
    int reportFailure(const Result& result) const;
    std::string formatProgress(const JobProgress& progress) const;

    std::shared_ptr<JobOrchestrator> orchestrator_;
};
