#include "cli/job_cli.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include "orchestrator/job_orchestrator.hpp"
#include "storage/job_storage.hpp"
#include "transfer/transfer_engine_factory.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace {

const char* kVersion = "1.0.0";

void printUsage() {
    std::cout << "Usage: jobpilot [--config FILE] [--verbose] <command> [options]\n"
              << "Commands:\n"
              << "  create    - Create a transfer job\n"
              << "  start     - Run a job in the foreground\n"
              << "  list      - List jobs\n"
              << "  show      - Show a job\n"
              << "  delete    - Delete a job\n"
              << "  recover   - Resolve jobs interrupted by an unclean shutdown\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help    Show this help message\n"
              << "  -v, --version Show version information\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath;
    bool verbose = false;

    int i = 1;
    for (; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "jobpilot version " << kVersion << "\n";
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires a file" << std::endl;
                return 1;
            }
            configPath = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            break;
        }
    }

    if (i >= argc) {
        std::cerr << "Error: No command specified" << std::endl;
        printUsage();
        return 1;
    }

    AppConfig config = defaultConfig();
    if (!configPath.empty()) {
        std::string error;
        if (!loadConfig(configPath, config, error)) {
            std::cerr << "Error: " << error << std::endl;
            return 1;
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(config.logDir, ec);
    if (!Logger::initialize(config.logPath, config.logLevel)) {
        std::cerr << "Failed to initialize logger at " << config.logPath << std::endl;
        return 1;
    }
    Logger::setConsoleOutput(verbose);

    int exitCode = 1;
    try {
        auto storage = std::make_shared<JobStorage>(config.storagePath,
                                                    std::chrono::milliseconds(config.storageLockTimeoutMs));
        auto factory = std::make_shared<TransferEngineFactory>(config);
        auto orchestrator = std::make_shared<JobOrchestrator>(config, storage, factory);

        if (!orchestrator->initialize()) {
            std::cerr << "Error: " << orchestrator->getLastError() << std::endl;
            Logger::shutdown();
            return 1;
        }

        JobCLI cli(orchestrator);
        exitCode = cli.run(argc - i, argv + i);
        orchestrator->shutdown();
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        Logger::error("Error in main: " + std::string(e.what()));
        exitCode = 1;
    }

    Logger::shutdown();
    return exitCode;
}
