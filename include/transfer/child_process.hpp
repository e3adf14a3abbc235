#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <cstddef>
#include <sys/types.h>

// One external process in its own process group with stdout and stderr
// merged into a single pipe. readLine() and wait() belong to the consuming
// thread; terminate() and kill() may be called from any thread.
class ChildProcess {
public:
    ChildProcess();
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    bool spawn(const std::vector<std::string>& argv);

    // Next line of output; '\n' and '\r' both end a line. False at end of
    // stream, or once the process has exited and the pipe holds no more data.
    bool readLine(std::string& line);

    // Blocks until the process exits and reaps it. Exit status, or 128 + signal.
    int wait();

    bool terminate();
    bool kill();

    std::string getLastError() const;

private:
    static constexpr int kPollIntervalMs = 200;
    // Output still accepted from surviving descendants once the process is gone
    static constexpr size_t kDrainLimit = 1 << 20;

    bool hasExited();
    bool signalGroup(int signal);
    void closeOutput();

    pid_t pid_{-1};
    int outputFd_{-1};
    std::string buffer_;
    bool eof_{false};
    size_t drainedAfterExit_{0};
    bool reaped_{false};
    int exitCode_{-1};
    std::string lastError_;
    mutable std::mutex mutex_;
};
