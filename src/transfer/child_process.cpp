#include "transfer/child_process.hpp"
#include <cerrno>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>

ChildProcess::ChildProcess() = default;

ChildProcess::~ChildProcess() {
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running = pid_ > 0 && !reaped_;
    }
    if (running) {
        signalGroup(SIGKILL);
        wait();
    }
    closeOutput();
}

bool ChildProcess::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        lastError_ = "Empty command";
        return false;
    }

    int outputPipe[2];
    int errorPipe[2];
    if (pipe2(outputPipe, O_CLOEXEC) != 0) {
        lastError_ = std::string("pipe failed: ") + strerror(errno);
        return false;
    }
    // Reports exec failures back to the parent; closed on a successful exec
    if (pipe2(errorPipe, O_CLOEXEC) != 0) {
        lastError_ = std::string("pipe failed: ") + strerror(errno);
        close(outputPipe[0]);
        close(outputPipe[1]);
        return false;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        lastError_ = std::string("fork failed: ") + strerror(errno);
        close(outputPipe[0]);
        close(outputPipe[1]);
        close(errorPipe[0]);
        close(errorPipe[1]);
        return false;
    }

    if (pid == 0) {
        setpgid(0, 0);
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        dup2(outputPipe[1], STDOUT_FILENO);
        dup2(outputPipe[1], STDERR_FILENO);
        execvp(args[0], args.data());

        int err = errno;
        ssize_t ignored = write(errorPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    setpgid(pid, pid);
    close(outputPipe[1]);
    close(errorPipe[1]);

    int childErrno = 0;
    ssize_t n;
    do {
        n = read(errorPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    close(errorPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close(outputPipe[0]);
        std::lock_guard<std::mutex> lock(mutex_);
        lastError_ = "Failed to execute " + argv[0] + ": " + strerror(childErrno);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    closeOutput();
    pid_ = pid;
    outputFd_ = outputPipe[0];
    buffer_.clear();
    eof_ = false;
    drainedAfterExit_ = 0;
    reaped_ = false;
    exitCode_ = -1;
    return true;
}

bool ChildProcess::readLine(std::string& line) {
    while (true) {
        auto pos = buffer_.find_first_of("\r\n");
        if (pos != std::string::npos) {
            line = buffer_.substr(0, pos);
            buffer_.erase(0, pos + 1);
            return true;
        }
        if (eof_ || outputFd_ < 0) {
            if (!buffer_.empty()) {
                line.swap(buffer_);
                buffer_.clear();
                return true;
            }
            return false;
        }

        // A descendant that left the process group can keep the pipe open
        // after the process itself is gone, so exit is taken from the pid
        bool exited = hasExited();
        if (exited && drainedAfterExit_ >= kDrainLimit) {
            eof_ = true;
            continue;
        }

        struct pollfd pfd{};
        pfd.fd = outputFd_;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, exited ? 0 : kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            lastError_ = std::string("poll failed: ") + strerror(errno);
            eof_ = true;
            continue;
        }
        if (ready == 0) {
            if (exited) {
                eof_ = true;
            }
            continue;
        }

        char chunk[4096];
        ssize_t n = read(outputFd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            lastError_ = std::string("read failed: ") + strerror(errno);
            eof_ = true;
        } else if (n == 0) {
            eof_ = true;
        } else {
            buffer_.append(chunk, static_cast<size_t>(n));
            if (exited) {
                drainedAfterExit_ += static_cast<size_t>(n);
            }
        }
    }
}

bool ChildProcess::hasExited() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0 || reaped_) {
        return true;
    }
    // Leaves the zombie in place so the pid cannot be reused before wait()
    siginfo_t info{};
    if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        return errno != EINTR;
    }
    return info.si_pid != 0;
}

int ChildProcess::wait() {
    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reaped_ || pid_ <= 0) {
            return exitCode_;
        }
        pid = pid_;
    }

    // Wait without reaping so the pid stays reserved while signals may still be sent
    siginfo_t info{};
    while (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR) {
            break;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    reaped_ = true;
    if (result < 0) {
        lastError_ = std::string("waitpid failed: ") + strerror(errno);
        exitCode_ = -1;
    } else if (WIFEXITED(status)) {
        exitCode_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exitCode_ = 128 + WTERMSIG(status);
    }
    return exitCode_;
}

bool ChildProcess::terminate() {
    return signalGroup(SIGTERM);
}

bool ChildProcess::kill() {
    return signalGroup(SIGKILL);
}

bool ChildProcess::signalGroup(int signal) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0 || reaped_) {
        return false;
    }
    if (::kill(-pid_, signal) != 0 && ::kill(pid_, signal) != 0) {
        lastError_ = std::string("kill failed: ") + strerror(errno);
        return false;
    }
    return true;
}

void ChildProcess::closeOutput() {
    if (outputFd_ >= 0) {
        close(outputFd_);
        outputFd_ = -1;
    }
}

std::string ChildProcess::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}
