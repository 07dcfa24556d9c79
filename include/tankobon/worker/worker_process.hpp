#pragma once

#include <tankobon/core/types.h>

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tankobon::worker {

struct WorkerProcessConfig {
    std::filesystem::path executable; // searched on PATH when it has no separator
    std::vector<std::string> args;
    std::map<std::string, std::string> env; // added to the inherited environment
};

/**
 * @brief A spawned child with its stdin, stdout and stderr on pipes
 *
 * The pipe ends kept by the parent are blocking and close-on-exec. The child
 * is reaped through poll() or waitForExit(); signals are never sent to a pid
 * that has already been reaped. Destruction kills and reaps a child that is
 * still running.
 */
class WorkerProcess {
public:
    static Result<std::unique_ptr<WorkerProcess>> spawn(const WorkerProcessConfig& config);

    ~WorkerProcess();

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    pid_t pid() const noexcept { return pid_; }
    int stdoutFd() const noexcept { return stdoutFd_; }
    int stderrFd() const noexcept { return stderrFd_; }

    /// Writes line plus '\n' in full. A closed pipe reports WorkerExited.
    Result<void> writeLine(std::string_view line);
    void closeStdin();

    /// Signals the child's process group, which the child leads. False once
    /// the child has been reaped.
    bool signal(int signo);

    /// Non-blocking reap; the exit code once the child is gone. Death by
    /// signal N reports 128 + N.
    std::optional<int> poll();
    bool waitForExit(std::chrono::milliseconds timeout);
    std::optional<int> exitCode() const;

private:
    WorkerProcess() = default;
    std::optional<int> reapLocked(bool block);

    pid_t pid_{-1};
    int stdinFd_{-1};
    int stdoutFd_{-1};
    int stderrFd_{-1};

    mutable std::mutex mutex_; // guards reaping, signals and exitCode_
    bool reaped_{false};
    std::optional<int> exitCode_;

    std::mutex stdinMutex_;
};

// Absolute path of the running executable's directory, if the platform says.
std::optional<std::filesystem::path> currentExecutableDir();

} // namespace tankobon::worker
