#include <tankobon/worker/worker_process.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace tankobon::worker {

namespace {

std::string errnoText(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct Pipe {
    int fds[2]{-1, -1};
    ~Pipe() {
        closeFd(fds[0]);
        closeFd(fds[1]);
    }
    int release(int end) {
        int fd = fds[end];
        fds[end] = -1;
        return fd;
    }
};

Result<std::filesystem::path> resolveExecutable(const std::filesystem::path& exe) {
    if (exe.empty()) {
        return Error{ErrorCode::InvalidArgument, "No worker executable configured"};
    }
    if (exe.has_parent_path()) {
        return exe;
    }
    const char* path = std::getenv("PATH");
    std::stringstream dirs(path ? path : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        auto candidate = std::filesystem::path(dir) / exe;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return Error{ErrorCode::FileNotFound, "Worker executable not found on PATH: " + exe.string()};
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

Result<std::unique_ptr<WorkerProcess>> WorkerProcess::spawn(const WorkerProcessConfig& config) {
    auto exe = resolveExecutable(config.executable);
    if (!exe) {
        return exe.error();
    }

    // A host that outlives its worker must see EPIPE, not die of SIGPIPE.
    std::signal(SIGPIPE, SIG_IGN);

    Pipe in, out, err;
    if (::pipe2(in.fds, O_CLOEXEC) < 0 || ::pipe2(out.fds, O_CLOEXEC) < 0 ||
        ::pipe2(err.fds, O_CLOEXEC) < 0) {
        return Error{ErrorCode::InternalError, errnoText("pipe2")};
    }

    // Everything the child touches is built before fork.
    const std::string exeStr = exe.value().string();
    std::vector<std::string> argStore;
    argStore.reserve(config.args.size() + 1);
    argStore.push_back(exeStr);
    argStore.insert(argStore.end(), config.args.begin(), config.args.end());
    std::vector<char*> argv;
    for (auto& a : argStore) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStore;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string_view::npos && config.env.count(std::string(entry.substr(0, eq)))) {
            continue;
        }
        envStore.emplace_back(entry);
    }
    for (const auto& [key, value] : config.env) {
        envStore.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& e : envStore) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorCode::InternalError, errnoText("fork")};
    }
    if (pid == 0) {
        // Own process group, so signals also reach anything the worker forks
        // that still holds the stdout pipe.
        ::setpgid(0, 0);
        // dup2 clears O_CLOEXEC on the targets.
        if (::dup2(in.fds[0], STDIN_FILENO) < 0 || ::dup2(out.fds[1], STDOUT_FILENO) < 0 ||
            ::dup2(err.fds[1], STDERR_FILENO) < 0) {
            ::_exit(126);
        }
        ::execve(argv[0], argv.data(), envp.data());
        ::_exit(127);
    }

    // Also set from the parent so a signal sent right after spawn finds the group.
    if (::setpgid(pid, pid) < 0 && errno != EACCES && errno != ESRCH) {
        spdlog::debug("WorkerProcess: {}", errnoText("setpgid"));
    }

    std::unique_ptr<WorkerProcess> process(new WorkerProcess());
    process->pid_ = pid;
    process->stdinFd_ = in.release(1);
    process->stdoutFd_ = out.release(0);
    process->stderrFd_ = err.release(0);
    spdlog::info("WorkerProcess: spawned {} (pid={})", exeStr, pid);
    return process;
}

WorkerProcess::~WorkerProcess() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!reaped_ && pid_ > 0) {
            spdlog::debug("WorkerProcess: killing pid {} on destruction", pid_);
            if (::kill(-pid_, SIGKILL) < 0) {
                ::kill(pid_, SIGKILL);
            }
            reapLocked(true);
        }
    }
    closeFd(stdinFd_);
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
}

Result<void> WorkerProcess::writeLine(std::string_view line) {
    std::lock_guard<std::mutex> lock(stdinMutex_);
    if (stdinFd_ < 0) {
        return Error{ErrorCode::WorkerExited, "Worker stdin is closed"};
    }
    std::string buffer;
    buffer.reserve(line.size() + 1);
    buffer.append(line);
    buffer.push_back('\n');

    std::size_t offset = 0;
    while (offset < buffer.size()) {
        ssize_t n = ::write(stdinFd_, buffer.data() + offset, buffer.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE) {
                return Error{ErrorCode::WorkerExited, "Worker closed its stdin"};
            }
            return Error{ErrorCode::WriteError, errnoText("write")};
        }
        offset += static_cast<std::size_t>(n);
    }
    return {};
}

void WorkerProcess::closeStdin() {
    std::lock_guard<std::mutex> lock(stdinMutex_);
    closeFd(stdinFd_);
}

bool WorkerProcess::signal(int signo) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_ || pid_ <= 0) {
        return false;
    }
    if (::kill(-pid_, signo) == 0) {
        return true;
    }
    return ::kill(pid_, signo) == 0;
}

std::optional<int> WorkerProcess::reapLocked(bool block) {
    if (reaped_) {
        return exitCode_;
    }
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        reaped_ = true;
        exitCode_ = decodeStatus(status);
        spdlog::info("WorkerProcess: pid {} exited with code {}", pid_, *exitCode_);
    } else if (r < 0) {
        // ECHILD: someone else reaped it; there is no status left to read.
        reaped_ = true;
        exitCode_ = -1;
        spdlog::warn("WorkerProcess: {}", errnoText("waitpid"));
    }
    return exitCode_;
}

std::optional<int> WorkerProcess::poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    return reapLocked(false);
}

bool WorkerProcess::waitForExit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (poll()) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
}

std::optional<int> WorkerProcess::exitCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exitCode_;
}

std::optional<std::filesystem::path> currentExecutableDir() {
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::nullopt;
    }
    return self.parent_path();
}

} // namespace tankobon::worker
