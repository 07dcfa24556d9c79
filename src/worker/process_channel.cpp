#include <tankobon/worker/worker_channel.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unistd.h>

namespace tankobon::worker {

namespace {

// Blocking read loop splitting fd output into lines. Returns on EOF or error.
template <typename OnLine> void readLines(int fd, OnLine&& onLine) {
    std::string pending;
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        pending.append(buffer, static_cast<std::size_t>(n));
        std::size_t start = 0;
        for (auto nl = pending.find('\n', start); nl != std::string::npos;
             nl = pending.find('\n', start)) {
            std::string line = pending.substr(start, nl - start);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                onLine(std::move(line));
            }
            start = nl + 1;
        }
        pending.erase(0, start);
    }
    if (!pending.empty()) {
        onLine(std::move(pending));
    }
}

class ProcessWorkerChannel final : public IWorkerChannel {
public:
    explicit ProcessWorkerChannel(WorkerProcessConfig config) : config_(std::move(config)) {}

    ~ProcessWorkerChannel() override {
        if (process_) {
            process_->signal(SIGKILL);
        }
        killer_ = {};
        stderrThread_ = {};
        stdoutThread_ = {};
    }

    Result<void> open(ChannelHandlers handlers) override {
        if (process_) {
            return Error{ErrorCode::InvalidState, "Channel already open"};
        }
        auto spawned = WorkerProcess::spawn(config_);
        if (!spawned) {
            return spawned.error();
        }
        process_ = std::move(spawned).value();
        handlers_ = std::move(handlers);

        stderrThread_ = std::jthread([this] {
            readLines(process_->stderrFd(),
                      [](std::string line) { spdlog::debug("worker: {}", line); });
        });
        stdoutThread_ = std::jthread([this](std::stop_token stop) { pumpStdout(stop); });
        return {};
    }

    Result<void> send(const std::string& line) override {
        if (!process_) {
            return Error{ErrorCode::NotInitialized, "Channel not open"};
        }
        return process_->writeLine(line);
    }

    void terminate(std::chrono::milliseconds grace) override {
        if (!process_ || killer_.joinable()) {
            return;
        }
        process_->closeStdin();
        process_->signal(SIGTERM);
        killer_ = std::jthread([this, grace](std::stop_token stop) {
            std::unique_lock<std::mutex> lock(exitMutex_);
            if (!exitCv_.wait_for(lock, stop, grace, [this] { return exited_; }) &&
                !stop.stop_requested()) {
                spdlog::warn("WorkerProcess: pid {} ignored SIGTERM for {}ms, killing",
                             process_->pid(), grace.count());
                process_->signal(SIGKILL);
            }
        });
    }

private:
    void pumpStdout(std::stop_token stop) {
        readLines(process_->stdoutFd(), [this](std::string line) {
            if (handlers_.onLine) {
                handlers_.onLine(std::move(line));
            }
        });

        // stdout is closed; the process is exiting or already gone.
        std::optional<int> code;
        while (!stop.stop_requested()) {
            code = process_->poll();
            if (code) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
        {
            std::lock_guard<std::mutex> lock(exitMutex_);
            exited_ = true;
        }
        exitCv_.notify_all();
        if (stop.stop_requested()) {
            return;
        }
        if (handlers_.onExit) {
            handlers_.onExit(code);
        }
    }

    WorkerProcessConfig config_;
    std::unique_ptr<WorkerProcess> process_;
    ChannelHandlers handlers_;

    std::mutex exitMutex_;
    std::condition_variable_any exitCv_;
    bool exited_{false};

    // Declared last: joined before the members they use are destroyed.
    std::jthread stdoutThread_;
    std::jthread stderrThread_;
    std::jthread killer_;
};

} // namespace

ChannelFactory makeProcessChannelFactory(WorkerProcessConfig config) {
    return [config = std::move(config)]() -> std::unique_ptr<IWorkerChannel> {
        return std::make_unique<ProcessWorkerChannel>(config);
    };
}

} // namespace tankobon::worker
