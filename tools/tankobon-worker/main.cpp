#include <tankobon/version.hpp>
#include <tankobon/worker/protocol.hpp>
#include <tankobon/worker/worker_runtime.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include <poll.h>
#include <unistd.h>

namespace {

using namespace tankobon;

// stdout carries the protocol; every line goes out whole.
class StdoutWriter {
public:
    void operator()(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (broken_) {
            return;
        }
        std::string framed = line;
        framed.push_back('\n');
        const char* data = framed.data();
        std::size_t left = framed.size();
        while (left > 0) {
            ssize_t n = ::write(STDOUT_FILENO, data, left);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                broken_ = true;
                spdlog::warn("tankobon-worker: stdout closed, dropping output");
                return;
            }
            data += n;
            left -= static_cast<std::size_t>(n);
        }
    }

private:
    std::mutex mutex_;
    bool broken_{false};
};

// Polls stdin so a stop request is seen within one interval; hands complete
// lines to onLine and calls onEof once the host side closes the pipe.
template <typename OnLine, typename OnEof>
void pumpStdin(std::stop_token stop, OnLine onLine, OnEof onEof) {
    std::string pending;
    char buffer[4096];
    while (!stop.stop_requested()) {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 200);
        if (ready < 0 && errno == EINTR) {
            continue;
        }
        if (ready == 0) {
            continue;
        }
        ssize_t n = ready > 0 ? ::read(STDIN_FILENO, buffer, sizeof(buffer)) : -1;
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        pending.append(buffer, static_cast<std::size_t>(n));
        std::size_t start = 0;
        for (auto nl = pending.find('\n'); nl != std::string::npos;
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
    if (!stop.stop_requested()) {
        onEof();
    }
}

void configureLogging(const std::string& level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("tankobon-worker", sink);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%l] %v");
    spdlog::set_level(spdlog::level::from_str(level));
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"tankobon download worker (spawned by the tankobon host)"};

    std::string logLevel = "info";
    if (const char* env = std::getenv("TANKOBON_LOG_LEVEL")) {
        logLevel = env;
    }
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error)");
    app.set_version_flag("--version", std::string(TANKOBON_VERSION_STRING));
    CLI11_PARSE(app, argc, argv);

    configureLogging(logLevel);
    // A vanished host must surface as a write error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    boost::asio::io_context io;
    auto strand = boost::asio::make_strand(io);
    StdoutWriter writer;
    std::optional<int> exitStatus;

    auto requestExit = [&](int status) {
        if (!exitStatus) {
            exitStatus = status;
        }
        io.stop();
    };

    worker::WorkerRuntime runtime(
        strand, [&writer](const std::string& line) { writer(line); }, requestExit);

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        boost::asio::post(strand, [&, signo] {
            spdlog::info("tankobon-worker: received signal {}, shutting down", signo);
            runtime.shutdown();
            requestExit(0);
        });
    });

    std::jthread reader([&](std::stop_token stop) {
        pumpStdin(
            stop,
            [&](std::string line) {
                boost::asio::post(strand, [&runtime, line = std::move(line)] {
                    runtime.handleLine(line);
                });
            },
            [&] {
                boost::asio::post(strand, [&] {
                    spdlog::info("tankobon-worker: stdin closed, host is gone");
                    runtime.shutdown();
                    requestExit(0);
                });
            });
    });

    spdlog::info("tankobon-worker {} started (pid {})", TANKOBON_VERSION_STRING, ::getpid());
    try {
        io.run();
    } catch (const std::exception& e) {
        spdlog::critical("tankobon-worker: uncaught exception: {}", e.what());
        writer(worker::encode(worker::WorkerMessage{worker::FatalErrorMessage{e.what(), std::nullopt}}));
        exitStatus = 1;
    }

    runtime.shutdown();
    reader.request_stop();
    spdlog::info("tankobon-worker: exiting with status {}", exitStatus.value_or(0));
    return exitStatus.value_or(0);
}
