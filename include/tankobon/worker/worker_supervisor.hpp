#pragma once

#include <tankobon/core/types.h>
#include <tankobon/worker/lifecycle_fsm.hpp>
#include <tankobon/worker/protocol.hpp>
#include <tankobon/worker/worker_channel.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/circular_buffer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace tankobon::worker {

struct SupervisorOptions {
    WorkerInitConfig init;

    bool autoRestart{true};
    int maxRestarts{5};
    std::chrono::milliseconds restartWindow{60000};
    std::chrono::milliseconds restartDelay{1000};
    std::chrono::milliseconds killGrace{5000};

    std::chrono::milliseconds readyTimeout{15000};
    std::chrono::milliseconds startTimeout{10000};
    std::chrono::milliseconds stopTimeout{5000};
    std::chrono::milliseconds queryTimeout{5000};
};

/**
 * Sliding-window restart budget: at most maxRestarts attempts inside any
 * window. Attempts older than the window are pruned before counting.
 */
class RestartWindow {
public:
    using Clock = std::chrono::steady_clock;

    RestartWindow(int maxRestarts, std::chrono::milliseconds window);

    /// Records an attempt at now if the budget allows it.
    bool tryAcquire(Clock::time_point now = Clock::now());
    std::size_t recentAttempts(Clock::time_point now = Clock::now());
    void clear() { attempts_.clear(); }

private:
    void prune(Clock::time_point now);

    boost::circular_buffer<Clock::time_point> attempts_;
    std::chrono::milliseconds window_;
};

/**
 * Owns one tankobon-worker process and speaks the NDJSON protocol with it.
 *
 * Every method must be called on the supervisor's executor, and every
 * completion runs there too. Each request settles exactly once: with the
 * correlated result or error, on timeout, when the worker exits, or when
 * the supervisor is destroyed, whichever comes first.
 */
class WorkerSupervisor {
public:
    template <typename T> using Completion = std::function<void(Result<T>)>;
    using EventListener = std::function<void(const json&)>;
    using ListenerId = std::uint64_t;

    WorkerSupervisor(boost::asio::any_io_executor executor, ChannelFactory channelFactory,
                     SupervisorOptions options);
    ~WorkerSupervisor();

    WorkerSupervisor(const WorkerSupervisor&) = delete;
    WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

    /// Spawns and initializes the worker if needed, then sends "start".
    /// Callers arriving while a start is in flight share its outcome.
    void start(Completion<void> done);

    /// Best-effort "stop", then terminate the process. Never fails.
    void stop(Completion<void> done);

    /// Rejects everything pending, kills the worker and drops all listeners.
    void destroy();

    void request(Command command, json payload, Completion<json> done,
                 std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    ListenerId addEventListener(EventListener listener);
    void removeEventListener(ListenerId id);

    WorkerState state() const { return fsm_.state(); }
    WorkerSnapshot snapshot() const { return fsm_.snapshot(); }
    std::size_t pendingRequests() const { return pending_.size(); }
    bool restartsExhausted() const { return restartsExhausted_; }
    const SupervisorOptions& options() const { return options_; }

private:
    struct Pending {
        Command command;
        Completion<json> done;
        std::unique_ptr<boost::asio::steady_timer> timer;
    };

    void spawn();
    void onLine(std::uint64_t generation, std::string line);
    void onExit(std::uint64_t generation, std::optional<int> code);
    void onReady();
    void failStart(const Error& error);
    void finishStart(const Result<void>& outcome);
    void settle(RequestId id, Result<json> outcome);
    void rejectAll(const Error& error);
    void scheduleRestart();
    void deliverEvent(const json& event);
    std::chrono::milliseconds timeoutFor(Command command) const;

    boost::asio::any_io_executor executor_;
    ChannelFactory channelFactory_;
    SupervisorOptions options_;

    WorkerLifecycleFsm fsm_;
    std::unique_ptr<IWorkerChannel> channel_;
    std::uint64_t generation_ = 0;
    boost::asio::steady_timer readyTimer_;
    boost::asio::steady_timer restartTimer_;

    RequestId nextRequestId_ = 1;
    std::map<RequestId, Pending> pending_;

    std::vector<Completion<void>> startWaiters_;
    std::vector<Completion<void>> stopWaiters_;
    bool startRequested_ = false;  // "start" goes out once the worker is ready
    bool resumeAfterRestart_ = false;
    bool expectingExit_ = false;
    bool restartsExhausted_ = false;
    RestartWindow restarts_;

    ListenerId nextListenerId_ = 1;
    std::map<ListenerId, EventListener> listeners_;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace tankobon::worker
