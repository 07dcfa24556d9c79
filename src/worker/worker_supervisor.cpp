#include <tankobon/worker/worker_supervisor.hpp>

#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>

#include <algorithm>
#include <type_traits>

namespace tankobon::worker {

// ---------------------------------------------------------------------------
// RestartWindow
// ---------------------------------------------------------------------------

RestartWindow::RestartWindow(int maxRestarts, std::chrono::milliseconds window)
    : attempts_(static_cast<std::size_t>(std::max(maxRestarts, 0))), window_(window) {}

void RestartWindow::prune(Clock::time_point now) {
    while (!attempts_.empty() && now - attempts_.front() >= window_) {
        attempts_.pop_front();
    }
}

bool RestartWindow::tryAcquire(Clock::time_point now) {
    prune(now);
    if (attempts_.full()) {
        return false;
    }
    attempts_.push_back(now);
    return true;
}

std::size_t RestartWindow::recentAttempts(Clock::time_point now) {
    prune(now);
    return attempts_.size();
}

// ---------------------------------------------------------------------------
// WorkerSupervisor
// ---------------------------------------------------------------------------

WorkerSupervisor::WorkerSupervisor(boost::asio::any_io_executor executor,
                                   ChannelFactory channelFactory, SupervisorOptions options)
    : executor_(executor), channelFactory_(std::move(channelFactory)),
      options_(std::move(options)), readyTimer_(executor), restartTimer_(executor),
      restarts_(options_.maxRestarts, options_.restartWindow) {}

WorkerSupervisor::~WorkerSupervisor() {
    destroy();
    alive_.reset();
    channel_.reset();
}

std::chrono::milliseconds WorkerSupervisor::timeoutFor(Command command) const {
    switch (timeoutClass(command)) {
        case TimeoutClass::Start:
            return options_.startTimeout;
        case TimeoutClass::Stop:
            return options_.stopTimeout;
        case TimeoutClass::Query:
            return options_.queryTimeout;
    }
    return options_.queryTimeout;
}

void WorkerSupervisor::start(Completion<void> done) {
    const auto current = state();
    if (current == WorkerState::Destroyed) {
        boost::asio::post(executor_, [done = std::move(done)] {
            done(Error{ErrorCode::SystemShutdown, "Worker host destroyed"});
        });
        return;
    }
    if (restartsExhausted_) {
        boost::asio::post(executor_, [done = std::move(done)] {
            done(Error{ErrorCode::RestartLimitExceeded,
                       "Worker restart limit exceeded; create a new host"});
        });
        return;
    }
    if (current == WorkerState::Started) {
        boost::asio::post(executor_, [done = std::move(done)] { done({}); });
        return;
    }

    startWaiters_.push_back(std::move(done));
    if (startWaiters_.size() > 1) {
        spdlog::debug("WorkerSupervisor: joining start already in flight");
        return;
    }
    startRequested_ = true;

    if (current == WorkerState::Ready) {
        onReady();
    } else if (current == WorkerState::Initializing) {
        // A restart is under way; onReady picks the request up.
    } else {
        spawn();
    }
}

void WorkerSupervisor::spawn() {
    fsm_.dispatch(SpawnRequestedEvent{});
    const auto generation = ++generation_;
    std::weak_ptr<bool> alive = alive_;
    auto executor = executor_;

    channel_ = channelFactory_();
    ChannelHandlers handlers;
    handlers.onLine = [this, alive, executor, generation](std::string line) {
        boost::asio::post(executor, [this, alive, generation, line = std::move(line)]() mutable {
            if (alive.expired()) {
                return;
            }
            onLine(generation, std::move(line));
        });
    };
    handlers.onExit = [this, alive, executor, generation](std::optional<int> code) {
        boost::asio::post(executor, [this, alive, generation, code] {
            if (alive.expired()) {
                return;
            }
            onExit(generation, code);
        });
    };

    if (auto opened = channel_->open(std::move(handlers)); !opened) {
        channel_.reset();
        failStart(Error{ErrorCode::InitializationFailed,
                        "Failed to spawn worker: " + opened.error().message});
        return;
    }
    if (auto sent = channel_->send(encode(HostMessage{InitMessage{options_.init}})); !sent) {
        failStart(Error{ErrorCode::InitializationFailed,
                        "Failed to send init to worker: " + sent.error().message});
        return;
    }
    spdlog::debug("WorkerSupervisor: init sent (generation {})", generation);

    readyTimer_.expires_after(options_.readyTimeout);
    readyTimer_.async_wait([this, alive, generation](const boost::system::error_code& ec) {
        if (ec || alive.expired() || generation != generation_ ||
            state() != WorkerState::Initializing) {
            return;
        }
        failStart(Error{ErrorCode::InitializationFailed,
                        fmt::format("Worker did not become ready within {}ms",
                                    options_.readyTimeout.count())});
    });
}

void WorkerSupervisor::onReady() {
    spdlog::info("WorkerSupervisor: worker ready");
    if (!startRequested_ && !resumeAfterRestart_) {
        return;
    }
    request(Command::Start, nullptr, [this](Result<json> outcome) {
        startRequested_ = false;
        resumeAfterRestart_ = false;
        if (!outcome) {
            finishStart(Error{outcome.error().code,
                              "Worker refused to start: " + outcome.error().message});
            return;
        }
        fsm_.dispatch(StartAcknowledgedEvent{});
        finishStart({});
    });
}

void WorkerSupervisor::failStart(const Error& error) {
    spdlog::error("WorkerSupervisor: {}", error.message);
    readyTimer_.cancel();
    fsm_.dispatch(InitFailedEvent{error.message});
    startRequested_ = false;
    resumeAfterRestart_ = false;
    if (channel_) {
        expectingExit_ = true;
        channel_->terminate(options_.killGrace);
    }
    finishStart(error);
}

void WorkerSupervisor::finishStart(const Result<void>& outcome) {
    auto waiters = std::move(startWaiters_);
    startWaiters_.clear();
    for (auto& waiter : waiters) {
        waiter(outcome);
    }
}

void WorkerSupervisor::stop(Completion<void> done) {
    if (state() == WorkerState::Destroyed) {
        boost::asio::post(executor_, [done = std::move(done)] { done({}); });
        return;
    }
    startRequested_ = false;
    resumeAfterRestart_ = false;

    if (!channel_) {
        // Possibly between a crash and its restart.
        restartTimer_.cancel();
        fsm_.dispatch(StopAcknowledgedEvent{});
        finishStart(Error{ErrorCode::OperationCancelled, "Worker stopped before it started"});
        boost::asio::post(executor_, [done = std::move(done)] { done({}); });
        return;
    }

    stopWaiters_.push_back(std::move(done));
    if (stopWaiters_.size() > 1) {
        return;
    }
    expectingExit_ = true;
    request(Command::Stop, nullptr, [this](Result<json> outcome) {
        if (!outcome) {
            spdlog::warn("WorkerSupervisor: stop command failed: {}", outcome.error().message);
        }
        if (channel_) {
            channel_->terminate(options_.killGrace);
            return;
        }
        auto waiters = std::move(stopWaiters_);
        stopWaiters_.clear();
        for (auto& waiter : waiters) {
            waiter({});
        }
    });
}

void WorkerSupervisor::destroy() {
    if (state() == WorkerState::Destroyed) {
        return;
    }
    fsm_.dispatch(DestroyRequestedEvent{});
    readyTimer_.cancel();
    restartTimer_.cancel();

    const Error destroyed{ErrorCode::SystemShutdown, "Worker host destroyed"};
    rejectAll(destroyed);
    finishStart(destroyed);
    auto stopWaiters = std::move(stopWaiters_);
    stopWaiters_.clear();
    for (auto& waiter : stopWaiters) {
        waiter({});
    }
    listeners_.clear();

    if (channel_) {
        expectingExit_ = true;
        if (auto sent = channel_->send(encode(HostMessage{CommandMessage{
                Command::Stop, nextRequestId_++, nullptr}}));
            !sent) {
            spdlog::debug("WorkerSupervisor: stop on destroy not delivered: {}",
                          sent.error().message);
        }
        channel_->terminate(options_.killGrace);
    }
}

void WorkerSupervisor::request(Command command, json payload, Completion<json> done,
                               std::optional<std::chrono::milliseconds> timeout) {
    auto fail = [this, &done](Error error) {
        boost::asio::post(executor_, [done = std::move(done), error = std::move(error)] {
            done(error);
        });
    };
    if (state() == WorkerState::Destroyed) {
        fail(Error{ErrorCode::SystemShutdown, "Worker host destroyed"});
        return;
    }
    if (restartsExhausted_) {
        fail(Error{ErrorCode::RestartLimitExceeded,
                   "Worker restart limit exceeded; create a new host"});
        return;
    }
    if (!channel_) {
        fail(Error{ErrorCode::NotInitialized, "Worker is not running; call start() first"});
        return;
    }

    const RequestId id = nextRequestId_++;
    const auto budget = timeout.value_or(timeoutFor(command));
    auto timer = std::make_unique<boost::asio::steady_timer>(executor_, budget);
    std::weak_ptr<bool> alive = alive_;
    timer->async_wait([this, alive, id, command, budget](const boost::system::error_code& ec) {
        if (ec || alive.expired() || !pending_.count(id)) {
            return;
        }
        spdlog::warn("WorkerSupervisor: '{}' (#{}) timed out after {}ms", commandName(command),
                     id, budget.count());
        settle(id, Error{ErrorCode::Timeout,
                         fmt::format("Command '{}' timed out after {}ms", commandName(command),
                                     budget.count())});
    });
    pending_.emplace(id, Pending{command, std::move(done), std::move(timer)});

    spdlog::debug("WorkerSupervisor: -> {} #{}", commandName(command), id);
    if (auto sent = channel_->send(encode(HostMessage{CommandMessage{command, id, std::move(payload)}}));
        !sent) {
        boost::asio::post(executor_, [this, alive, id, error = sent.error()] {
            if (!alive.expired()) {
                settle(id, error);
            }
        });
    }
}

void WorkerSupervisor::settle(RequestId id, Result<json> outcome) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        spdlog::warn("WorkerSupervisor: response for request #{} arrived after it settled", id);
        return;
    }
    Pending entry = std::move(it->second);
    pending_.erase(it);
    entry.timer->cancel();
    entry.done(std::move(outcome));
}

void WorkerSupervisor::rejectAll(const Error& error) {
    if (pending_.empty()) {
        return;
    }
    auto pending = std::move(pending_);
    pending_.clear();
    spdlog::warn("WorkerSupervisor: rejecting {} pending request(s): {}", pending.size(),
                 error.message);
    for (auto& [id, entry] : pending) {
        entry.timer->cancel();
        entry.done(error);
    }
}

void WorkerSupervisor::onLine(std::uint64_t generation, std::string line) {
    if (generation != generation_) {
        spdlog::debug("WorkerSupervisor: dropping output of a previous worker");
        return;
    }
    auto decoded = decodeWorkerMessage(line);
    if (!decoded) {
        spdlog::warn("WorkerSupervisor: dropping invalid message ({}): {}",
                     decoded.error().message, line);
        return;
    }

    std::visit(
        [this](auto&& message) {
            using T = std::decay_t<decltype(message)>;
            if constexpr (std::is_same_v<T, ReadyMessage>) {
                if (state() != WorkerState::Initializing) {
                    spdlog::debug("WorkerSupervisor: unexpected ready in state {}",
                                  toString(state()));
                    return;
                }
                readyTimer_.cancel();
                fsm_.dispatch(ReadyReceivedEvent{});
                onReady();
            } else if constexpr (std::is_same_v<T, StartedMessage>) {
                spdlog::info("WorkerSupervisor: worker started");
            } else if constexpr (std::is_same_v<T, StoppedMessage>) {
                spdlog::info("WorkerSupervisor: worker stopped");
            } else if constexpr (std::is_same_v<T, ResultMessage>) {
                spdlog::debug("WorkerSupervisor: <- result #{}", message.requestId);
                settle(message.requestId, std::move(message.result));
            } else if constexpr (std::is_same_v<T, ErrorMessage>) {
                if (!message.requestId) {
                    spdlog::error("WorkerSupervisor: worker error: {}", message.error);
                    return;
                }
                settle(*message.requestId, Error{ErrorCode::CommandFailed, message.error});
            } else if constexpr (std::is_same_v<T, FatalErrorMessage>) {
                spdlog::error("WorkerSupervisor: worker fatal error: {}", message.error);
                if (state() == WorkerState::Initializing) {
                    failStart(Error{ErrorCode::InitializationFailed,
                                    "Worker failed to initialize: " + message.error});
                }
            } else {
                static_assert(std::is_same_v<T, EventMessage>);
                deliverEvent(message.event);
            }
        },
        decoded.value());
}

void WorkerSupervisor::onExit(std::uint64_t generation, std::optional<int> code) {
    if (generation != generation_) {
        return;
    }
    readyTimer_.cancel();
    channel_.reset();

    const std::string reason =
        code ? fmt::format("Worker exited with code {}", *code) : std::string("Worker exited");
    rejectAll(Error{ErrorCode::WorkerExited, reason});

    if (state() == WorkerState::Destroyed) {
        return;
    }

    if (expectingExit_) {
        expectingExit_ = false;
        spdlog::info("WorkerSupervisor: {}", reason);
        fsm_.dispatch(StopAcknowledgedEvent{});
        finishStart(Error{ErrorCode::OperationCancelled, "Worker stopped before it started"});
        auto waiters = std::move(stopWaiters_);
        stopWaiters_.clear();
        for (auto& waiter : waiters) {
            waiter({});
        }
        return;
    }

    const bool crashed = code.value_or(-1) != 0;
    const bool wasRunning = state() == WorkerState::Started;
    bool restart = false;
    if (options_.autoRestart && crashed) {
        restart = restarts_.tryAcquire();
        if (!restart) {
            restartsExhausted_ = true;
            spdlog::error("WorkerSupervisor: {} restarts within {}ms; giving up",
                          options_.maxRestarts, options_.restartWindow.count());
        }
    }
    spdlog::error("WorkerSupervisor: {} unexpectedly", reason);
    fsm_.dispatch(WorkerCrashedEvent{reason, restart});

    if (restart) {
        resumeAfterRestart_ = wasRunning || startRequested_;
        scheduleRestart();
        return;
    }
    if (!startWaiters_.empty()) {
        startRequested_ = false;
        finishStart(restartsExhausted_
                        ? Error{ErrorCode::RestartLimitExceeded, reason + "; restart limit exceeded"}
                        : Error{ErrorCode::InitializationFailed, reason});
    }
}

void WorkerSupervisor::scheduleRestart() {
    spdlog::warn("WorkerSupervisor: restarting worker in {}ms ({}/{} in window)",
                 options_.restartDelay.count(), restarts_.recentAttempts(), options_.maxRestarts);
    std::weak_ptr<bool> alive = alive_;
    restartTimer_.expires_after(options_.restartDelay);
    restartTimer_.async_wait([this, alive](const boost::system::error_code& ec) {
        if (ec || alive.expired() || state() != WorkerState::Initializing) {
            return;
        }
        spawn();
    });
}

WorkerSupervisor::ListenerId WorkerSupervisor::addEventListener(EventListener listener) {
    const auto id = nextListenerId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void WorkerSupervisor::removeEventListener(ListenerId id) {
    listeners_.erase(id);
}

void WorkerSupervisor::deliverEvent(const json& event) {
    auto listeners = listeners_;
    for (auto& [id, listener] : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            spdlog::warn("WorkerSupervisor: event listener {} threw: {}", id, e.what());
        } catch (...) {
            spdlog::warn("WorkerSupervisor: event listener {} threw a non-standard exception", id);
        }
    }
}

} // namespace tankobon::worker
