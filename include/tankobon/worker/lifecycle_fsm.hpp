#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace tankobon::worker {

// Supervisor-side view of the worker process.
enum class WorkerState {
    Uninitialized = 0,
    Initializing,
    Ready,
    Started,
    Stopped,
    Destroyed,
};

const char* toString(WorkerState state);

struct WorkerSnapshot {
    WorkerState state{WorkerState::Uninitialized};
    std::string lastError; // empty when no error
    std::chrono::steady_clock::time_point lastTransition{};
};

// Events that can be dispatched to the FSM
struct SpawnRequestedEvent {};
struct ReadyReceivedEvent {};
struct StartAcknowledgedEvent {};
struct StopAcknowledgedEvent {};
struct InitFailedEvent {
    std::string error;
};
struct WorkerCrashedEvent {
    std::string error;
    bool restarting{false};
};
struct DestroyRequestedEvent {};

/**
 * Uninitialized -> Initializing -> Ready -> Started <-> Stopped -> Destroyed.
 *
 * A crash with a restart pending goes back to Initializing; a crash without
 * one, or a failed initialization, lands in Stopped. Destroyed is terminal.
 * Events that do not apply to the current state are ignored.
 */
class WorkerLifecycleFsm {
public:
    WorkerSnapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshot_;
    }
    WorkerState state() const { return snapshot().state; }

    void dispatch(const SpawnRequestedEvent&);
    void dispatch(const ReadyReceivedEvent&);
    void dispatch(const StartAcknowledgedEvent&);
    void dispatch(const StopAcknowledgedEvent&);
    void dispatch(const InitFailedEvent&);
    void dispatch(const WorkerCrashedEvent&);
    void dispatch(const DestroyRequestedEvent&);

private:
    void transitionTo(WorkerState next, std::optional<std::string> err = std::nullopt);

    WorkerSnapshot snapshot_{};
    mutable std::mutex mutex_;
};

} // namespace tankobon::worker
