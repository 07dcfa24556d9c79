#include <spdlog/spdlog.h>
#include <tankobon/worker/lifecycle_fsm.hpp>

namespace tankobon::worker {

const char* toString(WorkerState state) {
    switch (state) {
        case WorkerState::Uninitialized:
            return "uninitialized";
        case WorkerState::Initializing:
            return "initializing";
        case WorkerState::Ready:
            return "ready";
        case WorkerState::Started:
            return "started";
        case WorkerState::Stopped:
            return "stopped";
        case WorkerState::Destroyed:
            return "destroyed";
    }
    return "unknown";
}

void WorkerLifecycleFsm::transitionTo(WorkerState next, std::optional<std::string> err) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshot_.state == next && (!err || snapshot_.lastError == *err)) {
        return;
    }
    auto prev = snapshot_.state;
    snapshot_.state = next;
    if (err) {
        snapshot_.lastError = *err;
    } else if (next == WorkerState::Ready || next == WorkerState::Started) {
        snapshot_.lastError.clear();
    }
    snapshot_.lastTransition = std::chrono::steady_clock::now();
    spdlog::info("WorkerSupervisor: {} -> {}{}", toString(prev), toString(next),
                 err ? (std::string{" error="} + *err) : std::string{});
}

void WorkerLifecycleFsm::dispatch(const SpawnRequestedEvent&) {
    switch (state()) {
        case WorkerState::Uninitialized:
        case WorkerState::Stopped:
            transitionTo(WorkerState::Initializing);
            break;
        default:
            break;
    }
}

void WorkerLifecycleFsm::dispatch(const ReadyReceivedEvent&) {
    if (state() == WorkerState::Initializing) {
        transitionTo(WorkerState::Ready);
    }
}

void WorkerLifecycleFsm::dispatch(const StartAcknowledgedEvent&) {
    switch (state()) {
        case WorkerState::Ready:
        case WorkerState::Stopped:
            transitionTo(WorkerState::Started);
            break;
        default:
            break;
    }
}

void WorkerLifecycleFsm::dispatch(const StopAcknowledgedEvent&) {
    switch (state()) {
        case WorkerState::Initializing:
        case WorkerState::Ready:
        case WorkerState::Started:
            transitionTo(WorkerState::Stopped);
            break;
        default:
            break;
    }
}

void WorkerLifecycleFsm::dispatch(const InitFailedEvent& ev) {
    if (state() == WorkerState::Initializing) {
        transitionTo(WorkerState::Stopped, ev.error);
    }
}

void WorkerLifecycleFsm::dispatch(const WorkerCrashedEvent& ev) {
    switch (state()) {
        case WorkerState::Initializing:
        case WorkerState::Ready:
        case WorkerState::Started:
            transitionTo(ev.restarting ? WorkerState::Initializing : WorkerState::Stopped,
                         ev.error);
            break;
        default:
            break;
    }
}

void WorkerLifecycleFsm::dispatch(const DestroyRequestedEvent&) {
    transitionTo(WorkerState::Destroyed);
}

} // namespace tankobon::worker
