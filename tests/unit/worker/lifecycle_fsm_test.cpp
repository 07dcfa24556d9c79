#include <gtest/gtest.h>
#include <tankobon/worker/lifecycle_fsm.hpp>

using namespace tankobon::worker;

namespace {

void driveToStarted(WorkerLifecycleFsm& fsm) {
    fsm.dispatch(SpawnRequestedEvent{});
    fsm.dispatch(ReadyReceivedEvent{});
    fsm.dispatch(StartAcknowledgedEvent{});
}

} // namespace

TEST(WorkerLifecycleFsmTest, HappyPathToStarted) {
    WorkerLifecycleFsm fsm;
    EXPECT_EQ(fsm.state(), WorkerState::Uninitialized);
    fsm.dispatch(SpawnRequestedEvent{});
    EXPECT_EQ(fsm.state(), WorkerState::Initializing);
    fsm.dispatch(ReadyReceivedEvent{});
    EXPECT_EQ(fsm.state(), WorkerState::Ready);
    fsm.dispatch(StartAcknowledgedEvent{});
    EXPECT_EQ(fsm.state(), WorkerState::Started);
}

TEST(WorkerLifecycleFsmTest, StartBeforeReadyIsIgnored) {
    WorkerLifecycleFsm fsm;
    fsm.dispatch(StartAcknowledgedEvent{});
    EXPECT_EQ(fsm.state(), WorkerState::Uninitialized);
    fsm.dispatch(SpawnRequestedEvent{});
    fsm.dispatch(StartAcknowledgedEvent{});
    EXPECT_EQ(fsm.state(), WorkerState::Initializing);
}

TEST(WorkerLifecycleFsmTest, StartedAndStoppedToggle) {
    WorkerLifecycleFsm fsm;
    driveToStarted(fsm);
    fsm.dispatch(StopAcknowledgedEvent{});
    EXPECT_EQ(fsm.state(), WorkerState::Stopped);
    fsm.dispatch(SpawnRequestedEvent{});
    EXPECT_EQ(fsm.state(), WorkerState::Initializing);
}

TEST(WorkerLifecycleFsmTest, CrashWithRestartReturnsToInitializing) {
    WorkerLifecycleFsm fsm;
    driveToStarted(fsm);
    fsm.dispatch(WorkerCrashedEvent{.error = "exit 3", .restarting = true});
    auto snap = fsm.snapshot();
    EXPECT_EQ(snap.state, WorkerState::Initializing);
    EXPECT_EQ(snap.lastError, "exit 3");

    fsm.dispatch(ReadyReceivedEvent{});
    EXPECT_EQ(fsm.state(), WorkerState::Ready);
    EXPECT_TRUE(fsm.snapshot().lastError.empty());
}

TEST(WorkerLifecycleFsmTest, CrashWithoutRestartStops) {
    WorkerLifecycleFsm fsm;
    driveToStarted(fsm);
    fsm.dispatch(WorkerCrashedEvent{.error = "signal 9", .restarting = false});
    EXPECT_EQ(fsm.state(), WorkerState::Stopped);
    EXPECT_EQ(fsm.snapshot().lastError, "signal 9");
}

TEST(WorkerLifecycleFsmTest, InitFailureOnlyAppliesWhileInitializing) {
    WorkerLifecycleFsm fsm;
    fsm.dispatch(InitFailedEvent{.error = "late"});
    EXPECT_EQ(fsm.state(), WorkerState::Uninitialized);
    fsm.dispatch(SpawnRequestedEvent{});
    fsm.dispatch(InitFailedEvent{.error = "no ready within 15000ms"});
    EXPECT_EQ(fsm.state(), WorkerState::Stopped);
}

TEST(WorkerLifecycleFsmTest, DestroyedIsTerminal) {
    WorkerLifecycleFsm fsm;
    driveToStarted(fsm);
    fsm.dispatch(DestroyRequestedEvent{});
    EXPECT_EQ(fsm.state(), WorkerState::Destroyed);
    fsm.dispatch(SpawnRequestedEvent{});
    fsm.dispatch(WorkerCrashedEvent{.error = "x", .restarting = true});
    EXPECT_EQ(fsm.state(), WorkerState::Destroyed);
}
