/**
 * @file test_task_poller.cpp
 * @brief Unit tests for TaskPoller
 *
 * TaskPoller drives a submitted task to a terminal state:
 * - completes, fails or reports instrument cancellation
 * - aborts the task on timeout and on a cancel request
 * - passes poll errors through unchanged
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

#include "MockHardwareClients.hpp"
#include "TaskPoller.hpp"

using namespace PROBEFLOW;
using namespace PROBEFLOW::Hardware;
using namespace PROBEFLOW::test;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class TaskPollerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ON_CALL(client_, GetName()).WillByDefault(Return(std::string("stage")));
    ON_CALL(client_, Cancel(_)).WillByDefault(Return(Ok()));
    options_.poll_interval = 10ms;
    options_.timeout = 2s;
  }

  NiceMock<MockStageClient> client_;
  ControlSignals signals_;
  PollOptions options_;
};

// === Terminal Status Tests ===

TEST_F(TaskPollerTest, ReturnsSnapshotOnCompletion) {
  EXPECT_CALL(client_, Poll(TaskId("t1")))
      .WillOnce(Return(Ok(MakeTask("t1", TaskStatus::Pending))))
      .WillOnce(Return(Ok(MakeTask("t1", TaskStatus::Running, 50.0))))
      .WillOnce(Return(Ok(MakeTask("t1", TaskStatus::Completed, 100.0))));
  EXPECT_CALL(client_, Cancel(_)).Times(0);

  auto result = TaskPoller::AwaitCompletion(client_, "t1", options_, signals_);
  ASSERT_TRUE(isOk(result));
  EXPECT_EQ(getValue(result).status, TaskStatus::Completed);
  EXPECT_DOUBLE_EQ(getValue(result).progress_percent, 100.0);
}

TEST_F(TaskPollerTest, FailedTaskIsHardwareFaultWithInstrumentText) {
  EXPECT_CALL(client_, Poll(_))
      .WillOnce(Return(Ok(MakeTask("t1", TaskStatus::Failed, 0.0, std::string("lost light")))));

  auto result = TaskPoller::AwaitCompletion(client_, "t1", options_, signals_);
  ASSERT_FALSE(isOk(result));
  EXPECT_EQ(getError(result).code, ErrorCode::HardwareFault);
  EXPECT_EQ(getError(result).message, "lost light");
}

TEST_F(TaskPollerTest, FailedTaskWithoutTextNamesTheTask) {
  EXPECT_CALL(client_, Poll(_)).WillOnce(Return(Ok(MakeTask("t9", TaskStatus::Failed))));

  auto result = TaskPoller::AwaitCompletion(client_, "t9", options_, signals_);
  ASSERT_FALSE(isOk(result));
  EXPECT_EQ(getError(result).message, "stage task t9 failed");
}

TEST_F(TaskPollerTest, InstrumentCancellationIsNotACallerCancel) {
  EXPECT_CALL(client_, Poll(_))
      .WillOnce(Return(Ok(MakeTask("t1", TaskStatus::Cancelled))));
  EXPECT_CALL(client_, Cancel(_)).Times(0);

  auto result = TaskPoller::AwaitCompletion(client_, "t1", options_, signals_);
  ASSERT_FALSE(isOk(result));
  EXPECT_EQ(getError(result).code, ErrorCode::TaskCancelledByInstrument);
  EXPECT_EQ(getError(result).message, "stage task t1 cancelled by instrument");
  EXPECT_FALSE(signals_.IsCancelRequested());
}

// === Error Propagation Tests ===

TEST_F(TaskPollerTest, PollErrorIsReturnedUnchangedWithoutRetry) {
  EXPECT_CALL(client_, Poll(_))
      .Times(1)
      .WillOnce(Return(Err<HardwareTask>(ErrorCode::CommunicationError,
                                         "connection refused")));
  EXPECT_CALL(client_, Cancel(_)).Times(0);

  auto result = TaskPoller::AwaitCompletion(client_, "t1", options_, signals_);
  ASSERT_FALSE(isOk(result));
  EXPECT_EQ(getError(result).code, ErrorCode::CommunicationError);
  EXPECT_EQ(getError(result).message, "connection refused");
}

// === Timeout Tests ===

TEST_F(TaskPollerTest, TimeoutAbortsTask) {
  options_.timeout = 60ms;
  ON_CALL(client_, Poll(_)).WillByDefault(Return(Ok(MakeTask("t1", TaskStatus::Running))));
  EXPECT_CALL(client_, Cancel(TaskId("t1"))).Times(1);

  auto start = std::chrono::steady_clock::now();
  auto result = TaskPoller::AwaitCompletion(client_, "t1", options_, signals_);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_FALSE(isOk(result));
  EXPECT_EQ(getError(result).code, ErrorCode::HardwareTimeout);
  EXPECT_EQ(getError(result).message, "timeout");
  EXPECT_GE(elapsed, 60ms);
  EXPECT_LT(elapsed, 1s);
}

TEST_F(TaskPollerTest, FailedAbortDoesNotReplaceTimeout) {
  options_.timeout = 30ms;
  ON_CALL(client_, Poll(_)).WillByDefault(Return(Ok(MakeTask("t1", TaskStatus::Running))));
  EXPECT_CALL(client_, Cancel(_))
      .WillOnce(Return(Err<std::monostate>(ErrorCode::TaskAlreadyTerminal, "done")));

  auto result = TaskPoller::AwaitCompletion(client_, "t1", options_, signals_);
  ASSERT_FALSE(isOk(result));
  EXPECT_EQ(getError(result).code, ErrorCode::HardwareTimeout);
}

// === Cancel Tests ===

TEST_F(TaskPollerTest, CancelBeforeFirstPollAbortsWithoutPolling) {
  signals_.RequestCancel();
  EXPECT_CALL(client_, Poll(_)).Times(0);
  EXPECT_CALL(client_, Cancel(TaskId("t1"))).Times(1);

  auto result = TaskPoller::AwaitCompletion(client_, "t1", options_, signals_);
  ASSERT_FALSE(isOk(result));
  EXPECT_EQ(getError(result).code, ErrorCode::Cancelled);
  EXPECT_EQ(getError(result).message, "cancelled by caller");
}

TEST_F(TaskPollerTest, CancelDuringLongIntervalReturnsPromptly) {
  options_.poll_interval = 10s;
  options_.timeout = 60s;
  ON_CALL(client_, Poll(_)).WillByDefault(Return(Ok(MakeTask("t1", TaskStatus::Running))));
  EXPECT_CALL(client_, Cancel(TaskId("t1"))).Times(1);

  std::thread canceller([this] {
    std::this_thread::sleep_for(50ms);
    signals_.RequestCancel();
  });

  auto start = std::chrono::steady_clock::now();
  auto result = TaskPoller::AwaitCompletion(client_, "t1", options_, signals_);
  auto elapsed = std::chrono::steady_clock::now() - start;
  canceller.join();

  ASSERT_FALSE(isOk(result));
  EXPECT_EQ(getError(result).code, ErrorCode::Cancelled);
  EXPECT_LT(elapsed, 2s);
}

// === Progress Tests ===

TEST_F(TaskPollerTest, ProgressCallbackSeesEverySnapshot) {
  EXPECT_CALL(client_, Poll(_))
      .WillOnce(Return(Ok(MakeTask("t1", TaskStatus::Running, 25.0))))
      .WillOnce(Return(Ok(MakeTask("t1", TaskStatus::Running, 75.0))))
      .WillOnce(Return(Ok(MakeTask("t1", TaskStatus::Completed, 100.0))));

  std::vector<double> seen;
  auto result = TaskPoller::AwaitCompletion(
      client_, "t1", options_, signals_,
      [&seen](const HardwareTask& task) { seen.push_back(task.progress_percent); });

  ASSERT_TRUE(isOk(result));
  EXPECT_EQ(seen, (std::vector<double>{25.0, 75.0, 100.0}));
}
