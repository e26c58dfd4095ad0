/**
 * @file test_measurement_manager.cpp
 * @brief Unit tests for MeasurementManager
 *
 * MeasurementManager owns at most one run:
 * - Start validates, builds clients and runs the controller in the background
 * - Pause/Resume/Cancel are checked against the current state
 * - subscribers receive events emitted after they subscribed, in order
 * - a finished run is released once its status was read or retention expired
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "MeasurementManager.hpp"
#include "MockHardwareClients.hpp"

using namespace PROBEFLOW;
using namespace PROBEFLOW::test;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Eq;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

using Type = ProgressEventType;

class MeasurementManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    stage_ = std::make_shared<NiceMock<MockStageClient>>();
    analyzer_ = std::make_shared<NiceMock<MockAnalyzerClient>>();
    UseInstantHardware(*stage_, *analyzer_);
  }

  void TearDown() override {
    release_moves_ = true;
    release_abort_ = true;
    if (manager_) {
      manager_->Shutdown();
    }
  }

  void CreateManager(Hardware::ClientFactory factory = Hardware::ClientFactory()) {
    if (!factory) {
      factory = [this](const RunConfig&) -> Result<Hardware::HardwareClients> {
        ++factory_calls_;
        return Ok(Hardware::HardwareClients{stage_, analyzer_});
      };
    }
    manager_ = std::make_unique<MeasurementManager>(options_, std::move(factory));
  }

  /// Moves stay running until release_moves_ is set
  void HoldMoves() {
    ON_CALL(*stage_, Poll(Eq(TaskId("move_task"))))
        .WillByDefault(Invoke([this](const TaskId& id) {
          return Ok(MakeTask(id, release_moves_ ? TaskStatus::Completed
                                                : TaskStatus::Running));
        }));
  }

  /// Collect events until one of the given type arrives
  static bool CollectUntil(Subscription& subscription, Type type,
                           std::vector<ProgressEvent>& events) {
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
      auto event = subscription.Next(100ms);
      if (!event) {
        if (subscription.IsClosed()) {
          return false;
        }
        continue;
      }
      events.push_back(*event);
      if (event->GetType() == type) {
        return true;
      }
    }
    return false;
  }

  static std::vector<ProgressEvent> DrainUntilTerminal(Subscription& subscription) {
    std::vector<ProgressEvent> events;
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
      auto event = subscription.Next(100ms);
      if (!event) {
        if (subscription.IsClosed()) {
          break;
        }
        continue;
      }
      events.push_back(*event);
      if (event->IsTerminal()) {
        break;
      }
    }
    return events;
  }

  static std::vector<Type> TypesOf(const std::vector<ProgressEvent>& events) {
    std::vector<Type> types;
    for (const auto& event : events) {
      types.push_back(event.GetType());
    }
    return types;
  }

  template <typename Predicate>
  static bool Eventually(Predicate predicate) {
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (!predicate() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(10ms);
    }
    return predicate();
  }

  ManagerOptions options_;
  std::shared_ptr<NiceMock<MockStageClient>> stage_;
  std::shared_ptr<NiceMock<MockAnalyzerClient>> analyzer_;
  std::atomic<bool> release_moves_{false};
  std::atomic<bool> release_abort_{false};
  std::atomic<int> factory_calls_{0};
  std::unique_ptr<MeasurementManager> manager_;
};

// === Initial State Tests ===

TEST_F(MeasurementManagerTest, StatusBeforeFirstRunIsIdle) {
  CreateManager();
  auto status = manager_->GetStatus();
  EXPECT_TRUE(status.run_id.empty());
  EXPECT_EQ(status.state, RunState::Idle);
  EXPECT_FALSE(status.last_event.has_value());
  EXPECT_FALSE(manager_->HasActiveRun());
  EXPECT_TRUE(manager_->WaitForTerminal(10ms));
}

TEST_F(MeasurementManagerTest, ControlWithoutRunIsNoActiveRun) {
  CreateManager();
  EXPECT_EQ(getError(manager_->Pause()).code, ErrorCode::NoActiveRun);
  EXPECT_EQ(getError(manager_->Resume()).code, ErrorCode::NoActiveRun);
  EXPECT_EQ(getError(manager_->Cancel()).code, ErrorCode::NoActiveRun);
}

// === Start Tests ===

TEST_F(MeasurementManagerTest, StartRunsToCompletion) {
  CreateManager();
  auto handle = manager_->Start(MakeRunConfig(2));
  ASSERT_TRUE(isOk(handle)) << getError(handle).message;
  EXPECT_EQ(getValue(handle).run_id, "run_000001");

  ASSERT_TRUE(manager_->WaitForTerminal(5s));
  auto status = manager_->GetStatus();
  EXPECT_EQ(status.run_id, "run_000001");
  EXPECT_EQ(status.state, RunState::Completed);
  EXPECT_EQ(status.total_devices, 2u);
  EXPECT_EQ(status.successful_devices, 2u);
  EXPECT_EQ(status.failed_devices, 0u);
  ASSERT_TRUE(status.last_event.has_value());
  EXPECT_TRUE(status.last_event->Is<RunCompleted>());
  EXPECT_FALSE(manager_->HasActiveRun());
}

TEST_F(MeasurementManagerTest, InvalidConfigIsRejectedBeforeFactory) {
  CreateManager();
  auto config = MakeRunConfig(1);
  config.stage_endpoint.base_url.clear();

  auto handle = manager_->Start(config);
  ASSERT_FALSE(isOk(handle));
  EXPECT_EQ(getError(handle).code, ErrorCode::ConfigurationValidationFailed);
  EXPECT_EQ(factory_calls_, 0);
  EXPECT_EQ(manager_->GetStatus().state, RunState::Idle);
}

TEST_F(MeasurementManagerTest, FactoryErrorIsWrapped) {
  CreateManager([](const RunConfig&) -> Result<Hardware::HardwareClients> {
    return Err<Hardware::HardwareClients>(ErrorCode::CommunicationError, "no route");
  });

  auto handle = manager_->Start(MakeRunConfig(1));
  ASSERT_FALSE(isOk(handle));
  EXPECT_EQ(getError(handle).code, ErrorCode::CommunicationError);
  EXPECT_EQ(getError(handle).message, "creating hardware clients: no route");
  EXPECT_FALSE(manager_->HasActiveRun());
}

TEST_F(MeasurementManagerTest, SecondStartWhileActiveIsAlreadyRunning) {
  HoldMoves();
  CreateManager();
  ASSERT_TRUE(isOk(manager_->Start(MakeRunConfig(1))));

  auto second = manager_->Start(MakeRunConfig(1));
  ASSERT_FALSE(isOk(second));
  EXPECT_EQ(getError(second).code, ErrorCode::AlreadyRunning);
  EXPECT_EQ(factory_calls_, 1);
  EXPECT_TRUE(manager_->HasActiveRun());

  release_moves_ = true;
  EXPECT_TRUE(manager_->WaitForTerminal(5s));
}

TEST_F(MeasurementManagerTest, StartAfterFinishedRunGetsNextId) {
  CreateManager();
  ASSERT_TRUE(isOk(manager_->Start(MakeRunConfig(1))));
  ASSERT_TRUE(manager_->WaitForTerminal(5s));

  auto handle = manager_->Start(MakeRunConfig(1));
  ASSERT_TRUE(isOk(handle));
  EXPECT_EQ(getValue(handle).run_id, "run_000002");
  ASSERT_TRUE(manager_->WaitForTerminal(5s));
  EXPECT_EQ(manager_->GetStatus().run_id, "run_000002");
}

// === Subscription Tests ===

TEST_F(MeasurementManagerTest, SubscriberReceivesWholeRunInOrder) {
  CreateManager();
  auto subscription = manager_->Subscribe();
  ASSERT_TRUE(isOk(manager_->Start(MakeRunConfig(3))));

  auto events = DrainUntilTerminal(*subscription);
  EXPECT_EQ(TypesOf(events),
            (std::vector<Type>{Type::RunStarted, Type::DeviceStarted,
                               Type::MeasurementCompleted, Type::DeviceStarted,
                               Type::MeasurementCompleted, Type::DeviceStarted,
                               Type::MeasurementCompleted, Type::RunCompleted}));
  for (size_t i = 0; i < events.size(); ++i) {
    EXPECT_EQ(events[i].sequence, i);
  }
  EXPECT_EQ(subscription->Dropped(), 0u);
}

TEST_F(MeasurementManagerTest, LateSubscriberSeesOnlyLaterEvents) {
  HoldMoves();
  CreateManager();
  auto early = manager_->Subscribe();
  ASSERT_TRUE(isOk(manager_->Start(MakeRunConfig(2))));

  std::vector<ProgressEvent> early_events;
  ASSERT_TRUE(CollectUntil(*early, Type::DeviceStarted, early_events));
  ASSERT_TRUE(Eventually([this] {
    auto status = manager_->GetStatus();
    return status.last_event && status.last_event->Is<DeviceStarted>();
  }));

  auto late = manager_->Subscribe();
  release_moves_ = true;

  auto late_events = DrainUntilTerminal(*late);
  ASSERT_FALSE(late_events.empty());
  EXPECT_GT(late_events.front().sequence, early_events.back().sequence);
  for (size_t i = 1; i < late_events.size(); ++i) {
    EXPECT_EQ(late_events[i].sequence, late_events[i - 1].sequence + 1);
  }
  EXPECT_TRUE(late_events.back().Is<RunCompleted>());
}

TEST_F(MeasurementManagerTest, SlowSubscriberLosesOldestEvents) {
  options_.subscriber_queue_capacity = 2;
  CreateManager();
  auto subscription = manager_->Subscribe();
  ASSERT_TRUE(isOk(manager_->Start(MakeRunConfig(3))));
  ASSERT_TRUE(manager_->WaitForTerminal(5s));

  // 8 events into a queue of 2
  ASSERT_TRUE(Eventually([&subscription] { return subscription->Dropped() == 6u; }));
  EXPECT_EQ(subscription->Next(100ms)->sequence, 6u);
  auto last = subscription->Next(100ms);
  ASSERT_TRUE(last.has_value());
  EXPECT_TRUE(last->Is<RunCompleted>());
}

// === Pause / Resume / Cancel Tests ===

TEST_F(MeasurementManagerTest, PauseAndResume) {
  HoldMoves();
  CreateManager();
  auto subscription = manager_->Subscribe();
  ASSERT_TRUE(isOk(manager_->Start(MakeRunConfig(2))));

  std::vector<ProgressEvent> events;
  ASSERT_TRUE(CollectUntil(*subscription, Type::DeviceStarted, events));

  ASSERT_TRUE(isOk(manager_->Pause()));
  auto again = manager_->Pause();
  ASSERT_FALSE(isOk(again));
  EXPECT_EQ(getError(again).code, ErrorCode::RequestAlreadyPending);

  release_moves_ = true;
  ASSERT_TRUE(CollectUntil(*subscription, Type::RunPaused, events));
  EXPECT_EQ(manager_->GetStatus().state, RunState::Paused);

  auto while_paused = manager_->Pause();
  ASSERT_FALSE(isOk(while_paused));
  EXPECT_EQ(getError(while_paused).code, ErrorCode::InvalidStateTransition);

  ASSERT_TRUE(isOk(manager_->Resume()));
  ASSERT_TRUE(CollectUntil(*subscription, Type::RunCompleted, events));
  EXPECT_EQ(manager_->GetStatus().state, RunState::Completed);
}

TEST_F(MeasurementManagerTest, ResumeWithoutPauseIsInvalid) {
  HoldMoves();
  CreateManager();
  auto subscription = manager_->Subscribe();
  ASSERT_TRUE(isOk(manager_->Start(MakeRunConfig(1))));

  std::vector<ProgressEvent> events;
  ASSERT_TRUE(CollectUntil(*subscription, Type::DeviceStarted, events));

  auto resumed = manager_->Resume();
  ASSERT_FALSE(isOk(resumed));
  EXPECT_EQ(getError(resumed).code, ErrorCode::InvalidStateTransition);
}

TEST_F(MeasurementManagerTest, ResumeWithdrawsPendingPause) {
  HoldMoves();
  CreateManager();
  auto subscription = manager_->Subscribe();
  ASSERT_TRUE(isOk(manager_->Start(MakeRunConfig(2))));

  std::vector<ProgressEvent> events;
  ASSERT_TRUE(CollectUntil(*subscription, Type::DeviceStarted, events));
  ASSERT_TRUE(isOk(manager_->Pause()));
  ASSERT_TRUE(isOk(manager_->Resume()));

  release_moves_ = true;
  ASSERT_TRUE(CollectUntil(*subscription, Type::RunCompleted, events));
  for (const auto& event : events) {
    EXPECT_FALSE(event.Is<RunPaused>());
  }
}

TEST_F(MeasurementManagerTest, CancelEndsRunAndRepeatIsPending) {
  HoldMoves();
  ON_CALL(*stage_, Cancel(_)).WillByDefault(Invoke([this](const TaskId&) {
    Eventually([this] { return release_abort_.load(); });
    return Ok();
  }));
  CreateManager();
  auto subscription = manager_->Subscribe();
  ASSERT_TRUE(isOk(manager_->Start(MakeRunConfig(2))));

  std::vector<ProgressEvent> events;
  ASSERT_TRUE(CollectUntil(*subscription, Type::DeviceStarted, events));

  ASSERT_TRUE(isOk(manager_->Cancel()));
  auto again = manager_->Cancel();
  ASSERT_FALSE(isOk(again));
  EXPECT_EQ(getError(again).code, ErrorCode::RequestAlreadyPending);

  release_abort_ = true;
  ASSERT_TRUE(CollectUntil(*subscription, Type::RunCancelled, events));
  ASSERT_TRUE(manager_->WaitForTerminal(5s));
  EXPECT_EQ(manager_->GetStatus().state, RunState::Cancelled);

  auto after = manager_->Cancel();
  ASSERT_FALSE(isOk(after));
  EXPECT_EQ(getError(after).code, ErrorCode::NoActiveRun);
}

// === Status Tests ===

TEST_F(MeasurementManagerTest, StatusTracksFailures) {
  EXPECT_CALL(*stage_, Submit(_, _)).Times(::testing::AnyNumber());
  EXPECT_CALL(*stage_, Submit(Eq("move"), _))
      .WillOnce(Return(Err<TaskId>(ErrorCode::CommunicationError, "connection refused")))
      .WillRepeatedly(Return(Ok(TaskId("move_task"))));
  CreateManager();
  ASSERT_TRUE(isOk(manager_->Start(MakeRunConfig(2))));
  ASSERT_TRUE(manager_->WaitForTerminal(5s));

  auto status = manager_->GetStatus();
  EXPECT_EQ(status.state, RunState::Completed);
  EXPECT_EQ(status.successful_devices, 1u);
  EXPECT_EQ(status.failed_devices, 1u);
  EXPECT_EQ(status.current_device_index, 1u);
  ASSERT_TRUE(status.last_error.has_value());
  EXPECT_EQ(status.last_error->As<ErrorOccurred>().reason, "connection refused");

  auto json = RunStatusSnapshotToJSON(status);
  EXPECT_EQ(json["state"], "Completed");
  EXPECT_EQ(json["last_error"]["type"], "error_occurred");
  EXPECT_EQ(json["last_event"]["type"], "run_completed");
}

// === Retention Tests ===

TEST_F(MeasurementManagerTest, ReleasesRunAfterTerminalStatusIsRead) {
  std::weak_ptr<MockStageClient> watched;
  CreateManager([&watched](const RunConfig&) -> Result<Hardware::HardwareClients> {
    auto stage = std::make_shared<NiceMock<MockStageClient>>();
    auto analyzer = std::make_shared<NiceMock<MockAnalyzerClient>>();
    UseInstantHardware(*stage, *analyzer);
    watched = stage;
    return Ok(Hardware::HardwareClients{stage, analyzer});
  });

  ASSERT_TRUE(isOk(manager_->Start(MakeRunConfig(1))));
  ASSERT_TRUE(manager_->WaitForTerminal(5s));
  EXPECT_FALSE(watched.expired());

  EXPECT_EQ(manager_->GetStatus().state, RunState::Completed);
  EXPECT_TRUE(Eventually([&watched] { return watched.expired(); }));
  // The snapshot outlives the released run
  EXPECT_EQ(manager_->GetStatus().run_id, "run_000001");
}

TEST_F(MeasurementManagerTest, ReleasesRunAfterRetentionWindow) {
  options_.retention_window = 100ms;
  std::weak_ptr<MockStageClient> watched;
  CreateManager([&watched](const RunConfig&) -> Result<Hardware::HardwareClients> {
    auto stage = std::make_shared<NiceMock<MockStageClient>>();
    auto analyzer = std::make_shared<NiceMock<MockAnalyzerClient>>();
    UseInstantHardware(*stage, *analyzer);
    watched = stage;
    return Ok(Hardware::HardwareClients{stage, analyzer});
  });

  ASSERT_TRUE(isOk(manager_->Start(MakeRunConfig(1))));
  ASSERT_TRUE(manager_->WaitForTerminal(5s));
  EXPECT_TRUE(Eventually([&watched] { return watched.expired(); }));
}

// === Shutdown Tests ===

TEST_F(MeasurementManagerTest, ShutdownCancelsActiveRunAndClosesSubscriptions) {
  HoldMoves();
  CreateManager();
  auto subscription = manager_->Subscribe();
  ASSERT_TRUE(isOk(manager_->Start(MakeRunConfig(2))));

  std::vector<ProgressEvent> events;
  ASSERT_TRUE(CollectUntil(*subscription, Type::DeviceStarted, events));

  manager_->Shutdown();
  EXPECT_EQ(manager_->GetStatus().state, RunState::Cancelled);
  EXPECT_TRUE(subscription->IsClosed());

  auto remaining = DrainUntilTerminal(*subscription);
  ASSERT_FALSE(remaining.empty());
  EXPECT_TRUE(remaining.back().Is<RunCancelled>());

  auto handle = manager_->Start(MakeRunConfig(1));
  ASSERT_FALSE(isOk(handle));
  EXPECT_EQ(getError(handle).code, ErrorCode::InternalError);
  EXPECT_TRUE(manager_->Subscribe()->IsClosed());
}
