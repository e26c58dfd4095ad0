/**
 * @file MeasurementManager.hpp
 * @brief Owns the active run and fans its events out to subscribers
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "EventChannel.hpp"
#include "IHardwareClient.hpp"
#include "MeasurementController.hpp"
#include "Subscription.hpp"
#include "probeflow/core/ControlSignals.hpp"
#include "probeflow/core/Error.hpp"
#include "probeflow/core/Logger.hpp"

namespace PROBEFLOW
{

struct ManagerOptions {
  /// How long a finished run keeps its controller and clients
  std::chrono::milliseconds retention_window{std::chrono::minutes(10)};
  size_t event_channel_capacity = 256;
  size_t subscriber_queue_capacity = 1024;
};

struct RunHandle {
  std::string run_id;
};

/**
 * @brief Point-in-time view of the current (or last) run
 */
struct RunStatusSnapshot {
  std::string run_id;  ///< Empty before the first run
  RunState state = RunState::Idle;
  std::optional<ProgressEvent> last_event;
  std::optional<ProgressEvent> last_error;  ///< Last ErrorOccurred or RunFailed
  size_t current_device_index = 0;
  size_t total_devices = 0;
  size_t successful_devices = 0;
  size_t failed_devices = 0;
};

nlohmann::json RunStatusSnapshotToJSON(const RunStatusSnapshot &snapshot);

/**
 * @brief Service object controlling at most one run at a time
 *
 * Threads:
 * - one worker per run, executing MeasurementController::Run()
 * - one broadcaster per manager, moving events from the bounded channel
 *   (producer blocks when full) into subscriber queues (oldest dropped
 *   when full)
 *
 * Pause/Resume/Cancel only post requests; the run applies them at its next
 * checkpoint. All methods are thread-safe.
 */
class MeasurementManager
{
 public:
  MeasurementManager(ManagerOptions options, Hardware::ClientFactory factory);
  ~MeasurementManager();

  MeasurementManager(const MeasurementManager &) = delete;
  MeasurementManager &operator=(const MeasurementManager &) = delete;

  /**
   * @brief Validate the configuration and start a run in the background
   * @return Err(AlreadyRunning) while a run is active, the validation error,
   *         or the client factory error
   */
  Result<RunHandle> Start(const RunConfig &config);

  Status Pause();
  Status Resume();
  Status Cancel();

  /// Never blocks on the run
  RunStatusSnapshot GetStatus() const;

  /// Events emitted from now on, in order
  std::shared_ptr<Subscription> Subscribe();

  /**
   * @brief Block until the active run has finished
   * @return false on timeout; true when finished or no run was started
   */
  bool WaitForTerminal(std::chrono::milliseconds timeout);

  /// Cancel any active run, stop the broadcaster, close subscriptions
  void Shutdown();

  bool HasActiveRun() const;

 private:
  struct QueuedEvent {
    uint64_t ordinal;
    ProgressEvent event;
  };

  struct SubscriberEntry {
    std::weak_ptr<Subscription> subscription;
    uint64_t first_ordinal;  ///< Events before this one predate the subscription
  };

  RunState CurrentState() const;

  void OnEvent(const ProgressEvent &event);
  void OnStateChange(RunState state);
  void OnRunFinished();

  void BroadcastLoop();
  void Deliver(const QueuedEvent &queued);

  /// Join the worker and drop run resources once retention allows
  void MaybeReleaseRun();
  void ReleaseRunLocked();

  const ManagerOptions fOptions;
  Hardware::ClientFactory fFactory;
  std::shared_ptr<Logger> fLogger;

  // Run ownership; the worker thread never takes this mutex
  mutable std::mutex fRunMutex;
  std::shared_ptr<MeasurementController> fController;
  std::shared_ptr<ControlSignals> fSignals;
  std::thread fWorker;
  uint32_t fRunCounter = 0;

  // Snapshot, updated by the worker before each event is queued
  mutable std::mutex fStatusMutex;
  std::condition_variable fFinishedCondition;
  RunStatusSnapshot fStatus;
  bool fRunFinished = true;
  std::chrono::steady_clock::time_point fFinishedAt;
  mutable std::atomic<bool> fTerminalStatusRead{false};
  uint64_t fEmittedCount = 0;

  EventChannel<QueuedEvent> fChannel;
  std::thread fBroadcaster;

  std::mutex fSubscribersMutex;
  std::vector<SubscriberEntry> fSubscribers;

  std::atomic<bool> fShutdown{false};
};

}  // namespace PROBEFLOW
