#include "MeasurementManager.hpp"

#include <iomanip>
#include <sstream>

#include "probeflow/core/StateMachine.hpp"

namespace PROBEFLOW
{

namespace
{

constexpr std::chrono::milliseconds kBroadcastWakeInterval{200};

// A freshly started run reports Idle until the worker applies
// StartMeasurement; requests treat it as already calibrating.
RunState EffectiveState(RunState state)
{
  return state == RunState::Idle ? RunState::Calibrating : state;
}

nlohmann::json OptionalEventToJSON(const std::optional<ProgressEvent> &event)
{
  return event ? ProgressEventToJSON(*event) : nlohmann::json(nullptr);
}

}  // namespace

nlohmann::json RunStatusSnapshotToJSON(const RunStatusSnapshot &snapshot)
{
  return {{"run_id", snapshot.run_id},
          {"state", RunStateToString(snapshot.state)},
          {"last_event", OptionalEventToJSON(snapshot.last_event)},
          {"last_error", OptionalEventToJSON(snapshot.last_error)},
          {"current_device_index", snapshot.current_device_index},
          {"total_devices", snapshot.total_devices},
          {"successful_devices", snapshot.successful_devices},
          {"failed_devices", snapshot.failed_devices}};
}

MeasurementManager::MeasurementManager(ManagerOptions options,
                                       Hardware::ClientFactory factory)
    : fOptions(options),
      fFactory(std::move(factory)),
      fLogger(Logger::GetLogger("manager")),
      fChannel(options.event_channel_capacity)
{
  fBroadcaster = std::thread([this] { BroadcastLoop(); });
}

MeasurementManager::~MeasurementManager() { Shutdown(); }

// === Run control ===

Result<RunHandle> MeasurementManager::Start(const RunConfig &config)
{
  std::lock_guard<std::mutex> lock(fRunMutex);

  if (fShutdown) {
    return Err<RunHandle>(ErrorCode::InternalError, "manager is shut down");
  }

  if (fController) {
    bool finished;
    {
      std::lock_guard<std::mutex> status_lock(fStatusMutex);
      finished = fRunFinished;
    }
    if (!finished) {
      return Err<RunHandle>(ErrorCode::AlreadyRunning,
                            "run " + fController->GetRunId() + " is active");
    }
    ReleaseRunLocked();
  }

  auto valid = ValidateRunConfig(config);
  if (!isOk(valid)) {
    return Err<RunHandle>(getError(valid));
  }

  if (!fFactory) {
    return Err<RunHandle>(ErrorCode::InternalError, "no client factory");
  }
  auto clients = fFactory(config);
  if (!isOk(clients)) {
    return Err<RunHandle>(getError(clients).Wrap("creating hardware clients"));
  }
  if (!getValue(clients).stage || !getValue(clients).analyzer) {
    return Err<RunHandle>(ErrorCode::InternalError,
                          "client factory returned an empty client");
  }

  std::ostringstream oss;
  oss << "run_" << std::setfill('0') << std::setw(6) << ++fRunCounter;
  const std::string run_id = oss.str();

  fSignals = std::make_shared<ControlSignals>();
  fSignals->Reset();

  {
    std::lock_guard<std::mutex> status_lock(fStatusMutex);
    fStatus = RunStatusSnapshot();
    fStatus.run_id = run_id;
    fStatus.total_devices = config.devices.size();
    fRunFinished = false;
    fTerminalStatusRead = false;
  }

  fController = std::make_shared<MeasurementController>(
      run_id, config, getValue(clients), fSignals,
      [this](const ProgressEvent &event) { OnEvent(event); },
      [this](RunState state) { OnStateChange(state); });

  auto controller = fController;
  fWorker = std::thread([this, controller] {
    controller->Run();
    OnRunFinished();
  });

  fLogger->Info("Started " + run_id + " '" + config.run_label + "' with " +
                std::to_string(config.devices.size()) + " devices");
  return Ok(RunHandle{run_id});
}

Status MeasurementManager::Pause()
{
  std::lock_guard<std::mutex> lock(fRunMutex);
  if (!fController) {
    return Err<std::monostate>(ErrorCode::NoActiveRun, "no active run");
  }

  RunState state = EffectiveState(CurrentState());
  if (IsTerminal(state)) {
    return Err<std::monostate>(ErrorCode::NoActiveRun, "no active run");
  }
  if (!StateMachine::IsValidTransition(state, WorkflowEvent::Pause)) {
    return Err<std::monostate>(ErrorCode::InvalidStateTransition,
                               "cannot pause while " + RunStateToString(state));
  }
  if (!fSignals->RequestPause()) {
    return Err<std::monostate>(ErrorCode::RequestAlreadyPending,
                               "pause already requested");
  }

  fLogger->Info("Pause requested for " + fController->GetRunId());
  return Ok();
}

Status MeasurementManager::Resume()
{
  std::lock_guard<std::mutex> lock(fRunMutex);
  if (!fController) {
    return Err<std::monostate>(ErrorCode::NoActiveRun, "no active run");
  }

  RunState state = EffectiveState(CurrentState());
  if (IsTerminal(state)) {
    return Err<std::monostate>(ErrorCode::NoActiveRun, "no active run");
  }

  // Withdraw a pause the run has not reached yet
  if (state == RunState::Running && fSignals->IsPauseRequested()) {
    fSignals->RequestResume();
    fLogger->Info("Pending pause withdrawn for " + fController->GetRunId());
    return Ok();
  }

  if (!StateMachine::IsValidTransition(state, WorkflowEvent::Resume)) {
    return Err<std::monostate>(ErrorCode::InvalidStateTransition,
                               "cannot resume while " + RunStateToString(state));
  }

  fSignals->RequestResume();
  fLogger->Info("Resume requested for " + fController->GetRunId());
  return Ok();
}

Status MeasurementManager::Cancel()
{
  std::lock_guard<std::mutex> lock(fRunMutex);
  if (!fController) {
    return Err<std::monostate>(ErrorCode::NoActiveRun, "no active run");
  }

  RunState state = EffectiveState(CurrentState());
  if (IsTerminal(state)) {
    return Err<std::monostate>(ErrorCode::NoActiveRun, "no active run");
  }
  if (!StateMachine::IsValidTransition(state, WorkflowEvent::Cancel)) {
    return Err<std::monostate>(ErrorCode::InvalidStateTransition,
                               "cannot cancel while " + RunStateToString(state));
  }
  if (!fSignals->RequestCancel()) {
    return Err<std::monostate>(ErrorCode::RequestAlreadyPending,
                               "cancel already requested");
  }

  fLogger->Info("Cancel requested for " + fController->GetRunId());
  return Ok();
}

// === Status ===

RunStatusSnapshot MeasurementManager::GetStatus() const
{
  std::lock_guard<std::mutex> lock(fStatusMutex);
  if (IsTerminal(fStatus.state)) {
    fTerminalStatusRead = true;
  }
  return fStatus;
}

RunState MeasurementManager::CurrentState() const
{
  std::lock_guard<std::mutex> lock(fStatusMutex);
  return fStatus.state;
}

bool MeasurementManager::HasActiveRun() const
{
  std::lock_guard<std::mutex> lock(fRunMutex);
  if (!fController) {
    return false;
  }
  std::lock_guard<std::mutex> status_lock(fStatusMutex);
  return !fRunFinished;
}

bool MeasurementManager::WaitForTerminal(std::chrono::milliseconds timeout)
{
  std::unique_lock<std::mutex> lock(fStatusMutex);
  return fFinishedCondition.wait_for(lock, timeout, [this] { return fRunFinished; });
}

std::shared_ptr<Subscription> MeasurementManager::Subscribe()
{
  auto subscription =
      std::make_shared<Subscription>(fOptions.subscriber_queue_capacity);

  std::lock_guard<std::mutex> lock(fSubscribersMutex);
  if (fShutdown) {
    subscription->Close();
    return subscription;
  }

  uint64_t first_ordinal;
  {
    std::lock_guard<std::mutex> status_lock(fStatusMutex);
    first_ordinal = fEmittedCount;
  }
  fSubscribers.push_back(SubscriberEntry{subscription, first_ordinal});
  return subscription;
}

// === Worker callbacks ===

void MeasurementManager::OnEvent(const ProgressEvent &event)
{
  uint64_t ordinal;
  {
    std::lock_guard<std::mutex> lock(fStatusMutex);
    ordinal = fEmittedCount++;
    fStatus.last_event = event;

    if (event.Is<DeviceStarted>()) {
      fStatus.current_device_index = event.As<DeviceStarted>().device_index;
    } else if (event.Is<MeasurementCompleted>()) {
      ++fStatus.successful_devices;
    } else if (event.Is<ErrorOccurred>()) {
      fStatus.last_error = event;
      if (event.As<ErrorOccurred>().device_index) {
        ++fStatus.failed_devices;
      }
    } else if (event.Is<RunFailed>()) {
      fStatus.last_error = event;
    }
  }

  if (!fChannel.Push(QueuedEvent{ordinal, event})) {
    fLogger->Debug("Event channel closed, dropping " +
                   ProgressEventTypeToString(event.GetType()));
  }
}

void MeasurementManager::OnStateChange(RunState state)
{
  std::lock_guard<std::mutex> lock(fStatusMutex);
  fStatus.state = state;
}

void MeasurementManager::OnRunFinished()
{
  {
    std::lock_guard<std::mutex> lock(fStatusMutex);
    fRunFinished = true;
    fFinishedAt = std::chrono::steady_clock::now();
  }
  fFinishedCondition.notify_all();
}

// === Broadcasting ===

void MeasurementManager::BroadcastLoop()
{
  while (true) {
    auto queued = fChannel.Pop(kBroadcastWakeInterval);
    if (queued) {
      Deliver(*queued);
    } else if (fChannel.IsClosed()) {
      break;
    }
    MaybeReleaseRun();
  }
}

void MeasurementManager::Deliver(const QueuedEvent &queued)
{
  std::lock_guard<std::mutex> lock(fSubscribersMutex);
  for (auto it = fSubscribers.begin(); it != fSubscribers.end();) {
    auto subscription = it->subscription.lock();
    if (!subscription || subscription->IsClosed()) {
      it = fSubscribers.erase(it);
      continue;
    }
    if (queued.ordinal >= it->first_ordinal) {
      subscription->Deliver(queued.event);
    }
    ++it;
  }
}

// === Retention ===

void MeasurementManager::MaybeReleaseRun()
{
  std::unique_lock<std::mutex> lock(fRunMutex, std::try_to_lock);
  if (!lock.owns_lock() || !fController) {
    return;
  }

  std::chrono::steady_clock::duration since_finish;
  {
    std::lock_guard<std::mutex> status_lock(fStatusMutex);
    if (!fRunFinished) {
      return;
    }
    since_finish = std::chrono::steady_clock::now() - fFinishedAt;
  }

  if (fTerminalStatusRead || since_finish >= fOptions.retention_window) {
    ReleaseRunLocked();
  }
}

void MeasurementManager::ReleaseRunLocked()
{
  if (fWorker.joinable()) {
    fWorker.join();
  }
  if (fController) {
    fLogger->Debug("Released resources of " + fController->GetRunId());
  }
  fController.reset();
  fSignals.reset();
}

void MeasurementManager::Shutdown()
{
  bool expected = false;
  if (!fShutdown.compare_exchange_strong(expected, true)) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(fRunMutex);
    if (fSignals) {
      fSignals->RequestCancel();
    }
    // The broadcaster keeps draining the channel, so a blocked worker
    // can still finish.
    if (fWorker.joinable()) {
      fWorker.join();
    }
  }

  fChannel.Close();
  if (fBroadcaster.joinable()) {
    fBroadcaster.join();
  }

  {
    std::lock_guard<std::mutex> lock(fSubscribersMutex);
    for (auto &entry : fSubscribers) {
      if (auto subscription = entry.subscription.lock()) {
        subscription->Close();
      }
    }
    fSubscribers.clear();
  }

  std::lock_guard<std::mutex> lock(fRunMutex);
  ReleaseRunLocked();
  fLogger->Info("Measurement manager shut down");
}

}  // namespace PROBEFLOW
