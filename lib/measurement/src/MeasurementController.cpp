#include "MeasurementController.hpp"

#include "probeflow/core/StateMachine.hpp"

namespace PROBEFLOW
{

namespace
{

bool IsStageOperation(const std::string &operation)
{
  return operation == "move" || operation == "alignment" ||
         operation == "read_power";
}

std::string PhaseOf(const HardwareTask &task)
{
  if (task.result_payload && task.result_payload->is_object()) {
    auto it = task.result_payload->find("phase");
    if (it != task.result_payload->end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return TaskStatusToString(task.status);
}

}  // namespace

MeasurementController::MeasurementController(
    std::string run_id, RunConfig config, Hardware::HardwareClients clients,
    std::shared_ptr<ControlSignals> signals, EventSink sink,
    StateListener state_listener)
    : fRunId(std::move(run_id)),
      fConfig(std::move(config)),
      fClients(std::move(clients)),
      fSignals(std::move(signals)),
      fSink(std::move(sink)),
      fStateListener(std::move(state_listener)),
      fLogger(Logger::GetLogger("controller"))
{
  for (size_t i = 0; i < fConfig.devices.size(); ++i) {
    DeviceOutcome outcome;
    outcome.index = i;
    outcome.name = fConfig.devices[i].name;
    fSummary.devices.push_back(outcome);
  }
}

RunSummary MeasurementController::GetSummary() const
{
  std::lock_guard<std::mutex> lock(fSummaryMutex);
  return fSummary;
}

RunState MeasurementController::Run()
{
  RunState final_state = Execute();

  fClients.stage->Disconnect();
  fClients.analyzer->Disconnect();

  auto summary = GetSummary();
  fLogger->Info("Run " + fRunId + " finished as " +
                RunStateToString(final_state) + " (" +
                std::to_string(summary.successful_devices) + " measured, " +
                std::to_string(summary.failed_devices) + " failed)");
  return final_state;
}

RunState MeasurementController::Execute()
{
  fLogger->Info("Run " + fRunId + " '" + fConfig.run_label + "' starting with " +
                std::to_string(fConfig.devices.size()) + " devices");

  if (!Apply(WorkflowEvent::StartMeasurement)) {
    return fState.load();
  }
  Emit(RunStarted{fRunId, fConfig.run_label, fConfig.devices.size()});

  if (auto failure = Calibrate()) {
    if (IsTerminal(fState.load())) {
      return fState.load();
    }
    if (IsUserCancel(*failure)) {
      CancelRun(std::nullopt);
      return fState.load();
    }
    ReportError(std::nullopt, *failure);
    FailRun(failure->error.message, failure->error.code);
    return fState.load();
  }

  if (!Apply(WorkflowEvent::CalibrationComplete)) {
    return fState.load();
  }

  for (size_t i = 0; i < fConfig.devices.size(); ++i) {
    auto checkpoint = Checkpoint(i);
    if (!isOk(checkpoint)) {
      if (!IsTerminal(fState.load())) {
        CancelRun(std::nullopt);
      }
      return fState.load();
    }

    Emit(DeviceStarted{i, fConfig.devices[i].name});

    auto failure = MeasureDevice(i);
    if (!failure) {
      continue;
    }
    if (IsTerminal(fState.load())) {
      return fState.load();
    }
    if (IsUserCancel(*failure)) {
      CancelRun(i);
      return fState.load();
    }

    ReportError(i, *failure);
    MarkDevice(i, DeviceResult::Failed, failure->operation,
               failure->error.message);
    if (IsRecoverable(*failure)) {
      fLogger->Info("Skipping device " + std::to_string(i) + " after " +
                    failure->operation + " failure");
      continue;
    }
    FailRun(failure->error.message, failure->error.code);
    return fState.load();
  }

  if (Apply(WorkflowEvent::Complete)) {
    auto summary = GetSummary();
    Emit(RunCompleted{summary.successful_devices, summary.failed_devices});
  }
  return fState.load();
}

MeasurementController::StepResult MeasurementController::Calibrate()
{
  auto cancelled = [this]() -> StepResult {
    if (fSignals->IsCancelRequested()) {
      return StepFailure{"calibration",
                         Error(ErrorCode::Cancelled, "cancelled by caller")};
    }
    return std::nullopt;
  };

  if (auto stop = cancelled()) {
    return stop;
  }
  auto stage = fClients.stage->Connect();
  if (!isOk(stage)) {
    return StepFailure{"connect_stage", getError(stage)};
  }

  if (auto stop = cancelled()) {
    return stop;
  }
  auto analyzer = fClients.analyzer->Connect();
  if (!isOk(analyzer)) {
    return StepFailure{"connect_analyzer", getError(analyzer)};
  }

  if (fConfig.calibrate_analyzer) {
    if (auto stop = cancelled()) {
      return stop;
    }
    auto calibrated = fClients.analyzer->Calibrate();
    if (!isOk(calibrated)) {
      return StepFailure{"calibrate", getError(calibrated)};
    }
  }

  return cancelled();
}

MeasurementController::StepResult MeasurementController::MeasureDevice(size_t index)
{
  fAlignedPower.reset();

  if (auto failure = MoveToDevice(index)) {
    return failure;
  }
  if (auto failure = AlignDevice(index)) {
    return failure;
  }

  TraceSummary trace;
  if (auto failure = SweepDevice(index, trace)) {
    return failure;
  }

  MarkDevice(index, DeviceResult::Measured);
  Emit(MeasurementCompleted{index, trace, fAlignedPower});
  return std::nullopt;
}

MeasurementController::StepResult MeasurementController::MoveToDevice(size_t index)
{
  auto &stage = *fClients.stage;

  for (const auto &axis : fConfig.devices[index].position) {
    nlohmann::json params = {{"axis", axis.axis},
                             {"target", axis.target_um},
                             {"speed", axis.speed_um_per_s}};

    auto task_id = stage.Submit("move", params);
    if (!isOk(task_id)) {
      return StepFailure{"move", getError(task_id)};
    }

    auto done = Hardware::TaskPoller::AwaitCompletion(stage, getValue(task_id),
                                                      MotionPoll(), *fSignals);
    if (!isOk(done)) {
      return StepFailure{"move", getError(done)};
    }

    auto checkpoint = Checkpoint(index);
    if (!isOk(checkpoint)) {
      return StepFailure{"checkpoint", getError(checkpoint)};
    }
  }
  return std::nullopt;
}

MeasurementController::StepResult MeasurementController::AlignDevice(size_t index)
{
  auto &stage = *fClients.stage;

  std::optional<double> pre_alignment_power;
  if (fConfig.alignment_policy.periodic) {
    auto power = stage.ReadScalar("/power");
    if (!isOk(power)) {
      return StepFailure{"read_power", getError(power)};
    }
    pre_alignment_power = getValue(power);
  }

  if (!ShouldAlign(index, pre_alignment_power)) {
    fLogger->Debug("Alignment skipped for device " + std::to_string(index));
    fAlignedPower = pre_alignment_power;
    return std::nullopt;
  }

  auto task_id = stage.Submit("alignment", fConfig.devices[index].alignment);
  if (!isOk(task_id)) {
    return StepFailure{"alignment", getError(task_id)};
  }

  auto on_progress = [this, index](const HardwareTask &task) {
    if (!PROBEFLOW::IsTerminal(task.status)) {
      Emit(AlignmentProgress{index, PhaseOf(task), task.progress_percent});
    }
  };
  auto done = Hardware::TaskPoller::AwaitCompletion(
      stage, getValue(task_id), AlignmentPoll(), *fSignals, on_progress);
  if (!isOk(done)) {
    return StepFailure{"alignment", getError(done)};
  }

  auto checkpoint = Checkpoint(index);
  if (!isOk(checkpoint)) {
    return StepFailure{"checkpoint", getError(checkpoint)};
  }

  auto power = stage.ReadScalar("/power");
  if (!isOk(power)) {
    return StepFailure{"read_power", getError(power)};
  }

  fAlignedPower = getValue(power);
  fReferencePower = fAlignedPower;
  fLastAlignedIndex = index;

  checkpoint = Checkpoint(index);
  if (!isOk(checkpoint)) {
    return StepFailure{"checkpoint", getError(checkpoint)};
  }
  return std::nullopt;
}

MeasurementController::StepResult MeasurementController::SweepDevice(
    size_t index, TraceSummary &trace)
{
  auto &analyzer = *fClients.analyzer;

  auto configured = analyzer.Configure(fConfig.devices[index].sweep);
  if (!isOk(configured)) {
    return StepFailure{"configure", getError(configured)};
  }

  auto checkpoint = Checkpoint(index);
  if (!isOk(checkpoint)) {
    return StepFailure{"checkpoint", getError(checkpoint)};
  }

  auto task_id = analyzer.Submit("sweep", nlohmann::json::object());
  if (!isOk(task_id)) {
    return StepFailure{"sweep", getError(task_id)};
  }

  auto done = Hardware::TaskPoller::AwaitCompletion(analyzer, getValue(task_id),
                                                    SweepPoll(), *fSignals);
  if (!isOk(done)) {
    return StepFailure{"sweep", getError(done)};
  }

  checkpoint = Checkpoint(index);
  if (!isOk(checkpoint)) {
    return StepFailure{"checkpoint", getError(checkpoint)};
  }

  auto summary = analyzer.ReadTrace();
  if (!isOk(summary)) {
    return StepFailure{"read_trace", getError(summary)};
  }
  trace = getValue(summary);
  return std::nullopt;
}

Status MeasurementController::Checkpoint(size_t next_device_index)
{
  if (fSignals->IsCancelRequested()) {
    return Err<std::monostate>(ErrorCode::Cancelled, "cancelled by caller");
  }
  if (!fSignals->IsPauseRequested()) {
    return Ok();
  }

  if (!Apply(WorkflowEvent::Pause)) {
    return Err<std::monostate>(ErrorCode::InvalidStateTransition,
                               "pause rejected");
  }
  Emit(RunPaused{next_device_index});

  if (fSignals->WaitForResumeOrCancel()) {
    return Err<std::monostate>(ErrorCode::Cancelled, "cancelled while paused");
  }

  if (!Apply(WorkflowEvent::Resume)) {
    return Err<std::monostate>(ErrorCode::InvalidStateTransition,
                               "resume rejected");
  }
  Emit(RunResumed{next_device_index});
  return Ok();
}

bool MeasurementController::ShouldAlign(size_t index,
                                        std::optional<double> pre_alignment_power) const
{
  const auto &policy = fConfig.alignment_policy;
  if (!policy.periodic || !fLastAlignedIndex) {
    return true;
  }
  if (index - *fLastAlignedIndex >= policy.devices_between_alignments) {
    return true;
  }
  if (pre_alignment_power && fReferencePower &&
      *fReferencePower - *pre_alignment_power > policy.power_threshold_db) {
    fLogger->Info("Power on device " + std::to_string(index) + " dropped " +
                  std::to_string(*fReferencePower - *pre_alignment_power) +
                  " dB, realigning");
    return true;
  }
  return false;
}

// Only a cancel the manager requested ends the run as Cancelled
bool MeasurementController::IsUserCancel(const StepFailure &failure) const
{
  return failure.error.code == ErrorCode::Cancelled && fSignals->IsCancelRequested();
}

bool MeasurementController::IsRecoverable(const StepFailure &failure) const
{
  return IsStageOperation(failure.operation) &&
         !IsValidationError(failure.error.code);
}

bool MeasurementController::Apply(WorkflowEvent event)
{
  RunState current = fState.load();
  auto next = StateMachine::Transition(current, event);
  if (!isOk(next)) {
    const auto &error = getError(next);
    fLogger->Error("Run " + fRunId + " invariant violation: " + error.message);
    fState = RunState::Failed;
    if (fStateListener) {
      fStateListener(RunState::Failed);
    }
    Emit(RunFailed{error.message, ErrorCode::InvalidStateTransition});
    return false;
  }

  fLogger->Info("Run " + fRunId + ": " + RunStateToString(current) + " -> " +
                RunStateToString(getValue(next)) + " on " +
                WorkflowEventToString(event));
  fState = getValue(next);
  if (fStateListener) {
    fStateListener(getValue(next));
  }
  return true;
}

void MeasurementController::FailRun(const std::string &reason, ErrorCode code)
{
  if (Apply(WorkflowEvent::Fail)) {
    fLogger->Error("Run " + fRunId + " failed: " + reason + " (" +
                   ErrorCodeToString(code) + ")");
    Emit(RunFailed{reason, code});
  }
}

void MeasurementController::CancelRun(std::optional<size_t> device_index)
{
  if (Apply(WorkflowEvent::Cancel)) {
    Emit(RunCancelled{device_index});
  }
}

void MeasurementController::ReportError(std::optional<size_t> device_index,
                                        const StepFailure &failure)
{
  std::string where =
      device_index ? "device " + std::to_string(*device_index) : "run";
  fLogger->Warning(failure.operation + " failed on " + where + ": " +
                   failure.error.message);
  Emit(ErrorOccurred{device_index, failure.operation, failure.error.message,
                     failure.error.code});
}

void MeasurementController::MarkDevice(size_t index, DeviceResult result,
                                       const std::string &operation,
                                       const std::string &reason)
{
  std::lock_guard<std::mutex> lock(fSummaryMutex);
  auto &outcome = fSummary.devices.at(index);
  outcome.result = result;
  outcome.failed_operation = operation;
  outcome.reason = reason;
  if (result == DeviceResult::Measured) {
    ++fSummary.successful_devices;
  } else if (result == DeviceResult::Failed) {
    ++fSummary.failed_devices;
  }
}

void MeasurementController::Emit(EventPayload payload)
{
  ProgressEvent event;
  event.sequence = fNextSequence++;
  event.timestamp = std::chrono::system_clock::now();
  event.payload = std::move(payload);
  if (fSink) {
    fSink(event);
  }
}

Hardware::PollOptions MeasurementController::MotionPoll() const
{
  Hardware::PollOptions options;
  options.poll_interval =
      std::chrono::milliseconds(fConfig.timeouts.motion_poll_interval_ms);
  options.timeout = std::chrono::milliseconds(fConfig.timeouts.motion_timeout_ms);
  return options;
}

Hardware::PollOptions MeasurementController::AlignmentPoll() const
{
  Hardware::PollOptions options;
  options.poll_interval =
      std::chrono::milliseconds(fConfig.timeouts.alignment_poll_interval_ms);
  options.timeout =
      std::chrono::milliseconds(fConfig.timeouts.alignment_timeout_ms);
  return options;
}

Hardware::PollOptions MeasurementController::SweepPoll() const
{
  Hardware::PollOptions options;
  options.poll_interval =
      std::chrono::milliseconds(fConfig.timeouts.sweep_poll_interval_ms);
  options.timeout = std::chrono::milliseconds(fConfig.timeouts.sweep_timeout_ms);
  return options;
}

}  // namespace PROBEFLOW
