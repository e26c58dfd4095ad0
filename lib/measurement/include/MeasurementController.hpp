/**
 * @file MeasurementController.hpp
 * @brief Sequential workflow of one measurement run
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "IHardwareClient.hpp"
#include "TaskPoller.hpp"
#include "probeflow/core/ControlSignals.hpp"
#include "probeflow/core/Logger.hpp"
#include "probeflow/core/ProgressEvent.hpp"
#include "probeflow/core/RunConfig.hpp"
#include "probeflow/core/RunState.hpp"
#include "probeflow/core/RunSummary.hpp"

namespace PROBEFLOW
{

/// Receives every event of the run, in order, on the worker thread
using EventSink = std::function<void(const ProgressEvent &event)>;

/// Called after each accepted state transition
using StateListener = std::function<void(RunState state)>;

/**
 * @brief Drives one run from Idle to a terminal state
 *
 * Run() blocks the calling thread until the run is Completed, Failed or
 * Cancelled. Per device: move each axis, align (subject to the alignment
 * policy), read power, configure the analyzer, sweep, read the trace.
 *
 * Failure handling:
 * - stage failures (move, alignment, read_power) skip the device
 * - analyzer failures (configure, sweep, read_trace) fail the run
 * - HardwareRejected / UnknownOperation fail the run
 * - Cancelled ends the run as Cancelled
 * - a rejected state transition forces Failed and emits RunFailed
 *
 * Pause and cancel are observed before each device and between the steps
 * of a device.
 */
class MeasurementController
{
 public:
  MeasurementController(std::string run_id, RunConfig config,
                        Hardware::HardwareClients clients,
                        std::shared_ptr<ControlSignals> signals, EventSink sink,
                        StateListener state_listener = StateListener());

  MeasurementController(const MeasurementController &) = delete;
  MeasurementController &operator=(const MeasurementController &) = delete;

  RunState Run();

  RunState GetState() const { return fState.load(); }
  RunSummary GetSummary() const;
  const std::string &GetRunId() const { return fRunId; }
  const RunConfig &GetConfig() const { return fConfig; }

 private:
  /// A failed step of the workflow
  struct StepFailure {
    std::string operation;
    Error error;
  };
  using StepResult = std::optional<StepFailure>;

  RunState Execute();

  StepResult Calibrate();
  StepResult MeasureDevice(size_t index);
  StepResult MoveToDevice(size_t index);
  StepResult AlignDevice(size_t index);
  StepResult SweepDevice(size_t index, TraceSummary &trace);

  /// Honour pause and cancel requests; Err(Cancelled) to stop the run
  Status Checkpoint(size_t next_device_index);

  bool ShouldAlign(size_t index, std::optional<double> pre_alignment_power) const;
  bool IsUserCancel(const StepFailure &failure) const;
  bool IsRecoverable(const StepFailure &failure) const;

  /// Apply a transition; on rejection forces Failed and emits RunFailed
  bool Apply(WorkflowEvent event);

  void FailRun(const std::string &reason, ErrorCode code);
  void CancelRun(std::optional<size_t> device_index);
  void ReportError(std::optional<size_t> device_index, const StepFailure &failure);

  void MarkDevice(size_t index, DeviceResult result,
                  const std::string &operation = "",
                  const std::string &reason = "");

  void Emit(EventPayload payload);

  Hardware::PollOptions MotionPoll() const;
  Hardware::PollOptions AlignmentPoll() const;
  Hardware::PollOptions SweepPoll() const;

  const std::string fRunId;
  const RunConfig fConfig;
  Hardware::HardwareClients fClients;
  std::shared_ptr<ControlSignals> fSignals;
  EventSink fSink;
  StateListener fStateListener;
  std::shared_ptr<Logger> fLogger;

  std::atomic<RunState> fState{RunState::Idle};
  uint64_t fNextSequence = 0;

  // Alignment bookkeeping for the periodic policy
  std::optional<size_t> fLastAlignedIndex;
  std::optional<double> fReferencePower;
  std::optional<double> fAlignedPower;

  mutable std::mutex fSummaryMutex;
  RunSummary fSummary;
};

}  // namespace PROBEFLOW
