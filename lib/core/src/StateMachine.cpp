#include "probeflow/core/StateMachine.hpp"

#include <optional>

namespace PROBEFLOW {

namespace {

std::optional<RunState> NextState(RunState current, WorkflowEvent event) {
  switch (current) {
  case RunState::Idle:
    if (event == WorkflowEvent::StartMeasurement) {
      return RunState::Calibrating;
    }
    break;

  case RunState::Calibrating:
    if (event == WorkflowEvent::CalibrationComplete) {
      return RunState::Running;
    }
    if (event == WorkflowEvent::Cancel) {
      return RunState::Cancelled;
    }
    if (event == WorkflowEvent::Fail) {
      return RunState::Failed;
    }
    break;

  case RunState::Running:
    if (event == WorkflowEvent::Pause) {
      return RunState::Paused;
    }
    if (event == WorkflowEvent::Complete) {
      return RunState::Completed;
    }
    if (event == WorkflowEvent::Cancel) {
      return RunState::Cancelled;
    }
    if (event == WorkflowEvent::Fail) {
      return RunState::Failed;
    }
    break;

  case RunState::Paused:
    if (event == WorkflowEvent::Resume) {
      return RunState::Running;
    }
    if (event == WorkflowEvent::Cancel) {
      return RunState::Cancelled;
    }
    break;

  case RunState::Completed:
  case RunState::Failed:
  case RunState::Cancelled:
    break;  // Terminal
  }
  return std::nullopt;
}

}  // namespace

Result<RunState> StateMachine::Transition(RunState current,
                                          WorkflowEvent event) {
  auto next = NextState(current, event);
  if (!next) {
    return Err<RunState>(ErrorCode::InvalidStateTransition,
                         "invalid transition: " + RunStateToString(current) +
                             " + " + WorkflowEventToString(event));
  }
  return Ok(*next);
}

bool StateMachine::IsValidTransition(RunState current, WorkflowEvent event) {
  return NextState(current, event).has_value();
}

}  // namespace PROBEFLOW
