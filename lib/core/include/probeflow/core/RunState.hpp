#ifndef PROBEFLOW_CORE_RUN_STATE_HPP
#define PROBEFLOW_CORE_RUN_STATE_HPP

#include <cstdint>
#include <string>

namespace PROBEFLOW {

/**
 * @brief Workflow-level state of a measurement run
 *
 * State transitions (see StateMachine):
 *   Idle -> Calibrating -> Running <-> Paused
 *   Running -> Completed
 *   Calibrating | Running | Paused -> Cancelled
 *   Calibrating | Running -> Failed
 */
enum class RunState : uint8_t {
  Idle = 0,        ///< No run started yet
  Calibrating = 1, ///< Connecting and calibrating instruments
  Running = 2,     ///< Iterating over devices
  Paused = 3,      ///< Suspended at a checkpoint
  Completed = 4,   ///< All devices processed
  Failed = 5,      ///< Aborted by a run-fatal error
  Cancelled = 6    ///< Aborted by a cancel request
};

/**
 * @brief Events that drive RunState transitions
 */
enum class WorkflowEvent : uint8_t {
  StartMeasurement = 0,
  CalibrationComplete = 1,
  Pause = 2,
  Resume = 3,
  Complete = 4,
  Cancel = 5,
  Fail = 6
};

/**
 * @brief Convert RunState to string for logging/debugging
 */
inline std::string RunStateToString(RunState state) {
  switch (state) {
  case RunState::Idle:
    return "Idle";
  case RunState::Calibrating:
    return "Calibrating";
  case RunState::Running:
    return "Running";
  case RunState::Paused:
    return "Paused";
  case RunState::Completed:
    return "Completed";
  case RunState::Failed:
    return "Failed";
  case RunState::Cancelled:
    return "Cancelled";
  default:
    return "Unknown";
  }
}

inline std::string WorkflowEventToString(WorkflowEvent event) {
  switch (event) {
  case WorkflowEvent::StartMeasurement:
    return "StartMeasurement";
  case WorkflowEvent::CalibrationComplete:
    return "CalibrationComplete";
  case WorkflowEvent::Pause:
    return "Pause";
  case WorkflowEvent::Resume:
    return "Resume";
  case WorkflowEvent::Complete:
    return "Complete";
  case WorkflowEvent::Cancel:
    return "Cancel";
  case WorkflowEvent::Fail:
    return "Fail";
  default:
    return "Unknown";
  }
}

/**
 * @brief Completed, Failed and Cancelled have no outgoing transitions
 */
inline bool IsTerminal(RunState state) {
  return state == RunState::Completed || state == RunState::Failed ||
         state == RunState::Cancelled;
}

/**
 * @brief A run occupies the hardware from Calibrating until it terminates
 */
inline bool IsActive(RunState state) {
  return state == RunState::Calibrating || state == RunState::Running ||
         state == RunState::Paused;
}

} // namespace PROBEFLOW

#endif // PROBEFLOW_CORE_RUN_STATE_HPP
