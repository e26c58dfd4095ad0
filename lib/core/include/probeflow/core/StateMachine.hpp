#ifndef PROBEFLOW_CORE_STATE_MACHINE_HPP
#define PROBEFLOW_CORE_STATE_MACHINE_HPP

#include "Error.hpp"
#include "RunState.hpp"

namespace PROBEFLOW {

/**
 * @brief Pure transition function for the run workflow
 *
 * Valid transitions:
 * - Idle        --StartMeasurement-->    Calibrating
 * - Calibrating --CalibrationComplete--> Running
 * - Running     --Pause-->               Paused
 * - Paused      --Resume-->              Running
 * - Running     --Complete-->            Completed
 * - Calibrating | Running | Paused --Cancel--> Cancelled
 * - Calibrating | Running          --Fail-->   Failed
 *
 * Everything else yields Err(InvalidStateTransition). The function never
 * touches the caller's state; callers replace their value only on Ok.
 */
class StateMachine {
public:
  static Result<RunState> Transition(RunState current, WorkflowEvent event);

  /// True if Transition(current, event) would succeed
  static bool IsValidTransition(RunState current, WorkflowEvent event);
};

} // namespace PROBEFLOW

#endif // PROBEFLOW_CORE_STATE_MACHINE_HPP
