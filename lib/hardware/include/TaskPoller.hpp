/**
 * @file TaskPoller.hpp
 * @brief Drives a submitted hardware task to a terminal state
 */

#pragma once

#include <chrono>
#include <functional>

#include "IHardwareClient.hpp"
#include "probeflow/core/ControlSignals.hpp"

namespace PROBEFLOW::Hardware
{

struct PollOptions {
  std::chrono::milliseconds poll_interval{300};
  std::chrono::milliseconds timeout{30000};
};

using ProgressCallback = std::function<void(const HardwareTask &task)>;

/**
 * @brief Fixed-interval polling with timeout and cooperative cancel
 *
 * Each iteration:
 * 1. past the timeout       -> Cancel(), Err(HardwareTimeout, "timeout")
 * 2. cancel requested       -> Cancel(), Err(Cancelled, "cancelled by caller")
 * 3. Poll() fails           -> that error, unchanged
 * 4. on_progress(snapshot)
 * 5. completed              -> Ok(snapshot)
 *    failed                 -> Err(HardwareFault, snapshot error)
 *    cancelled              -> Err(Cancelled, "task cancelled by instrument")
 * 6. sleep poll_interval, waking early on cancel
 *
 * A failing best-effort Cancel() is logged and never replaces the primary
 * error.
 */
class TaskPoller
{
 public:
  static Result<HardwareTask> AwaitCompletion(
      IHardwareClient &client, const TaskId &task_id,
      const PollOptions &options, ControlSignals &signals,
      const ProgressCallback &on_progress = ProgressCallback());
};

}  // namespace PROBEFLOW::Hardware
