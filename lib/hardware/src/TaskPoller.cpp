#include "TaskPoller.hpp"

#include "probeflow/core/Logger.hpp"

namespace PROBEFLOW::Hardware
{

namespace
{

void AbortTask(IHardwareClient &client, const TaskId &task_id,
               const std::string &why)
{
  auto cancelled = client.Cancel(task_id);
  if (!isOk(cancelled)) {
    Logger::GetLogger("poller")->Warning(
        "Failed to abort " + client.GetName() + " task " + task_id + " after " +
        why + ": " + getError(cancelled).message);
  }
}

}  // namespace

Result<HardwareTask> TaskPoller::AwaitCompletion(IHardwareClient &client,
                                                 const TaskId &task_id,
                                                 const PollOptions &options,
                                                 ControlSignals &signals,
                                                 const ProgressCallback &on_progress)
{
  const auto start = std::chrono::steady_clock::now();

  while (true) {
    if (std::chrono::steady_clock::now() - start > options.timeout) {
      AbortTask(client, task_id, "timeout");
      return Err<HardwareTask>(ErrorCode::HardwareTimeout, "timeout");
    }

    if (signals.IsCancelRequested()) {
      AbortTask(client, task_id, "cancel request");
      return Err<HardwareTask>(ErrorCode::Cancelled, "cancelled by caller");
    }

    auto polled = client.Poll(task_id);
    if (!isOk(polled)) {
      return polled;
    }

    const auto &task = getValue(polled);
    if (on_progress) {
      on_progress(task);
    }

    switch (task.status) {
      case TaskStatus::Completed:
        return polled;
      case TaskStatus::Failed:
        return Err<HardwareTask>(
            ErrorCode::HardwareFault,
            task.error.value_or(client.GetName() + " task " + task_id + " failed"));
      case TaskStatus::Cancelled:
        return Err<HardwareTask>(ErrorCode::TaskCancelledByInstrument,
                                 client.GetName() + " task " + task_id +
                                     " cancelled by instrument");
      default:
        break;
    }

    signals.WaitForCancel(options.poll_interval);
  }
}

}  // namespace PROBEFLOW::Hardware
