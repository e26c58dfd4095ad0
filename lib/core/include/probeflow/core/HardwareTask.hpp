#ifndef PROBEFLOW_CORE_HARDWARE_TASK_HPP
#define PROBEFLOW_CORE_HARDWARE_TASK_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace PROBEFLOW {

/// Opaque identifier handed out by an instrument service
using TaskId = std::string;

/**
 * @brief Status of an asynchronous instrument task
 */
enum class TaskStatus : uint8_t {
  Pending,   ///< Accepted, not yet executing
  Running,   ///< Executing on the instrument
  Completed, ///< Finished successfully
  Failed,    ///< Finished with an instrument fault
  Cancelled  ///< Aborted before completion
};

inline std::string TaskStatusToString(TaskStatus status) {
  switch (status) {
  case TaskStatus::Pending:
    return "pending";
  case TaskStatus::Running:
    return "running";
  case TaskStatus::Completed:
    return "completed";
  case TaskStatus::Failed:
    return "failed";
  case TaskStatus::Cancelled:
    return "cancelled";
  default:
    return "unknown";
  }
}

/**
 * @brief Parse the wire spelling of a task status
 * @return std::nullopt for anything the instrument services never send
 */
inline std::optional<TaskStatus> TaskStatusFromString(const std::string &text) {
  if (text == "pending" || text == "queued") {
    return TaskStatus::Pending;
  }
  if (text == "running" || text == "in_progress") {
    return TaskStatus::Running;
  }
  if (text == "completed" || text == "done") {
    return TaskStatus::Completed;
  }
  if (text == "failed" || text == "error") {
    return TaskStatus::Failed;
  }
  if (text == "cancelled" || text == "canceled" || text == "stopped") {
    return TaskStatus::Cancelled;
  }
  return std::nullopt;
}

inline bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::Completed || status == TaskStatus::Failed ||
         status == TaskStatus::Cancelled;
}

/**
 * @brief Snapshot of an instrument task, as returned by one poll
 *
 * Owned by the client/poller pair that created the task; the orchestration
 * code only reads these values.
 */
struct HardwareTask {
  TaskId task_id;
  TaskStatus status = TaskStatus::Pending;
  double progress_percent = 0.0;
  std::optional<nlohmann::json> result_payload; ///< Raw status body
  std::optional<std::string> error;             ///< Instrument fault text
};

} // namespace PROBEFLOW

#endif // PROBEFLOW_CORE_HARDWARE_TASK_HPP
