#ifndef PROBEFLOW_CORE_PROGRESS_EVENT_HPP
#define PROBEFLOW_CORE_PROGRESS_EVENT_HPP

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "ErrorCode.hpp"

namespace PROBEFLOW {

/**
 * @brief Statistics of one analyzer trace
 */
struct TraceSummary {
  size_t point_count = 0;
  double start_wavelength_nm = 0.0;
  double stop_wavelength_nm = 0.0;
  double min_db = 0.0;
  double max_db = 0.0;
  double mean_db = 0.0;
  double peak_wavelength_nm = 0.0; ///< Wavelength of max_db
};

/**
 * @brief Reduce a raw trace to its summary
 * @note wavelengths and values must have equal, non-zero length
 */
TraceSummary SummarizeTrace(const std::vector<double> &wavelengths_nm,
                            const std::vector<double> &values_db);

// Event payloads

struct RunStarted {
  std::string run_id;
  std::string run_label;
  size_t total_devices = 0;
};

struct DeviceStarted {
  size_t device_index = 0;
  std::string device_name;
};

struct AlignmentProgress {
  size_t device_index = 0;
  std::string phase;
  double percent = 0.0;
};

struct MeasurementCompleted {
  size_t device_index = 0;
  TraceSummary trace_summary;
  std::optional<double> aligned_power_dbm;
};

struct ErrorOccurred {
  std::optional<size_t> device_index; ///< Empty for run-level failures
  std::string operation;              ///< "move", "alignment", "sweep", ...
  std::string reason;
  ErrorCode code = ErrorCode::Unknown;
};

struct RunPaused {
  size_t next_device_index = 0;
};

struct RunResumed {
  size_t next_device_index = 0;
};

struct RunCompleted {
  size_t successful_devices = 0;
  size_t failed_devices = 0;
};

struct RunCancelled {
  std::optional<size_t> device_index; ///< Device in progress, if any
};

struct RunFailed {
  std::string reason;
  ErrorCode code = ErrorCode::Unknown;
};

using EventPayload =
    std::variant<RunStarted, DeviceStarted, AlignmentProgress,
                 MeasurementCompleted, ErrorOccurred, RunPaused, RunResumed,
                 RunCompleted, RunCancelled, RunFailed>;

/**
 * @brief Event types, in the same order as the EventPayload alternatives
 */
enum class ProgressEventType : uint8_t {
  RunStarted = 0,
  DeviceStarted,
  AlignmentProgress,
  MeasurementCompleted,
  ErrorOccurred,
  RunPaused,
  RunResumed,
  RunCompleted,
  RunCancelled,
  RunFailed
};

/// Wire name, e.g. "run_started"
std::string ProgressEventTypeToString(ProgressEventType type);

/**
 * @brief One immutable progress notification of a run
 *
 * Sequence numbers start at 0 for RunStarted and increase by one per event.
 */
struct ProgressEvent {
  uint64_t sequence = 0;
  std::chrono::system_clock::time_point timestamp;
  EventPayload payload;

  ProgressEventType GetType() const {
    return static_cast<ProgressEventType>(payload.index());
  }

  template <typename T> bool Is() const {
    return std::holds_alternative<T>(payload);
  }

  template <typename T> const T &As() const { return std::get<T>(payload); }

  /// True for RunCompleted, RunCancelled and RunFailed
  bool IsTerminal() const;
};

/**
 * @brief Encode as {"type", "sequence", "timestamp", ...payload fields}
 *
 * The timestamp is seconds since the Unix epoch as a double. Error codes are
 * written both as number ("code") and name ("code_name").
 */
nlohmann::json ProgressEventToJSON(const ProgressEvent &event);

} // namespace PROBEFLOW

#endif // PROBEFLOW_CORE_PROGRESS_EVENT_HPP
