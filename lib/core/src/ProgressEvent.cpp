#include "probeflow/core/ProgressEvent.hpp"

#include <algorithm>
#include <numeric>

namespace PROBEFLOW {

TraceSummary SummarizeTrace(const std::vector<double> &wavelengths_nm,
                            const std::vector<double> &values_db) {
  TraceSummary summary;
  size_t count = std::min(wavelengths_nm.size(), values_db.size());
  if (count == 0) {
    return summary;
  }

  summary.point_count = count;
  summary.start_wavelength_nm = wavelengths_nm.front();
  summary.stop_wavelength_nm = wavelengths_nm[count - 1];

  auto begin = values_db.begin();
  auto end = values_db.begin() + static_cast<std::ptrdiff_t>(count);
  auto [min_it, max_it] = std::minmax_element(begin, end);
  summary.min_db = *min_it;
  summary.max_db = *max_it;
  summary.mean_db = std::accumulate(begin, end, 0.0) / static_cast<double>(count);
  summary.peak_wavelength_nm = wavelengths_nm[static_cast<size_t>(max_it - begin)];
  return summary;
}

std::string ProgressEventTypeToString(ProgressEventType type) {
  switch (type) {
  case ProgressEventType::RunStarted:
    return "run_started";
  case ProgressEventType::DeviceStarted:
    return "device_started";
  case ProgressEventType::AlignmentProgress:
    return "alignment_progress";
  case ProgressEventType::MeasurementCompleted:
    return "measurement_completed";
  case ProgressEventType::ErrorOccurred:
    return "error_occurred";
  case ProgressEventType::RunPaused:
    return "run_paused";
  case ProgressEventType::RunResumed:
    return "run_resumed";
  case ProgressEventType::RunCompleted:
    return "run_completed";
  case ProgressEventType::RunCancelled:
    return "run_cancelled";
  case ProgressEventType::RunFailed:
    return "run_failed";
  default:
    return "unknown";
  }
}

bool ProgressEvent::IsTerminal() const {
  return Is<RunCompleted>() || Is<RunCancelled>() || Is<RunFailed>();
}

namespace {

template <typename T> nlohmann::json OptionalToJSON(const std::optional<T> &v) {
  return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

nlohmann::json TraceSummaryToJSON(const TraceSummary &s) {
  return {{"point_count", s.point_count},
          {"start_wavelength_nm", s.start_wavelength_nm},
          {"stop_wavelength_nm", s.stop_wavelength_nm},
          {"min_db", s.min_db},
          {"max_db", s.max_db},
          {"mean_db", s.mean_db},
          {"peak_wavelength_nm", s.peak_wavelength_nm}};
}

void WriteCode(nlohmann::json &json, ErrorCode code) {
  json["code"] = static_cast<int>(code);
  json["code_name"] = ErrorCodeToString(code);
}

struct PayloadWriter {
  nlohmann::json &json;

  void operator()(const RunStarted &e) const {
    json["run_id"] = e.run_id;
    json["run_label"] = e.run_label;
    json["total_devices"] = e.total_devices;
  }
  void operator()(const DeviceStarted &e) const {
    json["device_index"] = e.device_index;
    json["device_name"] = e.device_name;
  }
  void operator()(const AlignmentProgress &e) const {
    json["device_index"] = e.device_index;
    json["phase"] = e.phase;
    json["percent"] = e.percent;
  }
  void operator()(const MeasurementCompleted &e) const {
    json["device_index"] = e.device_index;
    json["trace_summary"] = TraceSummaryToJSON(e.trace_summary);
    json["aligned_power_dbm"] = OptionalToJSON(e.aligned_power_dbm);
  }
  void operator()(const ErrorOccurred &e) const {
    json["device_index"] = OptionalToJSON(e.device_index);
    json["operation"] = e.operation;
    json["reason"] = e.reason;
    WriteCode(json, e.code);
  }
  void operator()(const RunPaused &e) const {
    json["next_device_index"] = e.next_device_index;
  }
  void operator()(const RunResumed &e) const {
    json["next_device_index"] = e.next_device_index;
  }
  void operator()(const RunCompleted &e) const {
    json["successful_devices"] = e.successful_devices;
    json["failed_devices"] = e.failed_devices;
  }
  void operator()(const RunCancelled &e) const {
    json["device_index"] = OptionalToJSON(e.device_index);
  }
  void operator()(const RunFailed &e) const {
    json["reason"] = e.reason;
    WriteCode(json, e.code);
  }
};

}  // namespace

nlohmann::json ProgressEventToJSON(const ProgressEvent &event) {
  auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(
      event.timestamp.time_since_epoch());

  nlohmann::json json;
  json["type"] = ProgressEventTypeToString(event.GetType());
  json["sequence"] = event.sequence;
  json["timestamp"] = static_cast<double>(since_epoch.count()) / 1e6;
  std::visit(PayloadWriter{json}, event.payload);
  return json;
}

}  // namespace PROBEFLOW
