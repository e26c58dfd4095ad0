#ifndef PROBEFLOW_CORE_RUN_SUMMARY_HPP
#define PROBEFLOW_CORE_RUN_SUMMARY_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace PROBEFLOW {

enum class DeviceResult : uint8_t { NotAttempted, Measured, Failed };

inline std::string DeviceResultToString(DeviceResult result) {
  switch (result) {
  case DeviceResult::NotAttempted:
    return "not_attempted";
  case DeviceResult::Measured:
    return "measured";
  case DeviceResult::Failed:
    return "failed";
  default:
    return "unknown";
  }
}

struct DeviceOutcome {
  size_t index = 0;
  std::string name;
  DeviceResult result = DeviceResult::NotAttempted;
  std::string failed_operation; ///< Empty unless result == Failed
  std::string reason;
};

/**
 * @brief Per-device outcome of a run, filled in as devices finish
 */
struct RunSummary {
  std::vector<DeviceOutcome> devices;
  size_t successful_devices = 0;
  size_t failed_devices = 0;
};

inline nlohmann::json RunSummaryToJSON(const RunSummary &summary) {
  nlohmann::json devices = nlohmann::json::array();
  for (const auto &d : summary.devices) {
    nlohmann::json entry = {{"index", d.index},
                            {"name", d.name},
                            {"result", DeviceResultToString(d.result)}};
    if (d.result == DeviceResult::Failed) {
      entry["failed_operation"] = d.failed_operation;
      entry["reason"] = d.reason;
    }
    devices.push_back(entry);
  }
  return {{"successful_devices", summary.successful_devices},
          {"failed_devices", summary.failed_devices},
          {"devices", devices}};
}

} // namespace PROBEFLOW

#endif // PROBEFLOW_CORE_RUN_SUMMARY_HPP
