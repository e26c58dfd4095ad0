#ifndef PROBEFLOW_CORE_RUN_CONFIG_HPP
#define PROBEFLOW_CORE_RUN_CONFIG_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "Error.hpp"

namespace PROBEFLOW {

/**
 * @brief One absolute axis move of the probe station
 */
struct AxisTarget {
  int axis = 0;                 ///< Axis number on the stage controller
  double target_um = 0.0;       ///< Absolute target position
  double speed_um_per_s = 1000.0;
};

/**
 * @brief Analyzer sweep settings for one device
 */
struct SweepParameters {
  double start_wavelength_nm = 1500.0;
  double stop_wavelength_nm = 1600.0;
  double resolution_pm = 10.0;
  double sweep_speed_nm_per_s = 50.0;
  double laser_power_dbm = 0.0;
};

/**
 * @brief A device on the chip under test
 */
struct DeviceDescriptor {
  std::string name;
  std::vector<AxisTarget> position; ///< Moves applied in order
  SweepParameters sweep;
  nlohmann::json alignment = nlohmann::json::object(); ///< Passed through to the stage
};

/**
 * @brief Address of one instrument service
 */
struct EndpointConfig {
  std::string base_url;               ///< e.g. "http://localhost:8001"
  uint32_t request_timeout_ms = 10000; ///< Deadline for one HTTP exchange
  uint32_t health_timeout_ms = 5000;   ///< Deadline for the /health probe
};

/**
 * @brief Per-operation time budgets and poll intervals
 *
 * Sweeps get the longest budget; motion and alignment poll faster because
 * they are short and latency-sensitive.
 */
struct TimeoutBudget {
  uint32_t motion_timeout_ms = 30000;
  uint32_t alignment_timeout_ms = 120000;
  uint32_t sweep_timeout_ms = 600000;
  uint32_t motion_poll_interval_ms = 300;
  uint32_t alignment_poll_interval_ms = 300;
  uint32_t sweep_poll_interval_ms = 500;
};

/**
 * @brief When to run optical alignment
 *
 * With periodic == false every device is aligned. Otherwise alignment runs
 * on the first device, every devices_between_alignments devices, and whenever
 * the power read before alignment has dropped more than power_threshold_db
 * below the last aligned reading.
 */
struct AlignmentPolicy {
  bool periodic = false;
  uint32_t devices_between_alignments = 5;
  double power_threshold_db = 1.5;
};

/**
 * @brief Configuration for one measurement run
 *
 * Created once at start, read-only for the run's lifetime.
 *
 * Example JSON:
 *   {
 *     "run_label": "order_1234",
 *     "stage": {"base_url": "http://localhost:8001"},
 *     "analyzer": {"base_url": "http://localhost:8002"},
 *     "timeouts": {"sweep_timeout_ms": 300000},
 *     "alignment_policy": {"periodic": true, "devices_between_alignments": 5},
 *     "calibrate_analyzer": true,
 *     "devices": [
 *       {
 *         "name": "ring_01",
 *         "position": [{"axis": 1, "target_um": 120.0, "speed_um_per_s": 500}],
 *         "sweep": {"start_wavelength_nm": 1520, "stop_wavelength_nm": 1580},
 *         "alignment": {"mode": "flat"}
 *       }
 *     ]
 *   }
 */
struct RunConfig {
  std::string run_label;
  std::vector<DeviceDescriptor> devices;
  EndpointConfig stage_endpoint;
  EndpointConfig analyzer_endpoint;
  TimeoutBudget timeouts;
  AlignmentPolicy alignment_policy;
  bool calibrate_analyzer = true;
};

/**
 * @brief Check ranges and required fields
 * @return Err(ConfigurationValidationFailed) naming the first offending field
 */
Status ValidateRunConfig(const RunConfig &config);

/**
 * @brief Build a RunConfig from JSON; missing fields keep their defaults
 * @return Err(InvalidConfiguration) on wrong types, or the validation error
 */
Result<RunConfig> RunConfigFromJSON(const nlohmann::json &json);

/**
 * @brief Read and parse a JSON file
 * @return Err(ConfigurationNotFound) if unreadable, else as RunConfigFromJSON
 */
Result<RunConfig> RunConfigFromFile(const std::string &filename);

nlohmann::json RunConfigToJSON(const RunConfig &config);

} // namespace PROBEFLOW

#endif // PROBEFLOW_CORE_RUN_CONFIG_HPP
