/**
 * @file ServiceConfig.hpp
 * @brief Daemon-level settings: sockets, logging and manager limits
 */

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "MeasurementManager.hpp"
#include "probeflow/core/Error.hpp"
#include "probeflow/core/Logger.hpp"

namespace PROBEFLOW::Control
{

/**
 * @brief Settings of the probeflow daemon
 *
 * Example JSON:
 *   {
 *     "control_address": "tcp://*:5570",
 *     "event_address": "tcp://*:5571",
 *     "log_directory": "./logs",
 *     "log_level": "info",
 *     "retention_window_s": 600,
 *     "event_channel_capacity": 256,
 *     "subscriber_queue_capacity": 1024
 *   }
 */
struct ServiceConfig {
  std::string control_address = "tcp://*:5570";  ///< REP socket for commands
  std::string event_address = "tcp://*:5571";    ///< PUB socket for events
  std::string log_directory;                     ///< Empty: log to stderr
  LogLevel log_level = LogLevel::INFO;
  uint32_t retention_window_s = 600;
  uint32_t event_channel_capacity = 256;
  uint32_t subscriber_queue_capacity = 1024;
};

Result<ServiceConfig> ServiceConfigFromJSON(const nlohmann::json &json);
Result<ServiceConfig> ServiceConfigFromFile(const std::string &filename);

ManagerOptions ToManagerOptions(const ServiceConfig &config);

}  // namespace PROBEFLOW::Control
