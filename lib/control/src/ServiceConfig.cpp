#include "ServiceConfig.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <utility>

namespace PROBEFLOW::Control
{

namespace
{

Status ReadUnsigned(const nlohmann::json &json, const std::string &key, uint32_t &out)
{
  auto it = json.find(key);
  if (it == json.end()) {
    return Ok();
  }
  if (!it->is_number_integer()) {
    return Err<std::monostate>(ErrorCode::InvalidConfiguration, key + " must be an integer");
  }
  auto value = it->get<int64_t>();
  if (value < 0 || value > std::numeric_limits<uint32_t>::max()) {
    return Err<std::monostate>(ErrorCode::InvalidConfiguration,
                               key + " is out of range: " + it->dump());
  }
  out = static_cast<uint32_t>(value);
  return Ok();
}

} // namespace

Result<ServiceConfig> ServiceConfigFromJSON(const nlohmann::json &json)
{
  ServiceConfig config;
  if (!json.is_object()) {
    return Err<ServiceConfig>(ErrorCode::InvalidConfiguration,
                              "service configuration must be a JSON object");
  }

  try {
    config.control_address = json.value("control_address", config.control_address);
    config.event_address = json.value("event_address", config.event_address);
    config.log_directory = json.value("log_directory", config.log_directory);
    for (auto field :
         {std::make_pair("retention_window_s", &config.retention_window_s),
          std::make_pair("event_channel_capacity", &config.event_channel_capacity),
          std::make_pair("subscriber_queue_capacity", &config.subscriber_queue_capacity)}) {
      auto read = ReadUnsigned(json, field.first, *field.second);
      if (!isOk(read)) {
        return Err<ServiceConfig>(getError(read));
      }
    }

    if (json.contains("log_level")) {
      auto level = LogLevelFromString(json.at("log_level").get<std::string>());
      if (!level) {
        return Err<ServiceConfig>(ErrorCode::InvalidConfiguration,
                                  "unknown log_level '" +
                                      json.at("log_level").get<std::string>() + "'");
      }
      config.log_level = *level;
    }
  } catch (const nlohmann::json::exception &e) {
    return Err<ServiceConfig>(ErrorCode::InvalidConfiguration,
                              std::string("malformed service configuration: ") +
                                  e.what());
  }

  if (config.control_address.empty() || config.event_address.empty()) {
    return Err<ServiceConfig>(ErrorCode::ConfigurationValidationFailed,
                              "socket addresses must not be empty");
  }
  if (config.event_channel_capacity == 0 || config.subscriber_queue_capacity == 0) {
    return Err<ServiceConfig>(ErrorCode::ConfigurationValidationFailed,
                              "queue capacities must be positive");
  }
  return Ok(std::move(config));
}

Result<ServiceConfig> ServiceConfigFromFile(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open()) {
    return Err<ServiceConfig>(ErrorCode::ConfigurationNotFound,
                              "cannot open service configuration: " + filename);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  auto json = nlohmann::json::parse(content, nullptr, false);
  if (json.is_discarded()) {
    return Err<ServiceConfig>(ErrorCode::InvalidConfiguration,
                              "service configuration is not valid JSON: " + filename);
  }
  return ServiceConfigFromJSON(json);
}

ManagerOptions ToManagerOptions(const ServiceConfig &config)
{
  ManagerOptions options;
  options.retention_window = std::chrono::seconds(config.retention_window_s);
  options.event_channel_capacity = config.event_channel_capacity;
  options.subscriber_queue_capacity = config.subscriber_queue_capacity;
  return options;
}

}  // namespace PROBEFLOW::Control
