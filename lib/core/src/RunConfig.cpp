#include "probeflow/core/RunConfig.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <utility>

namespace PROBEFLOW {

namespace {

// Absent keys keep the default; negative or oversized values are rejected
// instead of wrapping around.
Status ReadUnsigned(const nlohmann::json &json, const std::string &key,
                    uint32_t &out) {
  auto it = json.find(key);
  if (it == json.end()) {
    return Ok();
  }
  if (!it->is_number_integer()) {
    return Err<std::monostate>(ErrorCode::InvalidConfiguration,
                               key + " must be an integer");
  }
  auto value = it->get<int64_t>();
  if (value < 0 || value > std::numeric_limits<uint32_t>::max()) {
    return Err<std::monostate>(ErrorCode::InvalidConfiguration,
                               key + " is out of range: " + it->dump());
  }
  out = static_cast<uint32_t>(value);
  return Ok();
}

Status RequireObject(const nlohmann::json &json, const std::string &key) {
  if (!json.is_object()) {
    return Err<std::monostate>(ErrorCode::InvalidConfiguration,
                               key + " must be an object");
  }
  return Ok();
}

Status ReadEndpoint(const nlohmann::json &json, const std::string &key,
                    EndpointConfig &endpoint) {
  auto object = RequireObject(json, key);
  if (!isOk(object)) {
    return object;
  }
  endpoint.base_url = json.value("base_url", endpoint.base_url);
  for (auto field : {std::make_pair("request_timeout_ms", &endpoint.request_timeout_ms),
                     std::make_pair("health_timeout_ms", &endpoint.health_timeout_ms)}) {
    auto read = ReadUnsigned(json, field.first, *field.second);
    if (!isOk(read)) {
      return Err<std::monostate>(getError(read).Wrap(key));
    }
  }
  return Ok();
}

Status ReadTimeouts(const nlohmann::json &json, TimeoutBudget &out) {
  auto object = RequireObject(json, "timeouts");
  if (!isOk(object)) {
    return object;
  }
  for (auto field : {std::make_pair("motion_timeout_ms", &out.motion_timeout_ms),
                     std::make_pair("alignment_timeout_ms", &out.alignment_timeout_ms),
                     std::make_pair("sweep_timeout_ms", &out.sweep_timeout_ms),
                     std::make_pair("motion_poll_interval_ms", &out.motion_poll_interval_ms),
                     std::make_pair("alignment_poll_interval_ms",
                                    &out.alignment_poll_interval_ms),
                     std::make_pair("sweep_poll_interval_ms", &out.sweep_poll_interval_ms)}) {
    auto read = ReadUnsigned(json, field.first, *field.second);
    if (!isOk(read)) {
      return Err<std::monostate>(getError(read).Wrap("timeouts"));
    }
  }
  return Ok();
}

void ReadSweep(const nlohmann::json &json, SweepParameters &sweep) {
  sweep.start_wavelength_nm =
      json.value("start_wavelength_nm", sweep.start_wavelength_nm);
  sweep.stop_wavelength_nm =
      json.value("stop_wavelength_nm", sweep.stop_wavelength_nm);
  sweep.resolution_pm = json.value("resolution_pm", sweep.resolution_pm);
  sweep.sweep_speed_nm_per_s =
      json.value("sweep_speed_nm_per_s", sweep.sweep_speed_nm_per_s);
  sweep.laser_power_dbm = json.value("laser_power_dbm", sweep.laser_power_dbm);
}

DeviceDescriptor ReadDevice(const nlohmann::json &json, size_t index) {
  DeviceDescriptor device;
  device.name = json.value("name", "device_" + std::to_string(index));

  if (json.contains("position")) {
    for (const auto &axis_json : json.at("position")) {
      AxisTarget target;
      target.axis = axis_json.at("axis").get<int>();
      target.target_um = axis_json.at("target_um").get<double>();
      target.speed_um_per_s =
          axis_json.value("speed_um_per_s", target.speed_um_per_s);
      device.position.push_back(target);
    }
  }
  if (json.contains("sweep")) {
    ReadSweep(json.at("sweep"), device.sweep);
  }
  if (json.contains("alignment")) {
    device.alignment = json.at("alignment");
  }
  return device;
}

nlohmann::json EndpointToJSON(const EndpointConfig &endpoint) {
  return {{"base_url", endpoint.base_url},
          {"request_timeout_ms", endpoint.request_timeout_ms},
          {"health_timeout_ms", endpoint.health_timeout_ms}};
}

Status Invalid(const std::string &message) {
  return Err<std::monostate>(ErrorCode::ConfigurationValidationFailed, message);
}

bool IsHttpUrl(const std::string &url) {
  return url.rfind("http://", 0) == 0;
}

}  // namespace

Status ValidateRunConfig(const RunConfig &config) {
  if (config.stage_endpoint.base_url.empty()) {
    return Invalid("stage.base_url is empty");
  }
  if (!IsHttpUrl(config.stage_endpoint.base_url)) {
    return Invalid("stage.base_url must start with http://");
  }
  if (config.analyzer_endpoint.base_url.empty()) {
    return Invalid("analyzer.base_url is empty");
  }
  if (!IsHttpUrl(config.analyzer_endpoint.base_url)) {
    return Invalid("analyzer.base_url must start with http://");
  }
  if (config.stage_endpoint.request_timeout_ms == 0 ||
      config.analyzer_endpoint.request_timeout_ms == 0) {
    return Invalid("request_timeout_ms must be positive");
  }

  const auto &t = config.timeouts;
  if (t.motion_timeout_ms == 0 || t.alignment_timeout_ms == 0 ||
      t.sweep_timeout_ms == 0) {
    return Invalid("operation timeouts must be positive");
  }
  if (t.motion_poll_interval_ms == 0 || t.alignment_poll_interval_ms == 0 ||
      t.sweep_poll_interval_ms == 0) {
    return Invalid("poll intervals must be positive");
  }

  if (config.alignment_policy.devices_between_alignments == 0) {
    return Invalid("alignment_policy.devices_between_alignments must be positive");
  }

  for (size_t i = 0; i < config.devices.size(); ++i) {
    const auto &device = config.devices[i];
    if (device.position.empty()) {
      return Invalid("device " + std::to_string(i) + " has no position");
    }
    if (device.sweep.stop_wavelength_nm <= device.sweep.start_wavelength_nm) {
      return Invalid("device " + std::to_string(i) +
                     " sweep stop wavelength must exceed start");
    }
    if (!device.alignment.is_object()) {
      return Invalid("device " + std::to_string(i) +
                     " alignment must be an object");
    }
  }
  return Ok();
}

Result<RunConfig> RunConfigFromJSON(const nlohmann::json &json) {
  RunConfig config;
  try {
    if (!json.is_object()) {
      return Err<RunConfig>(ErrorCode::InvalidConfiguration,
                            "run configuration must be a JSON object");
    }

    config.run_label = json.value("run_label", config.run_label);
    config.calibrate_analyzer =
        json.value("calibrate_analyzer", config.calibrate_analyzer);

    Status read = Ok();
    if (json.contains("stage")) {
      read = ReadEndpoint(json.at("stage"), "stage", config.stage_endpoint);
    }
    if (isOk(read) && json.contains("analyzer")) {
      read = ReadEndpoint(json.at("analyzer"), "analyzer", config.analyzer_endpoint);
    }
    if (isOk(read) && json.contains("timeouts")) {
      read = ReadTimeouts(json.at("timeouts"), config.timeouts);
    }
    if (isOk(read) && json.contains("alignment_policy")) {
      const auto &p = json.at("alignment_policy");
      auto &out = config.alignment_policy;
      read = RequireObject(p, "alignment_policy");
      if (isOk(read)) {
        out.periodic = p.value("periodic", out.periodic);
        out.power_threshold_db = p.value("power_threshold_db", out.power_threshold_db);
        read = ReadUnsigned(p, "devices_between_alignments",
                            out.devices_between_alignments);
      }
    }
    if (!isOk(read)) {
      return Err<RunConfig>(getError(read));
    }

    if (json.contains("devices")) {
      const auto &devices = json.at("devices");
      if (!devices.is_array()) {
        return Err<RunConfig>(ErrorCode::InvalidConfiguration,
                              "devices must be an array");
      }
      for (size_t i = 0; i < devices.size(); ++i) {
        config.devices.push_back(ReadDevice(devices[i], i));
      }
    }
  } catch (const nlohmann::json::exception &e) {
    return Err<RunConfig>(ErrorCode::InvalidConfiguration,
                          std::string("malformed run configuration: ") + e.what());
  }

  auto valid = ValidateRunConfig(config);
  if (!isOk(valid)) {
    return Err<RunConfig>(getError(valid));
  }
  return Ok(std::move(config));
}

Result<RunConfig> RunConfigFromFile(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    return Err<RunConfig>(ErrorCode::ConfigurationNotFound,
                          "cannot open run configuration: " + filename);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  auto json = nlohmann::json::parse(content, nullptr, false);
  if (json.is_discarded()) {
    return Err<RunConfig>(ErrorCode::InvalidConfiguration,
                          "run configuration is not valid JSON: " + filename);
  }
  return RunConfigFromJSON(json);
}

nlohmann::json RunConfigToJSON(const RunConfig &config) {
  nlohmann::json devices = nlohmann::json::array();
  for (const auto &device : config.devices) {
    nlohmann::json position = nlohmann::json::array();
    for (const auto &target : device.position) {
      position.push_back({{"axis", target.axis},
                          {"target_um", target.target_um},
                          {"speed_um_per_s", target.speed_um_per_s}});
    }
    devices.push_back(
        {{"name", device.name},
         {"position", position},
         {"sweep",
          {{"start_wavelength_nm", device.sweep.start_wavelength_nm},
           {"stop_wavelength_nm", device.sweep.stop_wavelength_nm},
           {"resolution_pm", device.sweep.resolution_pm},
           {"sweep_speed_nm_per_s", device.sweep.sweep_speed_nm_per_s},
           {"laser_power_dbm", device.sweep.laser_power_dbm}}},
         {"alignment", device.alignment}});
  }

  const auto &t = config.timeouts;
  return {{"run_label", config.run_label},
          {"stage", EndpointToJSON(config.stage_endpoint)},
          {"analyzer", EndpointToJSON(config.analyzer_endpoint)},
          {"timeouts",
           {{"motion_timeout_ms", t.motion_timeout_ms},
            {"alignment_timeout_ms", t.alignment_timeout_ms},
            {"sweep_timeout_ms", t.sweep_timeout_ms},
            {"motion_poll_interval_ms", t.motion_poll_interval_ms},
            {"alignment_poll_interval_ms", t.alignment_poll_interval_ms},
            {"sweep_poll_interval_ms", t.sweep_poll_interval_ms}}},
          {"alignment_policy",
           {{"periodic", config.alignment_policy.periodic},
            {"devices_between_alignments",
             config.alignment_policy.devices_between_alignments},
            {"power_threshold_db", config.alignment_policy.power_threshold_db}}},
          {"calibrate_analyzer", config.calibrate_analyzer},
          {"devices", devices}};
}

}  // namespace PROBEFLOW
