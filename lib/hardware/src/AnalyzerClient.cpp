#include "AnalyzerClient.hpp"

namespace PROBEFLOW::Hardware
{

AnalyzerClient::AnalyzerClient(const EndpointConfig &endpoint)
    : fEndpoint(endpoint)
{
  auto address = ParseServiceAddress(endpoint.base_url);
  if (isOk(address)) {
    fTransport = std::make_unique<HttpTransport>(
        getValue(address),
        std::chrono::milliseconds(endpoint.request_timeout_ms), "analyzer");
  } else {
    fAddressError = getError(address);
  }
}

Status AnalyzerClient::RequireTransport() const
{
  if (!fTransport) {
    return Err<std::monostate>(fAddressError);
  }
  return Ok();
}

Status AnalyzerClient::Connect()
{
  auto ready = RequireTransport();
  if (!isOk(ready)) {
    return ready;
  }
  auto health = fTransport->GetJSON(
      "/health", std::chrono::milliseconds(fEndpoint.health_timeout_ms));
  if (!isOk(health)) {
    return Err<std::monostate>(getError(health).Wrap("analyzer health check"));
  }
  return Ok();
}

void AnalyzerClient::Disconnect()
{
  std::lock_guard<std::mutex> lock(fSweepMutex);
  fActiveSweep.clear();
}

Status AnalyzerClient::Configure(const SweepParameters &sweep)
{
  auto ready = RequireTransport();
  if (!isOk(ready)) {
    return ready;
  }
  if (sweep.stop_wavelength_nm <= sweep.start_wavelength_nm) {
    return Err<std::monostate>(ErrorCode::HardwareRejected,
                               "sweep stop wavelength must exceed start");
  }

  nlohmann::json body = {
      {"wavelength_range",
       {sweep.start_wavelength_nm, sweep.stop_wavelength_nm}},
      {"speed", sweep.sweep_speed_nm_per_s},
      {"power", sweep.laser_power_dbm},
      {"resolution_pm", sweep.resolution_pm}};

  auto response = fTransport->PostJSON("/configure", body);
  if (!isOk(response)) {
    return Err<std::monostate>(getError(response));
  }
  return Ok();
}

Status AnalyzerClient::Calibrate()
{
  auto ready = RequireTransport();
  if (!isOk(ready)) {
    return ready;
  }
  nlohmann::json body = {{"channels", nlohmann::json::array({"S21"})}};
  auto response = fTransport->PostJSON("/calibrate", body);
  if (!isOk(response)) {
    return Err<std::monostate>(getError(response));
  }
  return Ok();
}

Result<TaskId> AnalyzerClient::Submit(const std::string &operation,
                                      const nlohmann::json &params)
{
  auto ready = RequireTransport();
  if (!isOk(ready)) {
    return Err<TaskId>(getError(ready));
  }
  if (operation != "sweep") {
    return Err<TaskId>(ErrorCode::UnknownOperation,
                       "analyzer does not serve operation '" + operation + "'");
  }
  if (!params.is_null() && !params.is_object()) {
    return Err<TaskId>(ErrorCode::HardwareRejected,
                       "sweep parameters must be an object");
  }

  nlohmann::json body = {{"wait", false}};
  auto response = fTransport->PostJSON("/sweep/start", body);
  if (!isOk(response)) {
    return Err<TaskId>(getError(response));
  }

  const auto &json = getValue(response);
  if (!json.is_object()) {
    return Err<TaskId>(ErrorCode::InvalidResponse,
                       "POST /sweep/start answered a non-object: " + json.dump());
  }

  TaskId task_id;
  if (json.contains("task_id")) {
    auto extracted = ExtractTaskId(json, "POST /sweep/start");
    if (!isOk(extracted)) {
      return extracted;
    }
    task_id = getValue(extracted);
  } else {
    auto accepted = json.find("accepted");
    if (accepted == json.end() || !accepted->is_boolean() || !accepted->get<bool>()) {
      return Err<TaskId>(ErrorCode::InvalidResponse,
                         "sweep start was not accepted: " + json.dump());
    }
    task_id = kImplicitSweepId;
  }

  std::lock_guard<std::mutex> lock(fSweepMutex);
  fActiveSweep = task_id;
  return Ok(std::move(task_id));
}

Result<HardwareTask> AnalyzerClient::Poll(const TaskId &task_id)
{
  auto ready = RequireTransport();
  if (!isOk(ready)) {
    return Err<HardwareTask>(getError(ready));
  }
  auto body = fTransport->GetJSON("/sweep/status");
  if (!isOk(body)) {
    return Err<HardwareTask>(getError(body));
  }
  return ParseSweepStatus(getValue(body), task_id);
}

Status AnalyzerClient::Cancel(const TaskId &task_id)
{
  auto ready = RequireTransport();
  if (!isOk(ready)) {
    return ready;
  }
  {
    std::lock_guard<std::mutex> lock(fSweepMutex);
    if (task_id != fActiveSweep) {
      return Err<std::monostate>(ErrorCode::TaskAlreadyTerminal,
                                 "sweep '" + task_id + "' is not active");
    }
  }

  auto response = fTransport->PostJSON("/sweep/abort", nlohmann::json::object());
  if (!isOk(response)) {
    const auto &error = getError(response);
    if (error.code == ErrorCode::HardwareRejected) {
      return Err<std::monostate>(ErrorCode::TaskAlreadyTerminal, error.message,
                                 error.http_status.value_or(0));
    }
    return Err<std::monostate>(error);
  }
  return Ok();
}

Result<double> AnalyzerClient::ReadScalar(const std::string &path)
{
  auto ready = RequireTransport();
  if (!isOk(ready)) {
    return Err<double>(getError(ready));
  }
  auto body = fTransport->GetJSON(path);
  if (!isOk(body)) {
    return Err<double>(getError(body));
  }
  const auto &json = getValue(body);
  if (json.is_number()) {
    return Ok(json.get<double>());
  }
  if (json.is_object() && json.contains("power_dbm") &&
      json.at("power_dbm").is_number()) {
    return Ok(json.at("power_dbm").get<double>());
  }
  return Err<double>(ErrorCode::InvalidResponse,
                     "GET " + path + " returned no numeric value: " + json.dump());
}

Result<TraceSummary> AnalyzerClient::ReadTrace()
{
  auto ready = RequireTransport();
  if (!isOk(ready)) {
    return Err<TraceSummary>(getError(ready));
  }
  auto body = fTransport->GetJSON("/trace");
  if (!isOk(body)) {
    return Err<TraceSummary>(getError(body));
  }
  return ParseTrace(getValue(body));
}

Result<HardwareTask> AnalyzerClient::ParseSweepStatus(const nlohmann::json &body,
                                                      const TaskId &task_id)
{
  if (!body.is_object()) {
    return Err<HardwareTask>(ErrorCode::InvalidResponse,
                             "sweep status is not an object: " + body.dump());
  }

  HardwareTask task;
  task.task_id = task_id;
  task.result_payload = body;

  try {
    if (body.contains("error") && body.at("error").is_string() &&
        !body.at("error").get<std::string>().empty()) {
      task.status = TaskStatus::Failed;
      task.error = body.at("error").get<std::string>();
    } else if (body.value("is_complete", false)) {
      task.status = TaskStatus::Completed;
      task.progress_percent = 100.0;
    } else if (body.value("is_sweeping", false)) {
      task.status = TaskStatus::Running;
    } else if (body.value("aborted", false)) {
      task.status = TaskStatus::Cancelled;
    } else {
      task.status = TaskStatus::Pending;
    }

    if (task.status != TaskStatus::Completed && body.contains("progress_percent") &&
        body.at("progress_percent").is_number()) {
      task.progress_percent = body.at("progress_percent").get<double>();
    }
  } catch (const nlohmann::json::exception &e) {
    return Err<HardwareTask>(ErrorCode::InvalidResponse,
                             std::string("malformed sweep status: ") + e.what());
  }
  return Ok(std::move(task));
}

Result<TraceSummary> AnalyzerClient::ParseTrace(const nlohmann::json &body)
{
  std::vector<double> wavelengths;
  std::vector<double> values;
  try {
    wavelengths = body.at("wavelength_nm").get<std::vector<double>>();
    if (body.contains("power_dbm")) {
      values = body.at("power_dbm").get<std::vector<double>>();
    } else {
      values = body.at("s21_db").get<std::vector<double>>();
    }
  } catch (const nlohmann::json::exception &e) {
    return Err<TraceSummary>(ErrorCode::InvalidResponse,
                             std::string("malformed trace: ") + e.what());
  }

  if (wavelengths.empty() || wavelengths.size() != values.size()) {
    return Err<TraceSummary>(
        ErrorCode::InvalidResponse,
        "trace has " + std::to_string(wavelengths.size()) + " wavelengths and " +
            std::to_string(values.size()) + " values");
  }
  return Ok(SummarizeTrace(wavelengths, values));
}

}  // namespace PROBEFLOW::Hardware
