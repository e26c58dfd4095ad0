#include "StageClient.hpp"

namespace PROBEFLOW::Hardware
{

namespace
{

// Endpoint prefix per operation
std::string PathOf(const std::string &operation)
{
  return operation == "move" ? "/move" : "/alignment";
}

}  // namespace

StageClient::StageClient(const EndpointConfig &endpoint) : fEndpoint(endpoint)
{
  auto address = ParseServiceAddress(endpoint.base_url);
  if (isOk(address)) {
    fTransport = std::make_unique<HttpTransport>(
        getValue(address),
        std::chrono::milliseconds(endpoint.request_timeout_ms), "stage");
  } else {
    fAddressError = getError(address);
  }
}

Status StageClient::Connect()
{
  if (!fTransport) {
    return Err<std::monostate>(fAddressError);
  }
  auto health = fTransport->GetJSON(
      "/health", std::chrono::milliseconds(fEndpoint.health_timeout_ms));
  if (!isOk(health)) {
    return Err<std::monostate>(getError(health).Wrap("stage health check"));
  }
  return Ok();
}

void StageClient::Disconnect()
{
  std::lock_guard<std::mutex> lock(fTaskMutex);
  fTaskOperations.clear();
}

Result<TaskId> StageClient::Submit(const std::string &operation,
                                   const nlohmann::json &params)
{
  if (!fTransport) {
    return Err<TaskId>(fAddressError);
  }

  nlohmann::json body;
  std::string target;
  if (operation == "move") {
    if (!params.is_object() || !params.contains("axis") ||
        !params.at("axis").is_number_integer() || !params.contains("target") ||
        !params.at("target").is_number()) {
      return Err<TaskId>(ErrorCode::HardwareRejected,
                         "move requires integer 'axis' and numeric 'target'");
    }
    if (params.contains("speed") && !params.at("speed").is_number()) {
      return Err<TaskId>(ErrorCode::HardwareRejected,
                         "move 'speed' must be numeric");
    }
    body = params;
    target = "/move";
  } else if (operation == "alignment") {
    if (!params.is_object()) {
      return Err<TaskId>(ErrorCode::HardwareRejected,
                         "alignment parameters must be an object");
    }
    body = params;
    target = "/alignment/execute";
  } else {
    return Err<TaskId>(ErrorCode::UnknownOperation,
                       "stage does not serve operation '" + operation + "'");
  }

  auto response = fTransport->PostJSON(target, body);
  if (!isOk(response)) {
    return Err<TaskId>(getError(response));
  }

  auto task_id = ExtractTaskId(getValue(response), "POST " + target);
  if (!isOk(task_id)) {
    return task_id;
  }

  std::lock_guard<std::mutex> lock(fTaskMutex);
  fTaskOperations[getValue(task_id)] = operation;
  return task_id;
}

Result<std::string> StageClient::OperationOf(const TaskId &task_id) const
{
  std::lock_guard<std::mutex> lock(fTaskMutex);
  auto it = fTaskOperations.find(task_id);
  if (it == fTaskOperations.end()) {
    return Err<std::string>(ErrorCode::InvalidResponse,
                            "stage task '" + task_id + "' was not submitted here");
  }
  return Ok(it->second);
}

Result<HardwareTask> StageClient::Poll(const TaskId &task_id)
{
  auto operation = OperationOf(task_id);
  if (!isOk(operation)) {
    return Err<HardwareTask>(getError(operation));
  }

  auto body =
      fTransport->GetJSON(PathOf(getValue(operation)) + "/status/" + task_id);
  if (!isOk(body)) {
    return Err<HardwareTask>(getError(body));
  }
  return ParseTaskSnapshot(getValue(body), task_id);
}

Status StageClient::Cancel(const TaskId &task_id)
{
  auto operation = OperationOf(task_id);
  if (!isOk(operation)) {
    return Err<std::monostate>(getError(operation));
  }

  auto response = fTransport->PostJSON(
      PathOf(getValue(operation)) + "/stop/" + task_id, nlohmann::json::object());
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

Result<double> StageClient::ReadScalar(const std::string &path)
{
  if (!fTransport) {
    return Err<double>(fAddressError);
  }

  auto body = fTransport->GetJSON(path);
  if (!isOk(body)) {
    return Err<double>(getError(body));
  }

  const auto &json = getValue(body);
  if (json.is_number()) {
    return Ok(json.get<double>());
  }
  for (const char *key : {"power_dbm", "value"}) {
    if (json.is_object() && json.contains(key) && json.at(key).is_number()) {
      return Ok(json.at(key).get<double>());
    }
  }
  return Err<double>(ErrorCode::InvalidResponse,
                     "GET " + path + " returned no numeric value: " + json.dump());
}

Result<HardwareTask> StageClient::ParseTaskSnapshot(const nlohmann::json &body,
                                                    const TaskId &task_id)
{
  if (!body.is_object() || !body.contains("status") ||
      !body.at("status").is_string()) {
    return Err<HardwareTask>(ErrorCode::InvalidResponse,
                             "task status body has no status: " + body.dump());
  }

  auto status = TaskStatusFromString(body.at("status").get<std::string>());
  if (!status) {
    return Err<HardwareTask>(ErrorCode::InvalidResponse,
                             "unknown task status '" +
                                 body.at("status").get<std::string>() + "'");
  }

  HardwareTask task;
  task.task_id = task_id;
  task.status = *status;
  if (body.contains("progress_percent") && body.at("progress_percent").is_number()) {
    task.progress_percent = body.at("progress_percent").get<double>();
  } else if (task.status == TaskStatus::Completed) {
    task.progress_percent = 100.0;
  }
  if (body.contains("error") && body.at("error").is_string()) {
    task.error = body.at("error").get<std::string>();
  }
  task.result_payload = body;
  return Ok(std::move(task));
}

}  // namespace PROBEFLOW::Hardware
