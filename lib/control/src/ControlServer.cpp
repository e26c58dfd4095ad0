#include "ControlServer.hpp"

namespace PROBEFLOW::Control
{

std::string ControlCommandToString(ControlCommand command)
{
  switch (command) {
    case ControlCommand::Start:
      return "start";
    case ControlCommand::Pause:
      return "pause";
    case ControlCommand::Resume:
      return "resume";
    case ControlCommand::Cancel:
      return "cancel";
    case ControlCommand::Status:
      return "status";
    case ControlCommand::Ping:
      return "ping";
    default:
      return "unknown";
  }
}

std::optional<ControlCommand> ControlCommandFromString(const std::string &text)
{
  for (auto command : {ControlCommand::Start, ControlCommand::Pause,
                       ControlCommand::Resume, ControlCommand::Cancel,
                       ControlCommand::Status, ControlCommand::Ping}) {
    if (ControlCommandToString(command) == text) {
      return command;
    }
  }
  return std::nullopt;
}

ControlServer::ControlServer(MeasurementManager &manager,
                             ControlServerConfig config)
    : fManager(manager),
      fConfig(std::move(config)),
      fLogger(Logger::GetLogger("control"))
{
}

ControlServer::~ControlServer() { Stop(); }

Status ControlServer::Start()
{
  if (fRunning) {
    return Ok();
  }

  try {
    fCommandSocket = std::make_unique<zmq::socket_t>(fContext, ZMQ_REP);
    fCommandSocket->set(zmq::sockopt::linger, 0);
    fCommandSocket->set(zmq::sockopt::rcvtimeo, fConfig.receive_timeout_ms);
    fCommandSocket->bind(fConfig.control_address);

    fEventSocket = std::make_unique<zmq::socket_t>(fContext, ZMQ_PUB);
    fEventSocket->set(zmq::sockopt::linger, 0);
    fEventSocket->bind(fConfig.event_address);
  } catch (const zmq::error_t &e) {
    fCommandSocket.reset();
    fEventSocket.reset();
    return Err<std::monostate>(ErrorCode::CommunicationError,
                               "failed to bind control sockets (" +
                                   fConfig.control_address + ", " +
                                   fConfig.event_address + "): " + e.what());
  }

  fSubscription = fManager.Subscribe();
  fRunning = true;
  fCommandThread = std::thread([this] { CommandListenerLoop(); });
  fPublisherThread = std::thread([this] { PublisherLoop(); });

  fLogger->Info("Control server listening on " + fConfig.control_address +
                ", publishing on " + fConfig.event_address);
  return Ok();
}

void ControlServer::Stop()
{
  if (!fRunning.exchange(false)) {
    return;
  }

  if (fSubscription) {
    fSubscription->Close();
  }
  if (fCommandThread.joinable()) {
    fCommandThread.join();
  }
  if (fPublisherThread.joinable()) {
    fPublisherThread.join();
  }

  fCommandSocket.reset();
  fEventSocket.reset();
  fSubscription.reset();
  fLogger->Info("Control server stopped");
}

// === Command handling ===

void ControlServer::CommandListenerLoop()
{
  while (fRunning) {
    zmq::message_t request;
    try {
      auto received = fCommandSocket->recv(request, zmq::recv_flags::none);
      if (!received) {
        continue;  // Timeout
      }
    } catch (const zmq::error_t &e) {
      fLogger->Error(std::string("Command receive failed: ") + e.what());
      continue;
    }

    auto response = Encode(HandleRequest(request.to_string()));
    try {
      fCommandSocket->send(zmq::buffer(response), zmq::send_flags::none);
    } catch (const zmq::error_t &e) {
      fLogger->Error(std::string("Command reply failed: ") + e.what());
    }
  }
}

nlohmann::json ControlServer::HandleRequest(const std::string &request)
{
  auto json = nlohmann::json::parse(request, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    return ErrorResponse(
        Error(ErrorCode::InvalidConfiguration, "request is not a JSON object"));
  }

  auto it = json.find("command");
  if (it == json.end() || !it->is_string()) {
    return ErrorResponse(
        Error(ErrorCode::InvalidConfiguration, "request has no command"));
  }

  auto command = ControlCommandFromString(it->get<std::string>());
  if (!command) {
    return ErrorResponse(Error(ErrorCode::UnknownOperation,
                               "unknown command '" + it->get<std::string>() + "'"));
  }

  fLogger->Debug("Received " + ControlCommandToString(*command));
  return HandleCommand(*command, json);
}

nlohmann::json ControlServer::HandleCommand(ControlCommand command,
                                            const nlohmann::json &request)
{
  switch (command) {
    case ControlCommand::Start: {
      if (!request.contains("config")) {
        return ErrorResponse(
            Error(ErrorCode::InvalidConfiguration, "start requires a config"));
      }
      auto config = RunConfigFromJSON(request.at("config"));
      if (!isOk(config)) {
        return ErrorResponse(getError(config));
      }
      auto handle = fManager.Start(getValue(config));
      if (!isOk(handle)) {
        return ErrorResponse(getError(handle));
      }
      auto response = OkResponse();
      response["run_id"] = getValue(handle).run_id;
      return response;
    }

    case ControlCommand::Pause: {
      auto status = fManager.Pause();
      return isOk(status) ? OkResponse() : ErrorResponse(getError(status));
    }

    case ControlCommand::Resume: {
      auto status = fManager.Resume();
      return isOk(status) ? OkResponse() : ErrorResponse(getError(status));
    }

    case ControlCommand::Cancel: {
      auto status = fManager.Cancel();
      return isOk(status) ? OkResponse() : ErrorResponse(getError(status));
    }

    case ControlCommand::Status: {
      auto response = RunStatusSnapshotToJSON(fManager.GetStatus());
      response["ok"] = true;
      return response;
    }

    case ControlCommand::Ping:
      return OkResponse();

    default:
      return ErrorResponse(Error(ErrorCode::UnknownOperation, "unknown command"));
  }
}

std::string ControlServer::Encode(const nlohmann::json &message)
{
  // Instrument text may carry invalid UTF-8
  return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json ControlServer::OkResponse() { return {{"ok", true}}; }

nlohmann::json ControlServer::ErrorResponse(const Error &error)
{
  nlohmann::json response = {{"ok", false},
                             {"code", static_cast<int>(error.code)},
                             {"code_name", ErrorCodeToString(error.code)},
                             {"error", error.message}};
  if (error.http_status) {
    response["http_status"] = *error.http_status;
  }
  return response;
}

// === Event publishing ===

void ControlServer::PublisherLoop()
{
  const auto wait = std::chrono::milliseconds(fConfig.receive_timeout_ms);
  while (fRunning) {
    auto event = fSubscription->Next(wait);
    if (!event) {
      if (fSubscription->IsClosed()) {
        break;  // Manager shut down
      }
      continue;
    }

    auto payload = Encode(ProgressEventToJSON(*event));
    try {
      fEventSocket->send(zmq::buffer(payload), zmq::send_flags::none);
    } catch (const zmq::error_t &e) {
      fLogger->Error(std::string("Event publish failed: ") + e.what());
    }
  }

  auto dropped = fSubscription->Dropped();
  if (dropped > 0) {
    fLogger->Warning("Publisher dropped " + std::to_string(dropped) + " events");
  }
}

}  // namespace PROBEFLOW::Control
