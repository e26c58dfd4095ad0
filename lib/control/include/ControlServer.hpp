/**
 * @file ControlServer.hpp
 * @brief ZeroMQ front end of the measurement manager
 */

#pragma once

#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <zmq.hpp>

#include "MeasurementManager.hpp"
#include "probeflow/core/Error.hpp"
#include "probeflow/core/Logger.hpp"

namespace PROBEFLOW::Control
{

enum class ControlCommand { Start, Pause, Resume, Cancel, Status, Ping };

std::string ControlCommandToString(ControlCommand command);
std::optional<ControlCommand> ControlCommandFromString(const std::string &text);

struct ControlServerConfig {
  std::string control_address = "tcp://*:5570";
  std::string event_address = "tcp://*:5571";
  int receive_timeout_ms = 200;  ///< Bounds how long Stop() waits for the loops
};

/**
 * @brief REP socket for JSON commands, PUB socket for progress events
 *
 * Requests:
 *   {"command": "start", "config": {...RunConfig...}} -> {"ok": true, "run_id": ...}
 *   {"command": "pause" | "resume" | "cancel"}        -> {"ok": true}
 *   {"command": "status"}                             -> {"ok": true, "state": ...}
 *   {"command": "ping"}                               -> {"ok": true}
 * Failures answer {"ok": false, "code": <int>, "code_name": ..., "error": ...}.
 *
 * Each published message is one ProgressEvent encoded as JSON.
 */
class ControlServer
{
 public:
  ControlServer(MeasurementManager &manager, ControlServerConfig config);
  ~ControlServer();

  ControlServer(const ControlServer &) = delete;
  ControlServer &operator=(const ControlServer &) = delete;

  /// Bind both sockets and start the listener and publisher threads
  Status Start();
  void Stop();
  bool IsRunning() const { return fRunning; }

  /// Decode and execute one request; never throws
  nlohmann::json HandleRequest(const std::string &request);

  /// Wire encoding; invalid UTF-8 is replaced instead of throwing
  static std::string Encode(const nlohmann::json &message);

 private:
  void CommandListenerLoop();
  void PublisherLoop();

  nlohmann::json HandleCommand(ControlCommand command,
                               const nlohmann::json &request);

  static nlohmann::json OkResponse();
  static nlohmann::json ErrorResponse(const Error &error);

  MeasurementManager &fManager;
  ControlServerConfig fConfig;
  std::shared_ptr<Logger> fLogger;

  zmq::context_t fContext{1};
  std::unique_ptr<zmq::socket_t> fCommandSocket;
  std::unique_ptr<zmq::socket_t> fEventSocket;
  std::shared_ptr<Subscription> fSubscription;

  std::atomic<bool> fRunning{false};
  std::thread fCommandThread;
  std::thread fPublisherThread;
};

}  // namespace PROBEFLOW::Control
