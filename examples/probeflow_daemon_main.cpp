/**
 * @file probeflow_daemon_main.cpp
 * @brief Measurement orchestration daemon
 *
 * Hosts one MeasurementManager behind a ZeroMQ control socket and streams
 * progress events on a PUB socket.
 *
 * Usage:
 *   probeflow_daemon [options]
 *
 * Options:
 *   -c, --config <file>      Service configuration JSON
 *   --control <address>      Command REP address (default: tcp://*:5570)
 *   --events <address>       Event PUB address (default: tcp://*:5571)
 *   --log-dir <dir>          Write <dir>/<component>.log instead of stderr
 *   --log-level <level>      debug, info, warning or error (default: info)
 *   -r, --run <file>         Start a run from a RunConfig JSON at launch
 *   -h, --help               Show this help message
 *
 * Example:
 *   probeflow_daemon -c daemon.json --log-level debug
 *   probeflow_daemon --run wafer_17.json
 */

#include <ControlServer.hpp>
#include <MeasurementManager.hpp>
#include <ServiceConfig.hpp>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using namespace PROBEFLOW;

static volatile std::sig_atomic_t g_running = 1;

void signalHandler(int signum) {
  (void)signum;
  g_running = 0;
}

void printUsage(const char* program) {
  std::cout << "probeflow - Photonic measurement orchestration daemon\n\n";
  std::cout << "Usage: " << program << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>      Service configuration JSON\n";
  std::cout << "  --control <address>      Command REP address (default: tcp://*:5570)\n";
  std::cout << "  --events <address>       Event PUB address (default: tcp://*:5571)\n";
  std::cout << "  --log-dir <dir>          Log directory (default: stderr)\n";
  std::cout << "  --log-level <level>      debug, info, warning, error (default: info)\n";
  std::cout << "  -r, --run <file>         Start a run from a RunConfig JSON at launch\n";
  std::cout << "  -h, --help               Show this help message\n\n";
  std::cout << "Example:\n";
  std::cout << "  " << program << " -c daemon.json --log-level debug\n";
}

int main(int argc, char* argv[]) {
  std::string config_file;
  std::string run_file;
  std::optional<std::string> control_address;
  std::optional<std::string> event_address;
  std::optional<std::string> log_dir;
  std::optional<std::string> log_level;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        config_file = argv[++i];
      }
    } else if (arg == "--control") {
      if (i + 1 < argc) {
        control_address = argv[++i];
      }
    } else if (arg == "--events") {
      if (i + 1 < argc) {
        event_address = argv[++i];
      }
    } else if (arg == "--log-dir") {
      if (i + 1 < argc) {
        log_dir = argv[++i];
      }
    } else if (arg == "--log-level") {
      if (i + 1 < argc) {
        log_level = argv[++i];
      }
    } else if (arg == "-r" || arg == "--run") {
      if (i + 1 < argc) {
        run_file = argv[++i];
      }
    } else {
      std::cerr << "Unknown option: " << arg << "\n\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  // File settings first, command line overrides
  Control::ServiceConfig service;
  if (!config_file.empty()) {
    auto loaded = Control::ServiceConfigFromFile(config_file);
    if (!isOk(loaded)) {
      std::cerr << "ERROR: " << getError(loaded).message << std::endl;
      return 1;
    }
    service = getValue(loaded);
  }
  if (control_address) service.control_address = *control_address;
  if (event_address) service.event_address = *event_address;
  if (log_dir) service.log_directory = *log_dir;
  if (log_level) {
    auto level = LogLevelFromString(*log_level);
    if (!level) {
      std::cerr << "ERROR: unknown log level '" << *log_level << "'" << std::endl;
      return 1;
    }
    service.log_level = *level;
  }

  if (!Logger::Initialize(service.log_directory, service.log_level)) {
    return 1;
  }
  auto logger = Logger::GetLogger("daemon");

  std::cout << "=== probeflow daemon ===" << std::endl;
  std::cout << "Control address: " << service.control_address << std::endl;
  std::cout << "Event address:   " << service.event_address << std::endl;
  std::cout << "Log directory:   "
            << (service.log_directory.empty() ? "(stderr)" : service.log_directory)
            << std::endl;
  std::cout << "Log level:       " << LogLevelToString(service.log_level) << std::endl;
  std::cout << std::endl;

  // Setup signal handlers
  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

  MeasurementManager manager(Control::ToManagerOptions(service),
                             Hardware::MakeHttpClients);

  Control::ControlServerConfig server_config;
  server_config.control_address = service.control_address;
  server_config.event_address = service.event_address;

  Control::ControlServer server(manager, server_config);
  auto started = server.Start();
  if (!isOk(started)) {
    logger->Error(getError(started).message);
    return 1;
  }

  if (!run_file.empty()) {
    auto run_config = RunConfigFromFile(run_file);
    if (!isOk(run_config)) {
      logger->Error("Cannot load run: " + getError(run_config).message);
    } else {
      auto handle = manager.Start(getValue(run_config));
      if (isOk(handle)) {
        std::cout << "Started " << getValue(handle).run_id << std::endl;
      } else {
        logger->Error("Cannot start run: " + getError(handle).message);
      }
    }
  }

  std::cout << "Daemon running. Press Ctrl+C to stop." << std::endl;

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  // Cleanup
  std::cout << "Shutting down..." << std::endl;
  if (manager.HasActiveRun()) {
    auto cancelled = manager.Cancel();
    if (!isOk(cancelled)) {
      logger->Warning("Cancel on shutdown: " + getError(cancelled).message);
    }
    if (!manager.WaitForTerminal(std::chrono::seconds(30))) {
      logger->Warning("Run did not finish within 30 s of cancel");
    }
  }
  server.Stop();
  manager.Shutdown();

  auto status = manager.GetStatus();
  if (!status.run_id.empty()) {
    std::cout << "Last run " << status.run_id << ": "
              << RunStateToString(status.state) << " ("
              << status.successful_devices << " measured, "
              << status.failed_devices << " failed)" << std::endl;
  }
  return 0;
}
