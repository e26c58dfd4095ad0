/**
 * @file IHardwareClient.hpp
 * @brief Abstract clients for the instrument services driven by a run
 */

#pragma once

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "probeflow/core/Error.hpp"
#include "probeflow/core/HardwareTask.hpp"
#include "probeflow/core/ProgressEvent.hpp"
#include "probeflow/core/RunConfig.hpp"

namespace PROBEFLOW::Hardware
{

/**
 * @brief Client of one instrument service
 *
 * Long-running operations are submitted as tasks and observed by polling
 * (see TaskPoller). No method throws; transport failures come back as Err.
 *
 * Implementations must tolerate Poll and Cancel being called from the run's
 * worker thread only; they are not required to be thread-safe otherwise.
 */
class IHardwareClient
{
 public:
  virtual ~IHardwareClient() = default;

  /// Short name used in logs ("stage", "analyzer")
  virtual std::string GetName() const = 0;

  /// Probe the service health endpoint
  virtual Status Connect() = 0;

  virtual void Disconnect() = 0;

  /**
   * @brief Start a long-running operation
   * @return Task id, Err(UnknownOperation) for an operation the service does
   *         not serve, Err(HardwareRejected) for malformed params
   */
  virtual Result<TaskId> Submit(const std::string &operation,
                                const nlohmann::json &params) = 0;

  /// Read the current snapshot of a task; never changes instrument state
  virtual Result<HardwareTask> Poll(const TaskId &task_id) = 0;

  /// Best-effort abort; Err(TaskAlreadyTerminal) if it already finished
  virtual Status Cancel(const TaskId &task_id) = 0;

  /// Synchronous instantaneous reading, e.g. "/power"
  virtual Result<double> ReadScalar(const std::string &path) = 0;
};

/**
 * @brief Optical analyzer: a client with sweep configuration and traces
 */
class IAnalyzerClient : public IHardwareClient
{
 public:
  virtual Status Configure(const SweepParameters &sweep) = 0;
  virtual Status Calibrate() = 0;

  /// Fetch the last trace and reduce it to a TraceSummary
  virtual Result<TraceSummary> ReadTrace() = 0;
};

/**
 * @brief The pair of clients used by one run
 */
struct HardwareClients {
  std::shared_ptr<IHardwareClient> stage;
  std::shared_ptr<IAnalyzerClient> analyzer;
};

/// Builds the clients for a run from its configuration
using ClientFactory =
    std::function<Result<HardwareClients>(const RunConfig &config)>;

/**
 * @brief Default factory: HTTP clients for the configured endpoints
 */
Result<HardwareClients> MakeHttpClients(const RunConfig &config);

}  // namespace PROBEFLOW::Hardware
