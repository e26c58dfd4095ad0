/**
 * @file AnalyzerClient.hpp
 * @brief HTTP client of the optical analyzer service
 */

#pragma once

#include <mutex>
#include <string>

#include "HttpTransport.hpp"
#include "IHardwareClient.hpp"

namespace PROBEFLOW::Hardware
{

/**
 * @brief Sweeps and traces on the optical analyzer
 *
 * The analyzer runs one sweep at a time. A sweep accepted without an id is
 * tracked under the id "sweep". Status is read from GET /sweep/status:
 * - "error" set        -> failed
 * - "is_complete" true -> completed
 * - "is_sweeping" true -> running
 * - "aborted" true     -> cancelled
 * - otherwise          -> pending
 */
class AnalyzerClient : public IAnalyzerClient
{
 public:
  explicit AnalyzerClient(const EndpointConfig &endpoint);

  std::string GetName() const override { return "analyzer"; }

  Status Connect() override;
  void Disconnect() override;

  Result<TaskId> Submit(const std::string &operation,
                        const nlohmann::json &params) override;
  Result<HardwareTask> Poll(const TaskId &task_id) override;
  Status Cancel(const TaskId &task_id) override;
  Result<double> ReadScalar(const std::string &path) override;

  Status Configure(const SweepParameters &sweep) override;
  Status Calibrate() override;
  Result<TraceSummary> ReadTrace() override;

  static Result<HardwareTask> ParseSweepStatus(const nlohmann::json &body,
                                               const TaskId &task_id);
  static Result<TraceSummary> ParseTrace(const nlohmann::json &body);

  static constexpr const char *kImplicitSweepId = "sweep";

 private:
  Status RequireTransport() const;

  EndpointConfig fEndpoint;
  std::unique_ptr<HttpTransport> fTransport;
  Error fAddressError{ErrorCode::Success, ""};

  std::mutex fSweepMutex;
  TaskId fActiveSweep;
};

}  // namespace PROBEFLOW::Hardware
