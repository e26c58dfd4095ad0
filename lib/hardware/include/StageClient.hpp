/**
 * @file StageClient.hpp
 * @brief HTTP client of the probe-station (stage) service
 */

#pragma once

#include <map>
#include <mutex>
#include <string>

#include "HttpTransport.hpp"
#include "IHardwareClient.hpp"

namespace PROBEFLOW::Hardware
{

/**
 * @brief Motion and optical alignment on the probe station
 *
 * Operations:
 * - "move":      POST /move {axis, target, speed}, poll GET /move/status/{id},
 *                stop POST /move/stop/{id}
 * - "alignment": POST /alignment/execute {...}, poll
 *                GET /alignment/status/{id}, stop POST /alignment/stop/{id}
 *
 * Task ids are remembered with their operation so Poll and Cancel reach the
 * right endpoint. Power is read with ReadScalar("/power").
 */
class StageClient : public IHardwareClient
{
 public:
  explicit StageClient(const EndpointConfig &endpoint);

  std::string GetName() const override { return "stage"; }

  Status Connect() override;
  void Disconnect() override;

  Result<TaskId> Submit(const std::string &operation,
                        const nlohmann::json &params) override;
  Result<HardwareTask> Poll(const TaskId &task_id) override;
  Status Cancel(const TaskId &task_id) override;
  Result<double> ReadScalar(const std::string &path) override;

  /**
   * @brief Map a status body {status, progress_percent?, phase?, error?}
   * @return Err(InvalidResponse) when "status" is missing or unknown
   */
  static Result<HardwareTask> ParseTaskSnapshot(const nlohmann::json &body,
                                                const TaskId &task_id);

 private:
  Result<std::string> OperationOf(const TaskId &task_id) const;

  EndpointConfig fEndpoint;
  std::unique_ptr<HttpTransport> fTransport;
  Error fAddressError{ErrorCode::Success, ""};

  mutable std::mutex fTaskMutex;
  std::map<TaskId, std::string> fTaskOperations;
};

}  // namespace PROBEFLOW::Hardware
