/**
 * @file HttpTransport.hpp
 * @brief Blocking HTTP/1.1 + JSON exchange with an instrument service
 */

#pragma once

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "probeflow/core/Error.hpp"
#include "probeflow/core/HardwareTask.hpp"
#include "probeflow/core/Logger.hpp"

namespace PROBEFLOW::Hardware
{

struct HttpResponse {
  int status = 0;
  std::string body;
};

/**
 * @brief Parsed "http://host[:port][/base]" address
 */
struct ServiceAddress {
  std::string host;
  std::string port = "80";
  std::string base_path;  ///< Prefix for every target, no trailing '/'
};

Result<ServiceAddress> ParseServiceAddress(const std::string &base_url);

/**
 * @brief One connection per request, each bounded by a deadline
 *
 * Error mapping:
 * - resolve/connect/read/write failure -> CommunicationError
 * - deadline expiry                    -> Timeout
 * - 4xx                                -> HardwareRejected (with status)
 * - 5xx                                -> HardwareFault (with status)
 * - non-JSON body                      -> InvalidResponse
 */
class HttpTransport
{
 public:
  HttpTransport(const ServiceAddress &address,
                std::chrono::milliseconds request_timeout,
                const std::string &logger_name);

  /// Raw exchange; any HTTP status is Ok
  Result<HttpResponse> Get(const std::string &target,
                           std::optional<std::chrono::milliseconds> timeout =
                               std::nullopt);
  Result<HttpResponse> Post(const std::string &target,
                            const nlohmann::json &body,
                            std::optional<std::chrono::milliseconds> timeout =
                                std::nullopt);

  /// Exchange plus status check and JSON decoding of the body
  Result<nlohmann::json> GetJSON(
      const std::string &target,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt);
  Result<nlohmann::json> PostJSON(
      const std::string &target, const nlohmann::json &body,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  const ServiceAddress &GetAddress() const { return fAddress; }

  /// Map a non-2xx response to its Error; Ok for 2xx
  static Status CheckStatus(const HttpResponse &response,
                            const std::string &context);

  /// Printable ASCII excerpt of a response body, safe to embed in messages
  static std::string BodyExcerpt(const std::string &body);

  /// Empty body decodes to an empty object
  static Result<nlohmann::json> DecodeBody(const HttpResponse &response,
                                           const std::string &context);

 private:
  Result<HttpResponse> Perform(bool post, const std::string &target,
                               const std::string &body,
                               std::chrono::milliseconds timeout);

  ServiceAddress fAddress;
  std::chrono::milliseconds fRequestTimeout;
  std::shared_ptr<Logger> fLogger;
};

/**
 * @brief Task id from a submit response
 *
 * Accepts {"task_id": "<string>"} and {"task_id": <integer>}.
 */
Result<TaskId> ExtractTaskId(const nlohmann::json &body, const std::string &context);

}  // namespace PROBEFLOW::Hardware
