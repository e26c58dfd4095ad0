#include "HttpTransport.hpp"

#include <algorithm>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace PROBEFLOW::Hardware
{

Result<ServiceAddress> ParseServiceAddress(const std::string &base_url)
{
  const std::string scheme = "http://";
  if (base_url.rfind(scheme, 0) != 0) {
    return Err<ServiceAddress>(ErrorCode::InvalidConfiguration,
                               "unsupported URL (expected http://): " + base_url);
  }

  std::string rest = base_url.substr(scheme.size());
  ServiceAddress address;

  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    address.base_path = rest.substr(slash);
    while (!address.base_path.empty() && address.base_path.back() == '/') {
      address.base_path.pop_back();
    }
  }

  auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    address.host = authority.substr(0, colon);
    address.port = authority.substr(colon + 1);
  } else {
    address.host = authority;
  }

  if (address.host.empty() || address.port.empty()) {
    return Err<ServiceAddress>(ErrorCode::InvalidConfiguration,
                               "malformed URL: " + base_url);
  }
  return Ok(std::move(address));
}

HttpTransport::HttpTransport(const ServiceAddress &address,
                             std::chrono::milliseconds request_timeout,
                             const std::string &logger_name)
    : fAddress(address),
      fRequestTimeout(request_timeout),
      fLogger(Logger::GetLogger(logger_name))
{
}

Result<HttpResponse> HttpTransport::Get(
    const std::string &target, std::optional<std::chrono::milliseconds> timeout)
{
  return Perform(false, target, "", timeout.value_or(fRequestTimeout));
}

Result<HttpResponse> HttpTransport::Post(
    const std::string &target, const nlohmann::json &body,
    std::optional<std::chrono::milliseconds> timeout)
{
  return Perform(true, target, body.dump(), timeout.value_or(fRequestTimeout));
}

Result<nlohmann::json> HttpTransport::GetJSON(
    const std::string &target, std::optional<std::chrono::milliseconds> timeout)
{
  auto response = Get(target, timeout);
  if (!isOk(response)) {
    return Err<nlohmann::json>(getError(response));
  }
  std::string context = "GET " + target;
  auto status = CheckStatus(getValue(response), context);
  if (!isOk(status)) {
    return Err<nlohmann::json>(getError(status));
  }
  return DecodeBody(getValue(response), context);
}

Result<nlohmann::json> HttpTransport::PostJSON(
    const std::string &target, const nlohmann::json &body,
    std::optional<std::chrono::milliseconds> timeout)
{
  auto response = Post(target, body, timeout);
  if (!isOk(response)) {
    return Err<nlohmann::json>(getError(response));
  }
  std::string context = "POST " + target;
  auto status = CheckStatus(getValue(response), context);
  if (!isOk(status)) {
    return Err<nlohmann::json>(getError(status));
  }
  return DecodeBody(getValue(response), context);
}

Status HttpTransport::CheckStatus(const HttpResponse &response,
                                  const std::string &context)
{
  if (response.status >= 200 && response.status < 300) {
    return Ok();
  }

  std::string message = context + " returned HTTP " +
                        std::to_string(response.status);
  if (!response.body.empty()) {
    message += ": " + BodyExcerpt(response.body);
  }

  if (response.status >= 400 && response.status < 500) {
    return Err<std::monostate>(ErrorCode::HardwareRejected, message,
                               response.status);
  }
  if (response.status >= 500 && response.status < 600) {
    return Err<std::monostate>(ErrorCode::HardwareFault, message,
                               response.status);
  }
  return Err<std::monostate>(ErrorCode::InvalidResponse, message,
                             response.status);
}

std::string HttpTransport::BodyExcerpt(const std::string &body)
{
  constexpr size_t kMaxExcerpt = 256;

  std::string excerpt;
  excerpt.reserve(std::min(body.size(), kMaxExcerpt) + 3);
  for (size_t i = 0; i < body.size() && i < kMaxExcerpt; ++i) {
    auto c = static_cast<unsigned char>(body[i]);
    if (c == '\n' || c == '\r' || c == '\t') {
      excerpt += ' ';
    } else if (c < 0x20 || c >= 0x7f) {
      excerpt += '?';
    } else {
      excerpt += static_cast<char>(c);
    }
  }
  if (body.size() > kMaxExcerpt) {
    excerpt += "...";
  }
  return excerpt;
}

Result<nlohmann::json> HttpTransport::DecodeBody(const HttpResponse &response,
                                                 const std::string &context)
{
  if (response.body.empty()) {
    return Ok(nlohmann::json::object());
  }

  auto json = nlohmann::json::parse(response.body, nullptr, false);
  if (json.is_discarded()) {
    return Err<nlohmann::json>(ErrorCode::InvalidResponse,
                               context + " returned a non-JSON body: " +
                                   BodyExcerpt(response.body),
                               response.status);
  }
  return Ok(std::move(json));
}

Result<HttpResponse> HttpTransport::Perform(bool post,
                                            const std::string &target,
                                            const std::string &body,
                                            std::chrono::milliseconds timeout)
{
  const std::string full_target = fAddress.base_path + target;
  const char *method = post ? "POST" : "GET";

  http::request<http::string_body> request{
      post ? http::verb::post : http::verb::get, full_target, 11};
  request.set(http::field::host, fAddress.host);
  request.set(http::field::user_agent, "probeflow");
  request.set(http::field::accept, "application/json");
  request.keep_alive(false);
  if (post) {
    request.set(http::field::content_type, "application/json");
    request.body() = body;
  }
  request.prepare_payload();

  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  beast::flat_buffer buffer;
  http::response<http::string_body> response;

  beast::error_code failure;
  std::string failed_step;

  // Whole exchange shares one deadline
  stream.expires_after(timeout);

  resolver.async_resolve(
      fAddress.host, fAddress.port,
      [&](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
          failure = ec;
          failed_step = "resolve";
          return;
        }
        stream.async_connect(results, [&](beast::error_code ec,
                                          tcp::resolver::results_type::endpoint_type) {
          if (ec) {
            failure = ec;
            failed_step = "connect";
            return;
          }
          http::async_write(stream, request, [&](beast::error_code ec,
                                                 std::size_t) {
            if (ec) {
              failure = ec;
              failed_step = "write";
              return;
            }
            http::async_read(stream, buffer, response,
                             [&](beast::error_code ec, std::size_t) {
                               if (ec) {
                                 failure = ec;
                                 failed_step = "read";
                               }
                             });
          });
        });
      });

  ioc.run();

  beast::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

  const std::string peer = fAddress.host + ":" + fAddress.port;
  if (failure) {
    fLogger->Debug(std::string(method) + " " + full_target + " failed at " +
                   failed_step + ": " + failure.message());
    if (failure == beast::error::timeout) {
      return Err<HttpResponse>(
          ErrorCode::Timeout,
          std::string(method) + " " + target + " to " + peer + " timed out after " +
              std::to_string(timeout.count()) + " ms");
    }
    return Err<HttpResponse>(ErrorCode::CommunicationError,
                             std::string(method) + " " + target + " to " + peer +
                                 " failed (" + failed_step + "): " +
                                 failure.message());
  }

  HttpResponse result;
  result.status = static_cast<int>(response.result_int());
  result.body = std::move(response.body());

  fLogger->Debug(std::string(method) + " " + full_target + " -> " +
                 std::to_string(result.status));
  return Ok(std::move(result));
}

Result<TaskId> ExtractTaskId(const nlohmann::json &body, const std::string &context)
{
  if (!body.is_object() || !body.contains("task_id")) {
    return Err<TaskId>(ErrorCode::InvalidResponse,
                       context + " response has no task_id: " + body.dump());
  }
  const auto &id = body.at("task_id");
  if (id.is_string()) {
    return Ok(id.get<std::string>());
  }
  if (id.is_number_integer()) {
    return Ok(std::to_string(id.get<long long>()));
  }
  return Err<TaskId>(ErrorCode::InvalidResponse,
                     context + " task_id has unexpected type: " + id.dump());
}

}  // namespace PROBEFLOW::Hardware
