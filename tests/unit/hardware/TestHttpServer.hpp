/**
 * @file TestHttpServer.hpp
 * @brief In-process HTTP/1.1 server standing in for an instrument service
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace PROBEFLOW {
namespace test {

/**
 * @brief Serves one request per connection on an ephemeral port
 *
 * Every request is recorded and answered by the handler.
 */
class TestHttpServer {
 public:
  struct Request {
    std::string method;
    std::string target;
    std::string body;
  };

  struct Reply {
    int status = 200;
    std::string body = "{}";
    std::chrono::milliseconds delay{0};
  };

  using Handler = std::function<Reply(const Request&)>;

  explicit TestHttpServer(Handler handler)
      : handler_(std::move(handler)),
        acceptor_(ioc_, boost::asio::ip::tcp::endpoint(
                            boost::asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this] { Serve(); });
  }

  ~TestHttpServer() { Stop(); }

  TestHttpServer(const TestHttpServer&) = delete;
  TestHttpServer& operator=(const TestHttpServer&) = delete;

  /// Stop serving and release the port
  void Stop() {
    if (stopping_.exchange(true)) {
      return;
    }
    // Unblock accept() with a throwaway connection
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::socket wake(ioc);
    boost::beast::error_code ec;
    wake.connect({boost::asio::ip::make_address("127.0.0.1"), port_}, ec);
    if (thread_.joinable()) {
      thread_.join();
    }
    acceptor_.close(ec);
  }

  std::string BaseUrl() const { return "http://127.0.0.1:" + std::to_string(port_); }

  std::vector<Request> Requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  void Serve() {
    namespace http = boost::beast::http;

    while (!stopping_) {
      boost::asio::ip::tcp::socket socket(ioc_);
      boost::beast::error_code ec;
      acceptor_.accept(socket, ec);
      if (ec || stopping_) {
        break;
      }

      boost::beast::flat_buffer buffer;
      http::request<http::string_body> req;
      http::read(socket, buffer, req, ec);
      if (ec) {
        continue;
      }

      Request request{std::string(req.method_string().data(), req.method_string().size()),
                      std::string(req.target().data(), req.target().size()), req.body()};
      {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
      }

      Reply reply = handler_(request);
      if (reply.delay.count() > 0) {
        std::this_thread::sleep_for(reply.delay);
      }

      http::response<http::string_body> res{static_cast<http::status>(reply.status),
                                            req.version()};
      res.set(http::field::content_type, "application/json");
      res.keep_alive(false);
      res.body() = reply.body;
      res.prepare_payload();
      http::write(socket, res, ec);
      socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }
  }

  Handler handler_;
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  unsigned short port_ = 0;
  std::thread thread_;
  std::atomic<bool> stopping_{false};

  mutable std::mutex mutex_;
  std::vector<Request> requests_;
};

}  // namespace test
}  // namespace PROBEFLOW
