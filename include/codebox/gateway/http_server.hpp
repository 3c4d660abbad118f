#pragma once

#include "codebox/common/result.hpp"
#include "codebox/gateway/http.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace codebox::gateway {

using HttpHandler = std::function<HttpResponse(const HttpRequest &)>;

struct HttpServerOptions {
  std::string host = "127.0.0.1";
  // 0 picks an ephemeral port; see HttpServer::port().
  std::uint16_t port = 0;
  std::chrono::milliseconds read_timeout{30'000};
  std::size_t max_body_bytes = 1024 * 1024;
};

/// Blocking HTTP/1.1 listener, one thread per connection, one request per connection.
class HttpServer {
public:
  explicit HttpServer(HttpHandler handler);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  [[nodiscard]] common::Status start(const HttpServerOptions &options);
  /// Closes the listener and waits for in-flight connections to finish.
  void stop();

  [[nodiscard]] std::uint16_t port() const { return bound_port_; }
  [[nodiscard]] bool is_running() const { return running_.load(); }

private:
  void accept_loop(int listen_fd);
  void handle_client(int client_fd, std::string peer_address);

  HttpHandler handler_;
  HttpServerOptions options_;

  std::atomic<bool> running_{false};
  // Owned by start() and stop(); the accept thread gets its own copy.
  int listen_fd_ = -1;
  std::uint16_t bound_port_ = 0;
  std::thread accept_thread_;

  std::mutex connections_mutex_;
  std::condition_variable connections_cv_;
  std::size_t active_connections_ = 0;
};

} // namespace codebox::gateway
