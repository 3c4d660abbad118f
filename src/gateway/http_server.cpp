#include "codebox/gateway/http_server.hpp"

#include "codebox/observability/global.hpp"

#include <array>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace codebox::gateway {

namespace {

constexpr int kListenBacklog = 64;
constexpr std::size_t kMaxHeaderBytes = 16 * 1024;

void send_all(const int fd, const std::string &text) {
  std::size_t sent = 0;
  while (sent < text.size()) {
    const ssize_t n = send(fd, text.data() + sent, text.size() - sent, MSG_NOSIGNAL);
    if (n <= 0) {
      if (n < 0 && errno == EINTR) {
        continue;
      }
      return;
    }
    sent += static_cast<std::size_t>(n);
  }
}

void set_receive_timeout(const int fd, const std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  (void)setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

} // namespace

HttpServer::HttpServer(HttpHandler handler) : handler_(std::move(handler)) {}

HttpServer::~HttpServer() { stop(); }

common::Status HttpServer::start(const HttpServerOptions &options) {
  if (running_) {
    return common::Status::error("server already running");
  }
  options_ = options;

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create listen socket");
  }

  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  const std::string host = options.host == "localhost" ? "127.0.0.1" : options.host;
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("invalid bind host: " + options.host,
                                 common::ErrorCode::InvalidArgument);
  }
  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("bind failed: " + msg);
  }
  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("listen failed: " + msg);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options.port;
  }

  running_ = true;
  accept_thread_ = std::thread([this, fd = listen_fd_]() { accept_loop(fd); });
  return common::Status::success();
}

void HttpServer::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  // Wake accept() first; the descriptor is closed only after the accept thread is gone.
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  if (listen_fd_ >= 0) {
    close(listen_fd_);
    listen_fd_ = -1;
  }

  std::unique_lock<std::mutex> lock(connections_mutex_);
  connections_cv_.wait(lock, [this] { return active_connections_ == 0; });
}

void HttpServer::accept_loop(const int listen_fd) {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client = accept(listen_fd, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client < 0) {
      if (!running_) {
        break;
      }
      continue;
    }

    std::array<char, INET_ADDRSTRLEN> peer{};
    std::string peer_address;
    if (inet_ntop(AF_INET, &client_addr.sin_addr, peer.data(), peer.size()) != nullptr) {
      peer_address = peer.data();
    }

    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      ++active_connections_;
    }
    std::thread([this, client, peer_address]() mutable {
      handle_client(client, std::move(peer_address));
      close(client);
      std::lock_guard<std::mutex> lock(connections_mutex_);
      --active_connections_;
      connections_cv_.notify_all();
    }).detach();
  }
}

void HttpServer::handle_client(const int client_fd, std::string peer_address) {
  set_receive_timeout(client_fd, options_.read_timeout);

  std::string raw;
  raw.reserve(4096);
  std::array<char, 4096> buf{};

  std::size_t content_length = 0;
  std::size_t header_end = std::string::npos;
  bool complete = false;
  while (true) {
    const ssize_t n = recv(client_fd, buf.data(), buf.size(), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));

    if (header_end == std::string::npos) {
      header_end = raw.find("\r\n\r\n");
      if (header_end == std::string::npos) {
        if (raw.size() > kMaxHeaderBytes) {
          send_all(client_fd, render_http_response(make_error_response(
                                  400, "invalid_request", "request headers too large")));
          return;
        }
        continue;
      }

      auto head = parse_http_request(raw.substr(0, header_end + 4));
      if (!head.ok()) {
        send_all(client_fd, render_http_response(
                                make_error_response(400, "invalid_request", head.error())));
        return;
      }
      auto length = content_length_of(head.value());
      if (!length.ok()) {
        send_all(client_fd, render_http_response(
                                make_error_response(400, "invalid_request", length.error())));
        return;
      }
      content_length = length.value();
      if (content_length > options_.max_body_bytes) {
        send_all(client_fd, render_http_response(make_error_response(
                                413, "payload_too_large",
                                "request body exceeds " + std::to_string(options_.max_body_bytes) +
                                    " bytes")));
        return;
      }
    }

    if (raw.size() >= header_end + 4 + content_length) {
      complete = true;
      break;
    }
  }

  if (!complete) {
    if (!raw.empty()) {
      send_all(client_fd, render_http_response(make_error_response(
                              400, "invalid_request", "incomplete request")));
    }
    return;
  }

  raw.resize(header_end + 4 + content_length);
  auto parsed = parse_http_request(raw);
  if (!parsed.ok()) {
    send_all(client_fd,
             render_http_response(make_error_response(400, "invalid_request", parsed.error())));
    return;
  }
  parsed.value().peer_address = std::move(peer_address);

  HttpResponse response;
  try {
    response = handler_(parsed.value());
  } catch (const std::exception &err) {
    observability::record_error("http", std::string("handler threw: ") + err.what());
    response = make_error_response(500, "internal", "internal server error");
  }
  send_all(client_fd, render_http_response(response));
}

} // namespace codebox::gateway
