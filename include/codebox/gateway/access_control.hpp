#pragma once

#include "codebox/common/result.hpp"
#include "codebox/config/schema.hpp"
#include "codebox/gateway/http.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace codebox::gateway {

/// Checks `Authorization: Bearer <key>`. Missing header or another scheme is Unauthorized,
/// a wrong key is Forbidden. An empty api_key lets everything through.
[[nodiscard]] common::Status authenticate(const HttpRequest &request, const std::string &api_key);

/// First X-Forwarded-For entry, else the peer address, else "unknown".
[[nodiscard]] std::string client_id_for(const HttpRequest &request);

struct RateDecision {
  bool allowed = true;
  std::uint32_t remaining = 0;
};

/// Fixed window per client: the window restarts once more than `window` has passed since it
/// opened.
class RateLimiter {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  RateLimiter(std::uint32_t max_requests, std::chrono::seconds window,
              Clock clock = [] { return std::chrono::steady_clock::now(); });

  [[nodiscard]] RateDecision check(const std::string &client_id);
  [[nodiscard]] std::size_t tracked_clients() const;
  [[nodiscard]] std::uint32_t max_requests() const { return max_requests_; }

private:
  struct Window {
    std::uint32_t count = 0;
    std::chrono::steady_clock::time_point started;
  };

  void prune_locked(std::chrono::steady_clock::time_point now);

  std::uint32_t max_requests_;
  std::chrono::seconds window_;
  Clock clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Window> windows_;
};

/// Authentication, then rate limiting, then the wrapped handler.
class AccessControl {
public:
  AccessControl(std::string api_key, std::unique_ptr<RateLimiter> limiter);

  [[nodiscard]] HttpResponse handle(const HttpRequest &request,
                                    const std::function<HttpResponse(const HttpRequest &)> &next);

  [[nodiscard]] bool auth_enabled() const { return !api_key_.empty(); }
  [[nodiscard]] bool rate_limit_enabled() const { return limiter_ != nullptr; }

private:
  std::string api_key_;
  std::unique_ptr<RateLimiter> limiter_;
};

[[nodiscard]] std::unique_ptr<AccessControl>
make_access_control(const config::ServerConfig &server, const config::RateLimitConfig &limits);

} // namespace codebox::gateway
