#include "codebox/gateway/access_control.hpp"

#include "codebox/common/fs.hpp"
#include "codebox/observability/global.hpp"
#include "codebox/security/credentials.hpp"

#include <algorithm>

namespace codebox::gateway {

namespace {

constexpr std::size_t kPruneThreshold = 4096;
constexpr const char *kRemainingHeader = "X-RateLimit-Remaining";

} // namespace

common::Status authenticate(const HttpRequest &request, const std::string &api_key) {
  if (api_key.empty()) {
    return common::Status::success();
  }
  const std::string header = header_lookup(request, "authorization");
  const auto token = security::parse_bearer_token(header);
  if (!token.has_value()) {
    return common::Status::error("missing or invalid Authorization header",
                                 common::ErrorCode::Unauthorized);
  }
  if (!security::constant_time_equals(*token, api_key)) {
    return common::Status::error("invalid API key", common::ErrorCode::Forbidden);
  }
  return common::Status::success();
}

std::string client_id_for(const HttpRequest &request) {
  const std::string forwarded = header_lookup(request, "x-forwarded-for");
  if (!forwarded.empty()) {
    const std::string first = common::trim(forwarded.substr(0, forwarded.find(',')));
    if (!first.empty()) {
      return first;
    }
  }
  if (!request.peer_address.empty()) {
    return request.peer_address;
  }
  return "unknown";
}

RateLimiter::RateLimiter(const std::uint32_t max_requests, const std::chrono::seconds window,
                         Clock clock)
    : max_requests_(max_requests), window_(window), clock_(std::move(clock)) {}

RateDecision RateLimiter::check(const std::string &client_id) {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  if (windows_.size() > kPruneThreshold) {
    prune_locked(now);
  }

  auto [it, inserted] = windows_.try_emplace(client_id, Window{.count = 0, .started = now});
  Window &window = it->second;
  if (!inserted && now - window.started > window_) {
    window = Window{.count = 0, .started = now};
  }
  ++window.count;

  if (window.count > max_requests_) {
    return RateDecision{.allowed = false, .remaining = 0};
  }
  return RateDecision{.allowed = true, .remaining = max_requests_ - window.count};
}

std::size_t RateLimiter::tracked_clients() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return windows_.size();
}

void RateLimiter::prune_locked(const std::chrono::steady_clock::time_point now) {
  std::erase_if(windows_, [&](const auto &item) { return now - item.second.started > window_; });
}

AccessControl::AccessControl(std::string api_key, std::unique_ptr<RateLimiter> limiter)
    : api_key_(std::move(api_key)), limiter_(std::move(limiter)) {}

HttpResponse AccessControl::handle(const HttpRequest &request,
                                   const std::function<HttpResponse(const HttpRequest &)> &next) {
  const std::string client_id = client_id_for(request);

  const auto authenticated = authenticate(request, api_key_);
  if (!authenticated.ok()) {
    const auto response = make_error_response(authenticated.code(), authenticated.error());
    observability::record_request_rejected(client_id, authenticated.error(), response.status);
    return response;
  }

  if (limiter_ == nullptr) {
    return next(request);
  }

  const auto decision = limiter_->check(client_id);
  if (!decision.allowed) {
    auto response = make_error_response(common::ErrorCode::RateLimited, "rate limit exceeded");
    response.headers[kRemainingHeader] = "0";
    observability::record_request_rejected(client_id, "rate limit exceeded", response.status);
    return response;
  }

  auto response = next(request);
  response.headers[kRemainingHeader] = std::to_string(decision.remaining);
  return response;
}

std::unique_ptr<AccessControl> make_access_control(const config::ServerConfig &server,
                                                   const config::RateLimitConfig &limits) {
  std::unique_ptr<RateLimiter> limiter;
  if (limits.enabled) {
    limiter = std::make_unique<RateLimiter>(limits.max_requests,
                                            std::chrono::seconds(limits.window_seconds));
  }
  return std::make_unique<AccessControl>(server.api_key, std::move(limiter));
}

} // namespace codebox::gateway
