#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace codebox::common {

enum class ErrorCode {
  None,
  InvalidArgument,
  ValidationRejected,
  NotFound,
  AlreadyExists,
  RuntimeUnavailable,
  SandboxUnreachable,
  RateLimited,
  Unauthorized,
  Forbidden,
  Internal,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code);

class Status {
public:
  static Status success() { return Status(true, "", ErrorCode::None); }
  static Status error(std::string message, ErrorCode code = ErrorCode::Internal) {
    return Status(false, std::move(message), code);
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Status(bool ok, std::string error, ErrorCode code)
      : ok_(ok), error_(std::move(error)), code_(code) {}

  bool ok_;
  std::string error_;
  ErrorCode code_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(true, std::move(value), "", ErrorCode::None); }
  static Result failure(std::string message, ErrorCode code = ErrorCode::Internal) {
    return Result(false, std::nullopt, std::move(message), code);
  }
  /// Carries the message and code of a failed status or result of another type.
  template <typename Failed> static Result propagate(const Failed &failed) {
    return failure(failed.error(), failed.code());
  }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Result(bool ok, std::optional<T> value, std::string error, ErrorCode code)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)), code_(code) {}

  bool ok_;
  std::optional<T> value_;
  std::string error_;
  ErrorCode code_;
};

inline std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::ValidationRejected:
    return "validation_rejected";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::AlreadyExists:
    return "already_exists";
  case ErrorCode::RuntimeUnavailable:
    return "runtime_unavailable";
  case ErrorCode::SandboxUnreachable:
    return "sandbox_unreachable";
  case ErrorCode::RateLimited:
    return "rate_limited";
  case ErrorCode::Unauthorized:
    return "unauthorized";
  case ErrorCode::Forbidden:
    return "forbidden";
  case ErrorCode::Internal:
    return "internal";
  }
  return "internal";
}

} // namespace codebox::common
