#pragma once

#include "codebox/common/result.hpp"

#include <string>

namespace codebox::kernel {

/// Envelope shared by the kernel's /execute reply and the manager's execute response.
struct ExecutionResult {
  std::string type = "result";
  std::string stdout_text;
  std::string stderr_text;
  bool success = false;

  [[nodiscard]] std::string to_json() const;
};

/// Missing fields default the way the kernel would report them: type "result", empty
/// streams, success true.
[[nodiscard]] common::Result<ExecutionResult> parse_execution_result(const std::string &json);

/// The `code` member of an execute request body.
[[nodiscard]] common::Result<std::string> parse_execute_request(const std::string &json);

[[nodiscard]] std::string render_execute_request(const std::string &code);

} // namespace codebox::kernel
