#include "codebox/kernel/protocol.hpp"

#include "codebox/common/json_util.hpp"

namespace codebox::kernel {

std::string ExecutionResult::to_json() const {
  return std::string("{\"type\":") + common::json_string(type) +
         ",\"stdout\":" + common::json_string(stdout_text) +
         ",\"stderr\":" + common::json_string(stderr_text) +
         ",\"success\":" + (success ? "true" : "false") + "}";
}

common::Result<ExecutionResult> parse_execution_result(const std::string &json) {
  auto object = common::json_parse_object(json);
  if (!object.ok()) {
    return common::Result<ExecutionResult>::failure("malformed kernel reply: " + object.error(),
                                                    common::ErrorCode::SandboxUnreachable);
  }

  ExecutionResult result;
  result.success = true;
  const auto &members = object.value();
  if (const auto type = common::json_member_string(members, "type"); type.has_value()) {
    result.type = *type;
  }
  if (const auto out = common::json_member_string(members, "stdout"); out.has_value()) {
    result.stdout_text = *out;
  }
  if (const auto err = common::json_member_string(members, "stderr"); err.has_value()) {
    result.stderr_text = *err;
  }
  if (const auto it = members.find("success"); it != members.end()) {
    const auto flag = it->second.as_bool();
    if (!flag.has_value()) {
      return common::Result<ExecutionResult>::failure(
          "malformed kernel reply: success is not a boolean",
          common::ErrorCode::SandboxUnreachable);
    }
    result.success = *flag;
  }
  return common::Result<ExecutionResult>::success(std::move(result));
}

common::Result<std::string> parse_execute_request(const std::string &json) {
  auto object = common::json_parse_object(json);
  if (!object.ok()) {
    return common::Result<std::string>::propagate(object);
  }
  auto code = common::json_member_string(object.value(), "code");
  if (!code.has_value()) {
    return common::Result<std::string>::failure("field 'code' must be a string",
                                                common::ErrorCode::InvalidArgument);
  }
  return common::Result<std::string>::success(std::move(*code));
}

std::string render_execute_request(const std::string &code) {
  return "{\"code\":" + common::json_string(code) + "}";
}

} // namespace codebox::kernel
