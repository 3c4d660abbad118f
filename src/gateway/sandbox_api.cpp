#include "codebox/gateway/sandbox_api.hpp"

#include "codebox/common/fs.hpp"
#include "codebox/common/json_util.hpp"
#include "codebox/kernel/protocol.hpp"

namespace codebox::gateway {

namespace {

HttpResponse method_not_allowed(const HttpRequest &request) {
  return make_error_response(405, "method_not_allowed",
                             request.method + " is not allowed on " + request.path);
}

HttpResponse error_from(const common::ErrorCode code, const std::string &detail) {
  return make_error_response(code, detail);
}

/// Body parsed as a JSON object; an empty body counts as `{}`.
common::Result<common::JsonObject> parse_body(const HttpRequest &request) {
  if (common::trim(request.body).empty()) {
    return common::Result<common::JsonObject>::success({});
  }
  return common::json_parse_object(request.body);
}

common::Result<std::string> required_string(const common::JsonObject &body,
                                            const std::string &key) {
  auto value = common::json_member_string(body, key);
  if (!value.has_value()) {
    return common::Result<std::string>::failure("field '" + key + "' must be a string",
                                                common::ErrorCode::InvalidArgument);
  }
  return common::Result<std::string>::success(std::move(*value));
}

std::string optional_string(const common::JsonObject &body, const std::string &key,
                            const std::string &fallback) {
  return common::json_member_string(body, key).value_or(fallback);
}

} // namespace

SandboxApi::SandboxApi(sandbox::SandboxManager &manager, tools::DynamicToolRegistry *tools,
                       std::unique_ptr<AccessControl> access)
    : manager_(manager), tools_(tools), access_(std::move(access)) {}

HttpResponse SandboxApi::handle(const HttpRequest &request) {
  if (access_ == nullptr) {
    return route(request);
  }
  return access_->handle(request, [this](const HttpRequest &inner) { return route(inner); });
}

HttpResponse SandboxApi::route(const HttpRequest &request) {
  const auto segments = split_path(request.path);
  const std::string &method = request.method;

  if (segments.size() == 1 && segments[0] == "health") {
    if (method != "GET") {
      return method_not_allowed(request);
    }
    return make_json_response(200, R"({"status":"ok"})");
  }

  if (!segments.empty() && segments[0] == "sandboxes") {
    if (segments.size() == 1) {
      if (method == "POST") {
        return handle_create(request);
      }
      if (method == "GET") {
        return handle_list();
      }
      return method_not_allowed(request);
    }
    if (segments.size() == 2) {
      if (method == "GET") {
        return handle_get(segments[1]);
      }
      if (method == "DELETE") {
        return handle_delete(segments[1]);
      }
      return method_not_allowed(request);
    }
    if (segments.size() == 3 && segments[2] == "execute") {
      if (method != "POST") {
        return method_not_allowed(request);
      }
      return handle_execute(segments[1], request);
    }
    if (segments.size() == 4 && segments[2] == "tools") {
      if (method != "POST") {
        return method_not_allowed(request);
      }
      return handle_invoke_tool(segments[1], segments[3], request);
    }
  }

  if (segments.size() == 1 && segments[0] == "tools") {
    if (method == "POST") {
      return handle_register_tool(request);
    }
    if (method == "GET") {
      return handle_list_tools();
    }
    return method_not_allowed(request);
  }

  return make_error_response(404, "not_found", "no route for " + request.path);
}

HttpResponse SandboxApi::handle_create(const HttpRequest &request) {
  auto body = parse_body(request);
  if (!body.ok()) {
    return error_from(common::ErrorCode::InvalidArgument, body.error());
  }
  const auto lang_it = body.value().find("lang");
  if (lang_it != body.value().end() && !lang_it->second.is_string()) {
    return error_from(common::ErrorCode::InvalidArgument, "field 'lang' must be a string");
  }

  auto created = manager_.create(optional_string(body.value(), "lang", "python"));
  if (!created.ok()) {
    return error_from(created.code(), created.error());
  }
  return make_json_response(201, created.value().to_json());
}

HttpResponse SandboxApi::handle_list() {
  std::string body = "[";
  bool first = true;
  for (const auto &info : manager_.list()) {
    if (!first) {
      body += ",";
    }
    first = false;
    body += info.to_json();
  }
  body += "]";
  return make_json_response(200, std::move(body));
}

HttpResponse SandboxApi::handle_get(const std::string &id) {
  auto info = manager_.get(id);
  if (!info.ok()) {
    return error_from(info.code(), info.error());
  }
  return make_json_response(200, info.value().to_json());
}

HttpResponse SandboxApi::handle_execute(const std::string &id, const HttpRequest &request) {
  auto code = kernel::parse_execute_request(request.body);
  if (!code.ok()) {
    return error_from(common::ErrorCode::InvalidArgument, code.error());
  }
  auto result = manager_.execute(id, code.value());
  if (!result.ok()) {
    return error_from(result.code(), result.error());
  }
  return make_json_response(200, result.value().to_json());
}

HttpResponse SandboxApi::handle_delete(const std::string &id) {
  const auto removed = manager_.remove(id);
  if (!removed.ok()) {
    return error_from(removed.code(), removed.error());
  }
  return make_json_response(200, R"({"status":"deleted"})");
}

HttpResponse SandboxApi::handle_register_tool(const HttpRequest &request) {
  if (tools_ == nullptr) {
    return make_error_response(404, "not_found", "dynamic tools are disabled");
  }
  auto body = parse_body(request);
  if (!body.ok()) {
    return error_from(common::ErrorCode::InvalidArgument, body.error());
  }
  auto name = required_string(body.value(), "name");
  if (!name.ok()) {
    return error_from(name.code(), name.error());
  }
  auto code = required_string(body.value(), "code");
  if (!code.ok()) {
    return error_from(code.code(), code.error());
  }

  auto registered = tools_->register_tool(name.value(), optional_string(body.value(), "args", ""),
                                          code.value(), optional_string(body.value(), "doc", ""));
  if (!registered.ok()) {
    return error_from(registered.code(), registered.error());
  }
  return make_json_response(201, "{\"status\":\"registered\",\"name\":" +
                                     common::json_string(registered.value().name) + "}");
}

HttpResponse SandboxApi::handle_list_tools() {
  if (tools_ == nullptr) {
    return make_json_response(200, "[]");
  }
  auto listed = tools_->list_tools();
  if (!listed.ok()) {
    return error_from(listed.code(), listed.error());
  }
  std::string body = "[";
  for (std::size_t i = 0; i < listed.value().size(); ++i) {
    const auto &tool = listed.value()[i];
    if (i > 0) {
      body += ",";
    }
    body += "{\"name\":" + common::json_string(tool.name) +
            ",\"args\":" + common::json_string(tool.params) +
            ",\"doc\":" + common::json_string(tool.doc) +
            ",\"created_at\":" + common::json_string(tool.created_at) + "}";
  }
  body += "]";
  return make_json_response(200, std::move(body));
}

HttpResponse SandboxApi::handle_invoke_tool(const std::string &id, const std::string &name,
                                            const HttpRequest &request) {
  if (tools_ == nullptr) {
    return make_error_response(404, "not_found", "dynamic tools are disabled");
  }
  auto body = parse_body(request);
  if (!body.ok()) {
    return error_from(common::ErrorCode::InvalidArgument, body.error());
  }
  auto invocation = tools_->build_invocation(name, optional_string(body.value(), "args", ""));
  if (!invocation.ok()) {
    return error_from(invocation.code(), invocation.error());
  }
  auto result = manager_.execute(id, invocation.value());
  if (!result.ok()) {
    return error_from(result.code(), result.error());
  }
  return make_json_response(200, result.value().to_json());
}

} // namespace codebox::gateway
