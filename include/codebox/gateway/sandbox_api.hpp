#pragma once

#include "codebox/gateway/access_control.hpp"
#include "codebox/gateway/http.hpp"
#include "codebox/gateway/http_server.hpp"
#include "codebox/sandbox/manager.hpp"
#include "codebox/tools/dynamic_registry.hpp"

#include <memory>

namespace codebox::gateway {

/// REST surface of the sandbox manager. The manager and tool registry are owned by the caller
/// and must outlive the API object; the registry may be null when tools are disabled.
class SandboxApi {
public:
  SandboxApi(sandbox::SandboxManager &manager, tools::DynamicToolRegistry *tools,
             std::unique_ptr<AccessControl> access = nullptr);

  /// Access control followed by routing.
  [[nodiscard]] HttpResponse handle(const HttpRequest &request);
  /// Routing only.
  [[nodiscard]] HttpResponse route(const HttpRequest &request);

private:
  [[nodiscard]] HttpResponse handle_create(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_list();
  [[nodiscard]] HttpResponse handle_get(const std::string &id);
  [[nodiscard]] HttpResponse handle_execute(const std::string &id, const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_delete(const std::string &id);
  [[nodiscard]] HttpResponse handle_register_tool(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_list_tools();
  [[nodiscard]] HttpResponse handle_invoke_tool(const std::string &id, const std::string &name,
                                                const HttpRequest &request);

  sandbox::SandboxManager &manager_;
  tools::DynamicToolRegistry *tools_;
  std::unique_ptr<AccessControl> access_;
};

} // namespace codebox::gateway
