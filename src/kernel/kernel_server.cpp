#include "codebox/kernel/kernel_server.hpp"

#include "codebox/observability/global.hpp"

namespace codebox::kernel {

KernelServer::KernelServer(ExecutorOptions options)
    : executor_(std::move(options)),
      server_([this](const gateway::HttpRequest &request) { return handle(request); }) {}

common::Status KernelServer::start(const gateway::HttpServerOptions &options) {
  auto started = server_.start(options);
  if (started.ok()) {
    observability::record_lifecycle("kernel", "listening on " + options.host + ":" +
                                                  std::to_string(server_.port()));
  }
  return started;
}

void KernelServer::stop() { server_.stop(); }

gateway::HttpResponse KernelServer::handle(const gateway::HttpRequest &request) const {
  if (request.path == "/health") {
    if (request.method != "GET") {
      return gateway::make_error_response(405, "method_not_allowed", "use GET /health");
    }
    return gateway::make_json_response(200, R"({"status":"ok"})");
  }

  if (request.path == "/execute") {
    if (request.method != "POST") {
      return gateway::make_error_response(405, "method_not_allowed", "use POST /execute");
    }
    auto code = parse_execute_request(request.body);
    if (!code.ok()) {
      return gateway::make_error_response(400, "invalid_argument", code.error());
    }
    const auto result = executor_.run(code.value());
    return gateway::make_json_response(200, result.to_json());
  }

  return gateway::make_error_response(404, "not_found", "no route for " + request.path);
}

} // namespace codebox::kernel
