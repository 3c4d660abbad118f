#pragma once

#include "codebox/common/result.hpp"
#include "codebox/gateway/http_server.hpp"
#include "codebox/kernel/executor.hpp"

#include <memory>

namespace codebox::kernel {

/// The in-container listener: POST /execute and GET /health.
class KernelServer {
public:
  explicit KernelServer(ExecutorOptions options = {});

  [[nodiscard]] common::Status start(const gateway::HttpServerOptions &options);
  void stop();

  [[nodiscard]] std::uint16_t port() const { return server_.port(); }

  [[nodiscard]] gateway::HttpResponse handle(const gateway::HttpRequest &request) const;

private:
  CodeExecutor executor_;
  gateway::HttpServer server_;
};

} // namespace codebox::kernel
