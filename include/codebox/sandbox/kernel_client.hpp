#pragma once

#include "codebox/common/result.hpp"
#include "codebox/kernel/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace codebox::sandbox {

/// Talks to the kernel listening inside one sandbox. Transport failures, timeouts, non-2xx
/// replies and malformed bodies all carry SandboxUnreachable.
class IKernelClient {
public:
  virtual ~IKernelClient() = default;

  [[nodiscard]] virtual common::Result<kernel::ExecutionResult>
  execute(std::uint16_t port, const std::string &code, std::chrono::milliseconds timeout) = 0;

  [[nodiscard]] virtual common::Status health(std::uint16_t port,
                                              std::chrono::milliseconds timeout) = 0;
};

class CurlKernelClient final : public IKernelClient {
public:
  explicit CurlKernelClient(std::string host = "127.0.0.1");
  ~CurlKernelClient() override;

  CurlKernelClient(const CurlKernelClient &) = delete;
  CurlKernelClient &operator=(const CurlKernelClient &) = delete;

  [[nodiscard]] common::Result<kernel::ExecutionResult>
  execute(std::uint16_t port, const std::string &code, std::chrono::milliseconds timeout) override;

  [[nodiscard]] common::Status health(std::uint16_t port,
                                      std::chrono::milliseconds timeout) override;

private:
  std::string host_;
};

} // namespace codebox::sandbox
