#pragma once

#include "codebox/common/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace codebox::sandbox {

struct DockerCommandOptions {
  // Nonzero exits come back as results instead of failures.
  bool allow_failure = false;
  std::chrono::milliseconds timeout{60'000};
};

struct DockerProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

/// Container runtime seam. Failures carry RuntimeUnavailable when the runtime itself cannot
/// be reached (binary missing, daemon down, command timed out) and Internal otherwise.
/// RuntimeUnavailable is reported even with allow_failure set.
class IDockerRunner {
public:
  virtual ~IDockerRunner() = default;

  [[nodiscard]] virtual common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) = 0;
};

class DockerCliRunner final : public IDockerRunner {
public:
  explicit DockerCliRunner(std::string binary = "docker");

  [[nodiscard]] common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) override;

private:
  std::string binary_;
};

/// True for output that means the docker daemon could not be contacted.
[[nodiscard]] bool is_daemon_unreachable(const std::string &stderr_text);

} // namespace codebox::sandbox
