#pragma once

#include "codebox/kernel/protocol.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace codebox::kernel {

struct ExecutorOptions {
  // argv of the interpreter; the code is written to its stdin.
  std::vector<std::string> interpreter = {"python3", "-I", "-"};
  std::chrono::milliseconds timeout{25'000};
  std::size_t max_output_bytes = 1024 * 1024;
};

/// Runs each submission in a fresh interpreter process. User-code failures never surface as
/// errors: they come back as success=false with a description appended to stderr.
class CodeExecutor {
public:
  explicit CodeExecutor(ExecutorOptions options = {});

  [[nodiscard]] ExecutionResult run(const std::string &code) const;
  [[nodiscard]] const ExecutorOptions &options() const { return options_; }

private:
  ExecutorOptions options_;
};

} // namespace codebox::kernel
