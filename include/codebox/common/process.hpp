#pragma once

#include "codebox/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace codebox::common {

struct ProcessOptions {
  std::string stdin_data;
  std::chrono::milliseconds timeout{30'000};
  // Per-stream cap; bytes past it are drained and dropped.
  std::size_t output_limit = 1024 * 1024;
};

struct ProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
  bool truncated = false;
};

/// Runs argv[0] from PATH, feeds stdin_data, and collects both output streams.
/// The child runs in its own process group so a timeout kills everything it spawned.
/// Fails only when the process cannot be started; a nonzero exit is reported in exit_code
/// (127 when exec itself failed).
[[nodiscard]] Result<ProcessResult> run_process(const std::vector<std::string> &argv,
                                                const ProcessOptions &options = {});

[[nodiscard]] std::string join_args(const std::vector<std::string> &args);

} // namespace codebox::common
