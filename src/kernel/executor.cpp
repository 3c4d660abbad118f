#include "codebox/kernel/executor.hpp"

#include "codebox/common/process.hpp"

namespace codebox::kernel {

namespace {

void append_line(std::string &stream, const std::string &line) {
  if (!stream.empty() && stream.back() != '\n') {
    stream.push_back('\n');
  }
  stream += line;
}

} // namespace

CodeExecutor::CodeExecutor(ExecutorOptions options) : options_(std::move(options)) {}

ExecutionResult CodeExecutor::run(const std::string &code) const {
  ExecutionResult result;

  auto process = common::run_process(options_.interpreter,
                                     common::ProcessOptions{.stdin_data = code,
                                                            .timeout = options_.timeout,
                                                            .output_limit = options_.max_output_bytes});
  if (!process.ok()) {
    result.success = false;
    result.stderr_text = "failed to start interpreter: " + process.error();
    return result;
  }

  const auto &outcome = process.value();
  result.stdout_text = outcome.stdout_text;
  result.stderr_text = outcome.stderr_text;
  result.success = !outcome.timed_out && outcome.exit_code == 0;

  if (outcome.timed_out) {
    append_line(result.stderr_text, "execution timed out after " +
                                        std::to_string(options_.timeout.count()) + " ms");
  } else if (outcome.exit_code == 127 && outcome.stdout_text.empty() &&
             outcome.stderr_text.empty()) {
    append_line(result.stderr_text,
                "failed to start interpreter: " + common::join_args(options_.interpreter));
  } else if (outcome.exit_code != 0 && outcome.stderr_text.empty()) {
    append_line(result.stderr_text,
                "process exited with status " + std::to_string(outcome.exit_code));
  }
  if (outcome.truncated) {
    append_line(result.stderr_text, "output truncated to " +
                                        std::to_string(options_.max_output_bytes) + " bytes");
  }
  return result;
}

} // namespace codebox::kernel
