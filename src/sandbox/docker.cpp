#include "codebox/sandbox/docker.hpp"

#include "codebox/common/fs.hpp"
#include "codebox/common/process.hpp"

#include <array>

namespace codebox::sandbox {

namespace {

constexpr int kExecFailedExitCode = 127;

constexpr std::array<const char *, 4> kDaemonUnreachableMarkers = {
    "cannot connect to the docker daemon",
    "is the docker daemon running",
    "error during connect",
    "permission denied while trying to connect to the docker daemon",
};

} // namespace

bool is_daemon_unreachable(const std::string &stderr_text) {
  const std::string lowered = common::to_lower(stderr_text);
  for (const char *marker : kDaemonUnreachableMarkers) {
    if (lowered.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

DockerCliRunner::DockerCliRunner(std::string binary) : binary_(std::move(binary)) {}

common::Result<DockerProcessResult>
DockerCliRunner::run(const std::vector<std::string> &args, const DockerCommandOptions &options) {
  if (args.empty()) {
    return common::Result<DockerProcessResult>::failure("docker command is empty",
                                                        common::ErrorCode::InvalidArgument);
  }

  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(binary_);
  argv.insert(argv.end(), args.begin(), args.end());

  auto process = common::run_process(argv, common::ProcessOptions{.timeout = options.timeout});
  if (!process.ok()) {
    return common::Result<DockerProcessResult>::failure(process.error(),
                                                        common::ErrorCode::RuntimeUnavailable);
  }

  const auto &outcome = process.value();
  if (outcome.timed_out) {
    return common::Result<DockerProcessResult>::failure(
        "docker command timed out: " + common::join_args(args),
        common::ErrorCode::RuntimeUnavailable);
  }
  if (outcome.exit_code == kExecFailedExitCode && outcome.stdout_text.empty() &&
      outcome.stderr_text.empty()) {
    return common::Result<DockerProcessResult>::failure("docker binary not found: " + binary_,
                                                        common::ErrorCode::RuntimeUnavailable);
  }
  if (outcome.exit_code != 0 && is_daemon_unreachable(outcome.stderr_text)) {
    return common::Result<DockerProcessResult>::failure(
        "docker daemon unreachable: " + common::trim(outcome.stderr_text),
        common::ErrorCode::RuntimeUnavailable);
  }

  DockerProcessResult result{
      .exit_code = outcome.exit_code,
      .stdout_text = outcome.stdout_text,
      .stderr_text = outcome.stderr_text,
  };

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string message = result.stderr_text.empty()
                                    ? "docker command failed: " + common::join_args(args)
                                    : common::trim(result.stderr_text);
    return common::Result<DockerProcessResult>::failure(message, common::ErrorCode::Internal);
  }

  return common::Result<DockerProcessResult>::success(std::move(result));
}

} // namespace codebox::sandbox
