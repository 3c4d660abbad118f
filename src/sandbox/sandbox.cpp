#include "codebox/sandbox/sandbox.hpp"

namespace codebox::sandbox {

std::string container_name(const config::SandboxSettings &settings,
                           const std::string &sandbox_id) {
  return settings.container_prefix + sandbox_id;
}

std::vector<std::string> build_docker_run_args(const config::SandboxSettings &settings,
                                               const std::string &sandbox_id,
                                               const std::uint16_t host_port) {
  std::vector<std::string> args = {"run", "-d", "--name", container_name(settings, sandbox_id)};
  args.push_back("--label");
  args.push_back("codebox.sandbox=1");
  args.push_back("--label");
  args.push_back("codebox.id=" + sandbox_id);

  if (!settings.memory_limit.empty()) {
    args.push_back("--memory");
    args.push_back(settings.memory_limit);
  }
  if (settings.cpu_quota > 0) {
    args.push_back("--cpu-period");
    args.push_back(std::to_string(settings.cpu_period));
    args.push_back("--cpu-quota");
    args.push_back(std::to_string(settings.cpu_quota));
  }
  if (settings.pids_limit > 0) {
    args.push_back("--pids-limit");
    args.push_back(std::to_string(settings.pids_limit));
  }

  args.push_back("--cap-drop");
  args.push_back("ALL");
  args.push_back("--security-opt");
  args.push_back("no-new-privileges");

  args.push_back("-p");
  args.push_back("127.0.0.1:" + std::to_string(host_port) + ":" +
                 std::to_string(settings.kernel_port) + "/tcp");
  args.push_back(settings.image);
  return args;
}

std::vector<std::string> build_docker_stop_args(const std::string &container,
                                                const std::uint32_t grace_seconds) {
  return {"stop", "-t", std::to_string(grace_seconds), container};
}

std::vector<std::string> build_docker_remove_args(const std::string &container) {
  return {"rm", "-f", container};
}

std::vector<std::string> build_docker_status_args(const std::string &container) {
  return {"inspect", "-f", "{{.State.Status}}", container};
}

} // namespace codebox::sandbox
