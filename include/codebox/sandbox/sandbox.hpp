#pragma once

#include "codebox/config/schema.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace codebox::sandbox {

[[nodiscard]] std::string container_name(const config::SandboxSettings &settings,
                                         const std::string &sandbox_id);

/// `docker run -d ...` for one kernel container publishing the kernel port on
/// 127.0.0.1:<host_port>.
[[nodiscard]] std::vector<std::string> build_docker_run_args(const config::SandboxSettings &settings,
                                                             const std::string &sandbox_id,
                                                             std::uint16_t host_port);

[[nodiscard]] std::vector<std::string> build_docker_stop_args(const std::string &container,
                                                              std::uint32_t grace_seconds);
[[nodiscard]] std::vector<std::string> build_docker_remove_args(const std::string &container);
[[nodiscard]] std::vector<std::string> build_docker_status_args(const std::string &container);

} // namespace codebox::sandbox
