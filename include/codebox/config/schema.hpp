#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace codebox::config {

struct ServerConfig {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8000;
  // Empty disables authentication.
  std::string api_key;
  std::uint32_t read_timeout_ms = 30'000;
  std::size_t max_body_bytes = 1024 * 1024;
};

struct SandboxSettings {
  std::string image = "codebox-kernel:latest";
  std::string build_context;
  std::string container_prefix = "sandbox-";
  std::uint16_t kernel_port = 8000;
  std::string memory_limit = "512m";
  std::uint32_t cpu_quota = 50'000;
  std::uint32_t cpu_period = 100'000;
  std::uint32_t pids_limit = 128;
  std::uint16_t port_range_start = 49'152;
  std::uint16_t port_range_end = 49'407;
  std::uint32_t idle_ttl_seconds = 30 * 60;
  std::uint32_t reap_interval_seconds = 60;
  std::uint32_t execute_timeout_ms = 30'000;
  std::uint32_t kernel_ready_timeout_ms = 10'000;
  std::uint32_t stop_grace_seconds = 5;
  std::uint32_t shutdown_grace_seconds = 2;
  std::uint32_t docker_timeout_ms = 60'000;
};

struct RateLimitConfig {
  bool enabled = true;
  std::uint32_t max_requests = 100;
  std::uint32_t window_seconds = 60;
};

struct ToolsConfig {
  bool enabled = true;
  std::string db_path = "~/.codebox/tools.db";
};

struct KernelConfig {
  std::string host = "0.0.0.0";
  std::uint16_t port = 8000;
  std::vector<std::string> interpreter = {"python3", "-I", "-"};
  std::uint32_t exec_timeout_ms = 25'000;
  std::size_t max_output_bytes = 1024 * 1024;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ServerConfig server;
  SandboxSettings sandbox;
  RateLimitConfig rate_limit;
  ToolsConfig tools;
  KernelConfig kernel;
  ObservabilityConfig observability;
};

} // namespace codebox::config
