#pragma once

#include "codebox/common/result.hpp"
#include "codebox/config/schema.hpp"
#include "codebox/kernel/protocol.hpp"
#include "codebox/sandbox/docker.hpp"
#include "codebox/sandbox/kernel_client.hpp"
#include "codebox/sandbox/port_allocator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace codebox::sandbox {

struct SandboxInfo {
  std::string id;
  // Runtime-reported container state ("running", "exited", ...), "stopping" while being
  // removed, or "unknown" when the runtime could not be polled.
  std::string status;
  std::uint16_t port = 0;

  [[nodiscard]] std::string to_json() const;
};

enum class ProbeState { Ready, Starting, Unreachable };

[[nodiscard]] std::string probe_state_to_string(ProbeState state);

using Clock = std::function<std::chrono::steady_clock::time_point()>;
using IdGenerator = std::function<common::Result<std::string>()>;

/// Eight lowercase hex characters from the OpenSSL CSPRNG.
[[nodiscard]] common::Result<std::string> generate_sandbox_id();

struct ManagerDependencies {
  std::shared_ptr<IDockerRunner> docker = std::make_shared<DockerCliRunner>();
  std::shared_ptr<IKernelClient> kernel = std::make_shared<CurlKernelClient>();
  IdGenerator id_generator = generate_sandbox_id;
  Clock clock = [] { return std::chrono::steady_clock::now(); };
  PortProbe port_probe = is_port_bindable;
};

class SandboxManager {
public:
  explicit SandboxManager(config::SandboxSettings settings, ManagerDependencies deps = {});
  ~SandboxManager();

  SandboxManager(const SandboxManager &) = delete;
  SandboxManager &operator=(const SandboxManager &) = delete;

  [[nodiscard]] common::Result<SandboxInfo> create(const std::string &lang);
  [[nodiscard]] std::vector<SandboxInfo> list();
  [[nodiscard]] common::Result<SandboxInfo> get(const std::string &id);
  [[nodiscard]] common::Result<kernel::ExecutionResult> execute(const std::string &id,
                                                                const std::string &code);
  [[nodiscard]] common::Status remove(const std::string &id);
  [[nodiscard]] common::Result<ProbeState> probe(const std::string &id);

  /// Makes sure the kernel image exists, building it from the configured context if not.
  [[nodiscard]] common::Status prepare_image();

  /// Stops and removes every sandbox. Failures are logged and do not stop the sweep.
  void shutdown();

  /// Removes sandboxes idle for longer than the TTL. Returns how many were removed.
  std::size_t reap_idle();

  void start_reaper();
  void stop_reaper();

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] const config::SandboxSettings &settings() const { return settings_; }

private:
  struct Entry {
    std::string id;
    std::string container;
    std::uint16_t port = 0;
    std::uint64_t sequence = 0;

    // Held for the duration of execute and removal.
    std::mutex lane;

    mutable std::mutex meta;
    bool stopping = false;
    bool kernel_ready = false;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_used_at;
  };

  [[nodiscard]] std::shared_ptr<Entry> find_entry(const std::string &id) const;
  [[nodiscard]] static bool is_stopping(const Entry &entry);
  [[nodiscard]] std::string poll_status(const Entry &entry);
  [[nodiscard]] common::Status wait_for_kernel(Entry &entry);

  // Caller holds the entry's lane and has marked it stopping.
  [[nodiscard]] common::Status teardown(const std::shared_ptr<Entry> &entry,
                                        const std::string &reason, std::uint32_t grace_seconds);

  void publish_active_count();
  void reaper_loop();

  [[nodiscard]] DockerCommandOptions docker_options(bool allow_failure = false) const;

  config::SandboxSettings settings_;
  ManagerDependencies deps_;
  PortAllocator ports_;

  mutable std::mutex registry_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> registry_;
  std::uint64_t next_sequence_ = 0;

  std::mutex reaper_mutex_;
  std::condition_variable reaper_cv_;
  bool reaper_stop_ = false;
  std::thread reaper_thread_;
};

} // namespace codebox::sandbox
