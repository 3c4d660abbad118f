#include "codebox/sandbox/manager.hpp"

#include "codebox/common/fs.hpp"
#include "codebox/common/json_util.hpp"
#include "codebox/observability/global.hpp"
#include "codebox/sandbox/sandbox.hpp"
#include "codebox/security/code_screen.hpp"
#include "codebox/security/credentials.hpp"

#include <algorithm>

namespace codebox::sandbox {

namespace {

constexpr int kIdAttempts = 8;
constexpr auto kHealthPollInterval = std::chrono::milliseconds(100);
constexpr auto kHealthProbeTimeout = std::chrono::milliseconds(1'000);
constexpr auto kImageBuildTimeout = std::chrono::minutes(10);
constexpr const char *kComponent = "sandbox";

} // namespace

std::string SandboxInfo::to_json() const {
  return "{\"id\":" + common::json_string(id) + ",\"status\":" + common::json_string(status) +
         ",\"port\":" + std::to_string(port) + "}";
}

std::string probe_state_to_string(const ProbeState state) {
  switch (state) {
  case ProbeState::Ready:
    return "ready";
  case ProbeState::Starting:
    return "starting";
  case ProbeState::Unreachable:
    return "unreachable";
  }
  return "unreachable";
}

common::Result<std::string> generate_sandbox_id() { return security::random_hex(4); }

SandboxManager::SandboxManager(config::SandboxSettings settings, ManagerDependencies deps)
    : settings_(std::move(settings)), deps_(std::move(deps)),
      ports_(settings_.port_range_start, settings_.port_range_end, deps_.port_probe) {}

SandboxManager::~SandboxManager() { stop_reaper(); }

DockerCommandOptions SandboxManager::docker_options(const bool allow_failure) const {
  return DockerCommandOptions{.allow_failure = allow_failure,
                              .timeout = std::chrono::milliseconds(settings_.docker_timeout_ms)};
}

std::shared_ptr<SandboxManager::Entry> SandboxManager::find_entry(const std::string &id) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  const auto it = registry_.find(id);
  if (it == registry_.end()) {
    return nullptr;
  }
  return it->second;
}

std::size_t SandboxManager::size() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return registry_.size();
}

void SandboxManager::publish_active_count() { observability::record_active_sandboxes(size()); }

common::Result<SandboxInfo> SandboxManager::create(const std::string &lang) {
  if (lang != "python") {
    return common::Result<SandboxInfo>::failure("unsupported language '" + lang +
                                                    "': only python is supported",
                                                common::ErrorCode::InvalidArgument);
  }

  std::string id;
  for (int attempt = 0; attempt < kIdAttempts && id.empty(); ++attempt) {
    auto generated = deps_.id_generator();
    if (!generated.ok()) {
      return common::Result<SandboxInfo>::propagate(generated);
    }
    if (find_entry(generated.value()) == nullptr) {
      id = generated.value();
    }
  }
  if (id.empty()) {
    return common::Result<SandboxInfo>::failure("could not generate a unique sandbox id");
  }

  auto port = ports_.allocate();
  if (!port.ok()) {
    return common::Result<SandboxInfo>::propagate(port);
  }

  auto started = deps_.docker->run(build_docker_run_args(settings_, id, port.value()),
                                   docker_options());
  if (!started.ok()) {
    observability::record_error(kComponent, "create " + id + " failed: " + started.error());
    // The daemon may have created the container before the run failed or timed out.
    const auto cleanup = deps_.docker->run(build_docker_remove_args(container_name(settings_, id)),
                                           docker_options(true));
    if (!cleanup.ok()) {
      observability::record_error(kComponent, "cleanup of " + id + " failed: " + cleanup.error());
    }
    ports_.release(port.value());
    return common::Result<SandboxInfo>::propagate(started);
  }

  auto entry = std::make_shared<Entry>();
  entry->id = id;
  entry->container = common::trim(started.value().stdout_text);
  if (entry->container.empty()) {
    entry->container = container_name(settings_, id);
  }
  entry->port = port.value();
  entry->created_at = deps_.clock();
  entry->last_used_at = entry->created_at;

  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    entry->sequence = next_sequence_++;
    registry_[id] = entry;
  }

  observability::record_sandbox_created(id, entry->port);
  publish_active_count();
  return common::Result<SandboxInfo>::success(
      SandboxInfo{.id = id, .status = "running", .port = entry->port});
}

bool SandboxManager::is_stopping(const Entry &entry) {
  std::lock_guard<std::mutex> lock(entry.meta);
  return entry.stopping;
}

std::string SandboxManager::poll_status(const Entry &entry) {
  {
    std::lock_guard<std::mutex> lock(entry.meta);
    if (entry.stopping) {
      return "stopping";
    }
  }

  auto inspected = deps_.docker->run(build_docker_status_args(entry.container),
                                     docker_options(true));
  if (!inspected.ok() || inspected.value().exit_code != 0) {
    return "unknown";
  }
  const std::string status = common::to_lower(common::trim(inspected.value().stdout_text));
  return status.empty() ? std::string("unknown") : status;
}

std::vector<SandboxInfo> SandboxManager::list() {
  std::vector<std::shared_ptr<Entry>> entries;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    entries.reserve(registry_.size());
    for (const auto &[id, entry] : registry_) {
      entries.push_back(entry);
    }
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto &lhs, const auto &rhs) { return lhs->sequence < rhs->sequence; });

  std::vector<SandboxInfo> out;
  out.reserve(entries.size());
  for (const auto &entry : entries) {
    out.push_back(SandboxInfo{.id = entry->id, .status = poll_status(*entry), .port = entry->port});
  }
  return out;
}

common::Result<SandboxInfo> SandboxManager::get(const std::string &id) {
  const auto entry = find_entry(id);
  if (entry == nullptr) {
    return common::Result<SandboxInfo>::failure("sandbox not found: " + id,
                                                common::ErrorCode::NotFound);
  }
  return common::Result<SandboxInfo>::success(
      SandboxInfo{.id = entry->id, .status = poll_status(*entry), .port = entry->port});
}

common::Status SandboxManager::wait_for_kernel(Entry &entry) {
  {
    std::lock_guard<std::mutex> lock(entry.meta);
    if (entry.kernel_ready) {
      return common::Status::success();
    }
  }

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(settings_.kernel_ready_timeout_ms);
  common::Status last = common::Status::error("kernel did not become ready",
                                              common::ErrorCode::SandboxUnreachable);
  while (true) {
    last = deps_.kernel->health(entry.port, kHealthProbeTimeout);
    if (last.ok()) {
      std::lock_guard<std::mutex> lock(entry.meta);
      entry.kernel_ready = true;
      return common::Status::success();
    }
    if (std::chrono::steady_clock::now() + kHealthPollInterval >= deadline) {
      break;
    }
    std::this_thread::sleep_for(kHealthPollInterval);
  }
  return common::Status::error("kernel in sandbox " + entry.id +
                                   " did not become ready: " + last.error(),
                               common::ErrorCode::SandboxUnreachable);
}

common::Result<kernel::ExecutionResult> SandboxManager::execute(const std::string &id,
                                                                const std::string &code) {
  const auto screened = security::screen_patterns(code);
  if (!screened.ok()) {
    observability::record_validation_rejected("pattern", screened.error());
    return common::Result<kernel::ExecutionResult>::propagate(screened);
  }

  const auto entry = find_entry(id);
  if (entry == nullptr || is_stopping(*entry)) {
    return common::Result<kernel::ExecutionResult>::failure("sandbox not found: " + id,
                                                            common::ErrorCode::NotFound);
  }

  std::lock_guard<std::mutex> lane(entry->lane);
  {
    std::lock_guard<std::mutex> lock(entry->meta);
    if (entry->stopping) {
      return common::Result<kernel::ExecutionResult>::failure("sandbox not found: " + id,
                                                              common::ErrorCode::NotFound);
    }
    entry->last_used_at = deps_.clock();
  }

  const auto ready = wait_for_kernel(*entry);
  if (!ready.ok()) {
    observability::record_error(kComponent, ready.error());
    return common::Result<kernel::ExecutionResult>::propagate(ready);
  }

  const auto started = std::chrono::steady_clock::now();
  auto result = deps_.kernel->execute(entry->port, code,
                                      std::chrono::milliseconds(settings_.execute_timeout_ms));
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  {
    std::lock_guard<std::mutex> lock(entry->meta);
    entry->last_used_at = deps_.clock();
  }

  if (!result.ok()) {
    observability::record_error(kComponent, "execute in " + id + " failed: " + result.error());
    return common::Result<kernel::ExecutionResult>::failure(result.error(),
                                                            common::ErrorCode::SandboxUnreachable);
  }
  observability::record_code_executed(id, elapsed, result.value().success);
  return result;
}

common::Status SandboxManager::teardown(const std::shared_ptr<Entry> &entry,
                                        const std::string &reason,
                                        const std::uint32_t grace_seconds) {
  auto options = docker_options(true);
  options.timeout += std::chrono::seconds(grace_seconds);
  const auto stopped = deps_.docker->run(build_docker_stop_args(entry->container, grace_seconds),
                                         options);
  const auto removed = deps_.docker->run(build_docker_remove_args(entry->container),
                                         docker_options());

  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    const auto it = registry_.find(entry->id);
    if (it != registry_.end() && it->second == entry) {
      registry_.erase(it);
    }
  }
  ports_.release(entry->port);
  observability::record_sandbox_removed(entry->id, reason);
  publish_active_count();

  if (!removed.ok()) {
    std::string message = "failed to remove sandbox " + entry->id + ": " + removed.error();
    if (!stopped.ok()) {
      message += " (stop: " + stopped.error() + ")";
    }
    observability::record_error(kComponent, message);
    return common::Status::error(message, common::ErrorCode::Internal);
  }
  return common::Status::success();
}

common::Status SandboxManager::remove(const std::string &id) {
  const auto entry = find_entry(id);
  if (entry == nullptr) {
    return common::Status::error("sandbox not found: " + id, common::ErrorCode::NotFound);
  }
  {
    std::lock_guard<std::mutex> lock(entry->meta);
    if (entry->stopping) {
      return common::Status::error("sandbox not found: " + id, common::ErrorCode::NotFound);
    }
    entry->stopping = true;
  }

  std::lock_guard<std::mutex> lane(entry->lane);
  return teardown(entry, "deleted", settings_.stop_grace_seconds);
}

common::Result<ProbeState> SandboxManager::probe(const std::string &id) {
  const auto entry = find_entry(id);
  if (entry == nullptr) {
    return common::Result<ProbeState>::failure("sandbox not found: " + id,
                                               common::ErrorCode::NotFound);
  }
  if (poll_status(*entry) != "running") {
    return common::Result<ProbeState>::success(ProbeState::Unreachable);
  }
  if (!deps_.kernel->health(entry->port, kHealthProbeTimeout).ok()) {
    return common::Result<ProbeState>::success(ProbeState::Starting);
  }
  {
    std::lock_guard<std::mutex> lock(entry->meta);
    entry->kernel_ready = true;
  }
  return common::Result<ProbeState>::success(ProbeState::Ready);
}

common::Status SandboxManager::prepare_image() {
  auto inspected =
      deps_.docker->run({"image", "inspect", settings_.image}, docker_options(true));
  if (!inspected.ok()) {
    return common::Status::error(inspected.error(), inspected.code());
  }
  if (inspected.value().exit_code == 0) {
    return common::Status::success();
  }

  if (settings_.build_context.empty()) {
    return common::Status::error("kernel image " + settings_.image +
                                     " not found and no build context is configured",
                                 common::ErrorCode::NotFound);
  }

  observability::record_lifecycle(kComponent, "building kernel image " + settings_.image);
  auto built = deps_.docker->run(
      {"build", "-t", settings_.image, common::expand_path(settings_.build_context)},
      DockerCommandOptions{.allow_failure = false, .timeout = kImageBuildTimeout});
  if (!built.ok()) {
    return common::Status::error("kernel image build failed: " + built.error(), built.code());
  }
  return common::Status::success();
}

void SandboxManager::shutdown() {
  stop_reaper();

  std::vector<std::shared_ptr<Entry>> entries;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto &[id, entry] : registry_) {
      entries.push_back(entry);
    }
  }

  for (const auto &entry : entries) {
    {
      std::lock_guard<std::mutex> lock(entry->meta);
      if (entry->stopping) {
        continue;
      }
      entry->stopping = true;
    }
    std::lock_guard<std::mutex> lane(entry->lane);
    const auto status = teardown(entry, "shutdown", settings_.shutdown_grace_seconds);
    if (!status.ok()) {
      observability::record_error(kComponent, "shutdown cleanup: " + status.error());
    }
  }

  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    registry_.clear();
  }
  publish_active_count();
}

std::size_t SandboxManager::reap_idle() {
  const auto now = deps_.clock();
  const auto ttl = std::chrono::seconds(settings_.idle_ttl_seconds);

  std::vector<std::shared_ptr<Entry>> entries;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto &[id, entry] : registry_) {
      entries.push_back(entry);
    }
  }

  std::size_t reaped = 0;
  for (const auto &entry : entries) {
    std::unique_lock<std::mutex> lane(entry->lane, std::try_to_lock);
    if (!lane.owns_lock()) {
      continue;
    }
    {
      std::lock_guard<std::mutex> lock(entry->meta);
      if (entry->stopping || now - entry->last_used_at <= ttl) {
        continue;
      }
      entry->stopping = true;
    }
    const auto status = teardown(entry, "idle", settings_.stop_grace_seconds);
    if (!status.ok()) {
      observability::record_error(kComponent, "idle reap: " + status.error());
    }
    ++reaped;
  }
  return reaped;
}

void SandboxManager::start_reaper() {
  std::lock_guard<std::mutex> lock(reaper_mutex_);
  if (reaper_thread_.joinable()) {
    return;
  }
  reaper_stop_ = false;
  reaper_thread_ = std::thread([this] { reaper_loop(); });
}

void SandboxManager::stop_reaper() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(reaper_mutex_);
    reaper_stop_ = true;
    worker = std::move(reaper_thread_);
  }
  reaper_cv_.notify_all();
  if (worker.joinable()) {
    worker.join();
  }
}

void SandboxManager::reaper_loop() {
  const auto interval = std::chrono::seconds(std::max<std::uint32_t>(1, settings_.reap_interval_seconds));
  std::unique_lock<std::mutex> lock(reaper_mutex_);
  while (!reaper_stop_) {
    if (reaper_cv_.wait_for(lock, interval, [this] { return reaper_stop_; })) {
      break;
    }
    lock.unlock();
    const std::size_t reaped = reap_idle();
    if (reaped > 0) {
      observability::record_lifecycle(kComponent,
                                      "reaped " + std::to_string(reaped) + " idle sandbox(es)");
    }
    lock.lock();
  }
}

} // namespace codebox::sandbox
