#include "codebox/observability/global.hpp"

#include <mutex>

namespace codebox::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_sandbox_created(const std::string &sandbox_id, const std::uint16_t port) {
  record_event(SandboxCreatedEvent{.sandbox_id = sandbox_id, .port = port});
}

void record_sandbox_removed(const std::string &sandbox_id, const std::string &reason) {
  record_event(SandboxRemovedEvent{.sandbox_id = sandbox_id, .reason = reason});
}

void record_code_executed(const std::string &sandbox_id, const std::chrono::milliseconds duration,
                          const bool success) {
  record_event(
      CodeExecutedEvent{.sandbox_id = sandbox_id, .duration = duration, .success = success});
  record_metric(ExecutionLatencyMetric{.latency = duration});
}

void record_validation_rejected(const std::string &stage, const std::string &rule) {
  record_event(ValidationRejectedEvent{.stage = stage, .rule = rule});
}

void record_request_rejected(const std::string &client_id, const std::string &reason,
                             const int status) {
  record_event(RequestRejectedEvent{.client_id = client_id, .reason = reason, .status = status});
}

void record_tool_registered(const std::string &name) {
  record_event(ToolRegisteredEvent{.name = name});
}

void record_lifecycle(const std::string &component, const std::string &message) {
  record_event(LifecycleEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_active_sandboxes(const std::uint64_t count) {
  record_metric(ActiveSandboxesMetric{.count = count});
}

} // namespace codebox::observability
