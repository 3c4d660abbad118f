#include "codebox/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace codebox::observability {

void LogObserver::log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::cerr << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SandboxCreatedEvent>) {
          log_line("INFO", "sandbox.created id=" + evt.sandbox_id +
                               " port=" + std::to_string(evt.port));
        } else if constexpr (std::is_same_v<T, SandboxRemovedEvent>) {
          log_line("INFO", "sandbox.removed id=" + evt.sandbox_id + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, CodeExecutedEvent>) {
          log_line("INFO", "code.executed id=" + evt.sandbox_id +
                               " duration_ms=" + std::to_string(evt.duration.count()) +
                               " success=" + (evt.success ? "true" : "false"));
        } else if constexpr (std::is_same_v<T, ValidationRejectedEvent>) {
          log_line("WARN", "validation.rejected stage=" + evt.stage + " rule=" + evt.rule);
        } else if constexpr (std::is_same_v<T, RequestRejectedEvent>) {
          log_line("WARN", "request.rejected client=" + evt.client_id + " reason=" + evt.reason +
                               " status=" + std::to_string(evt.status));
        } else if constexpr (std::is_same_v<T, ToolRegisteredEvent>) {
          log_line("INFO", "tool.registered name=" + evt.name);
        } else if constexpr (std::is_same_v<T, LifecycleEvent>) {
          log_line("INFO", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ExecutionLatencyMetric>) {
          log_line("DEBUG", "metric.execution_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ActiveSandboxesMetric>) {
          log_line("DEBUG", "metric.active_sandboxes=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace codebox::observability
