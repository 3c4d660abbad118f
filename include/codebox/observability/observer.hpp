#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace codebox::observability {

struct SandboxCreatedEvent {
  std::string sandbox_id;
  std::uint16_t port = 0;
};

struct SandboxRemovedEvent {
  std::string sandbox_id;
  // "deleted", "idle" or "shutdown".
  std::string reason;
};

struct CodeExecutedEvent {
  std::string sandbox_id;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct ValidationRejectedEvent {
  // "pattern" or "syntax".
  std::string stage;
  std::string rule;
};

struct RequestRejectedEvent {
  std::string client_id;
  std::string reason;
  int status = 0;
};

struct ToolRegisteredEvent {
  std::string name;
};

struct LifecycleEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<SandboxCreatedEvent, SandboxRemovedEvent, CodeExecutedEvent,
                 ValidationRejectedEvent, RequestRejectedEvent, ToolRegisteredEvent,
                 LifecycleEvent, ErrorEvent>;

struct ExecutionLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ActiveSandboxesMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<ExecutionLatencyMetric, ActiveSandboxesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace codebox::observability
