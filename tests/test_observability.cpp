#include "test_framework.hpp"

#include "codebox/observability/factory.hpp"
#include "codebox/observability/global.hpp"
#include "codebox/observability/noop_observer.hpp"

#include <memory>
#include <vector>

namespace {

namespace obs = codebox::observability;

class RecordingObserver final : public obs::IObserver {
public:
  void record_event(const obs::ObserverEvent &event) override { events.push_back(event); }
  void record_metric(const obs::ObserverMetric &metric) override { metrics.push_back(metric); }
  void flush() override { ++flushes; }
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  std::vector<obs::ObserverEvent> events;
  std::vector<obs::ObserverMetric> metrics;
  int flushes = 0;
};

// Installs a recorder for the duration of a test and puts the no-op observer back after.
struct RecorderScope {
  RecordingObserver *recorder = nullptr;

  RecorderScope() {
    auto owned = std::make_unique<RecordingObserver>();
    recorder = owned.get();
    obs::set_global_observer(std::move(owned));
  }
  ~RecorderScope() { obs::set_global_observer(std::make_unique<obs::NoopObserver>()); }
};

} // namespace

void register_observability_tests(std::vector<codebox::tests::TestCase> &tests) {
  using codebox::tests::require;

  tests.push_back({"observability_factory_selects_backend", [] {
                     codebox::config::Config config;
                     require(obs::create_observer(config)->name() == "log", "default is log");
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none");
                     config.observability.backend = " NOOP ";
                     require(obs::create_observer(config)->name() == "noop", "normalized");
                     config.observability.backend = "";
                     require(obs::create_observer(config)->name() == "noop", "empty");
                   }});

  tests.push_back({"observability_records_sandbox_events", [] {
                     RecorderScope scope;
                     obs::record_sandbox_created("abc", 49'152);
                     obs::record_code_executed("abc", std::chrono::milliseconds(12), false);
                     obs::record_sandbox_removed("abc", "idle");
                     obs::record_active_sandboxes(3);

                     auto &events = scope.recorder->events;
                     require(events.size() == 3, "three events");
                     const auto *created = std::get_if<obs::SandboxCreatedEvent>(&events[0]);
                     require(created != nullptr && created->sandbox_id == "abc" &&
                                 created->port == 49'152,
                             "created event");
                     const auto *executed = std::get_if<obs::CodeExecutedEvent>(&events[1]);
                     require(executed != nullptr && !executed->success &&
                                 executed->duration == std::chrono::milliseconds(12),
                             "executed event");
                     const auto *removed = std::get_if<obs::SandboxRemovedEvent>(&events[2]);
                     require(removed != nullptr && removed->reason == "idle", "removed event");

                     auto &metrics = scope.recorder->metrics;
                     require(metrics.size() == 2, "latency and gauge");
                     const auto *latency = std::get_if<obs::ExecutionLatencyMetric>(&metrics[0]);
                     require(latency != nullptr &&
                                 latency->latency == std::chrono::milliseconds(12),
                             "latency metric");
                     const auto *active = std::get_if<obs::ActiveSandboxesMetric>(&metrics[1]);
                     require(active != nullptr && active->count == 3, "active gauge");
                   }});

  tests.push_back({"observability_records_rejections", [] {
                     RecorderScope scope;
                     obs::record_validation_rejected("syntax", "Forbidden name: open");
                     obs::record_request_rejected("10.0.0.1", "rate limit exceeded", 429);
                     obs::record_tool_registered("add");
                     obs::record_lifecycle("gateway", "listening");
                     obs::record_error("reaper", "rm failed");

                     auto &events = scope.recorder->events;
                     require(events.size() == 5, "five events");
                     const auto *validation = std::get_if<obs::ValidationRejectedEvent>(&events[0]);
                     require(validation != nullptr && validation->stage == "syntax",
                             "validation event");
                     const auto *request = std::get_if<obs::RequestRejectedEvent>(&events[1]);
                     require(request != nullptr && request->status == 429 &&
                                 request->client_id == "10.0.0.1",
                             "request event");
                     require(std::holds_alternative<obs::ToolRegisteredEvent>(events[2]), "tool");
                     require(std::holds_alternative<obs::LifecycleEvent>(events[3]), "lifecycle");
                     const auto *error = std::get_if<obs::ErrorEvent>(&events[4]);
                     require(error != nullptr && error->component == "reaper", "error event");
                   }});

  tests.push_back({"observability_flushes_on_replace", [] {
                     auto owned = std::make_unique<RecordingObserver>();
                     auto *recorder = owned.get();
                     obs::set_global_observer(std::move(owned));
                     recorder->flush();
                     require(recorder->flushes == 1, "explicit flush");
                     require(obs::get_global_observer() == recorder, "installed");
                     obs::set_global_observer(std::make_unique<obs::NoopObserver>());
                     require(obs::get_global_observer()->name() == "noop", "restored");
                   }});
}
