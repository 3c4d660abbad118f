#pragma once

#include "codebox/observability/observer.hpp"

#include <memory>

namespace codebox::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_sandbox_created(const std::string &sandbox_id, std::uint16_t port);
void record_sandbox_removed(const std::string &sandbox_id, const std::string &reason);
void record_code_executed(const std::string &sandbox_id, std::chrono::milliseconds duration,
                          bool success);
void record_validation_rejected(const std::string &stage, const std::string &rule);
void record_request_rejected(const std::string &client_id, const std::string &reason, int status);
void record_tool_registered(const std::string &name);
void record_lifecycle(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

void record_active_sandboxes(std::uint64_t count);

} // namespace codebox::observability
