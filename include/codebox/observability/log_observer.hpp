#pragma once

#include "codebox/observability/observer.hpp"

#include <mutex>

namespace codebox::observability {

class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(const std::string &level, const std::string &message);

  std::mutex write_mutex_;
};

} // namespace codebox::observability
