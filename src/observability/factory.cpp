#include "codebox/observability/factory.hpp"

#include "codebox/common/fs.hpp"
#include "codebox/observability/log_observer.hpp"
#include "codebox/observability/noop_observer.hpp"

namespace codebox::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace codebox::observability
