#pragma once

#include "codebox/config/schema.hpp"
#include "codebox/observability/observer.hpp"

#include <memory>

namespace codebox::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace codebox::observability
