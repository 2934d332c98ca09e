#pragma once

#include "rmm/config/schema.hpp"
#include "rmm/observability/observer.hpp"

#include <memory>

namespace rmm::observability {

/// Builds the observer named by observability.backend ("log", "noop", or a comma list).
[[nodiscard]] std::shared_ptr<IObserver> create_observer(const config::Config &config);

/// Shared no-op instance for components constructed without an observer.
[[nodiscard]] std::shared_ptr<IObserver> noop_observer();

} // namespace rmm::observability
