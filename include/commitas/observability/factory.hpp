#pragma once

#include "commitas/config/schema.hpp"
#include "commitas/observability/observer.hpp"

#include <memory>

namespace commitas::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace commitas::observability
