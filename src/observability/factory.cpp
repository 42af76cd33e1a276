#include "commitas/observability/factory.hpp"

#include "commitas/common/fs.hpp"
#include "commitas/observability/log_observer.hpp"
#include "commitas/observability/noop_observer.hpp"

namespace commitas::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace commitas::observability
