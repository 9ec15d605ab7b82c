#include "transloom/observability/factory.hpp"

#include "transloom/common/fs.hpp"
#include "transloom/observability/log_observer.hpp"
#include "transloom/observability/noop_observer.hpp"

namespace transloom::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (backend == "debug" || backend == "log:debug") {
    return std::make_unique<LogObserver>(true);
  }
  return std::make_unique<LogObserver>();
}

} // namespace transloom::observability
