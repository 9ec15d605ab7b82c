#pragma once

#include "transloom/config/schema.hpp"
#include "transloom/observability/observer.hpp"

#include <memory>

namespace transloom::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace transloom::observability
