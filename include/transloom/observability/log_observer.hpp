#pragma once

#include "transloom/observability/observer.hpp"

#include <mutex>

namespace transloom::observability {

class LogObserver final : public IObserver {
public:
  explicit LogObserver(bool verbose = false) : verbose_(verbose) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return verbose_ ? "debug" : "log"; }

private:
  void log_line(const std::string &level, const std::string &message);

  bool verbose_ = false;
  std::mutex mutex_;
};

} // namespace transloom::observability
