#pragma once

#include "transloom/observability/observer.hpp"

#include <memory>

namespace transloom::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_run_start(const std::string &session_id, const std::string &source,
                      const std::string &target_language);
void record_run_end(const std::string &session_id, std::chrono::milliseconds duration,
                    bool success);
void record_stage(const std::string &session_id, const std::string &stage);
void record_chunk(const std::string &session_id, const std::string &stage, std::size_t index,
                  std::chrono::milliseconds duration, bool success);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace transloom::observability
