#include "transloom/observability/global.hpp"

#include <mutex>

namespace transloom::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_run_start(const std::string &session_id, const std::string &source,
                      const std::string &target_language) {
  record_event(RunStartEvent{
      .session_id = session_id, .source = source, .target_language = target_language});
}

void record_run_end(const std::string &session_id, const std::chrono::milliseconds duration,
                    const bool success) {
  record_event(RunEndEvent{.session_id = session_id, .duration = duration, .success = success});
}

void record_stage(const std::string &session_id, const std::string &stage) {
  record_event(StageTransitionEvent{.session_id = session_id, .stage = stage});
}

void record_chunk(const std::string &session_id, const std::string &stage, const std::size_t index,
                  const std::chrono::milliseconds duration, const bool success) {
  record_event(ChunkProcessedEvent{.session_id = session_id,
                                   .stage = stage,
                                   .index = index,
                                   .duration = duration,
                                   .success = success});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace transloom::observability
