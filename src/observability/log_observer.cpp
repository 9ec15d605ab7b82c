#include "transloom/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace transloom::observability {

namespace {

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::log_line(const std::string &level, const std::string &message) {
  if (level == "DEBUG" && !verbose_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RunStartEvent>) {
          log_line("INFO", "run.start session=" + evt.session_id + " source=" + evt.source +
                               " target=" + evt.target_language);
        } else if constexpr (std::is_same_v<T, RunEndEvent>) {
          log_line(evt.success ? "INFO" : "ERROR",
                   "run.end session=" + evt.session_id +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, StageTransitionEvent>) {
          log_line("INFO", "stage session=" + evt.session_id + " stage=" + evt.stage);
        } else if constexpr (std::is_same_v<T, ChunkProcessedEvent>) {
          log_line(evt.success ? "DEBUG" : "WARN",
                   "chunk stage=" + evt.stage + " index=" + std::to_string(evt.index) +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, GenerationLatencyMetric>) {
          log_line("DEBUG", "metric.generation_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ChunkSizeMetric>) {
          log_line("DEBUG", "metric.chunk_bytes=" + std::to_string(m.bytes));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
}

} // namespace transloom::observability
