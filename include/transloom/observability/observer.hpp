#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace transloom::observability {

struct RunStartEvent {
  std::string session_id;
  std::string source;
  std::string target_language;
};

struct RunEndEvent {
  std::string session_id;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct StageTransitionEvent {
  std::string session_id;
  std::string stage;
};

struct ChunkProcessedEvent {
  std::string session_id;
  std::string stage;
  std::size_t index = 0;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<RunStartEvent, RunEndEvent, StageTransitionEvent,
                                   ChunkProcessedEvent, WarningEvent, ErrorEvent>;

struct GenerationLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ChunkSizeMetric {
  std::uint64_t bytes = 0;
};

using ObserverMetric = std::variant<GenerationLatencyMetric, ChunkSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace transloom::observability
