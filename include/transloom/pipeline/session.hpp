#pragma once

#include "transloom/common/result.hpp"
#include "transloom/pipeline/errors.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transloom::pipeline {

enum class Stage {
  Initializing,
  MetadataReady,
  Chunked,
  PromptsBuilt,
  Translating,
  Validating,
  Reassembling,
  Done,
  Failed,
};

[[nodiscard]] std::string_view stage_name(Stage stage);
[[nodiscard]] std::optional<Stage> stage_from_name(std::string_view name);

struct SessionConfig {
  std::string session_id;
  std::string source;
  std::string target_language;
  std::size_t max_chunk_size = 30'000;
  // 0 keeps every chunk.
  std::size_t max_chunks = 0;
  std::size_t metadata_preview_size = 30'000;
  std::string model = "gemini-2.5-flash";
  double temperature = 1.0;
  bool validation_enabled = true;
  std::size_t concurrency = 1;
  bool resume = false;
};

struct SessionState {
  Stage stage = Stage::Initializing;
  std::size_t chunks_created = 0;
  std::size_t prompts_built = 0;
  std::size_t translations_completed = 0;
  std::size_t validations_completed = 0;
  std::size_t validations_failed = 0;
  bool truncated = false;
  std::vector<std::string> warnings;
  std::vector<std::size_t> fallback_chunks;
  // Unset until a structural re-encode has been attempted.
  std::optional<bool> structural_encode;
  std::optional<PipelineError> last_error;
};

class SessionTracker {
public:
  using Listener = std::function<void(const SessionState &)>;

  explicit SessionTracker(Listener listener = {});

  void advance(Stage stage);
  void fail(const PipelineError &error);
  void chunk_created();
  void prompt_built();
  void translation_completed();
  void validation_completed();
  void validation_fallback(std::size_t index, const std::string &reason);
  void mark_truncated(const std::string &warning);
  void add_warning(const std::string &warning);
  void set_structural_encode(bool ok);

  [[nodiscard]] SessionState snapshot() const;

private:
  template <typename Fn> void mutate(Fn &&fn);

  mutable std::mutex mutex_;
  std::mutex notify_mutex_;
  SessionState state_;
  Listener listener_;
};

[[nodiscard]] common::Result<std::string> generate_session_id();

} // namespace transloom::pipeline
