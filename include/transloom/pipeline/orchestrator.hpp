#pragma once

#include "transloom/chunking/chunker.hpp"
#include "transloom/codecs/registry.hpp"
#include "transloom/pipeline/errors.hpp"
#include "transloom/pipeline/session.hpp"
#include "transloom/pipeline/status_store.hpp"
#include "transloom/providers/traits.hpp"
#include "transloom/storage/artifact_store.hpp"
#include "transloom/validation/validator.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace transloom::pipeline {

struct Dependencies {
  std::shared_ptr<providers::Provider> generator;
  // Required only when validation is enabled.
  std::shared_ptr<validation::Validator> validator;
  std::shared_ptr<storage::ArtifactStore> store;
  std::shared_ptr<const codecs::CodecRegistry> codecs;
  // Optional; receives every SessionState change.
  std::shared_ptr<StatusStore> status_store;
};

struct MetadataOverrides {
  std::optional<std::string> entities;
  std::optional<std::string> style;
};

struct RunReport {
  bool success = false;
  // Last stage entered; for a failed run, the stage where it stopped.
  Stage stage_reached = Stage::Initializing;
  SessionState state;
  std::string final_locator;
  std::optional<std::string> encoded_locator;
  std::string output_folder;
  std::size_t total_chunks = 0;
};

/// Runs one session end to end: decode, metadata, chunk, prompts, translate,
/// validate, reassemble. Every stage persists its artifacts before the next
/// one starts, so a failed or cancelled run can be resumed.
class PipelineOrchestrator {
public:
  PipelineOrchestrator(SessionConfig session, Dependencies dependencies);

  PipelineOrchestrator(const PipelineOrchestrator &) = delete;
  PipelineOrchestrator &operator=(const PipelineOrchestrator &) = delete;

  [[nodiscard]] RunReport run(const MetadataOverrides &overrides = {});

  void request_cancel();

  [[nodiscard]] SessionState state() const;
  [[nodiscard]] const SessionConfig &session() const { return session_; }

private:
  using StageError = std::optional<PipelineError>;

  [[nodiscard]] StageError check_configuration() const;
  [[nodiscard]] StageError decode_source();
  [[nodiscard]] StageError prepare_metadata(const MetadataOverrides &overrides);
  [[nodiscard]] StageError chunk_document();
  [[nodiscard]] StageError build_prompts();
  [[nodiscard]] StageError translate_chunks();
  [[nodiscard]] StageError validate_chunks();
  [[nodiscard]] StageError reassemble(RunReport &report);

  // `position` indexes prompt_refs_.
  [[nodiscard]] StageError translate_chunk(std::size_t position);
  [[nodiscard]] StageError finalize_chunk(std::size_t position);
  [[nodiscard]] StageError validate_chunk(std::size_t position);

  [[nodiscard]] common::Result<std::string> derive_metadata(const std::string &prompt);
  [[nodiscard]] StageError discard_stale_outputs(const std::string &prompt_key,
                                                 const std::string &prompt);

  [[nodiscard]] common::Result<std::vector<storage::ArtifactRef>>
  list_chunk_artifacts(const std::string &prefix) const;

  /// Runs task(0..count-1) on up to session.concurrency workers. The first
  /// error stops further dispatch; tasks already running finish.
  [[nodiscard]] StageError run_bounded(std::size_t count,
                                       const std::function<StageError(std::size_t)> &task);

  [[nodiscard]] PipelineError error(ErrorKind kind, const std::string &message) const;
  [[nodiscard]] StageError check_cancelled() const;
  [[nodiscard]] bool skip_existing(const std::string &key) const;
  void enter(Stage stage);

  SessionConfig session_;
  Dependencies deps_;
  SessionTracker tracker_;
  std::atomic<bool> cancel_requested_{false};
  std::atomic<Stage> current_stage_{Stage::Initializing};

  std::string source_bytes_;
  std::string source_digest_;
  std::shared_ptr<const codecs::DocumentCodec> codec_;
  codecs::DocumentContent document_;
  std::string entities_;
  std::string style_;
  std::vector<chunking::TextChunk> chunks_;
  std::vector<storage::ArtifactRef> prompt_refs_;
  std::size_t total_chunks_ = 0;
};

} // namespace transloom::pipeline
