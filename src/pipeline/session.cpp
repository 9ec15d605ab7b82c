#include "transloom/pipeline/session.hpp"

#include "transloom/common/digest.hpp"

#include <array>
#include <utility>

namespace transloom::pipeline {

namespace {

constexpr std::array<std::pair<Stage, std::string_view>, 9> STAGE_NAMES = {{
    {Stage::Initializing, "initializing"},
    {Stage::MetadataReady, "metadata_ready"},
    {Stage::Chunked, "chunked"},
    {Stage::PromptsBuilt, "prompts_built"},
    {Stage::Translating, "translating"},
    {Stage::Validating, "validating"},
    {Stage::Reassembling, "reassembling"},
    {Stage::Done, "done"},
    {Stage::Failed, "failed"},
}};

} // namespace

std::string_view stage_name(const Stage stage) {
  for (const auto &[value, name] : STAGE_NAMES) {
    if (value == stage) {
      return name;
    }
  }
  return "unknown";
}

std::optional<Stage> stage_from_name(const std::string_view name) {
  for (const auto &[value, stage_label] : STAGE_NAMES) {
    if (stage_label == name) {
      return value;
    }
  }
  return std::nullopt;
}

SessionTracker::SessionTracker(Listener listener) : listener_(std::move(listener)) {}

template <typename Fn> void SessionTracker::mutate(Fn &&fn) {
  std::lock_guard<std::mutex> notify_lock(notify_mutex_);
  SessionState copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    fn(state_);
    copy = state_;
  }
  if (listener_) {
    listener_(copy);
  }
}

void SessionTracker::advance(const Stage stage) {
  mutate([stage](SessionState &state) {
    // Stages only move forward.
    if (state.stage != Stage::Failed && stage > state.stage) {
      state.stage = stage;
    }
  });
}

void SessionTracker::fail(const PipelineError &error) {
  mutate([&error](SessionState &state) {
    state.stage = Stage::Failed;
    state.last_error = error;
  });
}

void SessionTracker::chunk_created() {
  mutate([](SessionState &state) { ++state.chunks_created; });
}

void SessionTracker::prompt_built() {
  mutate([](SessionState &state) { ++state.prompts_built; });
}

void SessionTracker::translation_completed() {
  mutate([](SessionState &state) { ++state.translations_completed; });
}

void SessionTracker::validation_completed() {
  mutate([](SessionState &state) { ++state.validations_completed; });
}

void SessionTracker::validation_fallback(const std::size_t index, const std::string &reason) {
  mutate([index, &reason](SessionState &state) {
    ++state.validations_failed;
    state.fallback_chunks.push_back(index);
    state.warnings.push_back("validation fell back to raw translation for chunk " +
                             std::to_string(index) + ": " + reason);
  });
}

void SessionTracker::mark_truncated(const std::string &warning) {
  mutate([&warning](SessionState &state) {
    state.truncated = true;
    state.warnings.push_back(warning);
  });
}

void SessionTracker::add_warning(const std::string &warning) {
  mutate([&warning](SessionState &state) { state.warnings.push_back(warning); });
}

void SessionTracker::set_structural_encode(const bool ok) {
  mutate([ok](SessionState &state) { state.structural_encode = ok; });
}

SessionState SessionTracker::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

common::Result<std::string> generate_session_id() { return common::random_hex(16); }

} // namespace transloom::pipeline
