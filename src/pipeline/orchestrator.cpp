#include "transloom/pipeline/orchestrator.hpp"

#include "transloom/common/digest.hpp"
#include "transloom/common/fs.hpp"
#include "transloom/common/text.hpp"
#include "transloom/observability/global.hpp"
#include "transloom/pipeline/prompts.hpp"
#include "transloom/storage/artifact_keys.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <future>
#include <mutex>

namespace transloom::pipeline {

namespace {

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

SessionTracker::Listener status_listener(std::shared_ptr<StatusStore> store,
                                         std::string session_id) {
  if (store == nullptr) {
    return {};
  }
  return [store = std::move(store), session_id = std::move(session_id)](const SessionState &state) {
    if (auto status = store->update_state(session_id, state); !status.ok()) {
      observability::record_warning("status", "cannot persist session state: " + status.error());
    }
  };
}

} // namespace

PipelineOrchestrator::PipelineOrchestrator(SessionConfig session, Dependencies dependencies)
    : session_(std::move(session)), deps_(std::move(dependencies)),
      tracker_(status_listener(deps_.status_store, session_.session_id)) {}

void PipelineOrchestrator::request_cancel() { cancel_requested_.store(true); }

SessionState PipelineOrchestrator::state() const { return tracker_.snapshot(); }

PipelineError PipelineOrchestrator::error(const ErrorKind kind, const std::string &message) const {
  return PipelineError{.kind = kind,
                       .stage = std::string(stage_name(current_stage_.load())),
                       .message = message};
}

PipelineOrchestrator::StageError PipelineOrchestrator::check_cancelled() const {
  if (cancel_requested_.load()) {
    return error(ErrorKind::Cancelled, "run cancelled");
  }
  return std::nullopt;
}

bool PipelineOrchestrator::skip_existing(const std::string &key) const {
  return session_.resume && deps_.store->exists(key);
}

void PipelineOrchestrator::enter(const Stage stage) {
  current_stage_.store(stage);
  tracker_.advance(stage);
  observability::record_stage(session_.session_id, std::string(stage_name(stage)));
}

RunReport PipelineOrchestrator::run(const MetadataOverrides &overrides) {
  const auto started = std::chrono::steady_clock::now();
  observability::record_run_start(session_.session_id, session_.source, session_.target_language);

  RunReport report;
  StageError failure = check_configuration();
  if (!failure) {
    report.output_folder = deps_.store->locator_for(session_.session_id);
    failure = decode_source();
  }
  if (!failure) {
    failure = prepare_metadata(overrides);
  }
  if (!failure) {
    failure = chunk_document();
  }
  if (!failure) {
    failure = build_prompts();
  }
  if (!failure) {
    failure = translate_chunks();
  }
  if (!failure && session_.validation_enabled) {
    failure = validate_chunks();
  }
  if (!failure) {
    failure = reassemble(report);
  }

  if (failure) {
    tracker_.fail(*failure);
    observability::record_error("pipeline", failure->to_string());
    report.stage_reached = stage_from_name(failure->stage).value_or(Stage::Initializing);
  } else {
    enter(Stage::Done);
    report.stage_reached = Stage::Done;
  }

  report.success = !failure.has_value();
  report.state = tracker_.snapshot();
  report.total_chunks = total_chunks_;
  observability::record_run_end(session_.session_id, elapsed_since(started), report.success);
  return report;
}

PipelineOrchestrator::StageError PipelineOrchestrator::check_configuration() const {
  const auto missing = [this](const std::string &what) {
    return error(ErrorKind::Configuration, "missing " + what);
  };
  if (common::trim(session_.session_id).empty()) {
    return missing("session id");
  }
  if (common::trim(session_.source).empty()) {
    return missing("source document");
  }
  if (common::trim(session_.target_language).empty()) {
    return missing("target language");
  }
  if (common::trim(session_.model).empty()) {
    return missing("generation model");
  }
  if (deps_.generator == nullptr) {
    return missing("generation service");
  }
  if (deps_.store == nullptr) {
    return missing("artifact store");
  }
  if (deps_.codecs == nullptr) {
    return missing("codec registry");
  }
  if (session_.validation_enabled && deps_.validator == nullptr) {
    return missing("validation service (or disable validation)");
  }
  if (session_.concurrency == 0) {
    return error(ErrorKind::Configuration, "concurrency must be at least 1");
  }
  if (session_.max_chunk_size == 0) {
    return error(ErrorKind::Chunking, "max chunk size must be greater than zero");
  }
  return std::nullopt;
}

PipelineOrchestrator::StageError PipelineOrchestrator::decode_source() {
  auto bytes = common::read_file(session_.source);
  if (!bytes.ok()) {
    return error(ErrorKind::Decode, bytes.error());
  }
  source_bytes_ = std::move(bytes.value());
  source_digest_ = common::sha256_hex(source_bytes_);

  if (deps_.status_store != nullptr) {
    auto previous = deps_.status_store->get(session_.session_id);
    if (!previous.ok()) {
      observability::record_warning("status", "cannot read session status: " + previous.error());
    } else if (session_.resume && previous.value().has_value() &&
               previous.value()->source_digest != source_digest_) {
      return error(ErrorKind::Configuration,
                   "session " + session_.session_id + " was started from a different source");
    }
    const SessionRecord record{.session_id = session_.session_id,
                               .source = session_.source,
                               .target_language = session_.target_language,
                               .source_digest = source_digest_,
                               .state = tracker_.snapshot()};
    if (auto saved = deps_.status_store->save(record); !saved.ok()) {
      observability::record_warning("status", "cannot persist session: " + saved.error());
    }
  }

  auto format = codecs::detect_format(session_.source);
  if (!format.ok()) {
    return error(ErrorKind::Decode, format.error());
  }
  auto codec = deps_.codecs->codec_for(format.value());
  if (!codec.ok()) {
    return error(ErrorKind::Decode, codec.error());
  }
  codec_ = codec.value();

  auto decoded = codec_->decode(source_bytes_);
  if (!decoded.ok()) {
    return error(ErrorKind::Decode, decoded.error());
  }
  document_ = std::move(decoded.value());
  return std::nullopt;
}

common::Result<std::string> PipelineOrchestrator::derive_metadata(const std::string &prompt) {
  const auto started = std::chrono::steady_clock::now();
  auto response = deps_.generator->chat(prompt, session_.model, session_.temperature);
  observability::record_metric(observability::GenerationLatencyMetric{elapsed_since(started)});
  return response;
}

PipelineOrchestrator::StageError
PipelineOrchestrator::prepare_metadata(const MetadataOverrides &overrides) {
  const std::string preview = common::utf8_prefix(document_.text, session_.metadata_preview_size);

  struct MetadataItem {
    const char *label;
    const std::optional<std::string> &supplied;
    std::string key;
    std::string (*prompt)(const std::string &, const std::string &);
    std::string &target;
  };
  const MetadataItem items[] = {
      {"entity dictionary", overrides.entities,
       storage::singleton_key(session_.session_id, storage::ENTITY_EXTRACTION_NAME),
       &entity_extraction_prompt, entities_},
      {"style guide", overrides.style,
       storage::singleton_key(session_.session_id, storage::STYLE_INSTRUCTIONS_NAME),
       &style_extraction_prompt, style_},
  };

  for (const auto &item : items) {
    if (auto cancelled = check_cancelled()) {
      return cancelled;
    }
    if (item.supplied.has_value()) {
      item.target = *item.supplied;
    } else if (skip_existing(item.key)) {
      auto stored = deps_.store->get(item.key);
      if (!stored.ok()) {
        return error(ErrorKind::Storage, stored.error());
      }
      item.target = std::move(stored.value());
    } else {
      auto derived = derive_metadata(item.prompt(session_.target_language, preview));
      if (!derived.ok()) {
        return error(ErrorKind::Generation,
                     std::string("cannot derive ") + item.label + ": " + derived.error());
      }
      item.target = std::move(derived.value());
    }

    auto stored = deps_.store->put(item.key, item.target);
    if (!stored.ok()) {
      return error(ErrorKind::Storage, stored.error());
    }
  }

  enter(Stage::MetadataReady);
  return std::nullopt;
}

PipelineOrchestrator::StageError PipelineOrchestrator::chunk_document() {
  auto chunks = chunking::chunk_text(document_.text, session_.max_chunk_size);
  if (!chunks.ok()) {
    return error(ErrorKind::Chunking, chunks.error());
  }
  chunks_ = std::move(chunks.value());

  if (session_.max_chunks > 0 && chunks_.size() > session_.max_chunks) {
    const std::string warning = "document split into " + std::to_string(chunks_.size()) +
                                " chunks; only the first " + std::to_string(session_.max_chunks) +
                                " are translated";
    chunks_.resize(session_.max_chunks);
    tracker_.mark_truncated(warning);
    observability::record_warning("chunker", warning);
  }
  total_chunks_ = chunks_.size();

  for (const auto &chunk : chunks_) {
    if (auto cancelled = check_cancelled()) {
      return cancelled;
    }
    auto stored = deps_.store->put(storage::original_chunk_key(session_.session_id, chunk.index),
                                   chunk.content);
    if (!stored.ok()) {
      return error(ErrorKind::Storage, stored.error());
    }
    tracker_.chunk_created();
    observability::record_metric(observability::ChunkSizeMetric{static_cast<std::uint64_t>(chunk.content.size())});
  }

  enter(Stage::Chunked);
  return std::nullopt;
}

PipelineOrchestrator::StageError PipelineOrchestrator::build_prompts() {
  for (const auto &chunk : chunks_) {
    if (auto cancelled = check_cancelled()) {
      return cancelled;
    }
    const std::string prompt = build_translation_prompt({.target_language = session_.target_language,
                                                         .format = document_.format,
                                                         .style = style_,
                                                         .entities = entities_,
                                                         .chunk = chunk.content,
                                                         .index = chunk.index,
                                                         .total = total_chunks_});
    const std::string key = storage::prompt_key(session_.session_id, chunk.index);
    if (auto stale = discard_stale_outputs(key, prompt)) {
      return stale;
    }
    auto stored = deps_.store->put(key, prompt);
    if (!stored.ok()) {
      return error(ErrorKind::Storage, stored.error());
    }
    tracker_.prompt_built();
  }

  enter(Stage::PromptsBuilt);
  return std::nullopt;
}

// Translated and final artifacts are only valid for the prompt that produced
// them. A prompt that changed since the previous run (other chunk size, source
// or metadata) drops both before it is rewritten.
PipelineOrchestrator::StageError
PipelineOrchestrator::discard_stale_outputs(const std::string &prompt_key,
                                            const std::string &prompt) {
  const std::string translated_key = storage::translated_key_from_prompt(prompt_key);
  const std::string final_key = storage::final_key_from_translated(translated_key);
  if (!deps_.store->exists(translated_key) && !deps_.store->exists(final_key)) {
    return std::nullopt;
  }
  if (deps_.store->exists(prompt_key)) {
    auto previous = deps_.store->get(prompt_key);
    if (!previous.ok()) {
      return error(ErrorKind::Storage, previous.error());
    }
    if (previous.value() == prompt) {
      return std::nullopt;
    }
  }

  if (session_.resume) {
    observability::record_warning("resume", prompt_key +
                                                " changed since the previous run; translating it again");
  }
  for (const auto &key : {translated_key, final_key}) {
    if (auto removed = deps_.store->remove(key); !removed.ok()) {
      return error(ErrorKind::Storage, removed.error());
    }
  }
  return std::nullopt;
}

common::Result<std::vector<storage::ArtifactRef>>
PipelineOrchestrator::list_chunk_artifacts(const std::string &prefix) const {
  auto listed = deps_.store->list_by_prefix(prefix);
  if (!listed.ok()) {
    return listed;
  }

  std::vector<std::pair<std::size_t, storage::ArtifactRef>> indexed;
  for (auto &ref : listed.value()) {
    const auto sequence = storage::sequence_from_key(ref.key);
    // Artifacts past the retained count belong to an earlier, longer run.
    if (sequence.has_value() && *sequence >= 1 && *sequence <= total_chunks_) {
      indexed.emplace_back(*sequence, std::move(ref));
    }
  }
  std::sort(indexed.begin(), indexed.end(),
            [](const auto &a, const auto &b) { return a.first < b.first; });

  if (indexed.size() != total_chunks_) {
    return common::Result<std::vector<storage::ArtifactRef>>::failure(
        "expected " + std::to_string(total_chunks_) + " artifacts under " + prefix + ", found " +
        std::to_string(indexed.size()));
  }

  std::vector<storage::ArtifactRef> out;
  out.reserve(indexed.size());
  for (auto &[sequence, ref] : indexed) {
    out.push_back(std::move(ref));
  }
  return common::Result<std::vector<storage::ArtifactRef>>::success(std::move(out));
}

PipelineOrchestrator::StageError
PipelineOrchestrator::run_bounded(const std::size_t count,
                                  const std::function<StageError(std::size_t)> &task) {
  if (count == 0) {
    return check_cancelled();
  }
  const std::size_t workers = std::min(std::max<std::size_t>(session_.concurrency, 1), count);

  std::atomic<std::size_t> cursor{0};
  std::atomic<bool> stop{false};
  std::mutex error_mutex;
  StageError first_error;

  const auto worker = [&]() {
    while (!stop.load()) {
      if (cancel_requested_.load()) {
        stop.store(true);
        break;
      }
      const std::size_t position = cursor.fetch_add(1);
      if (position >= count) {
        break;
      }
      if (auto failed = task(position)) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
          first_error = std::move(failed);
        }
        stop.store(true);
      }
    }
  };

  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    futures.push_back(std::async(std::launch::async, worker));
  }
  for (auto &future : futures) {
    future.get();
  }

  if (first_error) {
    return first_error;
  }
  return check_cancelled();
}

PipelineOrchestrator::StageError PipelineOrchestrator::translate_chunks() {
  enter(Stage::Translating);
  auto prompts = list_chunk_artifacts(storage::prompts_prefix(session_.session_id));
  if (!prompts.ok()) {
    return error(ErrorKind::Storage, prompts.error());
  }
  prompt_refs_ = std::move(prompts.value());

  return run_bounded(prompt_refs_.size(), [this](const std::size_t position) -> StageError {
    if (auto failed = translate_chunk(position)) {
      return failed;
    }
    if (!session_.validation_enabled) {
      return finalize_chunk(position);
    }
    return std::nullopt;
  });
}

PipelineOrchestrator::StageError PipelineOrchestrator::translate_chunk(const std::size_t position) {
  const auto &prompt_ref = prompt_refs_[position];
  const std::size_t index = storage::sequence_from_key(prompt_ref.key).value_or(position + 1);
  const std::string translated_key = storage::translated_key_from_prompt(prompt_ref.key);

  if (skip_existing(translated_key)) {
    tracker_.translation_completed();
    return std::nullopt;
  }

  auto prompt = deps_.store->get(prompt_ref.locator);
  if (!prompt.ok()) {
    return error(ErrorKind::Storage, prompt.error());
  }

  const auto started = std::chrono::steady_clock::now();
  auto translated = deps_.generator->chat(prompt.value(), session_.model, session_.temperature);
  const auto duration = elapsed_since(started);
  observability::record_metric(observability::GenerationLatencyMetric{duration});
  observability::record_chunk(session_.session_id, "translating", index, duration,
                              translated.ok());
  if (!translated.ok()) {
    return error(ErrorKind::Generation,
                 "chunk " + std::to_string(index) + ": " + translated.error());
  }

  // A final artifact left over from an earlier translation no longer matches.
  if (auto removed = deps_.store->remove(storage::final_key_from_translated(translated_key));
      !removed.ok()) {
    return error(ErrorKind::Storage, removed.error());
  }
  auto stored = deps_.store->put(translated_key, translated.value());
  if (!stored.ok()) {
    return error(ErrorKind::Storage, stored.error());
  }
  tracker_.translation_completed();
  return std::nullopt;
}

PipelineOrchestrator::StageError PipelineOrchestrator::finalize_chunk(const std::size_t position) {
  const std::string translated_key = storage::translated_key_from_prompt(prompt_refs_[position].key);
  const std::string final_key = storage::final_key_from_translated(translated_key);
  if (skip_existing(final_key)) {
    return std::nullopt;
  }

  auto translated = deps_.store->get(translated_key);
  if (!translated.ok()) {
    return error(ErrorKind::Storage, translated.error());
  }
  auto stored = deps_.store->put(final_key, translated.value());
  if (!stored.ok()) {
    return error(ErrorKind::Storage, stored.error());
  }
  return std::nullopt;
}

PipelineOrchestrator::StageError PipelineOrchestrator::validate_chunks() {
  if (auto cancelled = check_cancelled()) {
    return cancelled;
  }
  enter(Stage::Validating);
  return run_bounded(prompt_refs_.size(),
                     [this](const std::size_t position) { return validate_chunk(position); });
}

PipelineOrchestrator::StageError PipelineOrchestrator::validate_chunk(const std::size_t position) {
  const auto &prompt_ref = prompt_refs_[position];
  const std::size_t index = storage::sequence_from_key(prompt_ref.key).value_or(position + 1);
  const std::string translated_key = storage::translated_key_from_prompt(prompt_ref.key);
  const std::string final_key = storage::final_key_from_translated(translated_key);

  if (skip_existing(final_key)) {
    tracker_.validation_completed();
    return std::nullopt;
  }

  const auto started = std::chrono::steady_clock::now();
  auto validated =
      deps_.validator->validate(prompt_ref.locator, deps_.store->locator_for(translated_key));
  observability::record_chunk(session_.session_id, "validating", index, elapsed_since(started),
                              validated.ok());

  if (validated.ok()) {
    auto stored = deps_.store->put(final_key, validated.value());
    if (!stored.ok()) {
      return error(ErrorKind::Storage, stored.error());
    }
    tracker_.validation_completed();
    return std::nullopt;
  }

  const PipelineError recovered = error(ErrorKind::Validation,
                                        "chunk " + std::to_string(index) + ": " + validated.error());
  observability::record_warning("validation", recovered.to_string());

  auto raw = deps_.store->get(translated_key);
  if (!raw.ok()) {
    return error(ErrorKind::Storage, raw.error());
  }
  auto stored = deps_.store->put(final_key, raw.value());
  if (!stored.ok()) {
    return error(ErrorKind::Storage, stored.error());
  }
  tracker_.validation_fallback(index, validated.error());
  return std::nullopt;
}

PipelineOrchestrator::StageError PipelineOrchestrator::reassemble(RunReport &report) {
  if (auto cancelled = check_cancelled()) {
    return cancelled;
  }
  enter(Stage::Reassembling);

  auto finals = list_chunk_artifacts(storage::finals_prefix(session_.session_id));
  if (!finals.ok()) {
    return error(ErrorKind::Storage, finals.error());
  }

  std::string assembled;
  for (const auto &ref : finals.value()) {
    auto content = deps_.store->get(ref.locator);
    if (!content.ok()) {
      return error(ErrorKind::Storage, content.error());
    }
    assembled += content.value();
  }

  const std::string basename = std::filesystem::path(session_.source).filename().string();
  auto final_locator =
      deps_.store->put(storage::final_document_key(session_.session_id, basename), assembled);
  if (!final_locator.ok()) {
    return error(ErrorKind::Storage, final_locator.error());
  }
  report.final_locator = final_locator.value();

  if (!codec_->requires_structural_reassembly()) {
    return std::nullopt;
  }

  auto encoded = codec_->encode(assembled, document_, basename);
  if (!encoded.ok()) {
    const auto degraded = error(ErrorKind::ReassemblyEncode, encoded.error());
    tracker_.add_warning(degraded.to_string());
    tracker_.set_structural_encode(false);
    observability::record_error("reassembly", degraded.to_string());
    return std::nullopt;
  }

  auto encoded_locator = deps_.store->put(
      storage::singleton_key(session_.session_id, encoded.value().name), encoded.value().bytes);
  if (!encoded_locator.ok()) {
    const auto degraded = error(ErrorKind::ReassemblyEncode, encoded_locator.error());
    tracker_.add_warning(degraded.to_string());
    tracker_.set_structural_encode(false);
    observability::record_error("reassembly", degraded.to_string());
    return std::nullopt;
  }
  report.encoded_locator = encoded_locator.value();
  tracker_.set_structural_encode(true);
  return std::nullopt;
}

} // namespace transloom::pipeline
