#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace transloom::config {

struct GenerationConfig {
  std::string provider = "google";
  std::string model = "gemini-2.5-flash";
  std::optional<std::string> api_key;
  double temperature = 1.0;
  std::uint32_t max_output_tokens = 8192;
  std::uint64_t timeout_ms = 300'000;
};

struct ValidationConfig {
  bool enabled = true;
  // Empty means "same as generation.provider".
  std::string provider;
  std::string model = "gemini-2.5-flash";
  double temperature = 0.2;
};

struct ChunkingConfig {
  std::size_t max_chunk_size = 30'000;
  // 0 keeps every chunk.
  std::size_t max_chunks = 0;
  std::size_t metadata_preview_size = 30'000;
};

struct PipelineConfig {
  std::size_t concurrency = 1;
  bool resume = false;
};

struct StorageConfig {
  std::string backend = "filesystem";
  std::string root = "~/.transloom/artifacts";
  std::string status_db = "~/.transloom/status.db";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  GenerationConfig generation;
  ValidationConfig validation;
  ChunkingConfig chunking;
  PipelineConfig pipeline;
  StorageConfig storage;
  ObservabilityConfig observability;
};

} // namespace transloom::config
