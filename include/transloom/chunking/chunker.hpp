#pragma once

#include "transloom/common/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace transloom::chunking {

inline constexpr std::size_t DEFAULT_MAX_CHUNK_SIZE = 30'000;

inline constexpr double BOUNDARY_FLOOR_RATIO = 0.7;

enum class BoundaryKind {
  Paragraph,
  Line,
  Sentence,
  Word,
  HardCut,
  EndOfText,
};

struct TextChunk {
  std::size_t index = 0; // 1-based
  std::string content;
  std::size_t start_offset = 0;
  std::size_t end_offset = 0;
  BoundaryKind boundary = BoundaryKind::EndOfText;
};

/// Splits text into consecutive spans of at most max_chunk_size bytes.
/// Concatenating the returned contents in order reproduces `text` exactly.
/// Fails only when max_chunk_size is zero.
[[nodiscard]] common::Result<std::vector<TextChunk>>
chunk_text(std::string_view text, std::size_t max_chunk_size = DEFAULT_MAX_CHUNK_SIZE);

[[nodiscard]] std::string_view boundary_kind_name(BoundaryKind kind);

} // namespace transloom::chunking
