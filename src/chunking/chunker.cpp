#include "transloom/chunking/chunker.hpp"

#include <array>

namespace transloom::chunking {

namespace {

struct Boundary {
  std::size_t end = 0;
  BoundaryKind kind = BoundaryKind::HardCut;
};

// Position of the last `pattern` inside window that starts at or after floor.
std::size_t last_at_or_after(const std::string_view window, const std::string_view pattern,
                             const std::size_t floor) {
  const auto pos = window.rfind(pattern);
  if (pos == std::string_view::npos || pos < floor) {
    return std::string_view::npos;
  }
  return pos;
}

bool is_continuation_byte(const char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0U) == 0x80U;
}

Boundary find_boundary(const std::string_view text, const std::size_t start,
                       const std::size_t max_size) {
  const std::size_t ideal_end = start + max_size;
  if (ideal_end >= text.size()) {
    return {.end = text.size(), .kind = BoundaryKind::EndOfText};
  }

  const std::string_view window = text.substr(start, max_size);
  const auto floor = static_cast<std::size_t>(static_cast<double>(max_size) * BOUNDARY_FLOOR_RATIO);

  if (const auto pos = last_at_or_after(window, "\n\n", floor); pos != std::string_view::npos) {
    return {.end = start + pos + 2, .kind = BoundaryKind::Paragraph};
  }
  if (const auto pos = last_at_or_after(window, "\n", floor); pos != std::string_view::npos) {
    return {.end = start + pos + 1, .kind = BoundaryKind::Line};
  }

  static constexpr std::array<std::string_view, 6> terminators = {". ",  "! ",  "? ",
                                                                   ".\n", "!\n", "?\n"};
  std::size_t best = std::string_view::npos;
  for (const auto terminator : terminators) {
    const auto pos = last_at_or_after(window, terminator, floor);
    if (pos != std::string_view::npos && (best == std::string_view::npos || pos > best)) {
      best = pos;
    }
  }
  if (best != std::string_view::npos) {
    return {.end = start + best + 2, .kind = BoundaryKind::Sentence};
  }

  if (const auto pos = last_at_or_after(window, " ", floor); pos != std::string_view::npos) {
    return {.end = start + pos + 1, .kind = BoundaryKind::Word};
  }

  // Hard cut. Step back off a UTF-8 continuation byte unless that would empty the chunk.
  std::size_t end = ideal_end;
  while (end > start + 1 && is_continuation_byte(text[end])) {
    --end;
  }
  if (is_continuation_byte(text[end])) {
    end = ideal_end;
  }
  return {.end = end, .kind = BoundaryKind::HardCut};
}

} // namespace

common::Result<std::vector<TextChunk>> chunk_text(const std::string_view text,
                                                  const std::size_t max_chunk_size) {
  if (max_chunk_size == 0) {
    return common::Result<std::vector<TextChunk>>::failure(
        "max chunk size must be greater than zero");
  }

  std::vector<TextChunk> chunks;
  if (text.size() <= max_chunk_size) {
    chunks.push_back(TextChunk{.index = 1,
                               .content = std::string(text),
                               .start_offset = 0,
                               .end_offset = text.size(),
                               .boundary = BoundaryKind::EndOfText});
    return common::Result<std::vector<TextChunk>>::success(std::move(chunks));
  }

  std::size_t position = 0;
  while (position < text.size()) {
    const Boundary boundary = find_boundary(text, position, max_chunk_size);
    chunks.push_back(TextChunk{.index = chunks.size() + 1,
                               .content = std::string(text.substr(position, boundary.end - position)),
                               .start_offset = position,
                               .end_offset = boundary.end,
                               .boundary = boundary.kind});
    position = boundary.end;
  }

  return common::Result<std::vector<TextChunk>>::success(std::move(chunks));
}

std::string_view boundary_kind_name(const BoundaryKind kind) {
  switch (kind) {
  case BoundaryKind::Paragraph:
    return "paragraph";
  case BoundaryKind::Line:
    return "line";
  case BoundaryKind::Sentence:
    return "sentence";
  case BoundaryKind::Word:
    return "word";
  case BoundaryKind::HardCut:
    return "hard_cut";
  case BoundaryKind::EndOfText:
    return "end";
  }
  return "unknown";
}

} // namespace transloom::chunking
