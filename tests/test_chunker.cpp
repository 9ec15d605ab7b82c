#include "test_framework.hpp"

#include "transloom/chunking/chunker.hpp"
#include "transloom/common/text.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <random>
#include <string>

namespace {

namespace ch = transloom::chunking;

std::string concat(const std::vector<ch::TextChunk> &chunks) {
  std::string out;
  for (const auto &chunk : chunks) {
    out += chunk.content;
  }
  return out;
}

std::string random_text(std::mt19937 &rng, const std::size_t length) {
  static const std::vector<std::string> pieces = {"a", "b", "word", " ", " ", ". ", "\n",
                                                  "\n\n", "! ", "?\n", "\xC3\xA9", "\xE6\x97\xA5"};
  std::uniform_int_distribution<std::size_t> pick(0, pieces.size() - 1);
  std::string out;
  while (out.size() < length) {
    out += pieces[pick(rng)];
  }
  return out;
}

} // namespace

void register_chunker_tests(std::vector<transloom::tests::TestCase> &tests) {
  using transloom::tests::require;

  tests.push_back({"chunker_zero_size_fails", [] {
                     auto result = ch::chunk_text("some text", 0);
                     require(!result.ok(), "zero max size should fail");
                     require(result.error().find("greater than zero") != std::string::npos,
                             "error should explain the size problem");
                   }});

  tests.push_back({"chunker_short_text_single_chunk", [] {
                     const std::string text = "A short paragraph.\n\nAnd another one. ";
                     auto result = ch::chunk_text(text, text.size());
                     require(result.ok(), result.error());
                     require(result.value().size() == 1, "expected one chunk");
                     const auto &chunk = result.value().front();
                     require(chunk.content == text, "single chunk must be the unmodified text");
                     require(chunk.index == 1, "chunk index should be 1-based");
                     require(chunk.boundary == ch::BoundaryKind::EndOfText, "wrong boundary");
                   }});

  tests.push_back({"chunker_empty_text_single_empty_chunk", [] {
                     auto result = ch::chunk_text("", 10);
                     require(result.ok(), result.error());
                     require(result.value().size() == 1, "expected one chunk");
                     require(result.value().front().content.empty(), "chunk should be empty");
                   }});

  tests.push_back({"chunker_prefers_paragraph_over_line", [] {
                     const std::string text =
                         std::string(72, 'a') + "\n\n" + std::string(10, 'b') + "\n" +
                         std::string(100, 'c');
                     auto result = ch::chunk_text(text, 100);
                     require(result.ok(), result.error());
                     const auto &first = result.value().front();
                     require(first.end_offset == 74, "should cut right after the blank line");
                     require(first.boundary == ch::BoundaryKind::Paragraph, "wrong boundary kind");
                   }});

  tests.push_back({"chunker_prefers_paragraph_over_later_sentence", [] {
                     const std::string text = std::string(75, 'a') + "\n\n" +
                                              std::string(10, 'b') + ". " + "c c c" +
                                              std::string(100, 'd');
                     auto result = ch::chunk_text(text, 100);
                     require(result.ok(), result.error());
                     require(result.value().front().end_offset == 77,
                             "paragraph break should win over sentence and space");
                   }});

  tests.push_back({"chunker_line_then_sentence_then_word", [] {
                     {
                       const std::string text = std::string(75, 'a') + "\n" +
                                                std::string(10, 'b') + ". " +
                                                std::string(100, 'c');
                       auto result = ch::chunk_text(text, 100);
                       require(result.ok(), result.error());
                       require(result.value().front().end_offset == 76, "line cut");
                       require(result.value().front().boundary == ch::BoundaryKind::Line,
                               "line boundary");
                     }
                     {
                       const std::string text =
                           std::string(80, 'a') + ". " + std::string(100, 'b');
                       auto result = ch::chunk_text(text, 100);
                       require(result.ok(), result.error());
                       require(result.value().front().end_offset == 82,
                               "cut after the two-character terminator");
                       require(result.value().front().boundary == ch::BoundaryKind::Sentence,
                               "sentence boundary");
                     }
                     {
                       const std::string text =
                           std::string(80, 'a') + "?\n" + std::string(100, 'b');
                       auto result = ch::chunk_text(text, 100);
                       require(result.ok(), result.error());
                       require(result.value().front().end_offset == 82,
                               "newline cut after question mark");
                     }
                     {
                       const std::string text = std::string(80, 'a') + " " + std::string(100, 'b');
                       auto result = ch::chunk_text(text, 100);
                       require(result.ok(), result.error());
                       require(result.value().front().end_offset == 81, "word cut");
                       require(result.value().front().boundary == ch::BoundaryKind::Word,
                               "word boundary");
                     }
                   }});

  tests.push_back({"chunker_ignores_breaks_below_floor", [] {
                     const std::string text = std::string(10, 'a') + "\n\n" + std::string(200, 'b');
                     auto result = ch::chunk_text(text, 100);
                     require(result.ok(), result.error());
                     const auto &first = result.value().front();
                     require(first.end_offset == 100, "early break should not be used");
                     require(first.boundary == ch::BoundaryKind::HardCut, "expected a hard cut");
                   }});

  tests.push_back({"chunker_hard_cut_keeps_utf8_intact", [] {
                     std::string text;
                     for (int i = 0; i < 50; ++i) {
                       text += "\xC3\xA9";
                     }
                     auto result = ch::chunk_text(text, 5);
                     require(result.ok(), result.error());
                     for (const auto &chunk : result.value()) {
                       require(chunk.content.size() <= 5, "chunk exceeds max size");
                       require(transloom::common::is_valid_utf8(chunk.content),
                               "hard cut split a code point");
                     }
                     require(concat(result.value()) == text, "hard cuts must be lossless");
                   }});

  tests.push_back({"chunker_lossless_and_bounded_random", [] {
                     std::mt19937 rng(20240611);
                     std::uniform_int_distribution<std::size_t> length(0, 4000);
                     std::uniform_int_distribution<std::size_t> max_size(1, 600);
                     for (int round = 0; round < 200; ++round) {
                       const std::string text = random_text(rng, length(rng));
                       const std::size_t limit = max_size(rng);
                       auto result = ch::chunk_text(text, limit);
                       require(result.ok(), result.error());
                       const auto &chunks = result.value();
                       require(concat(chunks) == text, "concatenation must equal the input");

                       std::size_t expected_start = 0;
                       for (std::size_t i = 0; i < chunks.size(); ++i) {
                         require(chunks[i].index == i + 1, "indices must be 1..n");
                         require(chunks[i].start_offset == expected_start, "gap between chunks");
                         require(chunks[i].content.size() <= limit, "chunk exceeds max size");
                         require(!chunks[i].content.empty() || text.empty(),
                                 "only an empty input yields an empty chunk");
                         expected_start = chunks[i].end_offset;
                       }
                       require(expected_start == text.size(), "chunks must cover the input");
                     }
                   }});

  tests.push_back({"chunker_paragraph_document_scenario", [] {
                     const std::string text = transloom::testing::paragraph_text(100'000, 2'000);
                     require(text.size() == 100'000, "fixture size");
                     auto result = ch::chunk_text(text, 30'000);
                     require(result.ok(), result.error());
                     const auto &chunks = result.value();
                     require(chunks.size() == 4, "expected 4 chunks, got " +
                                                     std::to_string(chunks.size()));
                     for (std::size_t i = 0; i + 1 < chunks.size(); ++i) {
                       const auto size = chunks[i].content.size();
                       require(size >= 21'000 && size <= 30'000,
                               "chunk " + std::to_string(i + 1) + " has size " +
                                   std::to_string(size));
                       require(chunks[i].boundary == ch::BoundaryKind::Paragraph,
                               "chunk should end at a paragraph break");
                       require(chunks[i].content.size() >= 2 &&
                                   chunks[i].content.substr(chunks[i].content.size() - 2) == "\n\n",
                               "chunk should end right after a blank line");
                     }
                     require(chunks.back().content.substr(chunks.back().content.size() - 2) ==
                                 "\n\n",
                             "last chunk ends with the document's final paragraph break");
                     require(concat(chunks) == text, "scenario must be lossless");
                   }});

  tests.push_back({"chunker_boundary_kind_names", [] {
                     require(ch::boundary_kind_name(ch::BoundaryKind::Paragraph) == "paragraph",
                             "paragraph");
                     require(ch::boundary_kind_name(ch::BoundaryKind::HardCut) == "hard_cut",
                             "hard_cut");
                     require(ch::boundary_kind_name(ch::BoundaryKind::EndOfText) == "end", "end");
                   }});
}
