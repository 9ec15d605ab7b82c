#include "bench_common.hpp"

#include "transloom/chunking/chunker.hpp"
#include "transloom/pipeline/prompts.hpp"

namespace {

std::string novel_text(const std::size_t bytes) {
  const std::string paragraph =
      "The lamplighter crossed the square twice each evening. Nobody asked why.\n"
      "He kept a ledger of the flames, one line per lantern, and signed it at dawn.\n\n";
  std::string text;
  text.reserve(bytes + paragraph.size());
  while (text.size() < bytes) {
    text += paragraph;
  }
  return text;
}

} // namespace

void run_chunker_benchmarks() {
  const std::string text = novel_text(1'000'000);
  transloom::bench::run_bench("chunk_1mb_default", 50, [&] {
    (void)transloom::chunking::chunk_text(text, 30'000);
  });
  transloom::bench::run_bench("chunk_1mb_small", 50, [&] {
    (void)transloom::chunking::chunk_text(text, 2'000);
  });

  // No whitespace at all forces a hard cut for every chunk.
  const std::string dense(1'000'000, 'x');
  transloom::bench::run_bench("chunk_1mb_hard_cut", 50, [&] {
    (void)transloom::chunking::chunk_text(dense, 30'000);
  });

  const auto chunks = transloom::chunking::chunk_text(text, 30'000).value();
  transloom::bench::run_bench("translation_prompts", 20, [&] {
    for (const auto &chunk : chunks) {
      (void)transloom::pipeline::build_translation_prompt({.target_language = "French",
                                                           .style = "Formal register.",
                                                           .entities = "{}",
                                                           .chunk = chunk.content,
                                                           .index = chunk.index,
                                                           .total = chunks.size()});
    }
  });
}
