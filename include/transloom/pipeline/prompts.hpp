#pragma once

#include "transloom/codecs/codec.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace transloom::pipeline {

inline constexpr const char *STYLE_HEADING = "## 2. Style Guide";
inline constexpr const char *ENTITIES_HEADING = "## 3. Entity Dictionary (use these translations exactly)";
inline constexpr const char *SOURCE_HEADING = "## 4. Source Content";

[[nodiscard]] std::string entity_extraction_prompt(const std::string &target_language,
                                                   const std::string &document_preview);

[[nodiscard]] std::string style_extraction_prompt(const std::string &target_language,
                                                  const std::string &document_preview);

struct TranslationPromptInput {
  std::string target_language;
  codecs::DocumentFormat format = codecs::DocumentFormat::Plain;
  std::string style;
  std::string entities;
  std::string chunk;
  std::size_t index = 1;
  std::size_t total = 1;
};

[[nodiscard]] std::string build_translation_prompt(const TranslationPromptInput &input);

/// Text between the `start` heading line and the `end` heading line of a
/// translation prompt, trimmed. nullopt when `start` is missing.
[[nodiscard]] std::optional<std::string> extract_prompt_section(const std::string &prompt,
                                                                const std::string &start,
                                                                const std::string &end);

[[nodiscard]] std::string strip_code_fence(const std::string &text);

} // namespace transloom::pipeline
