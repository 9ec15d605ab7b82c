#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace transloom::storage {

inline constexpr const char *ENTITY_EXTRACTION_NAME = "entity_extraction.txt";
inline constexpr const char *STYLE_INSTRUCTIONS_NAME = "style_instructions.txt";

inline constexpr const char *ORIGINAL_CHUNKS_DIR = "original_chunks";
inline constexpr const char *PROMPTS_DIR = "prompts_for_translation";
inline constexpr const char *TRANSLATED_DIR = "translated_chunks";

inline constexpr const char *ORIGINAL_CHUNK_PREFIX = "original_chunk_";
inline constexpr const char *PROMPT_PREFIX = "translation_prompt_chunk_";
inline constexpr const char *TRANSLATED_PREFIX = "translated_chunk_";
inline constexpr const char *FINAL_PREFIX = "final_translated_chunk_";

[[nodiscard]] std::string singleton_key(const std::string &session, const std::string &name);

/// Zero-padded to four digits: original_chunk_0007.txt
[[nodiscard]] std::string sequence_name(const std::string &file_prefix, std::size_t index);

[[nodiscard]] std::string original_chunk_key(const std::string &session, std::size_t index);
[[nodiscard]] std::string prompt_key(const std::string &session, std::size_t index);
[[nodiscard]] std::string translated_key(const std::string &session, std::size_t index);
[[nodiscard]] std::string final_key(const std::string &session, std::size_t index);

[[nodiscard]] std::string original_chunks_prefix(const std::string &session);
[[nodiscard]] std::string prompts_prefix(const std::string &session);
[[nodiscard]] std::string translated_prefix(const std::string &session);
[[nodiscard]] std::string finals_prefix(const std::string &session);

/// prompts_for_translation/translation_prompt_chunk_N.txt -> translated_chunks/translated_chunk_N.txt
[[nodiscard]] std::string translated_key_from_prompt(const std::string &prompt_key);

/// translated_chunks/translated_chunk_N.txt -> translated_chunks/final_translated_chunk_N.txt
[[nodiscard]] std::string final_key_from_translated(const std::string &translated_key);

[[nodiscard]] std::string final_document_key(const std::string &session,
                                             const std::string &basename);

[[nodiscard]] std::optional<std::size_t> sequence_from_key(const std::string &key);

} // namespace transloom::storage
