#include "transloom/storage/artifact_keys.hpp"

#include "transloom/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace transloom::storage {

namespace {

std::string stage_key(const std::string &session, const char *dir, const char *file_prefix,
                      const std::size_t index) {
  return session + "/" + dir + "/" + sequence_name(file_prefix, index);
}

std::string stage_prefix(const std::string &session, const char *dir, const char *file_prefix) {
  return session + "/" + dir + "/" + file_prefix;
}

} // namespace

std::string singleton_key(const std::string &session, const std::string &name) {
  return session + "/" + name;
}

std::string sequence_name(const std::string &file_prefix, const std::size_t index) {
  char digits[32];
  std::snprintf(digits, sizeof(digits), "%04zu", index);
  return file_prefix + digits + ".txt";
}

std::string original_chunk_key(const std::string &session, const std::size_t index) {
  return stage_key(session, ORIGINAL_CHUNKS_DIR, ORIGINAL_CHUNK_PREFIX, index);
}

std::string prompt_key(const std::string &session, const std::size_t index) {
  return stage_key(session, PROMPTS_DIR, PROMPT_PREFIX, index);
}

std::string translated_key(const std::string &session, const std::size_t index) {
  return stage_key(session, TRANSLATED_DIR, TRANSLATED_PREFIX, index);
}

std::string final_key(const std::string &session, const std::size_t index) {
  return stage_key(session, TRANSLATED_DIR, FINAL_PREFIX, index);
}

std::string original_chunks_prefix(const std::string &session) {
  return stage_prefix(session, ORIGINAL_CHUNKS_DIR, ORIGINAL_CHUNK_PREFIX);
}

std::string prompts_prefix(const std::string &session) {
  return stage_prefix(session, PROMPTS_DIR, PROMPT_PREFIX);
}

std::string translated_prefix(const std::string &session) {
  return stage_prefix(session, TRANSLATED_DIR, TRANSLATED_PREFIX);
}

std::string finals_prefix(const std::string &session) {
  return stage_prefix(session, TRANSLATED_DIR, FINAL_PREFIX);
}

std::string translated_key_from_prompt(const std::string &prompt_key) {
  std::string key = common::replace_first(prompt_key, std::string("/") + PROMPTS_DIR + "/",
                                          std::string("/") + TRANSLATED_DIR + "/");
  return common::replace_first(std::move(key), "translation_prompt_", "translated_");
}

std::string final_key_from_translated(const std::string &translated_key) {
  const auto slash = translated_key.rfind('/');
  if (slash == std::string::npos) {
    return "final_" + translated_key;
  }
  return translated_key.substr(0, slash + 1) + "final_" + translated_key.substr(slash + 1);
}

std::string final_document_key(const std::string &session, const std::string &basename) {
  return singleton_key(session, "FINAL_" + basename);
}

std::optional<std::size_t> sequence_from_key(const std::string &key) {
  if (!common::ends_with(key, ".txt")) {
    return std::nullopt;
  }
  const std::size_t end = key.size() - 4;
  std::size_t begin = end;
  while (begin > 0 && std::isdigit(static_cast<unsigned char>(key[begin - 1])) != 0) {
    --begin;
  }
  if (begin == end || begin == 0 || key[begin - 1] != '_') {
    return std::nullopt;
  }
  std::size_t value = 0;
  const auto [ptr, ec] = std::from_chars(key.data() + begin, key.data() + end, value);
  if (ec != std::errc() || ptr != key.data() + end) {
    return std::nullopt;
  }
  return value;
}

} // namespace transloom::storage
