#include "transloom/pipeline/prompts.hpp"

#include "transloom/common/fs.hpp"

#include <sstream>

namespace transloom::pipeline {

std::string entity_extraction_prompt(const std::string &target_language,
                                     const std::string &document_preview) {
  std::ostringstream out;
  out << "Read the document below and list every term that has to be translated the same way "
         "everywhere when the document is translated into "
      << target_language << ".\n\n"
      << "Terms to list:\n"
      << "* Names of people, places and organizations.\n"
      << "* Technical terms and domain vocabulary.\n"
      << "* Product names, brands and trademarks.\n"
      << "* Acronyms and abbreviations.\n\n"
      << "Answer with a JSON object and nothing else. Each key is the term exactly as it "
         "appears in the document. Each value is an object with two fields:\n"
      << "  \"context\": one sentence on how the term is used,\n"
      << "  \"suggested_translation\": the translation to use, written in " << target_language
      << ".\n\n"
      << "Document:\n"
      << document_preview << "\n";
  return out.str();
}

std::string style_extraction_prompt(const std::string &target_language,
                                    const std::string &document_preview) {
  std::ostringstream out;
  out << "Read the document below and write a style guide for translating it into "
      << target_language << ".\n\n"
      << "Cover:\n"
      << "* Tone and voice: how formal the text is and the register it uses.\n"
      << "* Audience: who reads it and what they already know.\n"
      << "* Conventions: formatting, capitalization and structure the translation must keep.\n"
      << "* Cultural notes: idioms, references or sensitive points to adapt for "
      << target_language << " readers.\n\n"
      << "Document:\n"
      << document_preview << "\n\n"
      << "Write instructions a translator can follow directly.\n";
  return out.str();
}

std::string build_translation_prompt(const TranslationPromptInput &input) {
  std::ostringstream out;
  out << "# Translation Task\n\n"
      << "Translate the source content into " << input.target_language
      << " and keep its original format. Follow the style guide and use the entity "
         "dictionary translations exactly.\n\n"
      << "## 1. Context\n"
      << "This is part " << input.index << " of " << input.total << " of the document.\n"
      << "Document type: " << codecs::format_instruction(input.format) << "\n\n"
      << STYLE_HEADING << "\n"
      << input.style << "\n\n"
      << ENTITIES_HEADING << "\n"
      << input.entities << "\n\n"
      << SOURCE_HEADING << "\n"
      << "---\n"
      << input.chunk << "\n"
      << "---\n\n"
      << "Return ONLY the translated text, formatted exactly like the source. Do not add a "
         "preamble or explanations.\n";
  return out.str();
}

std::optional<std::string> extract_prompt_section(const std::string &prompt,
                                                  const std::string &start,
                                                  const std::string &end) {
  const auto start_pos = prompt.find(start + "\n");
  if (start_pos == std::string::npos) {
    return std::nullopt;
  }
  const auto body_start = start_pos + start.size() + 1;
  const auto end_pos = prompt.find("\n" + end + "\n", body_start);
  const auto length = end_pos == std::string::npos ? std::string::npos : end_pos - body_start;
  return common::trim(prompt.substr(body_start, length));
}

std::string strip_code_fence(const std::string &text) {
  std::string trimmed = common::trim(text);
  if (!common::starts_with(trimmed, "```") || !common::ends_with(trimmed, "```") ||
      trimmed.size() < 6) {
    return trimmed;
  }
  const auto first_newline = trimmed.find('\n');
  if (first_newline == std::string::npos) {
    return trimmed;
  }
  return common::trim(trimmed.substr(first_newline + 1, trimmed.size() - 3 - first_newline - 1));
}

} // namespace transloom::pipeline
