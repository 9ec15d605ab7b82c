#include "transloom/validation/agent_validator.hpp"

#include "transloom/common/fs.hpp"
#include "transloom/pipeline/prompts.hpp"

namespace transloom::validation {

namespace {

constexpr const char *ENTITY_INSTRUCTION =
    "You check translated text for terminology consistency. You get an entity dictionary "
    "(JSON: source term -> context and required translation) and a translated text. Find "
    "misspelled names, terms translated differently from the dictionary, terms that should have "
    "stayed untranslated, and terms used inconsistently. Answer with a JSON list of concrete "
    "edits, each naming the wrong text and its replacement. If nothing needs to change, answer "
    "with [] and nothing else.";

constexpr const char *STYLE_INSTRUCTION =
    "You check translated text against a style guide. You get the style guide and a translated "
    "text. Find passages whose tone, formality or wording breaks the guide. Answer with a JSON "
    "list of concrete edits, each naming the passage and its rewrite. If nothing needs to "
    "change, answer with [] and nothing else.";

constexpr const char *EDITOR_INSTRUCTION =
    "You are the final editor of a translation. Apply every entity edit and style edit you are "
    "given to the translated text, keep everything else as it is, and make sure the result "
    "reads correctly. Answer with the corrected text only.";

} // namespace

bool is_empty_edit_list(const std::string &edits) {
  std::string compact;
  for (const char ch : pipeline::strip_code_fence(edits)) {
    if (ch != ' ' && ch != '\n' && ch != '\t' && ch != '\r') {
      compact.push_back(ch);
    }
  }
  return compact == "[]";
}

AgentValidator::AgentValidator(std::shared_ptr<providers::Provider> provider,
                               std::shared_ptr<storage::ArtifactStore> store,
                               AgentValidatorOptions options)
    : provider_(std::move(provider)), store_(std::move(store)), options_(std::move(options)) {}

common::Result<std::string> AgentValidator::run_pass(const std::string &pass,
                                                     const std::string &instruction,
                                                     const std::string &message) const {
  auto response =
      provider_->chat_with_system(instruction, message, options_.model, options_.temperature);
  if (!response.ok()) {
    return common::Result<std::string>::failure(pass + " pass failed: " + response.error());
  }
  return response;
}

common::Result<std::string> AgentValidator::validate(const std::string &prompt_locator,
                                                     const std::string &translated_locator) {
  if (provider_ == nullptr || store_ == nullptr) {
    return common::Result<std::string>::failure("validator is not configured");
  }

  auto prompt = store_->get(prompt_locator);
  if (!prompt.ok()) {
    return common::Result<std::string>::failure("cannot read prompt: " + prompt.error());
  }
  auto translated = store_->get(translated_locator);
  if (!translated.ok()) {
    return common::Result<std::string>::failure("cannot read translation: " + translated.error());
  }

  const std::string entities =
      pipeline::extract_prompt_section(prompt.value(), pipeline::ENTITIES_HEADING,
                                       pipeline::SOURCE_HEADING)
          .value_or("{}");
  const std::string style = pipeline::extract_prompt_section(
                                prompt.value(), pipeline::STYLE_HEADING, pipeline::ENTITIES_HEADING)
                                .value_or("");

  auto entity_edits = run_pass("entity", ENTITY_INSTRUCTION,
                               "Entity dictionary:\n" + entities + "\n\nTranslated text:\n" +
                                   translated.value());
  if (!entity_edits.ok()) {
    return entity_edits;
  }
  auto style_edits = run_pass("style", STYLE_INSTRUCTION,
                              "Style guide:\n" + style + "\n\nTranslated text:\n" +
                                  translated.value());
  if (!style_edits.ok()) {
    return style_edits;
  }

  if (is_empty_edit_list(entity_edits.value()) && is_empty_edit_list(style_edits.value())) {
    return translated;
  }

  auto edited = run_pass("editor", EDITOR_INSTRUCTION,
                         "Entity edits:\n" + entity_edits.value() + "\n\nStyle edits:\n" +
                             style_edits.value() + "\n\nTranslated text:\n" + translated.value());
  if (!edited.ok()) {
    return edited;
  }
  if (common::trim(edited.value()).empty()) {
    return common::Result<std::string>::failure("editor pass returned no text");
  }
  return edited;
}

} // namespace transloom::validation
