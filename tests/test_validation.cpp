#include "test_framework.hpp"

#include "transloom/pipeline/prompts.hpp"
#include "transloom/storage/artifact_keys.hpp"
#include "transloom/storage/memory_store.hpp"
#include "transloom/validation/agent_validator.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

namespace {

namespace p = transloom::pipeline;
namespace s = transloom::storage;
namespace v = transloom::validation;

struct Fixture {
  std::shared_ptr<transloom::testing::ScriptedProvider> provider =
      std::make_shared<transloom::testing::ScriptedProvider>();
  std::shared_ptr<s::MemoryArtifactStore> store = std::make_shared<s::MemoryArtifactStore>();
  std::string prompt_locator;
  std::string translated_locator;

  Fixture() {
    const std::string prompt = p::build_translation_prompt({.target_language = "French",
                                                            .style = "Use the formal vous.",
                                                            .entities = R"({"Ada": "Ada"})",
                                                            .chunk = "Ada says hello.",
                                                            .index = 1,
                                                            .total = 1});
    prompt_locator = store->put(s::prompt_key("v", 1), prompt).value();
    translated_locator = store->put(s::translated_key("v", 1), "Ada dit bonjour.").value();
  }

  [[nodiscard]] v::AgentValidator validator() const { return v::AgentValidator(provider, store); }
};

} // namespace

void register_validation_tests(std::vector<transloom::tests::TestCase> &tests) {
  using transloom::tests::require;

  tests.push_back({"validator_skips_editor_when_no_edits", [] {
                     Fixture f;
                     f.provider->queue_system_response("[]");
                     f.provider->queue_system_response("```json\n[ ]\n```");
                     auto validator = f.validator();
                     auto result = validator.validate(f.prompt_locator, f.translated_locator);
                     require(result.ok(), result.error());
                     require(result.value() == "Ada dit bonjour.", "translation returned unchanged");
                     require(f.provider->system_prompts().size() == 2, "editor pass skipped");
                   }});

  tests.push_back({"validator_passes_sections_from_prompt", [] {
                     Fixture f;
                     f.provider->queue_system_response("[]");
                     f.provider->queue_system_response("[]");
                     auto validator = f.validator();
                     require(validator.validate(f.prompt_locator, f.translated_locator).ok(),
                             "validate");
                     const auto messages = f.provider->messages();
                     require(messages.size() == 2, "two passes");
                     require(messages[0].find(R"({"Ada": "Ada"})") != std::string::npos,
                             "entity pass receives the entity dictionary");
                     require(messages[0].find("Ada dit bonjour.") != std::string::npos,
                             "entity pass receives the translation");
                     require(messages[1].find("Use the formal vous.") != std::string::npos,
                             "style pass receives the style guide");
                     const auto systems = f.provider->system_prompts();
                     require(systems[0].has_value() && systems[0]->find("terminology") !=
                                                          std::string::npos,
                             "entity pass has its own instruction");
                   }});

  tests.push_back({"validator_applies_editor_output", [] {
                     Fixture f;
                     f.provider->queue_system_response(R"([{"wrong": "Ada", "right": "Ada L."}])");
                     f.provider->queue_system_response("[]");
                     f.provider->queue_system_response("Ada L. dit bonjour.");
                     auto validator = f.validator();
                     auto result = validator.validate(f.prompt_locator, f.translated_locator);
                     require(result.ok(), result.error());
                     require(result.value() == "Ada L. dit bonjour.", "editor output returned");
                     const auto messages = f.provider->messages();
                     require(messages.size() == 3, "three passes");
                     require(messages[2].find("Entity edits:") != std::string::npos &&
                                 messages[2].find("Ada L.") != std::string::npos,
                             "editor receives the edit lists");
                   }});

  tests.push_back({"validator_reports_failed_pass", [] {
                     Fixture f;
                     f.provider->fail_call(2, "rate limited");
                     auto validator = f.validator();
                     auto result = validator.validate(f.prompt_locator, f.translated_locator);
                     require(!result.ok(), "failed pass fails validation");
                     require(result.error().find("style pass failed") != std::string::npos,
                             "error names the pass: " + result.error());
                     require(result.error().find("rate limited") != std::string::npos,
                             "error keeps the cause");
                   }});

  tests.push_back({"validator_rejects_empty_editor_output", [] {
                     Fixture f;
                     f.provider->queue_system_response("[\"fix\"]");
                     f.provider->queue_system_response("[]");
                     f.provider->queue_system_response("  \n ");
                     auto validator = f.validator();
                     auto result = validator.validate(f.prompt_locator, f.translated_locator);
                     require(!result.ok(), "empty editor output is a failure");
                   }});

  tests.push_back({"validator_missing_artifacts", [] {
                     Fixture f;
                     auto validator = f.validator();
                     auto result = validator.validate("mem://v/nothing.txt", f.translated_locator);
                     require(!result.ok() &&
                                 result.error().find("cannot read prompt") != std::string::npos,
                             "missing prompt");
                     result = validator.validate(f.prompt_locator, "mem://v/nothing.txt");
                     require(!result.ok() &&
                                 result.error().find("cannot read translation") != std::string::npos,
                             "missing translation");
                     require(f.provider->call_count() == 0, "no pass runs without inputs");

                     v::AgentValidator unconfigured(nullptr, f.store);
                     require(!unconfigured.validate(f.prompt_locator, f.translated_locator).ok(),
                             "validator without provider fails");
                   }});

  tests.push_back({"empty_edit_list_detection", [] {
                     require(v::is_empty_edit_list("[]"), "bare");
                     require(v::is_empty_edit_list("  [ ]\n"), "padded");
                     require(v::is_empty_edit_list("```json\n[]\n```"), "fenced");
                     require(!v::is_empty_edit_list("[{\"a\": 1}]"), "non-empty list");
                     require(!v::is_empty_edit_list("No changes needed."), "prose");
                   }});
}
