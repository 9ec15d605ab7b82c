#pragma once

#include "transloom/providers/traits.hpp"
#include "transloom/storage/artifact_store.hpp"
#include "transloom/validation/validator.hpp"

#include <memory>
#include <string>

namespace transloom::validation {

struct AgentValidatorOptions {
  std::string model = "gemini-2.5-flash";
  double temperature = 0.2;
};

/// Three model passes: entity check, style check, then an editor pass that
/// applies both edit lists. The editor is skipped when neither check found
/// anything to change.
class AgentValidator final : public Validator {
public:
  AgentValidator(std::shared_ptr<providers::Provider> provider,
                 std::shared_ptr<storage::ArtifactStore> store, AgentValidatorOptions options = {});

  [[nodiscard]] common::Result<std::string>
  validate(const std::string &prompt_locator, const std::string &translated_locator) override;

  [[nodiscard]] std::string name() const override { return "agent"; }

private:
  [[nodiscard]] common::Result<std::string> run_pass(const std::string &pass,
                                                     const std::string &instruction,
                                                     const std::string &message) const;

  std::shared_ptr<providers::Provider> provider_;
  std::shared_ptr<storage::ArtifactStore> store_;
  AgentValidatorOptions options_;
};

[[nodiscard]] bool is_empty_edit_list(const std::string &edits);

} // namespace transloom::validation
