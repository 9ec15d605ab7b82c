#pragma once

#include "transloom/common/result.hpp"

#include <string>

namespace transloom::validation {

class Validator {
public:
  virtual ~Validator() = default;

  [[nodiscard]] virtual common::Result<std::string>
  validate(const std::string &prompt_locator, const std::string &translated_locator) = 0;

  [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace transloom::validation
