#pragma once

#include "transloom/common/result.hpp"

#include <cstddef>
#include <string>

namespace transloom::common {

[[nodiscard]] std::string sha256_hex(const std::string &data);

[[nodiscard]] Result<std::string> random_hex(std::size_t bytes);

} // namespace transloom::common
