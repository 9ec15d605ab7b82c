#pragma once

#include <cstddef>
#include <string>

namespace transloom::common {

[[nodiscard]] bool is_valid_utf8(const std::string &bytes);

[[nodiscard]] std::string latin1_to_utf8(const std::string &bytes);

/// Largest position <= pos that does not fall inside a multi-byte sequence.
[[nodiscard]] std::size_t utf8_floor(const std::string &text, std::size_t pos);

[[nodiscard]] std::string utf8_prefix(const std::string &text, std::size_t max_bytes);

} // namespace transloom::common
