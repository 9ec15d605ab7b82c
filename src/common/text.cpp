#include "transloom/common/text.hpp"

namespace transloom::common {

namespace {

bool is_continuation(const unsigned char byte) { return (byte & 0xC0U) == 0x80U; }

std::size_t sequence_length(const unsigned char lead) {
  if (lead < 0x80U) {
    return 1;
  }
  if ((lead & 0xE0U) == 0xC0U) {
    return lead >= 0xC2U ? 2 : 0;
  }
  if ((lead & 0xF0U) == 0xE0U) {
    return 3;
  }
  if ((lead & 0xF8U) == 0xF0U) {
    return lead <= 0xF4U ? 4 : 0;
  }
  return 0;
}

} // namespace

bool is_valid_utf8(const std::string &bytes) {
  std::size_t i = 0;
  while (i < bytes.size()) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    const std::size_t length = sequence_length(lead);
    if (length == 0 || i + length > bytes.size()) {
      return false;
    }
    for (std::size_t k = 1; k < length; ++k) {
      if (!is_continuation(static_cast<unsigned char>(bytes[i + k]))) {
        return false;
      }
    }
    if (length == 3) {
      const auto second = static_cast<unsigned char>(bytes[i + 1]);
      if ((lead == 0xE0U && second < 0xA0U) || (lead == 0xEDU && second >= 0xA0U)) {
        return false;
      }
    } else if (length == 4) {
      const auto second = static_cast<unsigned char>(bytes[i + 1]);
      if ((lead == 0xF0U && second < 0x90U) || (lead == 0xF4U && second >= 0x90U)) {
        return false;
      }
    }
    i += length;
  }
  return true;
}

std::string latin1_to_utf8(const std::string &bytes) {
  std::string out;
  out.reserve(bytes.size() + bytes.size() / 4);
  for (const char ch : bytes) {
    const auto byte = static_cast<unsigned char>(ch);
    if (byte < 0x80U) {
      out.push_back(ch);
      continue;
    }
    out.push_back(static_cast<char>(0xC0U | (byte >> 6U)));
    out.push_back(static_cast<char>(0x80U | (byte & 0x3FU)));
  }
  return out;
}

std::size_t utf8_floor(const std::string &text, std::size_t pos) {
  if (pos >= text.size()) {
    return text.size();
  }
  while (pos > 0 && is_continuation(static_cast<unsigned char>(text[pos]))) {
    --pos;
  }
  return pos;
}

std::string utf8_prefix(const std::string &text, const std::size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  return text.substr(0, utf8_floor(text, max_bytes));
}

} // namespace transloom::common
