#include "transloom/codecs/codec.hpp"

namespace transloom::codecs {

std::string_view format_name(const DocumentFormat format) {
  switch (format) {
  case DocumentFormat::Plain:
    return "plain";
  case DocumentFormat::Catalog:
    return "catalog";
  case DocumentFormat::Ebook:
    return "ebook";
  }
  return "unknown";
}

std::string_view format_instruction(const DocumentFormat format) {
  switch (format) {
  case DocumentFormat::Plain:
    return "Plain text document. Keep the paragraph structure and line breaks as they are.";
  case DocumentFormat::Catalog:
    return "gettext PO catalog rendered as text. Keep every entry header, the Context, "
           "Original, Plural and Translation labels, and formatting markers such as %s or "
           "{name} exactly as written. Translate only the text under Translation.";
  case DocumentFormat::Ebook:
    return "EPUB book content in HTML. Keep every HTML tag, attribute and the document "
           "structure untouched, do not escape HTML entities, and translate only the text "
           "between tags such as <p>, <h1>, <div>, <em> and <strong>.";
  }
  return "";
}

} // namespace transloom::codecs
