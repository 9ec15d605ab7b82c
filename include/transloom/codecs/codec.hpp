#pragma once

#include "transloom/codecs/po_catalog.hpp"
#include "transloom/common/result.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace transloom::codecs {

enum class DocumentFormat {
  Plain,
  Catalog,
  Ebook,
};

struct CatalogMetadata {
  PoCatalog catalog;
};

struct EbookMetadata {
  std::string title = "Unknown";
  std::string author = "Unknown";
  // Archive paths of the content documents in reading order.
  std::vector<std::string> spine;
  std::vector<std::string> skipped;
};

using DocumentMetadata = std::variant<std::monostate, CatalogMetadata, EbookMetadata>;

struct DocumentContent {
  std::string text;
  DocumentFormat format = DocumentFormat::Plain;
  DocumentMetadata metadata;
};

struct EncodedDocument {
  std::string name;
  std::string bytes;
};

class DocumentCodec {
public:
  virtual ~DocumentCodec() = default;

  [[nodiscard]] virtual DocumentFormat format() const = 0;
  [[nodiscard]] virtual common::Result<DocumentContent> decode(const std::string &bytes) const = 0;

  [[nodiscard]] virtual common::Result<EncodedDocument>
  encode(const std::string &translated_text, const DocumentContent &original,
         const std::string &source_name) const = 0;

  [[nodiscard]] virtual bool requires_structural_reassembly() const = 0;
};

[[nodiscard]] std::string_view format_name(DocumentFormat format);

[[nodiscard]] std::string_view format_instruction(DocumentFormat format);

} // namespace transloom::codecs
