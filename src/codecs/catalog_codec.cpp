#include "transloom/codecs/catalog_codec.hpp"

#include "transloom/common/text.hpp"

namespace transloom::codecs {

common::Result<DocumentContent> CatalogCodec::decode(const std::string &bytes) const {
  const std::string text = common::is_valid_utf8(bytes) ? bytes : common::latin1_to_utf8(bytes);
  auto catalog = parse_po(text);
  if (catalog.entries.empty()) {
    return common::Result<DocumentContent>::failure("PO catalog has no entries");
  }

  DocumentContent content;
  content.format = DocumentFormat::Catalog;
  content.text = render_catalog(catalog, options_);
  content.metadata = CatalogMetadata{.catalog = std::move(catalog)};
  return common::Result<DocumentContent>::success(std::move(content));
}

common::Result<EncodedDocument> CatalogCodec::encode(const std::string &translated_text,
                                                     const DocumentContent &original,
                                                     const std::string &source_name) const {
  const auto *metadata = std::get_if<CatalogMetadata>(&original.metadata);
  if (metadata == nullptr) {
    return common::Result<EncodedDocument>::failure("original document carries no PO catalog");
  }

  PoCatalog catalog = metadata->catalog;
  apply_translated_projection(catalog, translated_text);
  return common::Result<EncodedDocument>::success(
      EncodedDocument{.name = "assembled_" + source_name, .bytes = serialize_po(catalog)});
}

} // namespace transloom::codecs
