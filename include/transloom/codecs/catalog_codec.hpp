#pragma once

#include "transloom/codecs/codec.hpp"

namespace transloom::codecs {

class CatalogCodec final : public DocumentCodec {
public:
  explicit CatalogCodec(RenderOptions options = {}) : options_(options) {}

  [[nodiscard]] DocumentFormat format() const override { return DocumentFormat::Catalog; }
  [[nodiscard]] common::Result<DocumentContent> decode(const std::string &bytes) const override;
  [[nodiscard]] common::Result<EncodedDocument> encode(const std::string &translated_text,
                                                       const DocumentContent &original,
                                                       const std::string &source_name) const override;
  [[nodiscard]] bool requires_structural_reassembly() const override { return true; }

private:
  RenderOptions options_;
};

} // namespace transloom::codecs
