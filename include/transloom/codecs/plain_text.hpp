#pragma once

#include "transloom/codecs/codec.hpp"

namespace transloom::codecs {

class PlainTextCodec final : public DocumentCodec {
public:
  [[nodiscard]] DocumentFormat format() const override { return DocumentFormat::Plain; }
  [[nodiscard]] common::Result<DocumentContent> decode(const std::string &bytes) const override;
  [[nodiscard]] common::Result<EncodedDocument> encode(const std::string &translated_text,
                                                       const DocumentContent &original,
                                                       const std::string &source_name) const override;
  [[nodiscard]] bool requires_structural_reassembly() const override { return false; }
};

} // namespace transloom::codecs
