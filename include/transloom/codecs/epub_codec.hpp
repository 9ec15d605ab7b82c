#pragma once

#include "transloom/codecs/codec.hpp"

namespace transloom::codecs {

/// EPUB containers. Decoding keeps the body markup of every spine document.
/// Encoding does not rebuild the container: the translated markup is written
/// out as a flat `assembled_<stem>.txt` artifact.
class EpubCodec final : public DocumentCodec {
public:
  [[nodiscard]] DocumentFormat format() const override { return DocumentFormat::Ebook; }
  [[nodiscard]] common::Result<DocumentContent> decode(const std::string &bytes) const override;
  [[nodiscard]] common::Result<EncodedDocument> encode(const std::string &translated_text,
                                                       const DocumentContent &original,
                                                       const std::string &source_name) const override;
  [[nodiscard]] bool requires_structural_reassembly() const override { return true; }
};

} // namespace transloom::codecs
