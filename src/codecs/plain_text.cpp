#include "transloom/codecs/plain_text.hpp"

#include "transloom/common/text.hpp"

namespace transloom::codecs {

common::Result<DocumentContent> PlainTextCodec::decode(const std::string &bytes) const {
  DocumentContent content;
  content.format = DocumentFormat::Plain;
  content.text = common::is_valid_utf8(bytes) ? bytes : common::latin1_to_utf8(bytes);
  return common::Result<DocumentContent>::success(std::move(content));
}

common::Result<EncodedDocument> PlainTextCodec::encode(const std::string &translated_text,
                                                       const DocumentContent &,
                                                       const std::string &source_name) const {
  return common::Result<EncodedDocument>::success(
      EncodedDocument{.name = source_name, .bytes = translated_text});
}

} // namespace transloom::codecs
