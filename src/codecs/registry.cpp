#include "transloom/codecs/registry.hpp"

#include "transloom/codecs/catalog_codec.hpp"
#include "transloom/codecs/epub_codec.hpp"
#include "transloom/codecs/plain_text.hpp"
#include "transloom/common/fs.hpp"

namespace transloom::codecs {

namespace {

std::size_t slot(const DocumentFormat format) { return static_cast<std::size_t>(format); }

} // namespace

common::Result<DocumentFormat> detect_format(const std::filesystem::path &path) {
  const std::string extension = common::to_lower(path.extension().string());
  if (extension == ".txt") {
    return common::Result<DocumentFormat>::success(DocumentFormat::Plain);
  }
  if (extension == ".po") {
    return common::Result<DocumentFormat>::success(DocumentFormat::Catalog);
  }
  if (extension == ".epub") {
    return common::Result<DocumentFormat>::success(DocumentFormat::Ebook);
  }
  return common::Result<DocumentFormat>::failure("unsupported file type '" + extension +
                                                 "' (supported: .txt, .po, .epub)");
}

CodecRegistry CodecRegistry::with_default_codecs() {
  CodecRegistry registry;
  registry.register_codec(std::make_shared<PlainTextCodec>());
  registry.register_codec(std::make_shared<CatalogCodec>());
  registry.register_codec(std::make_shared<EpubCodec>());
  return registry;
}

void CodecRegistry::register_codec(std::shared_ptr<const DocumentCodec> codec) {
  if (codec == nullptr) {
    return;
  }
  const auto index = slot(codec->format());
  codecs_[index] = std::move(codec);
}

common::Result<std::shared_ptr<const DocumentCodec>>
CodecRegistry::codec_for(const DocumentFormat format) const {
  const auto &codec = codecs_[slot(format)];
  if (codec == nullptr) {
    return common::Result<std::shared_ptr<const DocumentCodec>>::failure(
        "no codec registered for format " + std::string(format_name(format)));
  }
  return common::Result<std::shared_ptr<const DocumentCodec>>::success(codec);
}

common::Result<DocumentContent> CodecRegistry::decode(const DocumentFormat format,
                                                      const std::string &bytes) const {
  auto codec = codec_for(format);
  if (!codec.ok()) {
    return common::Result<DocumentContent>::failure(codec.error());
  }
  return codec.value()->decode(bytes);
}

} // namespace transloom::codecs
