#pragma once

#include "transloom/codecs/codec.hpp"
#include "transloom/common/result.hpp"

#include <array>
#include <filesystem>
#include <memory>

namespace transloom::codecs {

[[nodiscard]] common::Result<DocumentFormat> detect_format(const std::filesystem::path &path);

class CodecRegistry {
public:
  [[nodiscard]] static CodecRegistry with_default_codecs();

  void register_codec(std::shared_ptr<const DocumentCodec> codec);

  [[nodiscard]] common::Result<std::shared_ptr<const DocumentCodec>>
  codec_for(DocumentFormat format) const;

  [[nodiscard]] common::Result<DocumentContent> decode(DocumentFormat format,
                                                       const std::string &bytes) const;

private:
  std::array<std::shared_ptr<const DocumentCodec>, 3> codecs_{};
};

} // namespace transloom::codecs
