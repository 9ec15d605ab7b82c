#include "transloom/codecs/epub_codec.hpp"

#include "transloom/common/fs.hpp"
#include "transloom/observability/global.hpp"

#include <pugixml.hpp>
#include <zip.h>

#include <filesystem>
#include <sstream>
#include <unordered_map>

namespace transloom::codecs {

namespace {

std::string local_name(const char *name) {
  const std::string full = name == nullptr ? "" : name;
  const auto colon = full.find(':');
  return colon == std::string::npos ? full : full.substr(colon + 1);
}

pugi::xml_node find_by_local_name(const pugi::xml_node &root, const std::string &name) {
  return root.find_node(
      [&name](const pugi::xml_node &node) { return local_name(node.name()) == name; });
}

class ZipArchive {
public:
  explicit ZipArchive(const std::string &bytes) {
    zip_error_t error;
    zip_error_init(&error);
    zip_source_t *source = zip_source_buffer_create(bytes.data(), bytes.size(), 0, &error);
    if (source == nullptr) {
      error_ = zip_error_strerror(&error);
      zip_error_fini(&error);
      return;
    }
    archive_ = zip_open_from_source(source, ZIP_RDONLY, &error);
    if (archive_ == nullptr) {
      error_ = zip_error_strerror(&error);
      zip_source_free(source);
    }
    zip_error_fini(&error);
  }

  ~ZipArchive() {
    if (archive_ != nullptr) {
      zip_discard(archive_);
    }
  }

  ZipArchive(const ZipArchive &) = delete;
  ZipArchive &operator=(const ZipArchive &) = delete;

  [[nodiscard]] bool ok() const { return archive_ != nullptr; }
  [[nodiscard]] const std::string &error() const { return error_; }

  [[nodiscard]] bool contains(const std::string &entry_name) const {
    return zip_name_locate(archive_, entry_name.c_str(), 0) >= 0;
  }

  [[nodiscard]] common::Result<std::string> read(const std::string &entry_name) const {
    zip_stat_t entry_stat;
    zip_stat_init(&entry_stat);
    if (zip_stat(archive_, entry_name.c_str(), 0, &entry_stat) != 0) {
      return common::Result<std::string>::failure("missing archive entry: " + entry_name);
    }

    zip_file_t *handle = zip_fopen(archive_, entry_name.c_str(), 0);
    if (handle == nullptr) {
      return common::Result<std::string>::failure("cannot open archive entry: " + entry_name);
    }
    std::string contents(static_cast<std::size_t>(entry_stat.size), '\0');
    const zip_int64_t bytes_read = zip_fread(handle, contents.data(), entry_stat.size);
    zip_fclose(handle);

    if (bytes_read < 0 || static_cast<zip_uint64_t>(bytes_read) != entry_stat.size) {
      return common::Result<std::string>::failure("short read on archive entry: " + entry_name);
    }
    return common::Result<std::string>::success(std::move(contents));
  }

private:
  zip_t *archive_ = nullptr;
  std::string error_;
};

std::string find_opf_path(const ZipArchive &archive) {
  if (auto container = archive.read("META-INF/container.xml"); container.ok()) {
    pugi::xml_document doc;
    if (doc.load_string(container.value().c_str())) {
      const auto rootfile = find_by_local_name(doc, "rootfile");
      const std::string full_path = rootfile.attribute("full-path").as_string();
      if (!full_path.empty()) {
        return full_path;
      }
    }
  }
  for (const char *candidate : {"OEBPS/content.opf", "content.opf", "EPUB/content.opf"}) {
    if (archive.contains(candidate)) {
      return candidate;
    }
  }
  return "";
}

std::string resolve_href(const std::string &content_dir, const std::string &href) {
  if (content_dir.empty() || content_dir == ".") {
    return std::filesystem::path(href).lexically_normal().generic_string();
  }
  return (std::filesystem::path(content_dir) / href).lexically_normal().generic_string();
}

std::string node_text(const pugi::xml_node &node, const std::string &fallback) {
  if (!node) {
    return fallback;
  }
  const std::string text = common::trim(node.text().as_string());
  return text.empty() ? fallback : text;
}

// Whitespace between inline and block elements is kept, and entity references
// stay as written: XHTML chapters routinely use HTML entities (&nbsp;) that an
// XML parser does not know.
constexpr unsigned int BODY_PARSE_OPTIONS =
    (pugi::parse_default | pugi::parse_ws_pcdata) & ~pugi::parse_escapes;
constexpr unsigned int BODY_FORMAT_OPTIONS = pugi::format_raw | pugi::format_no_escapes;

common::Result<std::string> body_markup(const std::string &xhtml) {
  pugi::xml_document doc;
  const auto parsed = doc.load_buffer(xhtml.data(), xhtml.size(), BODY_PARSE_OPTIONS);
  if (!parsed) {
    return common::Result<std::string>::failure(parsed.description());
  }
  const auto body = find_by_local_name(doc, "body");
  if (!body) {
    return common::Result<std::string>::failure("no <body> element");
  }
  std::ostringstream out;
  for (const auto &child : body.children()) {
    child.print(out, "", BODY_FORMAT_OPTIONS);
  }
  return common::Result<std::string>::success(common::trim(out.str()));
}

} // namespace

common::Result<DocumentContent> EpubCodec::decode(const std::string &bytes) const {
  const ZipArchive archive(bytes);
  if (!archive.ok()) {
    return common::Result<DocumentContent>::failure("not an EPUB archive: " + archive.error());
  }

  const std::string opf_path = find_opf_path(archive);
  if (opf_path.empty()) {
    return common::Result<DocumentContent>::failure("could not find content.opf in EPUB");
  }
  auto opf = archive.read(opf_path);
  if (!opf.ok()) {
    return common::Result<DocumentContent>::failure(opf.error());
  }

  pugi::xml_document package;
  if (const auto parsed = package.load_string(opf.value().c_str()); !parsed) {
    return common::Result<DocumentContent>::failure(std::string("invalid package document: ") +
                                                    parsed.description());
  }

  EbookMetadata metadata;
  const auto metadata_node = find_by_local_name(package, "metadata");
  if (metadata_node) {
    metadata.title = node_text(find_by_local_name(metadata_node, "title"), "Unknown");
    metadata.author = node_text(find_by_local_name(metadata_node, "creator"), "Unknown");
  }

  const std::string content_dir = std::filesystem::path(opf_path).parent_path().generic_string();
  std::unordered_map<std::string, std::string> manifest;
  if (const auto manifest_node = find_by_local_name(package, "manifest"); manifest_node) {
    for (const auto &item : manifest_node.children()) {
      if (local_name(item.name()) != "item") {
        continue;
      }
      const std::string id = item.attribute("id").as_string();
      const std::string href = item.attribute("href").as_string();
      if (!id.empty() && !href.empty()) {
        manifest[id] = href;
      }
    }
  }
  if (const auto spine_node = find_by_local_name(package, "spine"); spine_node) {
    for (const auto &itemref : spine_node.children()) {
      if (local_name(itemref.name()) != "itemref") {
        continue;
      }
      const auto it = manifest.find(itemref.attribute("idref").as_string());
      if (it != manifest.end()) {
        metadata.spine.push_back(resolve_href(content_dir, it->second));
      }
    }
  }

  std::string text;
  for (const auto &document_path : metadata.spine) {
    auto raw = archive.read(document_path);
    auto markup = raw.ok() ? body_markup(raw.value())
                           : common::Result<std::string>::failure(raw.error());
    if (!markup.ok()) {
      metadata.skipped.push_back(document_path);
      observability::record_warning("epub", "skipping " + document_path + ": " + markup.error());
      continue;
    }
    if (markup.value().empty()) {
      continue;
    }
    if (!text.empty()) {
      text += "\n\n";
    }
    text += markup.value();
  }

  if (text.empty()) {
    return common::Result<DocumentContent>::failure("EPUB contains no readable content");
  }

  DocumentContent content;
  content.format = DocumentFormat::Ebook;
  content.text = std::move(text);
  content.metadata = std::move(metadata);
  return common::Result<DocumentContent>::success(std::move(content));
}

common::Result<EncodedDocument> EpubCodec::encode(const std::string &translated_text,
                                                  const DocumentContent &,
                                                  const std::string &source_name) const {
  const std::string stem = std::filesystem::path(source_name).stem().string();
  return common::Result<EncodedDocument>::success(
      EncodedDocument{.name = "assembled_" + stem + ".txt", .bytes = translated_text});
}

} // namespace transloom::codecs
