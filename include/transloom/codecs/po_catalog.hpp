#pragma once

#include "transloom/common/result.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace transloom::codecs {

struct PoEntry {
  std::optional<std::string> msgctxt;
  std::string msgid;
  std::optional<std::string> msgid_plural;
  std::string msgstr;
  std::map<std::size_t, std::string> msgstr_plural;
  std::vector<std::string> comments;
  std::vector<std::string> extracted_comments;
  std::vector<std::string> references;
  std::vector<std::string> flags;
  std::optional<std::string> previous_msgid;
  bool obsolete = false;

  [[nodiscard]] bool is_translated() const;
  [[nodiscard]] bool is_fuzzy() const;
  [[nodiscard]] bool is_header() const { return msgid.empty() && !obsolete; }
};

struct PoCatalog {
  std::vector<PoEntry> entries;

  [[nodiscard]] const PoEntry *header() const;
};

struct CatalogStatistics {
  std::size_t total = 0;
  std::size_t translated = 0;
  std::size_t fuzzy = 0;
  std::size_t untranslated = 0;
  std::size_t obsolete = 0;
};

struct RenderOptions {
  bool include_untranslated = true;
  bool include_fuzzy = true;
  bool include_obsolete = false;
  bool include_metadata = true;
  bool include_comments = false;
};

[[nodiscard]] const std::string &entry_separator();

[[nodiscard]] PoCatalog parse_po(const std::string &content);

[[nodiscard]] CatalogStatistics catalog_statistics(const PoCatalog &catalog);

[[nodiscard]] std::string render_catalog(const PoCatalog &catalog, const RenderOptions &options = {});

[[nodiscard]] std::string serialize_po(const PoCatalog &catalog);

/// Copies translations from a (translated) projection onto matching entries,
/// keyed by context and msgid. Returns how many entries were updated.
std::size_t apply_translated_projection(PoCatalog &catalog, const std::string &projection);

} // namespace transloom::codecs
