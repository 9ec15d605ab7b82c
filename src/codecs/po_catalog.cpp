#include "transloom/codecs/po_catalog.hpp"

#include "transloom/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <sstream>
#include <utility>

namespace transloom::codecs {

namespace {

enum class Field { None, Context, Id, IdPlural, Str, StrPlural };

std::string po_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\\' || i + 1 >= raw.size()) {
      out.push_back(raw[i]);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case '"':
      out.push_back('"');
      break;
    case '\\':
      out.push_back('\\');
      break;
    default:
      out.push_back('\\');
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::string po_escape(const std::string &value) {
  std::string out;
  out.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  return out;
}

// Body of the first "..." literal on the line, or nullopt when there is none.
std::optional<std::string> quoted_value(const std::string &line) {
  const auto open = line.find('"');
  const auto close = line.rfind('"');
  if (open == std::string::npos || close == open) {
    return std::nullopt;
  }
  return po_unescape(line.substr(open + 1, close - open - 1));
}

std::string after_marker(const std::string &line) { return common::trim(line.substr(2)); }

std::string join(const std::vector<std::string> &values, const std::string &separator) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += values[i];
  }
  return out;
}

std::string frame(const std::string &title) {
  const std::string rule(80, '=');
  return rule + "\n" + title + "\n" + rule;
}

std::string entry_status(const PoEntry &entry) {
  if (entry.obsolete) {
    return "OBSOLETE";
  }
  if (entry.is_fuzzy()) {
    return "FUZZY";
  }
  return entry.is_translated() ? "TRANSLATED" : "UNTRANSLATED";
}

bool is_blank(const std::string &value) { return common::trim(value).empty(); }

void write_po_string(std::ostringstream &out, const std::string &prefix,
                     const std::string &keyword, const std::string &value) {
  const auto newline = value.find('\n');
  if (newline == std::string::npos || newline + 1 == value.size()) {
    out << prefix << keyword << " \"" << po_escape(value) << "\"\n";
    return;
  }
  out << prefix << keyword << " \"\"\n";
  std::size_t start = 0;
  while (start < value.size()) {
    const auto end = value.find('\n', start);
    const auto stop = end == std::string::npos ? value.size() : end + 1;
    out << prefix << "\"" << po_escape(value.substr(start, stop - start)) << "\"\n";
    start = stop;
  }
}

struct ProjectedEntry {
  std::optional<std::string> msgctxt;
  std::string msgid;
  std::string msgstr;
  std::map<std::size_t, std::string> msgstr_plural;
};

// Parses "[Plural form N]: text" (leading whitespace allowed).
bool parse_plural_line(const std::string &line, std::size_t &index, std::string &text) {
  const std::string trimmed = common::trim(line);
  const std::string marker = "[Plural form ";
  if (!common::starts_with(trimmed, marker)) {
    return false;
  }
  std::size_t pos = marker.size();
  const std::size_t digits_start = pos;
  while (pos < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[pos])) != 0) {
    ++pos;
  }
  if (pos == digits_start || trimmed.compare(pos, 2, "]:") != 0) {
    return false;
  }
  const auto [ptr, ec] = std::from_chars(trimmed.data() + digits_start, trimmed.data() + pos, index);
  if (ec != std::errc()) {
    return false;
  }
  text = common::trim(trimmed.substr(pos + 2));
  if (text == "(not translated)") {
    text.clear();
  }
  return true;
}

ProjectedEntry parse_projected_block(const std::string &block) {
  ProjectedEntry parsed;
  std::string msgid;
  std::string msgstr;
  enum class Section { None, Id, IdPlural, Str } section = Section::None;

  std::istringstream lines(block);
  std::string line;
  while (std::getline(lines, line)) {
    const std::string stripped = common::trim(line);
    if (common::starts_with(stripped, "[Entry") || common::starts_with(stripped, "Flags:") ||
        common::starts_with(stripped, "Previous msgid:")) {
      section = Section::None;
      continue;
    }
    if (common::starts_with(stripped, "Context:")) {
      parsed.msgctxt = common::trim(stripped.substr(8));
      section = Section::None;
      continue;
    }
    if (stripped == "Original:") {
      section = Section::Id;
      continue;
    }
    if (stripped == "Plural:") {
      section = Section::IdPlural;
      continue;
    }
    if (stripped == "Translation:") {
      section = Section::Str;
      continue;
    }

    switch (section) {
    case Section::Id:
      msgid += line + "\n";
      break;
    case Section::Str: {
      std::size_t index = 0;
      std::string text;
      if (parse_plural_line(line, index, text)) {
        parsed.msgstr_plural[index] = text;
      } else {
        msgstr += line + "\n";
      }
      break;
    }
    case Section::IdPlural:
    case Section::None:
      break;
    }
  }

  parsed.msgid = common::trim(msgid);
  parsed.msgstr = common::trim(msgstr);
  if (parsed.msgstr == "(not translated)") {
    parsed.msgstr.clear();
  }
  return parsed;
}

} // namespace

bool PoEntry::is_translated() const {
  if (!msgstr_plural.empty()) {
    return std::any_of(msgstr_plural.begin(), msgstr_plural.end(),
                       [](const auto &item) { return !is_blank(item.second); });
  }
  return !is_blank(msgstr);
}

bool PoEntry::is_fuzzy() const {
  return std::find(flags.begin(), flags.end(), "fuzzy") != flags.end();
}

const PoEntry *PoCatalog::header() const {
  const PoEntry *found = nullptr;
  for (const auto &entry : entries) {
    if (entry.is_header()) {
      found = &entry;
    }
  }
  return found;
}

const std::string &entry_separator() {
  static const std::string separator(80, '-');
  return separator;
}

PoCatalog parse_po(const std::string &content) {
  PoCatalog catalog;
  PoEntry current;
  bool has_content = false;
  Field field = Field::None;
  std::size_t plural_index = 0;

  const auto finish_entry = [&]() {
    if (has_content) {
      catalog.entries.push_back(std::move(current));
    }
    current = PoEntry{};
    has_content = false;
    field = Field::None;
  };

  std::istringstream stream(content);
  std::string raw_line;
  while (std::getline(stream, raw_line)) {
    std::string line = raw_line;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (is_blank(line)) {
      if (field != Field::None) {
        finish_entry();
      }
      continue;
    }

    if (common::starts_with(line, "#.")) {
      current.extracted_comments.push_back(after_marker(line));
      continue;
    }
    if (common::starts_with(line, "#:")) {
      current.references.push_back(after_marker(line));
      continue;
    }
    if (common::starts_with(line, "#,")) {
      std::istringstream flags(line.substr(2));
      std::string flag;
      while (std::getline(flags, flag, ',')) {
        const std::string trimmed = common::trim(flag);
        if (!trimmed.empty()) {
          current.flags.push_back(trimmed);
        }
      }
      continue;
    }
    if (common::starts_with(line, "#|")) {
      const std::string rest = after_marker(line);
      if (common::starts_with(rest, "msgid ")) {
        current.previous_msgid = quoted_value(rest);
      }
      continue;
    }
    if (common::starts_with(line, "#~")) {
      current.obsolete = true;
      line = after_marker(line);
    } else if (common::starts_with(line, "# ") || line == "#") {
      current.comments.push_back(common::trim(line.substr(1)));
      continue;
    }

    if (common::starts_with(line, "msgctxt")) {
      if (auto value = quoted_value(line); value.has_value()) {
        current.msgctxt = std::move(*value);
        field = Field::Context;
        has_content = true;
      }
      continue;
    }
    if (common::starts_with(line, "msgid_plural")) {
      if (auto value = quoted_value(line); value.has_value()) {
        current.msgid_plural = std::move(*value);
        field = Field::IdPlural;
      }
      continue;
    }
    if (common::starts_with(line, "msgid")) {
      if (auto value = quoted_value(line); value.has_value()) {
        current.msgid = std::move(*value);
        field = Field::Id;
        has_content = true;
      }
      continue;
    }
    if (common::starts_with(line, "msgstr[")) {
      const auto close = line.find(']');
      auto value = quoted_value(line);
      if (close != std::string::npos && value.has_value()) {
        const auto [ptr, ec] = std::from_chars(line.data() + 7, line.data() + close, plural_index);
        if (ec != std::errc() || ptr != line.data() + close) {
          continue;
        }
        current.msgstr_plural[plural_index] = std::move(*value);
        field = Field::StrPlural;
      }
      continue;
    }
    if (common::starts_with(line, "msgstr")) {
      if (auto value = quoted_value(line); value.has_value()) {
        current.msgstr = std::move(*value);
        field = Field::Str;
      }
      continue;
    }

    if (line.front() == '"' && field != Field::None) {
      const auto value = quoted_value(line);
      if (!value.has_value()) {
        continue;
      }
      switch (field) {
      case Field::Context:
        *current.msgctxt += *value;
        break;
      case Field::Id:
        current.msgid += *value;
        break;
      case Field::IdPlural:
        *current.msgid_plural += *value;
        break;
      case Field::Str:
        current.msgstr += *value;
        break;
      case Field::StrPlural:
        current.msgstr_plural[plural_index] += *value;
        break;
      case Field::None:
        break;
      }
    }
  }
  finish_entry();
  return catalog;
}

CatalogStatistics catalog_statistics(const PoCatalog &catalog) {
  CatalogStatistics stats;
  for (const auto &entry : catalog.entries) {
    if (entry.is_header()) {
      continue;
    }
    ++stats.total;
    const bool translated = entry.is_translated();
    const bool fuzzy = entry.is_fuzzy();
    if (translated && !fuzzy) {
      ++stats.translated;
    }
    if (fuzzy) {
      ++stats.fuzzy;
    }
    if (!translated) {
      ++stats.untranslated;
    }
    if (entry.obsolete) {
      ++stats.obsolete;
    }
  }
  return stats;
}

std::string render_catalog(const PoCatalog &catalog, const RenderOptions &options) {
  std::vector<std::string> parts;

  if (options.include_metadata) {
    if (const auto *header = catalog.header(); header != nullptr) {
      parts.push_back(frame("METADATA"));
      std::istringstream lines(header->msgstr);
      std::string line;
      while (std::getline(lines, line)) {
        if (!is_blank(line)) {
          parts.push_back(line);
        }
      }
      parts.emplace_back();
    }
  }

  const auto stats = catalog_statistics(catalog);
  parts.push_back(frame("STATISTICS"));
  parts.push_back("Total Entries: " + std::to_string(stats.total));
  parts.push_back("Translated: " + std::to_string(stats.translated));
  parts.push_back("Fuzzy: " + std::to_string(stats.fuzzy));
  parts.push_back("Untranslated: " + std::to_string(stats.untranslated));
  if (stats.obsolete > 0) {
    parts.push_back("Obsolete: " + std::to_string(stats.obsolete));
  }
  if (stats.total > 0) {
    char completion[32];
    std::snprintf(completion, sizeof(completion), "Completion: %.1f%%",
                  static_cast<double>(stats.translated) * 100.0 /
                      static_cast<double>(stats.total));
    parts.emplace_back(completion);
  }
  parts.emplace_back();
  parts.push_back(frame("ENTRIES"));
  parts.emplace_back();

  std::size_t position = 0;
  for (const auto &entry : catalog.entries) {
    if (entry.is_header()) {
      continue;
    }
    // Numbering counts filtered-out entries too.
    ++position;
    if (entry.obsolete && !options.include_obsolete) {
      continue;
    }
    if (entry.is_fuzzy() && !options.include_fuzzy) {
      continue;
    }
    if (!entry.is_translated() && !options.include_untranslated) {
      continue;
    }

    parts.push_back(entry_separator());
    parts.push_back("[Entry " + std::to_string(position) + "] [" + entry_status(entry) + "]");
    parts.emplace_back();

    if (options.include_comments && !entry.flags.empty()) {
      parts.push_back("Flags: " + join(entry.flags, ", "));
      parts.emplace_back();
    }
    if (entry.msgctxt.has_value() && !entry.msgctxt->empty()) {
      parts.push_back("Context: " + *entry.msgctxt);
      parts.emplace_back();
    }
    if (options.include_comments) {
      for (const auto &comment : entry.comments) {
        parts.push_back("# " + comment);
      }
      for (const auto &comment : entry.extracted_comments) {
        parts.push_back("#. " + comment);
      }
      for (const auto &reference : entry.references) {
        parts.push_back("#: " + reference);
      }
      if (!entry.comments.empty() || !entry.extracted_comments.empty() ||
          !entry.references.empty()) {
        parts.emplace_back();
      }
    }

    parts.emplace_back("Original:");
    parts.push_back(entry.msgid);
    parts.emplace_back();

    if (entry.msgid_plural.has_value() && !entry.msgid_plural->empty()) {
      parts.emplace_back("Plural:");
      parts.push_back(*entry.msgid_plural);
      parts.emplace_back();
    }

    parts.emplace_back("Translation:");
    if (!entry.msgstr_plural.empty()) {
      for (const auto &[index, text] : entry.msgstr_plural) {
        parts.push_back("  [Plural form " + std::to_string(index) +
                        "]: " + (is_blank(text) ? std::string("(not translated)") : text));
      }
    } else {
      parts.push_back(is_blank(entry.msgstr) ? std::string("(not translated)") : entry.msgstr);
    }
    parts.emplace_back();

    if (options.include_comments && entry.previous_msgid.has_value() &&
        !entry.previous_msgid->empty()) {
      parts.push_back("Previous msgid: " + *entry.previous_msgid);
      parts.emplace_back();
    }
  }

  return join(parts, "\n");
}

std::string serialize_po(const PoCatalog &catalog) {
  std::ostringstream out;
  bool first = true;
  for (const auto &entry : catalog.entries) {
    if (!first) {
      out << "\n";
    }
    first = false;

    for (const auto &comment : entry.comments) {
      out << "# " << comment << "\n";
    }
    for (const auto &comment : entry.extracted_comments) {
      out << "#. " << comment << "\n";
    }
    for (const auto &reference : entry.references) {
      out << "#: " << reference << "\n";
    }
    if (!entry.flags.empty()) {
      out << "#, " << join(entry.flags, ", ") << "\n";
    }
    if (entry.previous_msgid.has_value()) {
      out << "#| msgid \"" << po_escape(*entry.previous_msgid) << "\"\n";
    }

    const std::string prefix = entry.obsolete ? "#~ " : "";
    if (entry.msgctxt.has_value()) {
      write_po_string(out, prefix, "msgctxt", *entry.msgctxt);
    }
    write_po_string(out, prefix, "msgid", entry.msgid);
    if (entry.msgid_plural.has_value()) {
      write_po_string(out, prefix, "msgid_plural", *entry.msgid_plural);
    }
    if (!entry.msgstr_plural.empty()) {
      for (const auto &[index, text] : entry.msgstr_plural) {
        write_po_string(out, prefix, "msgstr[" + std::to_string(index) + "]", text);
      }
    } else {
      write_po_string(out, prefix, "msgstr", entry.msgstr);
    }
  }
  return out.str();
}

std::size_t apply_translated_projection(PoCatalog &catalog, const std::string &projection) {
  std::map<std::pair<std::optional<std::string>, std::string>, PoEntry *> lookup;
  for (auto &entry : catalog.entries) {
    lookup[{entry.msgctxt, common::trim(entry.msgid)}] = &entry;
  }

  const std::string &separator = entry_separator();
  std::size_t updated = 0;
  std::size_t cursor = projection.find(separator);
  while (cursor != std::string::npos) {
    const std::size_t start = cursor + separator.size();
    const std::size_t next = projection.find(separator, start);
    const std::string block =
        projection.substr(start, next == std::string::npos ? std::string::npos : next - start);
    cursor = next;

    if (is_blank(block)) {
      continue;
    }
    auto parsed = parse_projected_block(block);
    if (parsed.msgid.empty()) {
      continue;
    }
    const auto it = lookup.find({parsed.msgctxt, parsed.msgid});
    if (it == lookup.end()) {
      continue;
    }
    PoEntry &entry = *it->second;
    if (entry.msgid_plural.has_value() && !parsed.msgstr_plural.empty()) {
      entry.msgstr_plural = std::move(parsed.msgstr_plural);
    } else {
      entry.msgstr = std::move(parsed.msgstr);
    }
    ++updated;
  }
  return updated;
}

} // namespace transloom::codecs
