#include "test_framework.hpp"

#include "transloom/codecs/catalog_codec.hpp"
#include "transloom/chunking/chunker.hpp"
#include "transloom/codecs/epub_codec.hpp"
#include "transloom/codecs/plain_text.hpp"
#include "transloom/codecs/po_catalog.hpp"
#include "transloom/codecs/registry.hpp"
#include "transloom/common/fs.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>

namespace {

namespace c = transloom::codecs;

const c::PoEntry *find_entry(const c::PoCatalog &catalog, const std::string &msgid) {
  for (const auto &entry : catalog.entries) {
    if (entry.msgid == msgid) {
      return &entry;
    }
  }
  return nullptr;
}

std::string replace_once(std::string text, const std::string &from, const std::string &to) {
  const auto pos = text.find(from);
  if (pos == std::string::npos) {
    throw std::runtime_error("fixture text not found: " + from);
  }
  return text.replace(pos, from.size(), to);
}

class PrefixPlainCodec final : public c::DocumentCodec {
public:
  [[nodiscard]] c::DocumentFormat format() const override { return c::DocumentFormat::Plain; }
  [[nodiscard]] transloom::common::Result<c::DocumentContent>
  decode(const std::string &bytes) const override {
    c::DocumentContent content;
    content.text = "custom:" + bytes;
    return transloom::common::Result<c::DocumentContent>::success(std::move(content));
  }
  [[nodiscard]] transloom::common::Result<c::EncodedDocument>
  encode(const std::string &translated, const c::DocumentContent &,
         const std::string &name) const override {
    return transloom::common::Result<c::EncodedDocument>::success({.name = name, .bytes = translated});
  }
  [[nodiscard]] bool requires_structural_reassembly() const override { return false; }
};

} // namespace

void register_codec_tests(std::vector<transloom::tests::TestCase> &tests) {
  using transloom::tests::require;
  namespace t = transloom::testing;

  tests.push_back({"po_parse_sample_catalog", [] {
                     const auto catalog = c::parse_po(t::sample_po());
                     require(catalog.entries.size() == 5, "expected header plus four entries");
                     const auto *header = catalog.header();
                     require(header != nullptr, "header entry missing");
                     require(header->msgstr.find("Language: fr\n") != std::string::npos,
                             "header continuation lines should be joined and unescaped");

                     const auto *open = find_entry(catalog, "Open");
                     require(open != nullptr, "Open entry missing");
                     require(open->msgctxt.has_value() && *open->msgctxt == "menu", "context");
                     require(open->is_fuzzy(), "Open should be fuzzy");
                     require(open->extracted_comments.size() == 1, "extracted comment");
                     require(open->references.size() == 1 && open->references[0] == "src/menu.c:4",
                             "reference");

                     const auto *plural = find_entry(catalog, "One file");
                     require(plural != nullptr && plural->msgid_plural.has_value(),
                             "plural entry missing");
                     require(plural->msgstr_plural.size() == 2, "two plural forms");
                     require(!plural->is_translated(), "plural entry is untranslated");

                     const auto *old = find_entry(catalog, "Old text");
                     require(old != nullptr && old->obsolete, "obsolete entry missing");
                     require(old->msgstr == "Ancien texte", "obsolete translation");
                   }});

  tests.push_back({"po_statistics", [] {
                     const auto stats = c::catalog_statistics(c::parse_po(t::sample_po()));
                     require(stats.total == 4, "total excludes the header");
                     require(stats.translated == 2, "translated count");
                     require(stats.fuzzy == 1, "fuzzy count");
                     require(stats.untranslated == 1, "untranslated count");
                     require(stats.obsolete == 1, "obsolete count");
                   }});

  tests.push_back({"po_render_filters_fuzzy_and_obsolete", [] {
                     const std::string po = "msgid \"Apple\"\nmsgstr \"Pomme\"\n\n"
                                            "#, fuzzy\nmsgid \"Banana\"\nmsgstr \"Banane\"\n\n"
                                            "#~ msgid \"Cherry\"\n#~ msgstr \"Cerise\"\n";
                     const auto catalog = c::parse_po(po);
                     require(catalog.entries.size() == 3, "three entries");

                     c::RenderOptions options;
                     options.include_fuzzy = false;
                     options.include_obsolete = false;
                     const std::string rendered = c::render_catalog(catalog, options);
                     require(rendered.find("[Entry 1]") != std::string::npos, "entry 1 missing");
                     require(rendered.find("Apple") != std::string::npos, "Apple missing");
                     require(rendered.find("[Entry 2]") == std::string::npos,
                             "fuzzy entry header should be absent");
                     require(rendered.find("Banana") == std::string::npos, "fuzzy entry rendered");
                     require(rendered.find("Cherry") == std::string::npos,
                             "obsolete entry rendered");

                     const std::string everything = c::render_catalog(
                         catalog, c::RenderOptions{.include_fuzzy = true, .include_obsolete = true});
                     require(everything.find("[Entry 2] [FUZZY]") != std::string::npos,
                             "fuzzy status label");
                     require(everything.find("[Entry 3] [OBSOLETE]") != std::string::npos,
                             "obsolete status label");
                   }});

  tests.push_back({"po_render_untranslated_and_metadata_flags", [] {
                     const auto catalog = c::parse_po(t::sample_po());
                     const std::string full = c::render_catalog(catalog);
                     require(full.find("METADATA") != std::string::npos, "metadata section");
                     require(full.find("[Plural form 0]: (not translated)") != std::string::npos,
                             "plural placeholder");
                     require(full.find("Context: menu") != std::string::npos, "context line");
                     require(full.find(c::entry_separator()) != std::string::npos, "separator");

                     c::RenderOptions options;
                     options.include_untranslated = false;
                     options.include_metadata = false;
                     const std::string filtered = c::render_catalog(catalog, options);
                     require(filtered.find("METADATA") == std::string::npos, "metadata hidden");
                     require(filtered.find("One file") == std::string::npos,
                             "untranslated entry hidden");
                     require(filtered.find("Hello") != std::string::npos, "translated kept");
                   }});

  tests.push_back({"po_render_comments_flag", [] {
                     const auto catalog = c::parse_po(t::sample_po());
                     c::RenderOptions options;
                     options.include_comments = true;
                     const std::string rendered = c::render_catalog(catalog, options);
                     require(rendered.find("#. Shown on the menu") != std::string::npos,
                             "extracted comment");
                     require(rendered.find("#: src/main.c:10") != std::string::npos, "reference");
                     require(rendered.find("Flags: fuzzy") != std::string::npos, "flags line");
                   }});

  tests.push_back({"po_serialize_round_trip", [] {
                     const auto catalog = c::parse_po(t::sample_po());
                     const std::string serialized = c::serialize_po(catalog);
                     require(serialized.find("#~ msgid \"Old text\"") != std::string::npos,
                             "obsolete marker kept");
                     require(serialized.find("msgctxt \"menu\"") != std::string::npos, "context");
                     require(serialized.find("#, fuzzy") != std::string::npos, "flags");
                     require(serialized.find("msgstr[1] \"\"") != std::string::npos, "plural");

                     const auto reparsed = c::parse_po(serialized);
                     require(reparsed.entries.size() == catalog.entries.size(), "entry count");
                     for (std::size_t i = 0; i < catalog.entries.size(); ++i) {
                       require(reparsed.entries[i].msgid == catalog.entries[i].msgid, "msgid");
                       require(reparsed.entries[i].msgstr == catalog.entries[i].msgstr, "msgstr");
                       require(reparsed.entries[i].msgctxt == catalog.entries[i].msgctxt, "ctx");
                       require(reparsed.entries[i].obsolete == catalog.entries[i].obsolete,
                               "obsolete");
                     }
                   }});

  tests.push_back({"po_projection_updates_matched_entries_only", [] {
                     auto catalog = c::parse_po(t::sample_po());
                     const std::string projection = c::entry_separator() +
                                                    "\n[Entry 1] [TRANSLATED]\n\n"
                                                    "Original:\nHello\n\nTranslation:\nSalut\n\n" +
                                                    c::entry_separator() +
                                                    "\n[Entry 9] [TRANSLATED]\n\n"
                                                    "Original:\nNot in catalog\n\n"
                                                    "Translation:\nIgnored\n";
                     const std::size_t updated = c::apply_translated_projection(catalog, projection);
                     require(updated == 1, "only the matching block applies");
                     require(find_entry(catalog, "Hello")->msgstr == "Salut", "Hello updated");
                     require(find_entry(catalog, "Open")->msgstr == "Ouvrir",
                             "unmatched entry unchanged");
                     require(find_entry(catalog, "Old text")->msgstr == "Ancien texte",
                             "obsolete entry unchanged");
                     require(catalog.header()->msgstr.find("Project-Id-Version") != std::string::npos,
                             "header unchanged");
                   }});

  tests.push_back({"po_projection_requires_matching_context", [] {
                     auto catalog = c::parse_po(t::sample_po());
                     const std::string wrong_context = c::entry_separator() +
                                                       "\n[Entry 2] [FUZZY]\n\nContext: toolbar\n\n"
                                                       "Original:\nOpen\n\nTranslation:\nOuvrez\n";
                     require(c::apply_translated_projection(catalog, wrong_context) == 0,
                             "context mismatch must not apply");
                     const std::string right_context = replace_once(wrong_context, "toolbar", "menu");
                     require(c::apply_translated_projection(catalog, right_context) == 1,
                             "context match should apply");
                     require(find_entry(catalog, "Open")->msgstr == "Ouvrez", "Open updated");
                   }});

  tests.push_back({"catalog_codec_round_trip", [] {
                     const c::CatalogCodec codec;
                     auto decoded = codec.decode(t::sample_po());
                     require(decoded.ok(), decoded.error());
                     require(decoded.value().format == c::DocumentFormat::Catalog, "format");
                     require(std::holds_alternative<c::CatalogMetadata>(decoded.value().metadata),
                             "catalog metadata kept");

                     std::string translated = decoded.value().text;
                     translated = replace_once(translated, "Translation:\nBonjour",
                                               "Translation:\nSalut tout le monde");
                     translated = replace_once(translated, "[Plural form 0]: (not translated)",
                                               "[Plural form 0]: Un fichier");
                     translated = replace_once(translated, "[Plural form 1]: (not translated)",
                                               "[Plural form 1]: %d fichiers");

                     auto encoded = codec.encode(translated, decoded.value(), "messages.po");
                     require(encoded.ok(), encoded.error());
                     require(encoded.value().name == "assembled_messages.po", "encoded name");

                     const auto result = c::parse_po(encoded.value().bytes);
                     require(find_entry(result, "Hello")->msgstr == "Salut tout le monde",
                             "translation written back");
                     const auto *plural = find_entry(result, "One file");
                     require(plural->msgstr_plural.at(0) == "Un fichier", "plural form 0");
                     require(plural->msgstr_plural.at(1) == "%d fichiers", "plural form 1");
                     require(find_entry(result, "Open")->msgstr == "Ouvrir", "fuzzy entry kept");
                     require(find_entry(result, "Old text")->obsolete, "obsolete entry kept");
                   }});

  tests.push_back({"catalog_codec_rejects_empty_catalog", [] {
                     const c::CatalogCodec codec;
                     require(!codec.decode("# only a comment\n").ok(), "no entries should fail");
                     const c::DocumentContent plain;
                     require(!codec.encode("x", plain, "a.po").ok(),
                             "encode without catalog metadata should fail");
                   }});

  tests.push_back({"plain_codec_latin1_fallback", [] {
                     const c::PlainTextCodec codec;
                     auto utf8 = codec.decode("caf\xC3\xA9");
                     require(utf8.ok() && utf8.value().text == "caf\xC3\xA9", "utf8 unchanged");
                     auto latin1 = codec.decode("caf\xE9");
                     require(latin1.ok(), latin1.error());
                     require(latin1.value().text == "caf\xC3\xA9", "latin-1 should be converted");
                     require(!codec.requires_structural_reassembly(), "plain is not structural");
                   }});

  tests.push_back({"epub_decode_follows_spine_order", [] {
                     auto epub = t::build_epub({{"ch1.xhtml", "<h1>One</h1><p>First</p>"},
                                                {"ch2.xhtml", "<p>Second</p>"}},
                                               {"ch2.xhtml", "ch1.xhtml"});
                     require(epub.ok(), epub.error());
                     const c::EpubCodec codec;
                     auto decoded = codec.decode(epub.value());
                     require(decoded.ok(), decoded.error());
                     const auto &text = decoded.value().text;
                     require(text == "<p>Second</p>\n\n<h1>One</h1><p>First</p>",
                             "unexpected text: " + text);
                     const auto &meta = std::get<c::EbookMetadata>(decoded.value().metadata);
                     require(meta.title == "Sample Book", "title");
                     require(meta.author == "A. Writer", "author");
                     require(meta.spine.size() == 2 && meta.spine[0] == "OEBPS/ch2.xhtml",
                             "spine paths resolved against the package directory");
                     require(meta.skipped.empty(), "nothing skipped");
                   }});

  tests.push_back({"epub_decode_keeps_whitespace_and_entities", [] {
                     const std::string body =
                         "\n<p><em>Hello</em> <strong>world</strong></p>\n"
                         "<p>Caf&eacute;&nbsp;noir &amp; <a href=\"a.xhtml?x=1&amp;y=2\">lien</a></p>\n\n"
                         "<p>Line one<br />line two</p>\n";
                     auto epub = t::build_epub({{"ch1.xhtml", body}}, {"ch1.xhtml"});
                     require(epub.ok(), epub.error());
                     auto decoded = c::EpubCodec().decode(epub.value());
                     require(decoded.ok(), decoded.error());
                     const std::string expected =
                         "<p><em>Hello</em> <strong>world</strong></p>\n"
                         "<p>Caf&eacute;&nbsp;noir &amp; <a href=\"a.xhtml?x=1&amp;y=2\">lien</a></p>\n\n"
                         "<p>Line one<br />line two</p>";
                     require(decoded.value().text == expected,
                             "markup should pass through unchanged: " + decoded.value().text);

                     const auto chunks = transloom::chunking::chunk_text(decoded.value().text, 120);
                     require(chunks.ok() && chunks.value().size() == 2 &&
                                 chunks.value()[0].boundary ==
                                     transloom::chunking::BoundaryKind::Paragraph,
                             "blank lines between blocks stay usable as chunk boundaries");
                   }});

  tests.push_back({"epub_skips_unreadable_units", [] {
                     transloom::testing::ObserverGuard guard;
                     auto epub = t::build_epub({{"ch1.xhtml", "<p>Kept</p>"},
                                                {"bad.xhtml", "<p>unclosed"}},
                                               {"ch1.xhtml", "missing.xhtml", "bad.xhtml"});
                     require(epub.ok(), epub.error());
                     auto decoded = c::EpubCodec().decode(epub.value());
                     require(decoded.ok(), decoded.error());
                     require(decoded.value().text == "<p>Kept</p>", "only the readable unit");
                     const auto &meta = std::get<c::EbookMetadata>(decoded.value().metadata);
                     require(meta.skipped.size() == 2, "two skipped units");
                     const auto warnings = guard.observer().warnings();
                     require(warnings.size() == 2, "each skip is logged");
                     require(warnings[0].find("missing.xhtml") != std::string::npos,
                             "warning names the unit");
                   }});

  tests.push_back({"epub_decode_failures", [] {
                     const c::EpubCodec codec;
                     require(!codec.decode("definitely not a zip").ok(), "garbage should fail");
                     auto empty = t::build_epub({}, {"missing.xhtml"});
                     require(empty.ok(), empty.error());
                     auto decoded = codec.decode(empty.value());
                     require(!decoded.ok(), "no readable content should fail");
                     auto no_package = t::build_zip({{"mimetype", "application/epub+zip"}});
                     require(no_package.ok(), no_package.error());
                     require(!codec.decode(no_package.value()).ok(), "missing OPF should fail");
                   }});

  tests.push_back({"epub_encode_is_flat_text", [] {
                     const c::EpubCodec codec;
                     auto encoded = codec.encode("<p>Traduit</p>", c::DocumentContent{}, "book.epub");
                     require(encoded.ok(), encoded.error());
                     require(encoded.value().name == "assembled_book.txt", "flat artifact name");
                     require(encoded.value().bytes == "<p>Traduit</p>", "bytes are the text");
                   }});

  tests.push_back({"detect_format_by_extension", [] {
                     require(c::detect_format("notes.txt").value() == c::DocumentFormat::Plain,
                             "txt");
                     require(c::detect_format("fr/messages.po").value() ==
                                 c::DocumentFormat::Catalog,
                             "po");
                     require(c::detect_format("Book.EPUB").value() == c::DocumentFormat::Ebook,
                             "extension match is case-insensitive");
                     auto unsupported = c::detect_format("report.pdf");
                     require(!unsupported.ok(), "pdf is unsupported");
                     require(unsupported.error().find(".epub") != std::string::npos,
                             "error lists the supported types");
                     require(!c::detect_format("README").ok(), "no extension");
                   }});

  tests.push_back({"registry_dispatch_and_replacement", [] {
                     c::CodecRegistry empty;
                     require(!empty.codec_for(c::DocumentFormat::Plain).ok(),
                             "empty registry has no codecs");

                     auto registry = c::CodecRegistry::with_default_codecs();
                     for (const auto format : {c::DocumentFormat::Plain, c::DocumentFormat::Catalog,
                                               c::DocumentFormat::Ebook}) {
                       auto codec = registry.codec_for(format);
                       require(codec.ok(), codec.error());
                       require(codec.value()->format() == format, "codec registered under its format");
                       require(!c::format_instruction(format).empty(), "format instruction");
                     }
                     require(registry.codec_for(c::DocumentFormat::Catalog)
                                 .value()
                                 ->requires_structural_reassembly(),
                             "catalog is structural");

                     registry.register_codec(std::make_shared<PrefixPlainCodec>());
                     auto decoded = registry.decode(c::DocumentFormat::Plain, "abc");
                     require(decoded.ok() && decoded.value().text == "custom:abc",
                             "registered codec should replace the default");
                   }});
}
