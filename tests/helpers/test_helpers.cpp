#include "tests/helpers/test_helpers.hpp"

#include "transloom/common/fs.hpp"
#include "transloom/observability/global.hpp"
#include "transloom/pipeline/prompts.hpp"
#include "transloom/storage/artifact_keys.hpp"

#include <zip.h>

#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>

namespace transloom::testing {

config::Config mock_config() {
  config::Config config;
  config.generation.provider = "openai";
  config.generation.model = "gpt-4o-mini";
  config.generation.api_key = "test-key";
  config.storage.backend = "memory";
  config.observability.backend = "none";
  return config;
}

std::string source_from_prompt(const std::string &prompt) {
  const std::string opening = std::string(pipeline::SOURCE_HEADING) + "\n---\n";
  const auto start = prompt.find(opening);
  if (start == std::string::npos) {
    return "";
  }
  const auto body = start + opening.size();
  const auto end = prompt.rfind("\n---\n");
  if (end == std::string::npos || end < body) {
    return "";
  }
  return prompt.substr(body, end - body);
}

ScriptedProvider::ScriptedProvider(std::string tag) : tag_(std::move(tag)) {}

void ScriptedProvider::set_handler(Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = std::move(handler);
}

void ScriptedProvider::fail_call(const std::size_t call_number, std::string message) {
  std::lock_guard<std::mutex> lock(mutex_);
  failing_calls_[call_number] = std::move(message);
}

void ScriptedProvider::fail_when_source_contains(std::string needle, std::string message) {
  std::lock_guard<std::mutex> lock(mutex_);
  failing_sources_.emplace_back(std::move(needle), std::move(message));
}

void ScriptedProvider::set_fallback_response(std::string response) {
  std::lock_guard<std::mutex> lock(mutex_);
  fallback_response_ = std::move(response);
}

void ScriptedProvider::queue_system_response(std::string response) {
  std::lock_guard<std::mutex> lock(mutex_);
  system_responses_.push_back(std::move(response));
}

common::Result<std::string> ScriptedProvider::respond(const std::string &message) {
  Handler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(message);
    const std::size_t call_number = messages_.size();
    if (const auto it = failing_calls_.find(call_number); it != failing_calls_.end()) {
      return common::Result<std::string>::failure(it->second);
    }
    if (common::starts_with(message, "# Translation Task")) {
      const std::string source = source_from_prompt(message);
      for (const auto &[needle, error] : failing_sources_) {
        if (source.find(needle) != std::string::npos) {
          return common::Result<std::string>::failure(error);
        }
      }
      ++translations_;
      if (!handler_) {
        return common::Result<std::string>::success("[" + tag_ + "]" + source);
      }
    }
    handler = handler_;
    if (!handler) {
      if (message.find("JSON object") != std::string::npos) {
        return common::Result<std::string>::success(
            R"({"Ada": {"context": "a person", "suggested_translation": "Ada"}})");
      }
      if (message.find("style guide") != std::string::npos) {
        return common::Result<std::string>::success("Keep a neutral, formal tone.");
      }
      return common::Result<std::string>::success(fallback_response_);
    }
  }
  return handler(message);
}

common::Result<std::string> ScriptedProvider::chat(const std::string &message, const std::string &,
                                                   double) {
  return respond(message);
}

common::Result<std::string>
ScriptedProvider::chat_with_system(const std::optional<std::string> &system_prompt,
                                   const std::string &message, const std::string &, double) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    system_prompts_.push_back(system_prompt);
    if (next_system_response_ < system_responses_.size()) {
      messages_.push_back(message);
      return common::Result<std::string>::success(system_responses_[next_system_response_++]);
    }
  }
  return respond(message);
}

std::size_t ScriptedProvider::call_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return messages_.size();
}

std::size_t ScriptedProvider::translation_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return translations_;
}

std::vector<std::string> ScriptedProvider::messages() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return messages_;
}

std::vector<std::optional<std::string>> ScriptedProvider::system_prompts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return system_prompts_;
}

ScriptedValidator::ScriptedValidator(std::shared_ptr<storage::ArtifactStore> store,
                                     std::set<std::size_t> failing_chunks, std::string prefix)
    : store_(std::move(store)), failing_chunks_(std::move(failing_chunks)),
      prefix_(std::move(prefix)) {}

common::Result<std::string> ScriptedValidator::validate(const std::string &,
                                                        const std::string &translated_locator) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_;
  }
  const auto index = storage::sequence_from_key(translated_locator);
  if (index.has_value() && failing_chunks_.count(*index) > 0) {
    return common::Result<std::string>::failure("reviewer unavailable");
  }
  auto translated = store_->get(translated_locator);
  if (!translated.ok()) {
    return translated;
  }
  return common::Result<std::string>::success(prefix_ + translated.value());
}

std::size_t ScriptedValidator::call_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_;
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++metrics_;
}

std::vector<std::string> RecordingObserver::warnings() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  for (const auto &event : events_) {
    if (const auto *warning = std::get_if<observability::WarningEvent>(&event)) {
      out.push_back(warning->component + ": " + warning->message);
    }
  }
  return out;
}

std::vector<std::string> RecordingObserver::stages() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  for (const auto &event : events_) {
    if (const auto *stage = std::get_if<observability::StageTransitionEvent>(&event)) {
      out.push_back(stage->stage);
    }
  }
  return out;
}

std::size_t RecordingObserver::metric_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

ObserverGuard::ObserverGuard() {
  auto observer = std::make_unique<RecordingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ObserverGuard::~ObserverGuard() { observability::set_global_observer(nullptr); }

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("transloom-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempWorkspace::create_file(const std::string &name,
                                                 const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
  out << content;
  return file_path;
}

config::Config temp_config(const TempWorkspace &workspace) {
  auto config = mock_config();
  config.storage.backend = "filesystem";
  config.storage.root = (workspace.path() / "artifacts").string();
  config.storage.status_db = (workspace.path() / "status.db").string();
  return config;
}

std::string sample_po() {
  return R"(# Sample catalog
msgid ""
msgstr ""
"Project-Id-Version: sample 1.0\n"
"Language: fr\n"
"Content-Type: text/plain; charset=UTF-8\n"

#: src/main.c:10
msgid "Hello"
msgstr "Bonjour"

#. Shown on the menu
#: src/menu.c:4
#, fuzzy
msgctxt "menu"
msgid "Open"
msgstr "Ouvrir"

#: src/files.c:22
msgid "One file"
msgid_plural "%d files"
msgstr[0] ""
msgstr[1] ""

#~ msgid "Old text"
#~ msgstr "Ancien texte"
)";
}

common::Result<std::string>
build_zip(const std::vector<std::pair<std::string, std::string>> &files) {
  static std::mt19937_64 rng{std::random_device{}()};
  const auto path =
      std::filesystem::temp_directory_path() / ("transloom-zip-" + std::to_string(rng()) + ".zip");

  int error_code = 0;
  zip_t *archive = zip_open(path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error_code);
  if (archive == nullptr) {
    return common::Result<std::string>::failure("zip_open failed: " + std::to_string(error_code));
  }
  for (const auto &[name, content] : files) {
    zip_source_t *source = zip_source_buffer(archive, content.data(), content.size(), 0);
    if (source == nullptr || zip_file_add(archive, name.c_str(), source, ZIP_FL_OVERWRITE) < 0) {
      if (source != nullptr) {
        zip_source_free(source);
      }
      const std::string message = zip_strerror(archive);
      zip_discard(archive);
      return common::Result<std::string>::failure("cannot add " + name + ": " + message);
    }
  }
  if (zip_close(archive) != 0) {
    const std::string message = zip_strerror(archive);
    zip_discard(archive);
    return common::Result<std::string>::failure("zip_close failed: " + message);
  }

  auto bytes = common::read_file(path);
  std::error_code ec;
  std::filesystem::remove(path, ec);
  return bytes;
}

common::Result<std::string>
build_epub(const std::vector<std::pair<std::string, std::string>> &chapters,
           const std::vector<std::string> &spine_order, const std::string &title,
           const std::string &author) {
  std::ostringstream manifest;
  std::ostringstream spine;
  for (std::size_t i = 0; i < spine_order.size(); ++i) {
    const std::string id = "item" + std::to_string(i + 1);
    manifest << "    <item id=\"" << id << "\" href=\"" << spine_order[i]
             << "\" media-type=\"application/xhtml+xml\"/>\n";
    spine << "    <itemref idref=\"" << id << "\"/>\n";
  }

  std::vector<std::pair<std::string, std::string>> files;
  files.emplace_back("mimetype", "application/epub+zip");
  files.emplace_back("META-INF/container.xml",
                     R"(<?xml version="1.0"?>
<container version="1.0" xmlns="urn:oasis:names:tc:opendocument:xmlns:container">
  <rootfiles>
    <rootfile full-path="OEBPS/content.opf" media-type="application/oebps-package+xml"/>
  </rootfiles>
</container>
)");
  files.emplace_back("OEBPS/content.opf",
                     "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                     "<package xmlns=\"http://www.idpf.org/2007/opf\" version=\"3.0\">\n"
                     "  <metadata xmlns:dc=\"http://purl.org/dc/elements/1.1/\">\n"
                     "    <dc:title>" +
                         title + "</dc:title>\n    <dc:creator>" + author +
                         "</dc:creator>\n  </metadata>\n  <manifest>\n" + manifest.str() +
                         "  </manifest>\n  <spine>\n" + spine.str() + "  </spine>\n</package>\n");
  for (const auto &[name, body] : chapters) {
    files.emplace_back("OEBPS/" + name,
                       "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                       "<html xmlns=\"http://www.w3.org/1999/xhtml\"><head><title>" +
                           name + "</title></head><body>" + body + "</body></html>\n");
  }
  return build_zip(files);
}

std::string paragraph_text(const std::size_t total, const std::size_t paragraph) {
  static const std::string words = "lorem ipsum dolor sit amet ";
  std::string out;
  out.reserve(total);
  while (out.size() < total) {
    const std::size_t body = std::min(paragraph, total - out.size());
    std::string block;
    while (block.size() + 2 < body) {
      block += words[block.size() % words.size()];
    }
    out += block;
    out += body >= 2 ? "\n\n" : std::string(body - block.size(), '.');
  }
  out.resize(total);
  return out;
}

} // namespace transloom::testing
