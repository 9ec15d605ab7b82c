#include "transloom/cli/commands.hpp"

#include "transloom/chunking/chunker.hpp"
#include "transloom/codecs/registry.hpp"
#include "transloom/common/fs.hpp"
#include "transloom/config/config.hpp"
#include "transloom/observability/factory.hpp"
#include "transloom/observability/global.hpp"
#include "transloom/pipeline/orchestrator.hpp"
#include "transloom/pipeline/status_store.hpp"
#include "transloom/providers/factory.hpp"
#include "transloom/storage/factory.hpp"
#include "transloom/validation/agent_validator.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace transloom::cli {

namespace {

std::atomic<pipeline::PipelineOrchestrator *> g_active_run{nullptr};

void handle_interrupt(int) {
  if (auto *run = g_active_run.load(); run != nullptr) {
    run->request_cancel();
  }
}

std::string version_string() {
#ifdef TRANSLOOM_VERSION
  std::string version = TRANSLOOM_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef TRANSLOOM_GIT_COMMIT
  const std::string commit = TRANSLOOM_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "transloom " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<std::size_t> parse_size(const std::string &raw) {
  std::size_t value = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
  if (ec != std::errc() || ptr != raw.data() + raw.size()) {
    return std::nullopt;
  }
  return value;
}

// Reads an optional numeric option; false when present but malformed.
bool take_size_option(std::vector<std::string> &args, const std::string &name,
                      std::size_t &out_value) {
  std::string raw;
  if (!take_option(args, name, "", raw)) {
    return true;
  }
  const auto parsed = parse_size(raw);
  if (!parsed.has_value()) {
    std::cerr << "invalid value for " << name << ": " << raw << "\n";
    return false;
  }
  out_value = *parsed;
  return true;
}

common::Result<config::Config> load_checked_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return common::Result<config::Config>::failure(warnings.error());
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return cfg;
}

std::shared_ptr<pipeline::StatusStore> open_status_store(const config::Config &cfg) {
  auto store = std::make_shared<pipeline::StatusStore>(common::expand_path(cfg.storage.status_db));
  if (!store->is_open()) {
    observability::record_warning("status", "cannot open status db " + cfg.storage.status_db);
    return nullptr;
  }
  return store;
}

std::string format_time(const std::chrono::system_clock::time_point at) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(at);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buffer;
}

void print_state(const pipeline::SessionState &state) {
  std::cout << "Stage: " << pipeline::stage_name(state.stage) << "\n";
  std::cout << "Chunks created: " << state.chunks_created << "\n";
  std::cout << "Prompts built: " << state.prompts_built << "\n";
  std::cout << "Translations completed: " << state.translations_completed << "\n";
  std::cout << "Validations completed: " << state.validations_completed << "\n";
  std::cout << "Validations failed: " << state.validations_failed << "\n";
  if (!state.fallback_chunks.empty()) {
    std::cout << "Fallback chunks:";
    for (const auto index : state.fallback_chunks) {
      std::cout << " " << index;
    }
    std::cout << "\n";
  }
  if (state.structural_encode.has_value()) {
    std::cout << "Structural encode: " << (*state.structural_encode ? "ok" : "failed") << "\n";
  }
  for (const auto &warning : state.warnings) {
    std::cout << "Warning: " << warning << "\n";
  }
  if (state.last_error.has_value()) {
    std::cout << "Error: " << state.last_error->to_string() << "\n";
  }
}

int run_translate(std::vector<std::string> args) {
  auto cfg_result = load_checked_config();
  if (!cfg_result.ok()) {
    std::cerr << cfg_result.error() << "\n";
    return 1;
  }
  auto cfg = cfg_result.value();
  observability::set_global_observer(observability::create_observer(cfg));

  pipeline::SessionConfig session;
  session.max_chunk_size = cfg.chunking.max_chunk_size;
  session.max_chunks = cfg.chunking.max_chunks;
  session.metadata_preview_size = cfg.chunking.metadata_preview_size;
  session.model = cfg.generation.model;
  session.temperature = cfg.generation.temperature;
  session.validation_enabled = cfg.validation.enabled;
  session.concurrency = cfg.pipeline.concurrency;
  session.resume = cfg.pipeline.resume;

  if (!take_option(args, "--to", "-t", session.target_language)) {
    std::cerr << "usage: transloom translate <source> --to <language> [options]\n";
    return 1;
  }
  std::string value;
  if (take_option(args, "--session", "", value)) {
    session.session_id = value;
  }
  if (take_option(args, "--model", "-m", value)) {
    session.model = value;
  }
  if (!take_size_option(args, "--max-chunk-size", session.max_chunk_size) ||
      !take_size_option(args, "--max-chunks", session.max_chunks) ||
      !take_size_option(args, "--concurrency", session.concurrency)) {
    return 1;
  }
  if (take_flag(args, "--no-validation")) {
    session.validation_enabled = false;
  }
  if (take_flag(args, "--resume")) {
    session.resume = true;
  }

  pipeline::MetadataOverrides overrides;
  if (take_option(args, "--entities", "", value)) {
    auto content = common::read_file(common::expand_path(value));
    if (!content.ok()) {
      std::cerr << content.error() << "\n";
      return 1;
    }
    overrides.entities = content.value();
  }
  if (take_option(args, "--style", "", value)) {
    auto content = common::read_file(common::expand_path(value));
    if (!content.ok()) {
      std::cerr << content.error() << "\n";
      return 1;
    }
    overrides.style = content.value();
  }

  if (args.size() != 1) {
    std::cerr << "usage: transloom translate <source> --to <language> [options]\n";
    return 1;
  }
  session.source = common::expand_path(args[0]);

  if (session.session_id.empty()) {
    auto generated = pipeline::generate_session_id();
    if (!generated.ok()) {
      std::cerr << generated.error() << "\n";
      return 1;
    }
    session.session_id = generated.value();
  }

  pipeline::Dependencies deps;
  auto generator = providers::create_provider(
      cfg.generation.provider, cfg.generation.api_key,
      providers::ProviderOptions{.timeout_ms = cfg.generation.timeout_ms,
                                 .max_output_tokens = cfg.generation.max_output_tokens});
  if (!generator.ok()) {
    std::cerr << generator.error() << "\n";
    return 1;
  }
  deps.generator = generator.value();

  auto store = storage::create_artifact_store(cfg.storage);
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return 1;
  }
  deps.store = store.value();

  if (session.validation_enabled) {
    const std::string validation_provider =
        cfg.validation.provider.empty() ? cfg.generation.provider : cfg.validation.provider;
    const auto validation_key = validation_provider == cfg.generation.provider
                                    ? cfg.generation.api_key
                                    : std::optional<std::string>{};
    auto reviewer = providers::create_provider(
        validation_provider, validation_key,
        providers::ProviderOptions{.timeout_ms = cfg.generation.timeout_ms,
                                   .max_output_tokens = cfg.generation.max_output_tokens});
    if (!reviewer.ok()) {
      std::cerr << reviewer.error() << "\n";
      return 1;
    }
    deps.validator = std::make_shared<validation::AgentValidator>(
        reviewer.value(), deps.store,
        validation::AgentValidatorOptions{.model = cfg.validation.model,
                                          .temperature = cfg.validation.temperature});
  }

  deps.codecs = std::make_shared<const codecs::CodecRegistry>(
      codecs::CodecRegistry::with_default_codecs());
  deps.status_store = open_status_store(cfg);

  std::cout << "Session: " << session.session_id << "\n";
  pipeline::PipelineOrchestrator orchestrator(session, deps);
  g_active_run.store(&orchestrator);
  const auto previous_handler = std::signal(SIGINT, handle_interrupt);
  const auto report = orchestrator.run(overrides);
  std::signal(SIGINT, previous_handler);
  g_active_run.store(nullptr);

  print_state(report.state);
  std::cout << "Chunks: " << report.total_chunks << "\n";
  std::cout << "Output: " << report.output_folder << "\n";
  if (!report.final_locator.empty()) {
    std::cout << "Final: " << report.final_locator << "\n";
  }
  if (report.encoded_locator.has_value()) {
    std::cout << "Assembled: " << *report.encoded_locator << "\n";
  }

  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return report.success ? 0 : 1;
}

int run_status(std::vector<std::string> args) {
  if (args.size() != 1) {
    std::cerr << "usage: transloom status <session>\n";
    return 1;
  }
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  pipeline::StatusStore store(common::expand_path(cfg.value().storage.status_db));
  if (!store.is_open()) {
    std::cerr << "cannot open status db " << cfg.value().storage.status_db << "\n";
    return 1;
  }
  auto record = store.get(args[0]);
  if (!record.ok()) {
    std::cerr << record.error() << "\n";
    return 1;
  }
  if (!record.value().has_value()) {
    std::cerr << "unknown session: " << args[0] << "\n";
    return 1;
  }
  const auto &found = *record.value();
  std::cout << "Session: " << found.session_id << "\n";
  std::cout << "Source: " << found.source << "\n";
  std::cout << "Target language: " << found.target_language << "\n";
  std::cout << "Updated: " << format_time(found.updated_at) << "\n";
  print_state(found.state);
  return 0;
}

int run_chunk(std::vector<std::string> args) {
  std::size_t max_chunk_size = chunking::DEFAULT_MAX_CHUNK_SIZE;
  if (auto cfg = config::load_config(); cfg.ok()) {
    max_chunk_size = cfg.value().chunking.max_chunk_size;
  }
  if (!take_size_option(args, "--max-chunk-size", max_chunk_size)) {
    return 1;
  }
  if (args.size() != 1) {
    std::cerr << "usage: transloom chunk <file> [--max-chunk-size N]\n";
    return 1;
  }

  const std::string path = common::expand_path(args[0]);
  auto format = codecs::detect_format(path);
  if (!format.ok()) {
    std::cerr << format.error() << "\n";
    return 1;
  }
  auto bytes = common::read_file(path);
  if (!bytes.ok()) {
    std::cerr << bytes.error() << "\n";
    return 1;
  }
  const auto registry = codecs::CodecRegistry::with_default_codecs();
  auto document = registry.decode(format.value(), bytes.value());
  if (!document.ok()) {
    std::cerr << document.error() << "\n";
    return 1;
  }
  auto chunks = chunking::chunk_text(document.value().text, max_chunk_size);
  if (!chunks.ok()) {
    std::cerr << chunks.error() << "\n";
    return 1;
  }

  std::cout << "Format: " << codecs::format_name(format.value()) << "\n";
  std::cout << "Length: " << document.value().text.size() << "\n";
  std::cout << "Chunks: " << chunks.value().size() << "\n";
  for (const auto &chunk : chunks.value()) {
    std::cout << "  #" << chunk.index << "  [" << chunk.start_offset << ", " << chunk.end_offset
              << ")  " << chunk.content.size() << " bytes  "
              << chunking::boundary_kind_name(chunk.boundary) << "\n";
  }
  return 0;
}

int run_render(std::vector<std::string> args) {
  codecs::RenderOptions options;
  if (take_flag(args, "--no-untranslated")) {
    options.include_untranslated = false;
  }
  if (take_flag(args, "--no-fuzzy")) {
    options.include_fuzzy = false;
  }
  if (take_flag(args, "--obsolete")) {
    options.include_obsolete = true;
  }
  if (take_flag(args, "--no-metadata")) {
    options.include_metadata = false;
  }
  if (take_flag(args, "--comments")) {
    options.include_comments = true;
  }
  if (args.size() != 1) {
    std::cerr << "usage: transloom render <file.po> [--no-untranslated] [--no-fuzzy] "
                 "[--obsolete] [--no-metadata] [--comments]\n";
    return 1;
  }
  auto bytes = common::read_file(common::expand_path(args[0]));
  if (!bytes.ok()) {
    std::cerr << bytes.error() << "\n";
    return 1;
  }
  std::cout << codecs::render_catalog(codecs::parse_po(bytes.value()), options) << "\n";
  return 0;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  transloom" << RESET << DIM
            << "  chunked document translation pipeline" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "transloom [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  TRANSLATION" << RESET << "\n";
  std::cout << "  " << GREEN << "translate" << RESET << " FILE --to LANG" << DIM
            << "   Translate a .txt, .po or .epub document" << RESET << "\n";
  std::cout << DIM << "      --session ID  --model NAME  --max-chunk-size N  --max-chunks N\n"
            << "      --entities FILE  --style FILE  --concurrency N  --no-validation  --resume"
            << RESET << "\n";
  std::cout << "  " << GREEN << "status" << RESET << " SESSION" << DIM
            << "           Show the progress of a session" << RESET << "\n\n";

  std::cout << BOLD << "  INSPECTION" << RESET << "\n";
  std::cout << "  " << GREEN << "chunk" << RESET << " FILE" << DIM
            << "               Print chunk boundaries without translating" << RESET << "\n";
  std::cout << "  " << GREEN << "render" << RESET << " FILE.po" << DIM
            << "           Print the text projection of a PO catalog" << RESET << "\n\n";

  std::cout << BOLD << "  OTHER" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM
            << "              Print the configuration file location" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "                  Show version"
            << RESET << "\n\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "translate") {
    return run_translate(std::move(args));
  }
  if (subcommand == "status") {
    return run_status(std::move(args));
  }
  if (subcommand == "chunk") {
    return run_chunk(std::move(args));
  }
  if (subcommand == "render") {
    return run_render(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace transloom::cli
