#include "transloom/config/config.hpp"

#include "transloom/common/fs.hpp"
#include "transloom/common/toml.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace transloom::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".transloom";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TRANSLOOM_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      out.push_back(ch == 'n' ? '\n' : ch == 't' ? '\t' : ch);
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](const char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
  });
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!key.empty()) {
      set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
    }
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("TRANSLOOM_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

bool provider_is_known(const std::string &provider) {
  const std::string normalized = common::to_lower(common::trim(provider));
  if (common::starts_with(normalized, "custom:")) {
    return true;
  }
  const auto providers = known_providers();
  return std::find(providers.begin(), providers.end(), normalized) != providers.end();
}

std::optional<std::string> read_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::vector<std::string> known_providers() {
  return {"google", "openai", "openrouter", "ollama", "groq", "mistral", "deepseek", "together"};
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const auto provider = read_env("TRANSLOOM_PROVIDER"); provider.has_value()) {
    config.generation.provider = *provider;
  }
  if (const auto model = read_env("TRANSLOOM_MODEL"); model.has_value()) {
    config.generation.model = *model;
  }
  if (const auto api_key = read_env("TRANSLOOM_API_KEY"); api_key.has_value()) {
    config.generation.api_key = *api_key;
  }
  if (const auto root = read_env("TRANSLOOM_STORAGE_ROOT"); root.has_value()) {
    config.storage.root = *root;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;

  auto &generation = config.generation;
  generation.provider = doc.get_string("generation.provider", generation.provider);
  generation.model = doc.get_string("generation.model", generation.model);
  if (doc.has("generation.api_key")) {
    generation.api_key = expand_config_value(doc.get_string("generation.api_key"));
  }
  generation.temperature = doc.get_double("generation.temperature", generation.temperature);
  generation.max_output_tokens = static_cast<std::uint32_t>(
      doc.get_u64("generation.max_output_tokens", generation.max_output_tokens));
  generation.timeout_ms = doc.get_u64("generation.timeout_ms", generation.timeout_ms);

  auto &validation = config.validation;
  validation.enabled = doc.get_bool("validation.enabled", validation.enabled);
  validation.provider = doc.get_string("validation.provider", validation.provider);
  validation.model = doc.get_string("validation.model", validation.model);
  validation.temperature = doc.get_double("validation.temperature", validation.temperature);

  auto &chunking = config.chunking;
  chunking.max_chunk_size = doc.get_u64("chunking.max_chunk_size", chunking.max_chunk_size);
  chunking.max_chunks = doc.get_u64("chunking.max_chunks", chunking.max_chunks);
  chunking.metadata_preview_size =
      doc.get_u64("chunking.metadata_preview_size", chunking.metadata_preview_size);

  config.pipeline.concurrency = doc.get_u64("pipeline.concurrency", config.pipeline.concurrency);
  config.pipeline.resume = doc.get_bool("pipeline.resume", config.pipeline.resume);

  config.storage.backend = doc.get_string("storage.backend", config.storage.backend);
  config.storage.root = expand_config_value(doc.get_string("storage.root", config.storage.root));
  config.storage.status_db =
      expand_config_value(doc.get_string("storage.status_db", config.storage.status_db));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (!provider_is_known(config.generation.provider)) {
    return common::Result<std::vector<std::string>>::failure("Unknown generation.provider: " +
                                                              config.generation.provider);
  }
  if (!config.validation.provider.empty() && !provider_is_known(config.validation.provider)) {
    return common::Result<std::vector<std::string>>::failure("Unknown validation.provider: " +
                                                              config.validation.provider);
  }
  if (common::trim(config.generation.model).empty()) {
    return common::Result<std::vector<std::string>>::failure("generation.model must be set");
  }

  if (config.generation.temperature < 0.0 || config.generation.temperature > 2.0) {
    return common::Result<std::vector<std::string>>::failure(
        "generation.temperature must be between 0.0 and 2.0");
  }
  if (config.validation.temperature < 0.0 || config.validation.temperature > 2.0) {
    return common::Result<std::vector<std::string>>::failure(
        "validation.temperature must be between 0.0 and 2.0");
  }

  if (config.chunking.max_chunk_size == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "chunking.max_chunk_size must be greater than zero");
  }
  if (config.pipeline.concurrency == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "pipeline.concurrency must be at least 1");
  }

  const std::string backend = common::to_lower(config.storage.backend);
  if (backend != "filesystem" && backend != "memory") {
    return common::Result<std::vector<std::string>>::failure("Invalid storage.backend: " +
                                                              config.storage.backend);
  }

  if (config.chunking.metadata_preview_size > 4 * config.chunking.max_chunk_size) {
    warnings.push_back("chunking.metadata_preview_size is more than four times max_chunk_size");
  }
  if (config.pipeline.concurrency > 16) {
    warnings.push_back("pipeline.concurrency above 16 is likely to hit provider rate limits");
  }
  if (config.validation.enabled &&
      config.validation.temperature > config.generation.temperature) {
    warnings.push_back("validation.temperature is higher than generation.temperature");
  }
  if (backend == "memory") {
    warnings.push_back("storage.backend = \"memory\" keeps no artifacts after the run");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace transloom::config
