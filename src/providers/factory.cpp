#include "transloom/providers/factory.hpp"

#include "transloom/common/fs.hpp"
#include "transloom/providers/compatible.hpp"

#include <cctype>
#include <cstdlib>
#include <unordered_map>
#include <vector>

namespace transloom::providers {

namespace {

struct CompatibleRoute {
  std::string base_url;
  bool require_api_key = true;
  std::vector<const char *> key_env;
  std::unordered_map<std::string, std::string> extra_headers;
};

std::optional<std::string> read_env(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  const std::string trimmed = common::trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

std::string provider_env_prefix(const std::string &provider) {
  std::string prefix;
  prefix.reserve(provider.size());
  for (const char ch : provider) {
    if (std::isalnum(static_cast<unsigned char>(ch)) != 0) {
      prefix.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
      continue;
    }
    prefix.push_back('_');
  }
  return prefix;
}

std::string resolve_base_url(const std::string &provider, const std::string &default_base_url) {
  const std::string prefix = provider_env_prefix(provider);
  if (const auto local = read_env(prefix + "_BASE_URL"); local.has_value()) {
    return *local;
  }
  if (const auto global = read_env("TRANSLOOM_" + prefix + "_BASE_URL"); global.has_value()) {
    return *global;
  }
  return default_base_url;
}

std::optional<std::string> resolve_api_key(const std::optional<std::string> &api_key,
                                           const std::vector<const char *> &env_names) {
  if (api_key.has_value()) {
    const std::string trimmed = common::trim(*api_key);
    if (!trimmed.empty()) {
      return trimmed;
    }
  }
  for (const auto *name : env_names) {
    if (auto value = read_env(name); value.has_value()) {
      return value;
    }
  }
  return std::nullopt;
}

const std::unordered_map<std::string, CompatibleRoute> &routes() {
  static const std::unordered_map<std::string, CompatibleRoute> table = {
      {"google",
       {"https://generativelanguage.googleapis.com/v1beta/openai", true,
        {"GEMINI_API_KEY", "GOOGLE_API_KEY"}, {}}},
      {"openai", {"https://api.openai.com/v1", true, {"OPENAI_API_KEY"}, {}}},
      {"openrouter",
       {"https://openrouter.ai/api/v1", true, {"OPENROUTER_API_KEY"},
        {{"X-Title", "transloom"}}}},
      {"ollama", {"http://127.0.0.1:11434/v1", false, {"OLLAMA_API_KEY"}, {}}},
      {"groq", {"https://api.groq.com/openai/v1", true, {"GROQ_API_KEY"}, {}}},
      {"mistral", {"https://api.mistral.ai/v1", true, {"MISTRAL_API_KEY"}, {}}},
      {"deepseek", {"https://api.deepseek.com/v1", true, {"DEEPSEEK_API_KEY"}, {}}},
      {"together", {"https://api.together.xyz/v1", true, {"TOGETHER_API_KEY"}, {}}},
  };
  return table;
}

} // namespace

common::Result<std::shared_ptr<Provider>>
create_provider(const std::string &name, const std::optional<std::string> &api_key,
                ProviderOptions options, std::shared_ptr<HttpClient> http_client) {
  const std::string trimmed_name = common::trim(name);
  const std::string normalized = common::to_lower(trimmed_name);

  if (const auto it = routes().find(normalized); it != routes().end()) {
    const auto &route = it->second;
    return common::Result<std::shared_ptr<Provider>>::success(std::make_shared<CompatibleProvider>(
        normalized, resolve_base_url(normalized, route.base_url),
        resolve_api_key(api_key, route.key_env).value_or(""), std::move(http_client),
        route.require_api_key, options, route.extra_headers));
  }

  if (common::starts_with(normalized, "custom:")) {
    const std::string url = common::trim(trimmed_name.substr(7));
    if (url.empty() ||
        (!common::starts_with(url, "http://") && !common::starts_with(url, "https://"))) {
      return common::Result<std::shared_ptr<Provider>>::failure(
          "Custom provider requires URL format custom:https://...");
    }
    return common::Result<std::shared_ptr<Provider>>::success(std::make_shared<CompatibleProvider>(
        "custom", url, resolve_api_key(api_key, {"TRANSLOOM_CUSTOM_API_KEY"}).value_or(""),
        std::move(http_client), false, options));
  }

  return common::Result<std::shared_ptr<Provider>>::failure("Unknown provider: " + name);
}

} // namespace transloom::providers
