#pragma once

#include "transloom/common/result.hpp"
#include "transloom/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace transloom::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

/// Hard errors fail; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

[[nodiscard]] std::vector<std::string> known_providers();

void apply_env_overrides(Config &config);

} // namespace transloom::config
