#pragma once

#include "transloom/common/result.hpp"
#include <filesystem>
#include <string>

namespace transloom::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string replace_first(std::string value, const std::string &from,
                                        const std::string &to);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Writes through a sibling `.tmp` file and renames it over the target.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path, const std::string &bytes);

} // namespace transloom::common
