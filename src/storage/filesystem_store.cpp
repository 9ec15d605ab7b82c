#include "transloom/storage/filesystem_store.hpp"

#include "transloom/common/fs.hpp"

#include <algorithm>

namespace transloom::storage {

namespace {

constexpr const char *FILE_SCHEME = "file://";

bool is_valid_key(const std::string &key) {
  if (key.empty() || key.front() == '/') {
    return false;
  }
  for (const auto &part : std::filesystem::path(key)) {
    if (part == "..") {
      return false;
    }
  }
  return true;
}

} // namespace

FilesystemArtifactStore::FilesystemArtifactStore(std::filesystem::path root)
    : root_(std::filesystem::absolute(std::move(root)).lexically_normal()) {}

std::filesystem::path FilesystemArtifactStore::path_for(const std::string &key) const {
  return root_ / key;
}

std::string FilesystemArtifactStore::locator_for(const std::string &key) const {
  return FILE_SCHEME + path_for(key).generic_string();
}

common::Result<std::string> FilesystemArtifactStore::put(const std::string &key,
                                                         const std::string &bytes) {
  if (!is_valid_key(key)) {
    return common::Result<std::string>::failure("invalid artifact key: " + key);
  }
  const auto path = path_for(key);
  auto dir = common::ensure_dir(path.parent_path());
  if (!dir.ok()) {
    return common::Result<std::string>::failure(dir.error());
  }
  auto written = common::write_file_atomic(path, bytes);
  if (!written.ok()) {
    return common::Result<std::string>::failure(written.error());
  }
  return common::Result<std::string>::success(locator_for(key));
}

common::Result<std::string> FilesystemArtifactStore::get(const std::string &locator_or_key) const {
  if (common::starts_with(locator_or_key, FILE_SCHEME)) {
    return common::read_file(locator_or_key.substr(std::string(FILE_SCHEME).size()));
  }
  if (!is_valid_key(locator_or_key)) {
    return common::Result<std::string>::failure("invalid artifact key: " + locator_or_key);
  }
  return common::read_file(path_for(locator_or_key));
}

common::Result<std::vector<ArtifactRef>>
FilesystemArtifactStore::list_by_prefix(const std::string &prefix) const {
  std::vector<ArtifactRef> out;
  const auto slash = prefix.rfind('/');
  const std::filesystem::path base =
      slash == std::string::npos ? root_ : root_ / prefix.substr(0, slash);

  std::error_code ec;
  if (!std::filesystem::is_directory(base, ec)) {
    return common::Result<std::vector<ArtifactRef>>::success(std::move(out));
  }

  std::filesystem::recursive_directory_iterator it(base, ec);
  if (ec) {
    return common::Result<std::vector<ArtifactRef>>::failure("cannot list " + base.string() +
                                                             ": " + ec.message());
  }
  for (const auto end = std::filesystem::recursive_directory_iterator(); it != end;
       it.increment(ec)) {
    if (ec) {
      return common::Result<std::vector<ArtifactRef>>::failure("cannot list " + base.string() +
                                                               ": " + ec.message());
    }
    if (!it->is_regular_file(ec) || it->path().extension() == ".tmp") {
      continue;
    }
    const std::string key = it->path().lexically_relative(root_).generic_string();
    if (common::starts_with(key, prefix)) {
      out.push_back({.key = key, .locator = locator_for(key)});
    }
  }

  std::sort(out.begin(), out.end(),
            [](const ArtifactRef &a, const ArtifactRef &b) { return a.key < b.key; });
  return common::Result<std::vector<ArtifactRef>>::success(std::move(out));
}

bool FilesystemArtifactStore::exists(const std::string &key) const {
  if (!is_valid_key(key)) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::is_regular_file(path_for(key), ec);
}

common::Status FilesystemArtifactStore::remove(const std::string &key) {
  if (!is_valid_key(key)) {
    return common::Status::error("invalid artifact key: " + key);
  }
  std::error_code ec;
  std::filesystem::remove(path_for(key), ec);
  if (ec) {
    return common::Status::error("cannot remove " + key + ": " + ec.message());
  }
  return common::Status::success();
}

} // namespace transloom::storage
