#include "transloom/storage/memory_store.hpp"

#include "transloom/common/fs.hpp"

namespace transloom::storage {

namespace {

constexpr const char *MEMORY_SCHEME = "mem://";

std::string strip_scheme(const std::string &locator_or_key) {
  if (common::starts_with(locator_or_key, MEMORY_SCHEME)) {
    return locator_or_key.substr(std::string(MEMORY_SCHEME).size());
  }
  return locator_or_key;
}

} // namespace

common::Result<std::string> MemoryArtifactStore::put(const std::string &key,
                                                     const std::string &bytes) {
  if (key.empty()) {
    return common::Result<std::string>::failure("invalid artifact key: empty");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  objects_[key] = bytes;
  ++writes_;
  return common::Result<std::string>::success(MEMORY_SCHEME + key);
}

common::Result<std::string> MemoryArtifactStore::get(const std::string &locator_or_key) const {
  const std::string key = strip_scheme(locator_or_key);
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = objects_.find(key);
  if (it == objects_.end()) {
    return common::Result<std::string>::failure("artifact not found: " + key);
  }
  return common::Result<std::string>::success(it->second);
}

common::Result<std::vector<ArtifactRef>>
MemoryArtifactStore::list_by_prefix(const std::string &prefix) const {
  std::vector<ArtifactRef> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = objects_.lower_bound(prefix);
       it != objects_.end() && common::starts_with(it->first, prefix); ++it) {
    out.push_back({.key = it->first, .locator = MEMORY_SCHEME + it->first});
  }
  return common::Result<std::vector<ArtifactRef>>::success(std::move(out));
}

bool MemoryArtifactStore::exists(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.find(strip_scheme(key)) != objects_.end();
}

common::Status MemoryArtifactStore::remove(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  objects_.erase(strip_scheme(key));
  return common::Status::success();
}

std::string MemoryArtifactStore::locator_for(const std::string &key) const {
  return MEMORY_SCHEME + key;
}

std::size_t MemoryArtifactStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.size();
}

std::size_t MemoryArtifactStore::write_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return writes_;
}

} // namespace transloom::storage
