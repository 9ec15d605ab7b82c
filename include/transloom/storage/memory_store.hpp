#pragma once

#include "transloom/storage/artifact_store.hpp"

#include <map>
#include <mutex>

namespace transloom::storage {

class MemoryArtifactStore final : public ArtifactStore {
public:
  [[nodiscard]] common::Result<std::string> put(const std::string &key,
                                                const std::string &bytes) override;
  [[nodiscard]] common::Result<std::string> get(const std::string &locator_or_key) const override;
  [[nodiscard]] common::Result<std::vector<ArtifactRef>>
  list_by_prefix(const std::string &prefix) const override;
  [[nodiscard]] bool exists(const std::string &key) const override;
  [[nodiscard]] common::Status remove(const std::string &key) override;
  [[nodiscard]] std::string locator_for(const std::string &key) const override;
  [[nodiscard]] std::string name() const override { return "memory"; }

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t write_count() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> objects_;
  std::size_t writes_ = 0;
};

} // namespace transloom::storage
