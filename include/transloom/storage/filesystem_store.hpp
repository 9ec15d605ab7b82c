#pragma once

#include "transloom/storage/artifact_store.hpp"

#include <filesystem>

namespace transloom::storage {

/// Keys map to paths below `root`; locators are `file://<absolute path>`.
class FilesystemArtifactStore final : public ArtifactStore {
public:
  explicit FilesystemArtifactStore(std::filesystem::path root);

  [[nodiscard]] common::Result<std::string> put(const std::string &key,
                                                const std::string &bytes) override;
  [[nodiscard]] common::Result<std::string> get(const std::string &locator_or_key) const override;
  [[nodiscard]] common::Result<std::vector<ArtifactRef>>
  list_by_prefix(const std::string &prefix) const override;
  [[nodiscard]] bool exists(const std::string &key) const override;
  [[nodiscard]] common::Status remove(const std::string &key) override;
  [[nodiscard]] std::string locator_for(const std::string &key) const override;
  [[nodiscard]] std::string name() const override { return "filesystem"; }

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] std::filesystem::path path_for(const std::string &key) const;

private:
  std::filesystem::path root_;
};

} // namespace transloom::storage
