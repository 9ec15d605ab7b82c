#include "transloom/storage/factory.hpp"

#include "transloom/common/fs.hpp"
#include "transloom/storage/filesystem_store.hpp"
#include "transloom/storage/memory_store.hpp"

namespace transloom::storage {

common::Result<std::shared_ptr<ArtifactStore>>
create_artifact_store(const config::StorageConfig &config) {
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend == "memory") {
    return common::Result<std::shared_ptr<ArtifactStore>>::success(
        std::make_shared<MemoryArtifactStore>());
  }
  if (backend == "filesystem") {
    const std::filesystem::path root = common::expand_path(config.root);
    auto dir = common::ensure_dir(root);
    if (!dir.ok()) {
      return common::Result<std::shared_ptr<ArtifactStore>>::failure(dir.error());
    }
    return common::Result<std::shared_ptr<ArtifactStore>>::success(
        std::make_shared<FilesystemArtifactStore>(root));
  }
  return common::Result<std::shared_ptr<ArtifactStore>>::failure("Unknown storage backend: " +
                                                                 config.backend);
}

} // namespace transloom::storage
