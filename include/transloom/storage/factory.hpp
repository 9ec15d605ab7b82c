#pragma once

#include "transloom/common/result.hpp"
#include "transloom/config/schema.hpp"
#include "transloom/storage/artifact_store.hpp"

#include <memory>

namespace transloom::storage {

[[nodiscard]] common::Result<std::shared_ptr<ArtifactStore>>
create_artifact_store(const config::StorageConfig &config);

} // namespace transloom::storage
