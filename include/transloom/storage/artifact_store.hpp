#pragma once

#include "transloom/common/result.hpp"

#include <string>
#include <vector>

namespace transloom::storage {

struct ArtifactRef {
  std::string key;
  std::string locator;
};

/// Durable key -> bytes store. Writing an existing key overwrites it.
/// Implementations must allow concurrent writes to distinct keys.
class ArtifactStore {
public:
  virtual ~ArtifactStore() = default;

  [[nodiscard]] virtual common::Result<std::string> put(const std::string &key,
                                                        const std::string &bytes) = 0;

  [[nodiscard]] virtual common::Result<std::string> get(const std::string &locator_or_key) const = 0;

  /// Artifacts whose key starts with `prefix`, sorted by key.
  [[nodiscard]] virtual common::Result<std::vector<ArtifactRef>>
  list_by_prefix(const std::string &prefix) const = 0;

  [[nodiscard]] virtual bool exists(const std::string &key) const = 0;
  // Removing a missing key succeeds.
  [[nodiscard]] virtual common::Status remove(const std::string &key) = 0;
  [[nodiscard]] virtual std::string locator_for(const std::string &key) const = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace transloom::storage
