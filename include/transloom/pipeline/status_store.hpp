#pragma once

#include "transloom/common/result.hpp"
#include "transloom/pipeline/session.hpp"

#include <sqlite3.h>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace transloom::pipeline {

struct SessionRecord {
  std::string session_id;
  std::string source;
  std::string target_language;
  std::string source_digest;
  SessionState state;
  std::chrono::system_clock::time_point updated_at{};
};

/// Latest SessionState per session, kept in SQLite so another process can poll it.
class StatusStore {
public:
  explicit StatusStore(std::filesystem::path db_path);
  ~StatusStore();

  StatusStore(const StatusStore &) = delete;
  StatusStore &operator=(const StatusStore &) = delete;

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }

  [[nodiscard]] common::Status save(const SessionRecord &record);
  [[nodiscard]] common::Status update_state(const std::string &session_id,
                                            const SessionState &state);
  [[nodiscard]] common::Result<std::optional<SessionRecord>> get(const std::string &session_id);
  [[nodiscard]] common::Result<std::vector<SessionRecord>> list();

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<std::vector<SessionRecord>>
  query(const std::string &sql, const std::optional<std::string> &session_id);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace transloom::pipeline
