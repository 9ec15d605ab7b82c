#include "transloom/pipeline/status_store.hpp"

#include "transloom/common/json_util.hpp"

#include <charconv>
#include <sstream>

namespace transloom::pipeline {

namespace {

constexpr const char *NOT_OPEN = "status db not initialized";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message);
  }
  return common::Status::success();
}

// Warnings are free text and may span several lines, so the column holds a
// JSON array of strings.
std::string join_warnings(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    out += "\"" + common::json_escape(values[i]) + "\"";
  }
  out.push_back(']');
  return out;
}

std::vector<std::string> split_warnings(const std::string &value) {
  std::vector<std::string> out;
  std::size_t pos = common::json_skip_ws(value, 0);
  if (pos >= value.size() || value[pos] != '[') {
    return out;
  }
  pos = common::json_skip_ws(value, pos + 1);
  while (pos < value.size() && value[pos] == '"') {
    const auto end = common::json_find_string_end(value, pos);
    if (end == std::string::npos) {
      break;
    }
    out.push_back(common::json_unescape(value.substr(pos + 1, end - pos - 1)));
    pos = common::json_skip_ws(value, end + 1);
    if (pos < value.size() && value[pos] == ',') {
      pos = common::json_skip_ws(value, pos + 1);
    }
  }
  return out;
}

std::string join_indices(const std::vector<std::size_t> &values) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    out += std::to_string(values[i]);
  }
  return out;
}

std::vector<std::size_t> split_indices(const std::string &value) {
  std::vector<std::size_t> out;
  std::istringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    std::size_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), parsed);
    if (ec == std::errc() && ptr == item.data() + item.size()) {
      out.push_back(parsed);
    }
  }
  return out;
}

std::optional<ErrorKind> error_kind_from_name(const std::string &name) {
  for (const auto kind : {ErrorKind::Configuration, ErrorKind::Decode, ErrorKind::Chunking,
                          ErrorKind::Generation, ErrorKind::Validation, ErrorKind::ReassemblyEncode,
                          ErrorKind::Storage, ErrorKind::Cancelled}) {
    if (error_kind_name(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  return text == nullptr ? "" : text;
}

void bind_text(sqlite3_stmt *stmt, const int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_size(sqlite3_stmt *stmt, const int index, const std::size_t value) {
  sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(value));
}

// Binds the state columns ?2..?13.
void bind_state(sqlite3_stmt *stmt, const SessionState &state) {
  bind_text(stmt, 2, std::string(stage_name(state.stage)));
  bind_size(stmt, 3, state.chunks_created);
  bind_size(stmt, 4, state.prompts_built);
  bind_size(stmt, 5, state.translations_completed);
  bind_size(stmt, 6, state.validations_completed);
  bind_size(stmt, 7, state.validations_failed);
  sqlite3_bind_int(stmt, 8, state.truncated ? 1 : 0);
  bind_text(stmt, 9, join_warnings(state.warnings));
  bind_text(stmt, 10, join_indices(state.fallback_chunks));
  if (state.structural_encode.has_value()) {
    sqlite3_bind_int(stmt, 11, *state.structural_encode ? 1 : 0);
  } else {
    sqlite3_bind_null(stmt, 11);
  }
  if (state.last_error.has_value()) {
    bind_text(stmt, 12, std::string(error_kind_name(state.last_error->kind)));
    bind_text(stmt, 13, state.last_error->stage + "\n" + state.last_error->message);
  } else {
    sqlite3_bind_null(stmt, 12);
    sqlite3_bind_null(stmt, 13);
  }
  const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
  sqlite3_bind_int64(stmt, 14, static_cast<sqlite3_int64>(now));
}

constexpr const char *SELECT_COLUMNS =
    "SELECT id, source, target_language, source_digest, stage, chunks_created, prompts_built, "
    "translations_completed, validations_completed, validations_failed, truncated, warnings, "
    "fallback_chunks, structural_encode, error_kind, error_detail, updated_at FROM sessions";

SessionRecord row_to_record(sqlite3_stmt *stmt) {
  SessionRecord record;
  record.session_id = column_text(stmt, 0);
  record.source = column_text(stmt, 1);
  record.target_language = column_text(stmt, 2);
  record.source_digest = column_text(stmt, 3);

  auto &state = record.state;
  state.stage = stage_from_name(column_text(stmt, 4)).value_or(Stage::Initializing);
  state.chunks_created = static_cast<std::size_t>(sqlite3_column_int64(stmt, 5));
  state.prompts_built = static_cast<std::size_t>(sqlite3_column_int64(stmt, 6));
  state.translations_completed = static_cast<std::size_t>(sqlite3_column_int64(stmt, 7));
  state.validations_completed = static_cast<std::size_t>(sqlite3_column_int64(stmt, 8));
  state.validations_failed = static_cast<std::size_t>(sqlite3_column_int64(stmt, 9));
  state.truncated = sqlite3_column_int(stmt, 10) != 0;
  state.warnings = split_warnings(column_text(stmt, 11));
  state.fallback_chunks = split_indices(column_text(stmt, 12));
  if (sqlite3_column_type(stmt, 13) != SQLITE_NULL) {
    state.structural_encode = sqlite3_column_int(stmt, 13) != 0;
  }
  if (sqlite3_column_type(stmt, 14) != SQLITE_NULL) {
    const auto kind = error_kind_from_name(column_text(stmt, 14));
    const std::string detail = column_text(stmt, 15);
    const auto newline = detail.find('\n');
    state.last_error = PipelineError{
        .kind = kind.value_or(ErrorKind::Configuration),
        .stage = newline == std::string::npos ? detail : detail.substr(0, newline),
        .message = newline == std::string::npos ? "" : detail.substr(newline + 1),
    };
  }
  record.updated_at = std::chrono::system_clock::time_point(
      std::chrono::seconds(sqlite3_column_int64(stmt, 16)));
  return record;
}

} // namespace

StatusStore::StatusStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  if (!init_schema().ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

StatusStore::~StatusStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status StatusStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error(NOT_OPEN);
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS sessions (
  id TEXT PRIMARY KEY,
  source TEXT NOT NULL,
  target_language TEXT NOT NULL,
  source_digest TEXT NOT NULL,
  stage TEXT NOT NULL,
  chunks_created INTEGER NOT NULL DEFAULT 0,
  prompts_built INTEGER NOT NULL DEFAULT 0,
  translations_completed INTEGER NOT NULL DEFAULT 0,
  validations_completed INTEGER NOT NULL DEFAULT 0,
  validations_failed INTEGER NOT NULL DEFAULT 0,
  truncated INTEGER NOT NULL DEFAULT 0,
  warnings TEXT NOT NULL DEFAULT '',
  fallback_chunks TEXT NOT NULL DEFAULT '',
  structural_encode INTEGER,
  error_kind TEXT,
  error_detail TEXT,
  updated_at INTEGER NOT NULL
);
)");
}

common::Status StatusStore::save(const SessionRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(NOT_OPEN);
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT OR REPLACE INTO sessions(id, stage, chunks_created, prompts_built, "
      "translations_completed, validations_completed, validations_failed, truncated, warnings, "
      "fallback_chunks, structural_encode, error_kind, error_detail, updated_at, source, "
      "target_language, source_digest) "
      "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, record.session_id);
  bind_state(stmt, record.state);
  bind_text(stmt, 15, record.source);
  bind_text(stmt, 16, record.target_language);
  bind_text(stmt, 17, record.source_digest);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Status StatusStore::update_state(const std::string &session_id,
                                         const SessionState &state) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(NOT_OPEN);
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "UPDATE sessions SET stage = ?2, chunks_created = ?3, prompts_built = ?4, "
      "translations_completed = ?5, validations_completed = ?6, validations_failed = ?7, "
      "truncated = ?8, warnings = ?9, fallback_chunks = ?10, structural_encode = ?11, "
      "error_kind = ?12, error_detail = ?13, updated_at = ?14 WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, session_id);
  bind_state(stmt, state);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  if (sqlite3_changes(db_) == 0) {
    return common::Status::error("unknown session: " + session_id);
  }
  return common::Status::success();
}

common::Result<std::vector<SessionRecord>>
StatusStore::query(const std::string &sql, const std::optional<std::string> &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<SessionRecord>>::failure(NOT_OPEN);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<SessionRecord>>::failure(sqlite3_errmsg(db_));
  }
  if (session_id.has_value()) {
    bind_text(stmt, 1, *session_id);
  }

  std::vector<SessionRecord> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    out.push_back(row_to_record(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<SessionRecord>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<SessionRecord>>::success(std::move(out));
}

common::Result<std::optional<SessionRecord>> StatusStore::get(const std::string &session_id) {
  auto rows = query(std::string(SELECT_COLUMNS) + " WHERE id = ?1", session_id);
  if (!rows.ok()) {
    return common::Result<std::optional<SessionRecord>>::failure(rows.error());
  }
  if (rows.value().empty()) {
    return common::Result<std::optional<SessionRecord>>::success(std::nullopt);
  }
  return common::Result<std::optional<SessionRecord>>::success(std::move(rows.value().front()));
}

common::Result<std::vector<SessionRecord>> StatusStore::list() {
  return query(std::string(SELECT_COLUMNS) + " ORDER BY updated_at DESC, id ASC", std::nullopt);
}

} // namespace transloom::pipeline
