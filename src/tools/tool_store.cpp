#include "codebox/tools/tool_store.hpp"

#include "codebox/common/fs.hpp"

namespace codebox::tools {

namespace {

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

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  return text == nullptr ? std::string() : std::string(text);
}

} // namespace

ToolStore::ToolStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  if (db_path_.has_parent_path()) {
    if (const auto dir = common::ensure_dir(db_path_.parent_path()); !dir.ok()) {
      open_error_ = dir.error();
      return;
    }
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "sqlite3_open failed" : sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }
  const auto schema = init_schema();
  if (!schema.ok()) {
    open_error_ = schema.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

ToolStore::~ToolStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status ToolStore::init_schema() {
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS tools (
  name TEXT PRIMARY KEY,
  params TEXT NOT NULL,
  body TEXT NOT NULL,
  doc TEXT NOT NULL,
  source TEXT NOT NULL,
  created_at TEXT NOT NULL
);
)");
}

common::Status ToolStore::insert(const ToolEntry &entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("tool store unavailable: " + open_error_);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO tools(name, params, body, doc, source, created_at) "
                    "VALUES(?1, ?2, ?3, ?4, ?5, ?6)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  sqlite3_bind_text(stmt, 1, entry.name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, entry.params.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, entry.body.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, entry.doc.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, entry.source.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 6, entry.created_at.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc == SQLITE_CONSTRAINT) {
    return common::Status::error("tool '" + entry.name + "' already exists",
                                 common::ErrorCode::AlreadyExists);
  }
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::vector<ToolEntry>> ToolStore::list() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<ToolEntry>>::failure("tool store unavailable: " +
                                                           open_error_);
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "SELECT name, params, body, doc, source, created_at FROM tools "
                         "ORDER BY created_at ASC, name ASC",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<ToolEntry>>::failure(sqlite3_errmsg(db_));
  }

  std::vector<ToolEntry> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    out.push_back(ToolEntry{
        .name = column_text(stmt, 0),
        .params = column_text(stmt, 1),
        .body = column_text(stmt, 2),
        .doc = column_text(stmt, 3),
        .source = column_text(stmt, 4),
        .created_at = column_text(stmt, 5),
    });
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<ToolEntry>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<ToolEntry>>::success(std::move(out));
}

} // namespace codebox::tools
