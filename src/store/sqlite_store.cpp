#include "rmm/store/sqlite_store.hpp"

#include "rmm/common/id.hpp"

namespace rmm::store {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

} // namespace

SqliteStore::SqliteStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  if (db_path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "sqlite3_open failed" : sqlite3_errmsg(db_);
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }

  if (auto status = init_schema(); !status.ok()) {
    open_error_ = status.error();
  }
}

SqliteStore::~SqliteStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }

  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS store_items (
  namespace TEXT NOT NULL,
  key TEXT NOT NULL,
  value TEXT NOT NULL,
  created_at INTEGER NOT NULL,
  updated_at INTEGER NOT NULL,
  PRIMARY KEY (namespace, key)
);
)");
}

common::Result<std::optional<StoreItem>> SqliteStore::get(const Namespace &ns,
                                                          const std::string &key) {
  using ResultT = common::Result<std::optional<StoreItem>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr || !open_error_.empty()) {
    return ResultT::failure("store unavailable: " + open_error_);
  }

  const std::string ns_key = namespace_key(ns);
  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "SELECT value, created_at, updated_at FROM store_items WHERE namespace = ?1 AND key = ?2";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return ResultT::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, ns_key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
    StoreItem item{
        .value = text == nullptr ? "" : text,
        .created_at = sqlite3_column_int64(stmt, 1),
        .updated_at = sqlite3_column_int64(stmt, 2),
    };
    sqlite3_finalize(stmt);
    return ResultT::success(std::move(item));
  }

  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return ResultT::failure(sqlite3_errmsg(db_));
  }
  return ResultT::success(std::nullopt);
}

common::Status SqliteStore::put(const Namespace &ns, const std::string &key,
                                const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr || !open_error_.empty()) {
    return common::Status::error("store unavailable: " + open_error_);
  }

  const std::string ns_key = namespace_key(ns);
  const std::int64_t now = common::now_ms();
  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
INSERT INTO store_items(namespace, key, value, created_at, updated_at)
VALUES(?1, ?2, ?3, ?4, ?4)
ON CONFLICT(namespace, key) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, ns_key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 4, now);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

} // namespace rmm::store
