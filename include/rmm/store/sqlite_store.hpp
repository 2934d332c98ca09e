#pragma once

#include "rmm/store/store.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <mutex>

namespace rmm::store {

/// Single-table SQLite store: (namespace, key) -> value, created_at, updated_at.
class SqliteStore final : public IKeyValueStore {
public:
  explicit SqliteStore(std::filesystem::path db_path);
  ~SqliteStore() override;

  SqliteStore(const SqliteStore &) = delete;
  SqliteStore &operator=(const SqliteStore &) = delete;

  /// Open failure or schema failure; empty when the store is usable.
  [[nodiscard]] const std::string &open_error() const { return open_error_; }

  [[nodiscard]] std::string_view name() const override { return "sqlite"; }
  [[nodiscard]] common::Result<std::optional<StoreItem>> get(const Namespace &ns,
                                                             const std::string &key) override;
  [[nodiscard]] common::Status put(const Namespace &ns, const std::string &key,
                                   const std::string &value) override;

private:
  common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::mutex mutex_;
};

} // namespace rmm::store
