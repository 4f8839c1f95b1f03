#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mountsync::db::sqlite {

struct SqliteOptions {
  bool     wal_mode          = true;
  uint32_t busy_timeout_ms   = 5000;
  // false: opening a path with no database file fails instead of creating one
  bool     create_if_missing = true;
};

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // One connection carries one transaction at a time.
  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  // Brings the schema up to the latest version.
  void Migrate(const std::vector<std::string>& ordered_sql);

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace mountsync::db::sqlite
