#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/db/sql/migrations.hpp"
#include "internal/util/time.hpp"

namespace mountsync::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int CurrentVersion() override {
    sqlite3_stmt* st      = db_.Prepare("SELECT COALESCE(MAX(version),0) FROM schema_migrations;");
    int           version = 0;
    if (sqlite3_step(st) == SQLITE_ROW) {
      version = sqlite3_column_int(st, 0);
    }
    sqlite3_finalize(st);
    return version;
  }

  void RecordVersion(int version) override {
    sqlite3_stmt* st = db_.Prepare("INSERT INTO schema_migrations(version,applied_at_ms) VALUES(?,?);");
    sqlite3_bind_int(st, 1, version);
    sqlite3_bind_int64(st, 2, static_cast<sqlite3_int64>(util::ToUnixMillis(util::Now())));
    const int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
      throw std::runtime_error("record schema version: " + std::string(sqlite3_errmsg(db_.Handle())));
    }
  }

 private:
  SqliteDB& db_;
};

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
  if (options_.create_if_missing) {
    flags |= SQLITE_OPEN_CREATE;
  }
  int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = path_ + ": " + (db_ ? sqlite3_errmsg(db_) : "sqlite open failed");
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Migrate(const std::vector<std::string>& ordered_sql) {
  SqliteMigrationExecutor executor(*this);
  sql::RunMigrations(executor, ordered_sql);
}

void SqliteDB::Configure() {
  // WAL lets the ctl tool read while the daemon writes
  if (options_.wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite; item_files cascades on them
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout_ms)), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace mountsync::db::sqlite
