#include "migrations.hpp"

namespace mountsync::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  executor.ExecuteSQL("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");

  const int current = executor.CurrentVersion();
  for (size_t i = static_cast<size_t>(current); i < ordered_sql.size(); ++i) {
    executor.ExecuteSQL(ordered_sql[i]);
    executor.RecordVersion(static_cast<int>(i + 1));
  }
}

const std::vector<std::string>& ItemStoreMigrations() {
  static const std::vector<std::string> kMigrations = {
      // v1
      "CREATE TABLE IF NOT EXISTS items ("
      " id TEXT PRIMARY KEY,"
      " name TEXT NOT NULL,"
      " status INTEGER NOT NULL,"
      " missing_streak INTEGER NOT NULL DEFAULT 0,"
      " source_path TEXT NOT NULL DEFAULT '',"
      " metadata_hash TEXT NOT NULL DEFAULT '',"
      " needs_inspection INTEGER NOT NULL DEFAULT 0,"
      " inspection_note TEXT NOT NULL DEFAULT '',"
      " created_at_ms INTEGER NOT NULL,"
      " last_seen_at_ms INTEGER NOT NULL DEFAULT 0,"
      " last_checked_at_ms INTEGER NOT NULL DEFAULT 0,"
      " status_changed_at_ms INTEGER NOT NULL DEFAULT 0);"
      "CREATE TABLE IF NOT EXISTS item_files ("
      " item_id TEXT NOT NULL REFERENCES items(id) ON DELETE CASCADE,"
      " position INTEGER NOT NULL,"
      " path TEXT NOT NULL,"
      " size_bytes INTEGER NOT NULL,"
      " PRIMARY KEY (item_id, position));",
      // v2
      "CREATE INDEX IF NOT EXISTS items_status_idx ON items(status);"
      "CREATE INDEX IF NOT EXISTS items_source_path_idx ON items(source_path);",
  };
  return kMigrations;
}

} // namespace mountsync::db::sql
