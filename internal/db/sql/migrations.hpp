#pragma once

#include <string>
#include <vector>

namespace mountsync::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor; versions already recorded in
  schema_migrations are skipped.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  virtual int CurrentVersion() = 0;

  virtual void RecordVersion(int version) = 0;
};

// Index i of ordered_sql is schema version i + 1.
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// The item store schema, in order.
const std::vector<std::string>& ItemStoreMigrations();

} // namespace mountsync::db::sql
