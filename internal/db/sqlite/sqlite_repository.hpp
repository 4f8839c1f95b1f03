#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace mountsync::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertItem(Transaction&, const model::ItemRecord&) override;
  std::optional<model::ItemRecord> GetItem(Transaction&, const std::string&) override;
  std::vector<model::ItemRecord> ListItems(Transaction&, const ItemFilter&) override;
  Result UpdateItem(Transaction&, const model::ItemRecord&) override;
  Result DeleteItem(Transaction&, const std::string&) override;
  Result PurgeRemoved(Transaction&, uint64_t status_changed_before_ms, uint64_t* purged) override;
  std::map<mountsync::model::ItemStatus, uint64_t> CountByStatus(Transaction&) override;

  Result ReplaceFiles(Transaction&, const std::string& id, const std::vector<model::FileRecord>&) override;
  std::vector<model::FileRecord> GetFiles(Transaction&, const std::string&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
