#pragma once

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/item_record.hpp"

namespace mountsync::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - An item row and its file list commit together

  The DB is the source of truth for:
    item status
    declared file lists
    reconciliation timestamps
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Items
  // ---------------------------------------------------------------------

  virtual Result InsertItem(Transaction&, const model::ItemRecord&) = 0;

  virtual std::optional<model::ItemRecord> GetItem(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::ItemRecord> ListItems(Transaction&, const ItemFilter& filter) = 0;

  virtual Result UpdateItem(Transaction&, const model::ItemRecord&) = 0;

  // Hard delete; rows are normally retired by status, see PurgeRemoved.
  virtual Result DeleteItem(Transaction&, const std::string& id) = 0;

  // Deletes REMOVED rows whose status changed before the cutoff.
  virtual Result PurgeRemoved(Transaction&, uint64_t status_changed_before_ms, uint64_t* purged) = 0;

  virtual std::map<mountsync::model::ItemStatus, uint64_t> CountByStatus(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Declared files
  // ---------------------------------------------------------------------

  // Replaces the whole ordered list.
  virtual Result ReplaceFiles(Transaction&, const std::string& id, const std::vector<model::FileRecord>& files) = 0;

  virtual std::vector<model::FileRecord> GetFiles(Transaction&, const std::string& id) = 0;
};

} // namespace mountsync::db
