#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/item.hpp"
#include "internal/util/time.hpp"

namespace mountsync::store {

enum class UpsertOutcome {
  kInserted,
  kUpdated,
  kUnchanged,
};

/*
  Item-level facade over the repository; the single source of truth for
  every other component.

  - Every call is one transaction; the row and its file list commit together.
  - Calls for the same id are serialized, different ids are not.
  - Upsert is idempotent: an unchanged snapshot only advances
    last_checked_at and never moves last_seen_at.
*/
class StateStore {
 public:
  explicit StateStore(std::shared_ptr<mountsync::db::Repository> repository);

  // Throws util::InvalidState on an illegal status move (REMOVED included,
  // see MarkRemoved) and util::StoreWriteError when persistence fails.
  UpsertOutcome Upsert(const mountsync::model::Item& item);

  std::optional<mountsync::model::Item> Get(const std::string& id);

  std::vector<mountsync::model::Item> List(const mountsync::db::ItemFilter& filter = {});

  // MISSING -> REMOVED. The row is kept.
  void MarkRemoved(const std::string& id, util::TimePoint at);

  // Drops an inspection placeholder row; real items are never hard-deleted here.
  void DeletePlaceholder(const std::string& id);

  // Maintenance: hard-deletes REMOVED rows retired before the cutoff.
  uint64_t PurgeRemoved(util::TimePoint retired_before);

  std::map<mountsync::model::ItemStatus, uint64_t> CountByStatus();
  uint64_t                                         Count();

  // Number of per-id write locks currently held in the lock table.
  size_t TrackedItemLocks() const;

 private:
  std::shared_ptr<std::mutex> ItemMutex(const std::string& id);
  // Drop lock-table entries nobody else holds; a waiter always keeps its entry.
  void ReleaseItemMutex(const std::string& id);
  void PruneIdleItemMutexes();

  std::shared_ptr<mountsync::db::Repository> repository_;

  mutable std::mutex                                                  item_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>>        item_mutexes_;
};

} // namespace mountsync::store
