#include "state_store.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mountsync::store {

using mountsync::model::Item;
using mountsync::model::ItemStatus;
namespace dbm = mountsync::db::model;

namespace {

constexpr int kMaxWriteAttempts = 3;

void ThrowIfDbError(const mountsync::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case mountsync::db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case mountsync::db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw util::StoreWriteError(message);
  }
}

dbm::ItemRecord ToRecord(const Item& item) {
  dbm::ItemRecord record;
  record.id                   = item.id;
  record.name                 = item.name;
  record.status               = item.status;
  record.missing_streak       = item.missing_streak;
  record.source_path          = item.source_path;
  record.metadata_hash        = item.source_metadata_hash;
  record.needs_inspection     = item.needs_inspection;
  record.inspection_note      = item.inspection_note;
  record.created_at_ms        = util::ToUnixMillis(item.created_at);
  record.last_seen_at_ms      = util::ToUnixMillis(item.last_seen_at);
  record.last_checked_at_ms   = util::ToUnixMillis(item.last_checked_at);
  record.status_changed_at_ms = util::ToUnixMillis(item.status_changed_at);
  return record;
}

std::vector<dbm::FileRecord> ToFileRecords(const std::vector<model::FileEntry>& files) {
  std::vector<dbm::FileRecord> records;
  records.reserve(files.size());
  for (const auto& file : files) {
    records.push_back({file.path, file.size_bytes});
  }
  return records;
}

Item ToItem(const dbm::ItemRecord& record, const std::vector<dbm::FileRecord>& files) {
  Item item;
  item.id                   = record.id;
  item.name                 = record.name;
  item.status               = record.status;
  item.missing_streak       = record.missing_streak;
  item.source_path          = record.source_path;
  item.source_metadata_hash = record.metadata_hash;
  item.needs_inspection     = record.needs_inspection;
  item.inspection_note      = record.inspection_note;
  item.created_at           = util::FromUnixMillis(record.created_at_ms);
  item.last_seen_at         = util::FromUnixMillis(record.last_seen_at_ms);
  item.last_checked_at      = util::FromUnixMillis(record.last_checked_at_ms);
  item.status_changed_at    = util::FromUnixMillis(record.status_changed_at_ms);
  item.files.reserve(files.size());
  for (const auto& file : files) {
    item.files.push_back({file.path, file.size_bytes});
  }
  return item;
}

// Retries transient backend failures (busy, snapshot conflicts). Status
// errors are final and propagate untouched.
template <typename Fn>
auto WithRetry(const std::string& context, Fn&& fn) -> decltype(fn()) {
  std::string last_error;
  for (int attempt = 1; attempt <= kMaxWriteAttempts; ++attempt) {
    try {
      return fn();
    } catch (const util::InvalidState&) {
      throw;
    } catch (const util::NotFound&) {
      throw;
    } catch (const std::exception& e) {
      last_error = e.what();
      MOUNTSYNC_LOG_DEBUG("store write retry", {observability::StringField("context", context), observability::IntField("attempt", attempt),
                                                observability::StringField("error", last_error)});
    }
  }
  throw util::StoreWriteError(context + ": " + last_error);
}

} // namespace

StateStore::StateStore(std::shared_ptr<mountsync::db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("state store requires a repository");
  }
}

std::shared_ptr<std::mutex> StateStore::ItemMutex(const std::string& id) {
  std::lock_guard<std::mutex> lock(item_mutexes_guard_);
  auto&                       item_mutex = item_mutexes_[id];
  if (!item_mutex) {
    item_mutex = std::make_shared<std::mutex>();
  }
  return item_mutex;
}

void StateStore::ReleaseItemMutex(const std::string& id) {
  std::lock_guard<std::mutex> lock(item_mutexes_guard_);
  auto                        it = item_mutexes_.find(id);
  if (it != item_mutexes_.end() && it->second.use_count() == 1) {
    item_mutexes_.erase(it);
  }
}

void StateStore::PruneIdleItemMutexes() {
  std::lock_guard<std::mutex> lock(item_mutexes_guard_);
  for (auto it = item_mutexes_.begin(); it != item_mutexes_.end();) {
    if (it->second.use_count() == 1) {
      it = item_mutexes_.erase(it);
    } else {
      ++it;
    }
  }
}

size_t StateStore::TrackedItemLocks() const {
  std::lock_guard<std::mutex> lock(item_mutexes_guard_);
  return item_mutexes_.size();
}

UpsertOutcome StateStore::Upsert(const Item& item) {
  if (item.id.empty()) {
    throw util::InvalidState("upsert item: id must not be empty");
  }
  auto                        item_mutex = ItemMutex(item.id);
  std::lock_guard<std::mutex> item_lock(*item_mutex);

  return WithRetry("upsert item " + item.id, [&]() -> UpsertOutcome {
    auto tx       = repository_->Begin();
    auto existing = repository_->GetItem(*tx, item.id);

    if (item.status == ItemStatus::kRemoved && (!existing || existing->status != ItemStatus::kRemoved)) {
      throw util::InvalidState("upsert item " + item.id + ": REMOVED is only reachable through MarkRemoved");
    }

    if (!existing) {
      auto record = ToRecord(item);
      if (record.created_at_ms == 0) record.created_at_ms = util::ToUnixMillis(util::Now());
      if (record.status_changed_at_ms == 0) record.status_changed_at_ms = record.created_at_ms;

      ThrowIfDbError(repository_->InsertItem(*tx, record), "insert item");
      ThrowIfDbError(repository_->ReplaceFiles(*tx, item.id, ToFileRecords(item.files)), "insert item files");
      tx->Commit();
      return UpsertOutcome::kInserted;
    }

    const auto current = ToItem(*existing, repository_->GetFiles(*tx, item.id));
    if (!model::CanTransition(current.status, item.status)) {
      throw util::InvalidState("upsert item " + item.id + ": illegal transition " + std::string(model::ToString(current.status)) + " -> " +
                               std::string(model::ToString(item.status)));
    }

    if (model::SameContent(current, item)) {
      if (item.last_checked_at <= current.last_checked_at) {
        tx->Commit();
        return UpsertOutcome::kUnchanged;
      }
      auto touched               = *existing;
      touched.last_checked_at_ms = util::ToUnixMillis(item.last_checked_at);
      ThrowIfDbError(repository_->UpdateItem(*tx, touched), "touch item");
      tx->Commit();
      return UpsertOutcome::kUnchanged;
    }

    auto record          = ToRecord(item);
    record.created_at_ms = existing->created_at_ms;
    if (record.last_seen_at_ms == 0) record.last_seen_at_ms = existing->last_seen_at_ms;
    if (record.last_checked_at_ms < existing->last_checked_at_ms) record.last_checked_at_ms = existing->last_checked_at_ms;
    if (item.status == current.status) {
      record.status_changed_at_ms = existing->status_changed_at_ms;
    } else if (record.status_changed_at_ms <= existing->status_changed_at_ms) {
      record.status_changed_at_ms = util::ToUnixMillis(util::Now());
    }

    ThrowIfDbError(repository_->UpdateItem(*tx, record), "update item");
    if (item.files != current.files) {
      ThrowIfDbError(repository_->ReplaceFiles(*tx, item.id, ToFileRecords(item.files)), "replace item files");
    }
    tx->Commit();
    return UpsertOutcome::kUpdated;
  });
}

std::optional<Item> StateStore::Get(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetItem(*tx, id);
  if (!record) {
    tx->Commit();
    return std::nullopt;
  }
  auto item = ToItem(*record, repository_->GetFiles(*tx, id));
  tx->Commit();
  return item;
}

std::vector<Item> StateStore::List(const mountsync::db::ItemFilter& filter) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListItems(*tx, filter);

  std::vector<Item> items;
  items.reserve(records.size());
  for (const auto& record : records) {
    items.push_back(ToItem(record, repository_->GetFiles(*tx, record.id)));
  }
  tx->Commit();
  return items;
}

void StateStore::MarkRemoved(const std::string& id, util::TimePoint at) {
  auto                        item_mutex = ItemMutex(id);
  std::lock_guard<std::mutex> item_lock(*item_mutex);

  WithRetry("mark removed " + id, [&] {
    auto tx     = repository_->Begin();
    auto record = repository_->GetItem(*tx, id);
    if (!record) {
      throw util::NotFound("mark removed: item not found: " + id);
    }
    if (record->status == ItemStatus::kRemoved) {
      tx->Commit();
      return;
    }
    if (!model::CanTransition(record->status, ItemStatus::kRemoved)) {
      throw util::InvalidState("mark removed " + id + ": item is " + std::string(model::ToString(record->status)) + ", not MISSING");
    }

    record->status               = ItemStatus::kRemoved;
    record->status_changed_at_ms = util::ToUnixMillis(at);
    record->last_checked_at_ms   = util::ToUnixMillis(at);
    ThrowIfDbError(repository_->UpdateItem(*tx, *record), "mark removed");
    tx->Commit();
  });
}

void StateStore::DeletePlaceholder(const std::string& id) {
  {
    auto                        item_mutex = ItemMutex(id);
    std::lock_guard<std::mutex> item_lock(*item_mutex);

    WithRetry("delete placeholder " + id, [&] {
      auto tx     = repository_->Begin();
      auto record = repository_->GetItem(*tx, id);
      if (!record) {
        tx->Commit();
        return;
      }
      if (!record->needs_inspection || record->status != ItemStatus::kPending) {
        throw util::InvalidState("delete placeholder " + id + ": not an inspection placeholder");
      }
      ThrowIfDbError(repository_->DeleteItem(*tx, id), "delete placeholder");
      tx->Commit();
    });
  }
  ReleaseItemMutex(id);
}

uint64_t StateStore::PurgeRemoved(util::TimePoint retired_before) {
  const auto purged = WithRetry("purge removed", [&] {
    uint64_t count = 0;
    auto     tx    = repository_->Begin();
    ThrowIfDbError(repository_->PurgeRemoved(*tx, util::ToUnixMillis(retired_before), &count), "purge removed");
    tx->Commit();
    return count;
  });
  PruneIdleItemMutexes();
  return purged;
}

std::map<ItemStatus, uint64_t> StateStore::CountByStatus() {
  auto tx     = repository_->Begin();
  auto counts = repository_->CountByStatus(*tx);
  tx->Commit();
  return counts;
}

uint64_t StateStore::Count() {
  uint64_t total = 0;
  for (const auto& [_, count] : CountByStatus()) {
    total += count;
  }
  return total;
}

} // namespace mountsync::store
