#include "internal/store/state_store.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/store/retention.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;
using mountsync::model::Item;
using mountsync::model::ItemStatus;
using mountsync::store::StateStore;
using mountsync::store::UpsertOutcome;
using mountsync::util::FromUnixMillis;
using mountsync::util::InvalidState;
using mountsync::util::NotFound;

std::shared_ptr<StateStore> MemoryStore() {
  return std::make_shared<StateStore>(std::make_shared<mountsync::db::memory::MemoryRepository>());
}

std::shared_ptr<StateStore> SqliteStore(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "mountsync_state_store_tests";
  fs::create_directories(dir);
  const auto path = dir / (name + ".db");
  fs::remove(path);
  fs::remove(path.string() + "-wal");
  fs::remove(path.string() + "-shm");

  auto db = std::make_shared<mountsync::db::sqlite::SqliteDB>(path.string());
  db->Migrate(mountsync::db::sql::ItemStoreMigrations());
  return std::make_shared<StateStore>(std::make_shared<mountsync::db::sqlite::SqliteRepository>(db));
}

Item MakeItem(const std::string& id, ItemStatus status = ItemStatus::kPending) {
  Item item;
  item.id          = id;
  item.name        = "Show " + id;
  item.files       = {{"a.mkv", 100}, {"b.srt", 1}};
  item.status      = status;
  item.source_path = id + ".zurginfo";
  item.created_at  = FromUnixMillis(1000);
  return item;
}

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const InvalidState&) {
    return true;
  } catch (const NotFound&) {
    return true;
  }
  return false;
}

void TestInsertThenUnchanged() {
  auto store = MemoryStore();
  auto item  = MakeItem("A");
  item.last_checked_at = FromUnixMillis(2000);

  assert(store->Upsert(item) == UpsertOutcome::kInserted);
  assert(store->Upsert(item) == UpsertOutcome::kUnchanged);

  auto stored = store->Get("A");
  assert(stored.has_value());
  assert(stored->name == "Show A");
  assert(stored->files.size() == 2 && stored->files[1].path == "b.srt");
  assert(stored->created_at == FromUnixMillis(1000));
  assert(stored->status_changed_at == FromUnixMillis(1000));
}

void TestUnchangedOnlyAdvancesLastChecked() {
  auto store = MemoryStore();
  auto item  = MakeItem("A", ItemStatus::kAvailable);
  item.last_seen_at    = FromUnixMillis(2000);
  item.last_checked_at = FromUnixMillis(2000);
  store->Upsert(item);

  item.last_seen_at    = FromUnixMillis(3000);
  item.last_checked_at = FromUnixMillis(3000);
  assert(store->Upsert(item) == UpsertOutcome::kUnchanged);

  auto stored = store->Get("A");
  assert(stored->last_checked_at == FromUnixMillis(3000));
  assert(stored->last_seen_at == FromUnixMillis(2000));
}

void TestUpdateKeepsCreatedAndTracksStatusChange() {
  auto store = MemoryStore();
  store->Upsert(MakeItem("A"));

  auto next              = MakeItem("A", ItemStatus::kPartial);
  next.created_at        = FromUnixMillis(9999);
  next.status_changed_at = FromUnixMillis(5000);
  next.files.pop_back();
  assert(store->Upsert(next) == UpsertOutcome::kUpdated);

  auto stored = store->Get("A");
  assert(stored->status == ItemStatus::kPartial);
  assert(stored->created_at == FromUnixMillis(1000));
  assert(stored->status_changed_at == FromUnixMillis(5000));
  assert(stored->files.size() == 1);

  // same status: status_changed_at is kept
  next.name              = "renamed";
  next.status_changed_at = FromUnixMillis(7000);
  assert(store->Upsert(next) == UpsertOutcome::kUpdated);
  assert(store->Get("A")->status_changed_at == FromUnixMillis(5000));
}

void TestIllegalTransitionsAreRejected() {
  auto store = MemoryStore();
  store->Upsert(MakeItem("A", ItemStatus::kAvailable));

  assert(Throws([&] { store->Upsert(MakeItem("A", ItemStatus::kPending)); }));
  assert(Throws([&] { store->Upsert(MakeItem("B", ItemStatus::kRemoved)); }));
  assert(Throws([&] { store->Upsert(MakeItem("A", ItemStatus::kRemoved)); }));
  assert(Throws([&] { store->Upsert(MakeItem("", ItemStatus::kPending)); }));
  assert(Throws([&] { store->MarkRemoved("A", FromUnixMillis(5000)); }));
  assert(Throws([&] { store->MarkRemoved("nope", FromUnixMillis(5000)); }));

  assert(store->Get("A")->status == ItemStatus::kAvailable);
}

void TestMarkRemovedAndPurge() {
  auto store = MemoryStore();
  store->Upsert(MakeItem("A", ItemStatus::kMissing));
  store->Upsert(MakeItem("B", ItemStatus::kAvailable));

  store->MarkRemoved("A", FromUnixMillis(5000));
  store->MarkRemoved("A", FromUnixMillis(6000));

  auto removed = store->Get("A");
  assert(removed->status == ItemStatus::kRemoved);
  assert(removed->status_changed_at == FromUnixMillis(5000));

  // metadata of a retired row may still be refreshed
  auto refresh   = *removed;
  refresh.name   = "still tracked";
  assert(store->Upsert(refresh) == UpsertOutcome::kUpdated);

  auto counts = store->CountByStatus();
  assert(counts[ItemStatus::kRemoved] == 1);
  assert(counts[ItemStatus::kAvailable] == 1);
  assert(store->Count() == 2);

  assert(store->PurgeRemoved(FromUnixMillis(5000)) == 0);
  assert(store->PurgeRemoved(FromUnixMillis(5001)) == 1);
  assert(!store->Get("A").has_value());
  assert(store->Count() == 1);

  // idle per-id locks do not outlive a purge
  assert(store->TrackedItemLocks() == 0);
  assert(store->Upsert(MakeItem("C")) == UpsertOutcome::kInserted);
  assert(store->TrackedItemLocks() == 1);
}

void TestPlaceholderDeletion() {
  auto store = MemoryStore();

  auto placeholder             = MakeItem("unparsed:bad.zurginfo");
  placeholder.files            = {};
  placeholder.needs_inspection = true;
  placeholder.inspection_note  = "truncated";
  store->Upsert(placeholder);
  store->Upsert(MakeItem("A"));

  mountsync::db::ItemFilter filter;
  filter.needs_inspection = true;
  assert(store->List(filter).size() == 1);

  assert(Throws([&] { store->DeletePlaceholder("A"); }));
  store->DeletePlaceholder("unparsed:bad.zurginfo");
  store->DeletePlaceholder("unparsed:bad.zurginfo");
  assert(!store->Get("unparsed:bad.zurginfo").has_value());
  assert(store->Get("A").has_value());

  // only the live item keeps a lock entry
  assert(store->TrackedItemLocks() == 1);
}

void TestRetentionDays() {
  using mountsync::store::ParseRetentionDays;
  using mountsync::store::RetentionCutoff;

  assert(ParseRetentionDays("30") == 30u);
  assert(ParseRetentionDays("1") == 1u);
  assert(ParseRetentionDays("3650") == 3650u);
  assert(!ParseRetentionDays("0"));
  assert(!ParseRetentionDays("-1"));
  assert(!ParseRetentionDays("+5"));
  assert(!ParseRetentionDays("3651"));
  assert(!ParseRetentionDays("18446744073709551615"));
  assert(!ParseRetentionDays("12abc"));
  assert(!ParseRetentionDays(""));

  constexpr uint64_t kDayMs = 86400000;
  assert(RetentionCutoff(FromUnixMillis(10 * kDayMs), 3) == FromUnixMillis(7 * kDayMs));
  assert(RetentionCutoff(FromUnixMillis(1000), 3650) == FromUnixMillis(0));
}

void TestOpenWithoutCreateLeavesNoFile() {
  const auto path = fs::temp_directory_path() / "mountsync_state_store_tests" / "typo.db";
  fs::create_directories(path.parent_path());
  fs::remove(path);

  mountsync::db::sqlite::SqliteOptions options;
  options.create_if_missing = false;

  bool threw = false;
  try {
    mountsync::db::sqlite::SqliteDB db(path.string(), options);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(!fs::exists(path));
}

void TestConcurrentWritersOnSqlite() {
  auto store = SqliteStore("concurrent");

  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([store, t] {
      for (int i = 0; i < 25; ++i) {
        auto item = MakeItem("T" + std::to_string(t) + "-" + std::to_string(i));
        store->Upsert(item);
        item.status = ItemStatus::kAvailable;
        store->Upsert(item);
      }
    });
  }
  for (auto& writer : writers) writer.join();

  assert(store->Count() == 100);
  assert(store->CountByStatus()[ItemStatus::kAvailable] == 100);
}

} // namespace

int main() {
  TestInsertThenUnchanged();
  TestUnchangedOnlyAdvancesLastChecked();
  TestUpdateKeepsCreatedAndTracksStatusChange();
  TestIllegalTransitionsAreRejected();
  TestMarkRemovedAndPurge();
  TestPlaceholderDeletion();
  TestRetentionDays();
  TestOpenWithoutCreateLeavesNoFile();
  TestConcurrentWritersOnSqlite();

  std::cout << "mountsync_unit_state_store: pass\n";
  return 0;
}
