#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace mountsync::db::memory {

using mountsync::model::ItemStatus;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertItem(Transaction& t, const model::ItemRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.items.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "item already exists: " + r.id);
  s.items[r.id] = r;
  return Result::Ok();
}

std::optional<model::ItemRecord> MemoryRepository::GetItem(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.items.find(id);
  if (it == s.items.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ItemRecord> MemoryRepository::ListItems(Transaction& t, const ItemFilter& filter) {
  const auto&                    s = TX(t).View();
  std::vector<model::ItemRecord> records;
  for (const auto& [_, record] : s.items) {
    if (filter.status && record.status != *filter.status) continue;
    if (filter.needs_inspection && record.needs_inspection != *filter.needs_inspection) continue;
    records.push_back(record);
  }
  // match the sqlite ORDER BY id
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return records;
}

Result MemoryRepository::UpdateItem(Transaction& t, const model::ItemRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.items.contains(r.id)) return Result::Err(ErrorCode::NotFound, "item not found: " + r.id);
  s.items[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteItem(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  s.items.erase(id);
  s.files.erase(id);
  return Result::Ok();
}

Result MemoryRepository::PurgeRemoved(Transaction& t, uint64_t status_changed_before_ms, uint64_t* purged) {
  auto&    s     = TX(t).Mutable();
  uint64_t count = 0;
  for (auto it = s.items.begin(); it != s.items.end();) {
    if (it->second.status == ItemStatus::kRemoved && it->second.status_changed_at_ms < status_changed_before_ms) {
      s.files.erase(it->first);
      it = s.items.erase(it);
      ++count;
    } else {
      ++it;
    }
  }
  if (purged) *purged = count;
  return Result::Ok();
}

std::map<ItemStatus, uint64_t> MemoryRepository::CountByStatus(Transaction& t) {
  std::map<ItemStatus, uint64_t> out;
  for (const auto& [_, record] : TX(t).View().items) {
    out[record.status]++;
  }
  return out;
}

Result MemoryRepository::ReplaceFiles(Transaction& t, const std::string& id, const std::vector<model::FileRecord>& files) {
  auto& s = TX(t).Mutable();
  // same as the sqlite foreign key
  if (!s.items.contains(id)) return Result::Err(ErrorCode::ConstraintViolation, "files for unknown item: " + id);
  s.files[id] = files;
  return Result::Ok();
}

std::vector<model::FileRecord> MemoryRepository::GetFiles(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.files.find(id);
  if (it == s.files.end()) return {};
  return it->second;
}

} // namespace mountsync::db::memory
