#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace mountsync::db::memory {

class MemoryTransaction;

/*
  In-process backend with the same contract as sqlite; used by tests.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ItemRecord> items;
    std::unordered_map<std::string, std::vector<model::FileRecord>> files;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
