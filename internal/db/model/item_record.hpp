#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace mountsync::db::model {

/*
  Persistent item row.

  IMPORTANT:
  - Timestamps are unix milliseconds, 0 = never.
  - The file list lives in item_files and is written with ReplaceFiles()
    inside the same transaction as the row.
*/

struct ItemRecord {
  std::string id;
  std::string name;

  mountsync::model::ItemStatus status = mountsync::model::ItemStatus::kPending;

  uint32_t missing_streak = 0;

  std::string source_path;
  std::string metadata_hash;

  bool        needs_inspection = false;
  std::string inspection_note;

  uint64_t created_at_ms        = 0;
  uint64_t last_seen_at_ms      = 0;
  uint64_t last_checked_at_ms   = 0;
  uint64_t status_changed_at_ms = 0;
};

struct FileRecord {
  std::string path;
  uint64_t    size_bytes = 0;
};

}
