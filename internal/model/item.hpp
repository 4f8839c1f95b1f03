#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"

namespace mountsync::model {

struct FileEntry {
  std::string   path; // relative to the item root, '/' separated
  std::uint64_t size_bytes = 0;

  bool operator==(const FileEntry&) const = default;
};

struct Item {
  std::string            id;
  std::string            name;
  std::vector<FileEntry> files;

  ItemStatus    status         = ItemStatus::kPending;
  std::uint32_t missing_streak = 0;

  // Descriptor path relative to the info directory.
  std::string source_path;
  std::string source_metadata_hash;

  bool        needs_inspection = false;
  std::string inspection_note;

  std::chrono::system_clock::time_point created_at{};
  std::chrono::system_clock::time_point last_seen_at{};
  std::chrono::system_clock::time_point last_checked_at{};
  std::chrono::system_clock::time_point status_changed_at{};
};

// Equality over everything a pass can observe; bookkeeping timestamps excluded.
inline bool SameContent(const Item& a, const Item& b) {
  return a.id == b.id && a.name == b.name && a.files == b.files && a.status == b.status && a.missing_streak == b.missing_streak &&
         a.source_path == b.source_path && a.source_metadata_hash == b.source_metadata_hash && a.needs_inspection == b.needs_inspection &&
         a.inspection_note == b.inspection_note;
}

} // namespace mountsync::model
