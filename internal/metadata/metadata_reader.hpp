#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "internal/model/item.hpp"

namespace mountsync::metadata {

// One successfully read descriptor file.
struct Descriptor {
  std::string                           id;
  std::string                           name;
  std::vector<mountsync::model::FileEntry> files;

  // SHA-256 of the raw file bytes.
  std::string raw_hash;
  // Path relative to the info directory.
  std::string source_path;

  // Digest matched the caller's known digest: id is known, name/files
  // were not parsed and must be taken from the store.
  bool unchanged = false;
};

// A descriptor that could not be parsed (truncated, still being written,
// wrong shape). Isolated to its own file.
struct MalformedDescriptor {
  std::string source_path;
  std::string error;
};

using DescriptorResult = std::variant<Descriptor, MalformedDescriptor>;

struct KnownDescriptor {
  std::string id;
  std::string raw_hash;
};

// source_path -> what the store recorded for it last time
using KnownDigests = std::unordered_map<std::string, KnownDescriptor>;

/*
  Aggregated outcome of one walk over the info directory.

  `authoritative` is true only when the directory existed and every entry
  was visited; only then may a missing descriptor be read as "retired".
*/
struct MetadataBatch {
  bool directory_present = false;
  bool authoritative     = false;

  std::vector<Descriptor>          descriptors;
  std::vector<MalformedDescriptor> malformed;

  uint64_t files_seen    = 0;
  uint64_t unchanged     = 0;
  uint64_t duplicate_ids = 0;
};

/*
  Reads *.zurginfo (JSON) and *.zurgtorrent (bencoded torrent) descriptors.

  Best-effort per file: one bad file becomes a MalformedDescriptor and
  never aborts the walk. A missing directory yields an empty,
  non-authoritative batch.
*/
class MetadataReader {
 public:
  struct Options {
    std::chrono::milliseconds progress_log_interval{30000};
  };

  MetadataReader(std::filesystem::path info_dir, Options options);

  // Lazy form: visits each descriptor file in path order. Returns false
  // when the walk did not cover the whole directory.
  bool Walk(const KnownDigests& known, const std::function<void(DescriptorResult&&)>& visit,
            const std::atomic<bool>* cancel = nullptr) const;

  MetadataBatch Read(const KnownDigests& known = {}, const std::atomic<bool>* cancel = nullptr) const;

  const std::filesystem::path& InfoDir() const {
    return info_dir_;
  }

  // Parsers, exposed for tests. Both throw util::MalformedMetadataError.
  static Descriptor ParseZurgInfo(std::string_view content);
  static Descriptor ParseZurgTorrent(std::string_view content);

  static bool IsDescriptorFile(const std::filesystem::path& path);

 private:
  DescriptorResult ReadOne(const std::filesystem::path& path, const std::string& source_path, const KnownDigests& known) const;

  std::filesystem::path info_dir_;
  Options               options_;
};

} // namespace mountsync::metadata
