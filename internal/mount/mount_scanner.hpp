#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/util/time.hpp"

namespace mountsync::mount {

struct MountEntry {
  uint64_t        size_bytes = 0;
  util::TimePoint modified_at{};
  bool            is_dir = false;
};

enum class ScanOutcome {
  // Listing is authoritative: a path not in `entries` is confirmed absent.
  kHealthy,
  // Mount unreachable, timed out or implausible. Says nothing about any path.
  kUnknown,
};

struct MountSnapshot {
  ScanOutcome outcome = ScanOutcome::kUnknown;
  std::string reason;

  // Keyed by '/'-separated path relative to the content directory.
  std::unordered_map<std::string, MountEntry> entries;
  // Immediate child directories of the content directory.
  std::vector<std::string> top_level_dirs;

  std::chrono::milliseconds elapsed{0};

  bool Healthy() const {
    return outcome == ScanOutcome::kHealthy;
  }

  const MountEntry* Find(const std::string& relative_path) const {
    auto it = entries.find(relative_path);
    return it == entries.end() ? nullptr : &it->second;
  }

  static MountSnapshot Unknown(std::string why) {
    MountSnapshot snapshot;
    snapshot.outcome = ScanOutcome::kUnknown;
    snapshot.reason  = std::move(why);
    return snapshot;
  }
};

/*
  Lists the rclone mount.

  Scan() never blocks longer than the configured timeout and never
  throws: a walk that errors or overruns becomes kUnknown. An overrunning
  walk keeps running on its helper thread (a stuck FUSE call cannot be
  interrupted) and later scans report kUnknown until it returns.
*/
class MountScanner {
 public:
  // Synchronous walk of a content root; throws util::TransientMountError.
  using Walker = std::function<MountSnapshot(const std::filesystem::path& content_root, const std::atomic<bool>& abandon)>;

  struct Options {
    // Empty or "." scans the mount root itself.
    std::string               content_dir = "__all__";
    std::chrono::milliseconds timeout{120000};
    bool                      allow_empty_listing = false;
  };

  MountScanner(std::filesystem::path mount_root, Options options, Walker walker = &MountScanner::Walk);

  MountSnapshot Scan();

  std::filesystem::path ContentRoot() const;

  static MountSnapshot Walk(const std::filesystem::path& content_root, const std::atomic<bool>& abandon);

 private:
  struct InFlight;

  std::filesystem::path mount_root_;
  Options               options_;
  Walker                walker_;

  std::mutex                mutex_;
  std::shared_ptr<InFlight> in_flight_;
};

} // namespace mountsync::mount
