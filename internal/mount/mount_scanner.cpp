#include "mount_scanner.hpp"

#include <future>
#include <system_error>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mountsync::mount {

namespace fs = std::filesystem;
using observability::IntField;
using observability::StringField;

struct MountScanner::InFlight {
  std::promise<MountSnapshot> promise;
  std::atomic<bool>           abandon{false};
  std::atomic<bool>           done{false};
};

namespace {

util::TimePoint ToSystemTime(fs::file_time_type ftime) {
  return std::chrono::time_point_cast<util::Clock::duration>(std::chrono::file_clock::to_sys(ftime));
}

[[noreturn]] void ThrowMountError(const std::string& what, const fs::path& path, const std::error_code& ec) {
  throw util::TransientMountError(what + " '" + path.string() + "': " + ec.message());
}

bool Vanished(const std::error_code& ec) {
  return ec == std::errc::no_such_file_or_directory;
}

// Fills `entry` from a listed path. Returns false when the path is gone
// (deleted mid-walk or a dangling link); any other failure is a mount error.
bool StatEntry(const fs::directory_entry& dirent, MountEntry& entry) {
  std::error_code ec;

  entry.is_dir = dirent.is_directory(ec);
  if (ec) {
    if (Vanished(ec)) return false;
    ThrowMountError("cannot stat", dirent.path(), ec);
  }
  if (!entry.is_dir) {
    entry.size_bytes = dirent.file_size(ec);
    if (ec) {
      if (Vanished(ec)) return false;
      ThrowMountError("cannot read size of", dirent.path(), ec);
    }
  }
  const auto mtime = dirent.last_write_time(ec);
  if (ec) {
    if (Vanished(ec)) return false;
    ThrowMountError("cannot read mtime of", dirent.path(), ec);
  }
  entry.modified_at = ToSystemTime(mtime);
  return true;
}

} // namespace

MountScanner::MountScanner(fs::path mount_root, Options options, Walker walker)
    : mount_root_(std::move(mount_root)), options_(std::move(options)), walker_(std::move(walker)) {
}

fs::path MountScanner::ContentRoot() const {
  if (options_.content_dir.empty() || options_.content_dir == ".") {
    return mount_root_;
  }
  return mount_root_ / options_.content_dir;
}

MountSnapshot MountScanner::Walk(const fs::path& content_root, const std::atomic<bool>& abandon) {
  const auto started = std::chrono::steady_clock::now();

  MountSnapshot snapshot;
  std::error_code ec;

  // A dead FUSE mount leaves an empty mount point behind, so the content
  // directory itself acts as the liveness sentinel.
  const bool present = fs::is_directory(content_root, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    ThrowMountError("cannot stat content root", content_root, ec);
  }
  if (!present) {
    return MountSnapshot::Unknown("content directory missing: " + content_root.string());
  }

  fs::recursive_directory_iterator it(content_root, fs::directory_options::none, ec);
  if (ec) {
    ThrowMountError("cannot open content root", content_root, ec);
  }

  const fs::recursive_directory_iterator end;
  while (it != end) {
    if (abandon.load()) {
      throw util::TransientMountError("scan abandoned after timeout");
    }

    const auto relative = it->path().lexically_relative(content_root).generic_string();

    MountEntry entry;
    if (!StatEntry(*it, entry)) {
      MOUNTSYNC_LOG_DEBUG("entry vanished during scan; treated as absent", {StringField("path", relative)});
    } else {
      if (entry.is_dir && it.depth() == 0) {
        snapshot.top_level_dirs.push_back(relative);
      }
      snapshot.entries.emplace(relative, entry);
    }

    it.increment(ec);
    if (ec) {
      ThrowMountError("directory listing failed under", content_root, ec);
    }
  }

  snapshot.outcome = ScanOutcome::kHealthy;
  snapshot.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  return snapshot;
}

MountSnapshot MountScanner::Scan() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (in_flight_ && !in_flight_->done.load()) {
    return MountSnapshot::Unknown("previous scan still in flight");
  }

  auto state  = std::make_shared<InFlight>();
  auto future = state->promise.get_future();
  in_flight_  = state;

  // Detached: the thread owns copies of everything it touches.
  std::thread([state, walker = walker_, root = ContentRoot()] {
    MountSnapshot result;
    try {
      result = walker(root, state->abandon);
    } catch (const util::TransientMountError& e) {
      result = MountSnapshot::Unknown(e.what());
    } catch (const std::exception& e) {
      result = MountSnapshot::Unknown(std::string("scan failed: ") + e.what());
    }
    state->done.store(true);
    state->promise.set_value(std::move(result));
  }).detach();

  if (future.wait_for(options_.timeout) != std::future_status::ready) {
    state->abandon.store(true);
    MOUNTSYNC_LOG_WARN("mount scan timed out", {StringField("root", ContentRoot().string()), IntField("timeout_ms", options_.timeout.count())});
    return MountSnapshot::Unknown("scan timed out");
  }

  auto snapshot = future.get();
  if (snapshot.Healthy() && snapshot.entries.empty() && !options_.allow_empty_listing) {
    return MountSnapshot::Unknown("empty listing; mount is probably detached");
  }
  return snapshot;
}

} // namespace mountsync::mount
