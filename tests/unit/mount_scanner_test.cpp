#include "internal/mount/mount_scanner.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;
using mountsync::mount::MountScanner;
using mountsync::mount::MountSnapshot;
using mountsync::mount::ScanOutcome;
using namespace std::chrono_literals;

fs::path FreshDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "mountsync_mount_scanner_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void WriteBytes(const fs::path& path, size_t size) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << std::string(size, 'x');
}

MountScanner::Options Options(std::chrono::milliseconds timeout = 5000ms) {
  MountScanner::Options options;
  options.content_dir = "__all__";
  options.timeout     = timeout;
  return options;
}

void TestHealthyScanListsEntries() {
  const auto root = FreshDir("healthy");
  WriteBytes(root / "__all__" / "Show" / "a.mkv", 100);
  WriteBytes(root / "__all__" / "Show" / "subs" / "b.srt", 1);

  MountScanner scanner(root, Options());
  const auto   snapshot = scanner.Scan();

  assert(snapshot.Healthy());
  assert(snapshot.top_level_dirs.size() == 1);
  assert(snapshot.top_level_dirs[0] == "Show");

  const auto* show = snapshot.Find("Show");
  assert(show != nullptr && show->is_dir);
  const auto* movie = snapshot.Find("Show/a.mkv");
  assert(movie != nullptr && !movie->is_dir && movie->size_bytes == 100);
  const auto* subs = snapshot.Find("Show/subs/b.srt");
  assert(subs != nullptr && subs->size_bytes == 1);
  assert(snapshot.Find("Show/c.mkv") == nullptr);
}

void TestMissingContentDirIsUnknown() {
  const auto root = FreshDir("detached");

  MountScanner scanner(root, Options());
  const auto   snapshot = scanner.Scan();
  assert(snapshot.outcome == ScanOutcome::kUnknown);
  assert(snapshot.entries.empty());
}

void TestEmptyListingIsUnknownUnlessAllowed() {
  const auto root = FreshDir("empty");
  fs::create_directories(root / "__all__");

  MountScanner strict(root, Options());
  assert(!strict.Scan().Healthy());

  auto options                = Options();
  options.allow_empty_listing = true;
  MountScanner lenient(root, options);
  assert(lenient.Scan().Healthy());
}

void TestContentDirDotScansMountRoot() {
  const auto root = FreshDir("dot");
  WriteBytes(root / "Show" / "a.mkv", 3);

  auto options        = Options();
  options.content_dir = ".";
  MountScanner scanner(root, options);
  assert(scanner.ContentRoot() == root);

  const auto snapshot = scanner.Scan();
  assert(snapshot.Healthy());
  assert(snapshot.Find("Show/a.mkv") != nullptr);
}

void TestDanglingEntriesAreAbsentNotUnknown() {
  const auto root = FreshDir("dangling");
  WriteBytes(root / "__all__" / "X" / "a.mkv", 100);
  fs::create_symlink(root / "nowhere", root / "__all__" / "Y");
  fs::create_symlink(root / "nowhere" / "b.srt", root / "__all__" / "X" / "b.srt");

  MountScanner scanner(root, Options());
  const auto   snapshot = scanner.Scan();

  assert(snapshot.Healthy());
  assert(snapshot.Find("X/a.mkv") != nullptr);
  assert(snapshot.Find("X/b.srt") == nullptr);
  assert(snapshot.Find("Y") == nullptr);
  assert(snapshot.top_level_dirs.size() == 1 && snapshot.top_level_dirs[0] == "X");
}

void TestWalkerErrorIsUnknown() {
  MountScanner scanner("/unused", Options(), [](const fs::path&, const std::atomic<bool>&) -> MountSnapshot {
    throw mountsync::util::TransientMountError("Transport endpoint is not connected");
  });

  const auto snapshot = scanner.Scan();
  assert(!snapshot.Healthy());
  assert(snapshot.reason.find("Transport endpoint") != std::string::npos);
}

void TestTimeoutReportsUnknownAndBlocksOverlap() {
  auto release = std::make_shared<std::atomic<bool>>(false);

  MountScanner scanner("/unused", Options(50ms), [release](const fs::path&, const std::atomic<bool>&) {
    while (!release->load()) {
      std::this_thread::sleep_for(5ms);
    }
    MountSnapshot snapshot;
    snapshot.outcome = ScanOutcome::kHealthy;
    snapshot.entries.emplace("late", mountsync::mount::MountEntry{});
    return snapshot;
  });

  const auto first = scanner.Scan();
  assert(!first.Healthy());
  assert(first.reason == "scan timed out");

  const auto overlapping = scanner.Scan();
  assert(!overlapping.Healthy());
  assert(overlapping.reason == "previous scan still in flight");

  release->store(true);

  // The stuck walk finishes on its own thread; afterwards scans run again.
  bool recovered = false;
  for (int i = 0; i < 200 && !recovered; ++i) {
    std::this_thread::sleep_for(10ms);
    recovered = scanner.Scan().Healthy();
  }
  assert(recovered);
}

} // namespace

int main() {
  TestHealthyScanListsEntries();
  TestMissingContentDirIsUnknown();
  TestEmptyListingIsUnknownUnlessAllowed();
  TestContentDirDotScansMountRoot();
  TestDanglingEntriesAreAbsentNotUnknown();
  TestWalkerErrorIsUnknown();
  TestTimeoutReportsUnknownAndBlocksOverlap();

  std::cout << "mountsync_unit_mount_scanner: pass\n";
  return 0;
}
