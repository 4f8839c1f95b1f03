#include "internal/runtime/reconcile_driver.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;
using mountsync::model::ItemStatus;
using mountsync::mount::MountEntry;
using mountsync::mount::MountScanner;
using mountsync::mount::MountSnapshot;
using mountsync::mount::ScanOutcome;
using mountsync::runtime::ReconcileDriver;
using namespace std::chrono_literals;

// Scripted mount: either unreachable or a fixed listing.
struct FakeMount {
  std::mutex    mutex;
  bool          reachable = true;
  bool          with_item = true;
  int           fail_next = 0;
  std::atomic<bool> entered{false};
  std::atomic<bool> release{true};

  MountSnapshot Walk() {
    entered = true;
    while (!release.load()) std::this_thread::sleep_for(2ms);

    std::lock_guard<std::mutex> lock(mutex);
    if (fail_next > 0) {
      --fail_next;
      throw mountsync::util::TransientMountError("Input/output error");
    }
    if (!reachable) {
      throw mountsync::util::TransientMountError("Transport endpoint is not connected");
    }
    MountSnapshot snapshot;
    snapshot.outcome = ScanOutcome::kHealthy;
    snapshot.entries.emplace("Other", MountEntry{0, {}, true});
    snapshot.top_level_dirs.push_back("Other");
    if (with_item) {
      snapshot.entries.emplace("X", MountEntry{0, {}, true});
      snapshot.entries.emplace("X/a.mkv", MountEntry{100, {}, false});
      snapshot.top_level_dirs.push_back("X");
    }
    return snapshot;
  }

  void Set(bool is_reachable, bool has_item) {
    std::lock_guard<std::mutex> lock(mutex);
    reachable = is_reachable;
    with_item = has_item;
  }
};

struct Harness {
  std::shared_ptr<FakeMount>                          mount = std::make_shared<FakeMount>();
  std::shared_ptr<mountsync::store::StateStore>       store;
  std::shared_ptr<ReconcileDriver>                    driver;

  explicit Harness(const std::string& name, ReconcileDriver::Options options = DefaultOptions()) {
    const auto info_dir = fs::temp_directory_path() / "mountsync_reconcile_driver_tests" / name;
    fs::remove_all(info_dir);
    fs::create_directories(info_dir);
    std::ofstream(info_dir / "X.zurginfo") << R"({"hash":"x1","filename":"X","files":[{"path":"/a.mkv","bytes":100}]})";

    store = std::make_shared<mountsync::store::StateStore>(std::make_shared<mountsync::db::memory::MemoryRepository>());

    auto reader = std::make_shared<mountsync::metadata::MetadataReader>(info_dir, mountsync::metadata::MetadataReader::Options{});

    MountScanner::Options scanner_options;
    scanner_options.timeout = 5000ms;
    auto fake               = mount;
    auto scanner            = std::make_shared<MountScanner>("/unused", scanner_options,
                                                             [fake](const fs::path&, const std::atomic<bool>&) { return fake->Walk(); });

    auto reconciler = std::make_shared<mountsync::reconcile::Reconciler>(store, mountsync::reconcile::ReconcilePolicy{3, 85});
    driver          = std::make_shared<ReconcileDriver>(reader, scanner, reconciler, options);
  }

  static ReconcileDriver::Options DefaultOptions() {
    ReconcileDriver::Options options;
    options.interval                          = 1h;
    options.scan_retries                      = 0;
    options.outage.pause_threshold            = 0ms;
    options.outage.resume_after_healthy_scans = 2;
    return options;
  }

  mountsync::model::Item X() {
    auto item = store->Get("X1");
    assert(item.has_value());
    return *item;
  }
};

void TestOverlappingRunIsSkipped() {
  Harness h("overlap");
  h.mount->release = false;

  auto first = std::async(std::launch::async, [&] { return h.driver->RunOnce(); });
  while (!h.mount->entered.load()) std::this_thread::sleep_for(2ms);

  assert(!h.driver->RunOnce().has_value());
  assert(h.driver->SkippedTicks() == 1);

  h.mount->release = true;
  auto report      = first.get();
  assert(report.has_value());
  assert(report->inserted == 1);
  assert(h.driver->PassesCompleted() == 1);
  assert(h.X().status == ItemStatus::kAvailable);
}

void TestOutagePausesDowngradesUntilMountIsBack() {
  Harness h("outage");

  h.driver->RunOnce();
  assert(h.X().status == ItemStatus::kAvailable);

  h.mount->Set(false, false);
  auto report = h.driver->RunOnce();
  assert(report.has_value() && !report->mount_healthy);
  assert(h.driver->Health().downgrades_paused);

  // back, but the item is gone: the first healthy scan stays paused
  h.mount->Set(true, false);
  report = h.driver->RunOnce();
  assert(report->downgrades_paused);
  assert(h.X().missing_streak == 0);
  assert(h.X().status == ItemStatus::kAvailable);

  report = h.driver->RunOnce();
  assert(!report->downgrades_paused);
  assert(!h.driver->Health().downgrades_paused);
  assert(h.X().missing_streak == 1);
}

void TestRetryRecoversFromTransientScanError() {
  auto options                  = Harness::DefaultOptions();
  options.scan_retries          = 2;
  options.retry_backoff_initial = 1ms;
  options.retry_backoff_max     = 2ms;
  Harness h("retry", options);

  {
    std::lock_guard<std::mutex> lock(h.mount->mutex);
    h.mount->fail_next = 2;
  }

  auto report = h.driver->RunOnce();
  assert(report.has_value() && report->mount_healthy);
  assert(h.X().status == ItemStatus::kAvailable);
  assert(!h.driver->Health().downgrades_paused);
}

void TestBackgroundLoopRunsAndStops() {
  Harness h("loop");
  h.driver->Start();

  auto wait_for_passes = [&](uint64_t n) {
    for (int i = 0; i < 500 && h.driver->PassesCompleted() < n; ++i) std::this_thread::sleep_for(5ms);
    return h.driver->PassesCompleted() >= n;
  };

  assert(wait_for_passes(1));
  h.driver->Trigger();
  assert(wait_for_passes(2));

  h.driver->Stop();
  const auto passes = h.driver->PassesCompleted();
  std::this_thread::sleep_for(20ms);
  assert(h.driver->PassesCompleted() == passes);
  assert(h.X().status == ItemStatus::kAvailable);
}

void TestTriggerDuringPassIsSkippedNotQueued() {
  Harness h("trigger_in_flight");
  h.mount->release = false;
  h.driver->Start();
  while (!h.mount->entered.load()) std::this_thread::sleep_for(2ms);

  h.driver->Trigger();
  assert(h.driver->SkippedTicks() == 1);

  h.mount->release = true;
  for (int i = 0; i < 500 && h.driver->PassesCompleted() < 1; ++i) std::this_thread::sleep_for(5ms);
  assert(h.driver->PassesCompleted() == 1);

  // the interval is an hour; nothing may run until the next real tick
  std::this_thread::sleep_for(100ms);
  assert(h.driver->PassesCompleted() == 1);

  h.driver->Trigger();
  for (int i = 0; i < 500 && h.driver->PassesCompleted() < 2; ++i) std::this_thread::sleep_for(5ms);
  assert(h.driver->PassesCompleted() == 2);
  assert(h.driver->SkippedTicks() == 1);

  h.driver->Stop();
}

} // namespace

int main() {
  TestOverlappingRunIsSkipped();
  TestOutagePausesDowngradesUntilMountIsBack();
  TestRetryRecoversFromTransientScanError();
  TestBackgroundLoopRunsAndStops();
  TestTriggerDuringPassIsSkippedNotQueued();

  std::cout << "mountsync_unit_reconcile_driver: pass\n";
  return 0;
}
