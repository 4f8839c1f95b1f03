#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "internal/metadata/metadata_reader.hpp"
#include "internal/mount/mount_scanner.hpp"
#include "internal/reconcile/mount_health.hpp"
#include "internal/reconcile/reconciler.hpp"

namespace mountsync::runtime {

/*
  Runs reconcile passes: once on Start(), then every interval, or on
  Trigger().

  At most one pass is in flight; a tick or Trigger() that lands during a
  pass is skipped and counted, never queued. Stop() lets the current item finish, then the
  pass ends early and the thread joins.
*/
class ReconcileDriver {
 public:
  struct Options {
    std::chrono::milliseconds interval{86400000};
    uint32_t                  scan_retries = 3;
    std::chrono::milliseconds retry_backoff_initial{1000};
    std::chrono::milliseconds retry_backoff_max{30000};
    reconcile::OutagePolicy   outage;
  };

  ReconcileDriver(std::shared_ptr<metadata::MetadataReader> reader, std::shared_ptr<mount::MountScanner> scanner,
                  std::shared_ptr<reconcile::Reconciler> reconciler, Options options);
  ~ReconcileDriver();

  void Start();
  void Stop();
  void Trigger();

  // Runs a pass on the calling thread; nullopt when one is already running.
  std::optional<reconcile::PassReport> RunOnce();

  reconcile::MountHealth Health() const;
  uint64_t               PassesCompleted() const {
    return passes_completed_.load();
  }
  uint64_t SkippedTicks() const {
    return skipped_ticks_.load();
  }

 private:
  void                    Loop();
  reconcile::PassReport   RunPass();
  mount::MountSnapshot    ScanWithRetry();
  // false when Stop() interrupted the wait
  bool                    SleepUnlessStopped(std::chrono::milliseconds duration);

  std::shared_ptr<metadata::MetadataReader> reader_;
  std::shared_ptr<mount::MountScanner>      scanner_;
  std::shared_ptr<reconcile::Reconciler>    reconciler_;
  Options                                   options_;

  std::mutex pass_mutex_;

  mutable std::mutex     health_mutex_;
  reconcile::MountHealth health_;

  std::mutex              wake_mutex_;
  std::condition_variable wake_;
  bool                    triggered_ = false;
  bool                    in_flight_ = false;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<bool>     stop_{false};
  std::atomic<uint64_t> passes_completed_{0};
  std::atomic<uint64_t> skipped_ticks_{0};
};

} // namespace mountsync::runtime
