#include "reconcile_driver.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace mountsync::runtime {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

// Marks a pass in flight for Trigger(); cleared even when the pass throws.
class InFlightScope {
 public:
  InFlightScope(std::mutex& mutex, bool& in_flight, bool& triggered) : mutex_(mutex), in_flight_(in_flight) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_ = true;
    triggered  = false;
  }
  ~InFlightScope() {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_ = false;
  }

  InFlightScope(const InFlightScope&)            = delete;
  InFlightScope& operator=(const InFlightScope&) = delete;

 private:
  std::mutex& mutex_;
  bool&       in_flight_;
};

} // namespace

ReconcileDriver::ReconcileDriver(std::shared_ptr<metadata::MetadataReader> reader, std::shared_ptr<mount::MountScanner> scanner,
                                 std::shared_ptr<reconcile::Reconciler> reconciler, Options options)
    : reader_(std::move(reader)), scanner_(std::move(scanner)), reconciler_(std::move(reconciler)), options_(options) {
}

ReconcileDriver::~ReconcileDriver() {
  Stop();
}

void ReconcileDriver::Start() {
  if (running_.exchange(true)) {
    return;
  }
  stop_   = false;
  thread_ = std::thread(&ReconcileDriver::Loop, this);
}

void ReconcileDriver::Stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    stop_ = true;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

void ReconcileDriver::Trigger() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    if (!in_flight_) {
      triggered_ = true;
    } else {
      ++skipped_ticks_;
    }
  }
  wake_.notify_all();
}

reconcile::MountHealth ReconcileDriver::Health() const {
  std::lock_guard<std::mutex> lock(health_mutex_);
  return health_;
}

std::optional<reconcile::PassReport> ReconcileDriver::RunOnce() {
  std::unique_lock<std::mutex> pass_lock(pass_mutex_, std::try_to_lock);
  if (!pass_lock.owns_lock()) {
    ++skipped_ticks_;
    MOUNTSYNC_LOG_WARN("previous pass still running; tick skipped");
    return std::nullopt;
  }
  std::optional<reconcile::PassReport> report;
  {
    InFlightScope scope(wake_mutex_, in_flight_, triggered_);
    report = RunPass();
  }
  ++passes_completed_;
  return report;
}

void ReconcileDriver::Loop() {
  MOUNTSYNC_LOG_INFO("reconcile driver started", {IntField("interval_ms", options_.interval.count())});

  while (!stop_) {
    const auto started = std::chrono::steady_clock::now();
    try {
      RunOnce();
    } catch (const std::exception& e) {
      MOUNTSYNC_LOG_ERROR("reconcile pass failed", {StringField("error", e.what())});
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (options_.interval.count() > 0 && elapsed >= options_.interval) {
      const auto missed = static_cast<uint64_t>(elapsed / options_.interval);
      skipped_ticks_ += missed;
      MOUNTSYNC_LOG_WARN("pass overran the interval; ticks skipped", {IntField("skipped", static_cast<int64_t>(missed))});
    }

    std::unique_lock<std::mutex> lock(wake_mutex_);
    const auto deadline = started + options_.interval;
    wake_.wait_until(lock, deadline, [this] { return stop_.load() || triggered_; });
    triggered_ = false;
  }

  MOUNTSYNC_LOG_INFO("reconcile driver stopped", {IntField("passes", static_cast<int64_t>(passes_completed_.load()))});
}

bool ReconcileDriver::SleepUnlessStopped(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(wake_mutex_);
  return !wake_.wait_for(lock, duration, [this] { return stop_.load(); });
}

mount::MountSnapshot ReconcileDriver::ScanWithRetry() {
  auto backoff  = options_.retry_backoff_initial;
  auto snapshot = scanner_->Scan();

  for (uint32_t attempt = 1; !snapshot.Healthy() && attempt <= options_.scan_retries; ++attempt) {
    MOUNTSYNC_LOG_WARN("mount scan inconclusive; retrying",
                       {StringField("reason", snapshot.reason), IntField("attempt", attempt), IntField("backoff_ms", backoff.count())});
    if (!SleepUnlessStopped(backoff)) {
      break;
    }
    backoff  = std::min(backoff * 2, options_.retry_backoff_max);
    snapshot = scanner_->Scan();
  }
  return snapshot;
}

reconcile::PassReport ReconcileDriver::RunPass() {
  const auto now = util::Now();

  metadata::KnownDigests known;
  try {
    known = reconciler_->KnownDigests();
  } catch (const std::exception& e) {
    MOUNTSYNC_LOG_WARN("known digests unavailable; re-reading every descriptor", {StringField("error", e.what())});
  }

  // metadata is read while the mount is scanned
  auto pending_batch = std::async(std::launch::async, [this, &known] { return reader_->Read(known, &stop_); });
  auto snapshot      = ScanWithRetry();
  auto batch         = pending_batch.get();

  reconcile::PassContext context;
  context.now  = now;
  context.stop = &stop_;
  {
    std::lock_guard<std::mutex> lock(health_mutex_);
    if (health_.Observe(snapshot.Healthy(), now, options_.outage)) {
      if (health_.downgrades_paused) {
        MOUNTSYNC_LOG_WARN("mount unreachable past threshold; downgrades paused",
                           {IntField("unknown_scans", health_.consecutive_unknown), IntField("threshold_ms", options_.outage.pause_threshold.count())});
      } else {
        MOUNTSYNC_LOG_INFO("mount healthy again; downgrades resumed", {IntField("healthy_scans", health_.consecutive_healthy)});
      }
    }
    context.downgrades_paused = health_.downgrades_paused;
  }

  MOUNTSYNC_LOG_DEBUG("pass inputs ready", {BoolField("mount_healthy", snapshot.Healthy()), IntField("mount_entries", static_cast<int64_t>(snapshot.entries.size())),
                                            IntField("scan_ms", snapshot.elapsed.count()),
                                            IntField("descriptors", static_cast<int64_t>(batch.descriptors.size()))});

  return reconciler_->Reconcile(batch, snapshot, context);
}

} // namespace mountsync::runtime
