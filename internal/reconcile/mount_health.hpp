#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "internal/util/time.hpp"

namespace mountsync::reconcile {

struct OutagePolicy {
  // Unknown scans for this long pause every downgrade.
  std::chrono::milliseconds pause_threshold{600000};
  // Healthy scans in a row needed before downgrades resume.
  uint32_t resume_after_healthy_scans = 2;
};

/*
  Mount availability across passes.

  Owned by the driver and handed to each pass by value, so a pass never
  reads global scheduling state.
*/
struct MountHealth {
  uint32_t                       consecutive_unknown = 0;
  uint32_t                       consecutive_healthy = 0;
  std::optional<util::TimePoint> unknown_since;
  bool                           downgrades_paused = false;

  // Returns true when downgrades_paused flipped.
  bool Observe(bool healthy, util::TimePoint now, const OutagePolicy& policy) {
    const bool was_paused = downgrades_paused;

    if (!healthy) {
      consecutive_healthy = 0;
      ++consecutive_unknown;
      if (!unknown_since) {
        unknown_since = now;
      }
      if (now - *unknown_since >= policy.pause_threshold) {
        downgrades_paused = true;
      }
    } else {
      consecutive_unknown = 0;
      unknown_since.reset();
      ++consecutive_healthy;
      if (downgrades_paused && consecutive_healthy >= policy.resume_after_healthy_scans) {
        downgrades_paused = false;
      }
    }

    return was_paused != downgrades_paused;
  }
};

} // namespace mountsync::reconcile
