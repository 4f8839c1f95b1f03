#include "retention.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <system_error>

namespace mountsync::store {

std::optional<uint32_t> ParseRetentionDays(std::string_view text) {
  uint32_t   days  = 0;
  const auto first = text.data();
  const auto last  = text.data() + text.size();

  // from_chars rejects a leading sign, so "-1" never wraps around
  const auto [end, ec] = std::from_chars(first, last, days);
  if (text.empty() || ec != std::errc() || end != last) {
    return std::nullopt;
  }
  if (days == 0 || days > kMaxRetentionDays) {
    return std::nullopt;
  }
  return days;
}

util::TimePoint RetentionCutoff(util::TimePoint now, uint32_t days) {
  return std::max(now - std::chrono::hours(24) * static_cast<int64_t>(days), util::TimePoint{});
}

} // namespace mountsync::store
