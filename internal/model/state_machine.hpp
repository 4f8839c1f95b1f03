#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace mountsync::model {

enum class ItemStatus : std::uint8_t {
  kPending   = 0,
  kAvailable = 1,
  kPartial   = 2,
  kMissing   = 3,
  kRemoved   = 4,
};

constexpr bool IsVisible(ItemStatus status) {
  return status == ItemStatus::kAvailable || status == ItemStatus::kPartial;
}

/*
  Allowed moves:

    PENDING            -> AVAILABLE | PARTIAL
    AVAILABLE, PARTIAL -> MISSING           (after the debounce)
    MISSING            -> REMOVED           (descriptor gone as well)
    any                -> AVAILABLE | PARTIAL (re-observed)

  Nothing ever moves back to PENDING.
*/
constexpr bool CanTransition(ItemStatus from, ItemStatus to) {
  if (from == to) {
    return true;
  }
  switch (to) {
    case ItemStatus::kAvailable:
    case ItemStatus::kPartial:
      return true;
    case ItemStatus::kMissing:
      return IsVisible(from);
    case ItemStatus::kRemoved:
      return from == ItemStatus::kMissing;
    case ItemStatus::kPending:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(ItemStatus status) {
  switch (status) {
    case ItemStatus::kPending:
      return "PENDING";
    case ItemStatus::kAvailable:
      return "AVAILABLE";
    case ItemStatus::kPartial:
      return "PARTIAL";
    case ItemStatus::kMissing:
      return "MISSING";
    case ItemStatus::kRemoved:
      return "REMOVED";
  }
  return "UNKNOWN";
}

inline std::optional<ItemStatus> ParseItemStatus(std::string_view text) {
  for (auto status : {ItemStatus::kPending, ItemStatus::kAvailable, ItemStatus::kPartial, ItemStatus::kMissing, ItemStatus::kRemoved}) {
    if (ToString(status) == text) {
      return status;
    }
  }
  return std::nullopt;
}

} // namespace mountsync::model
