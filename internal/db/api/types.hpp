#pragma once

#include <optional>

#include "internal/model/state_machine.hpp"

namespace mountsync::db {

struct ItemFilter {
  std::optional<mountsync::model::ItemStatus> status;
  std::optional<bool>                         needs_inspection;
};

} // namespace mountsync::db
