#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/util/time.hpp"

namespace mountsync::store {

// Ten years; anything longer is a typo.
constexpr uint32_t kMaxRetentionDays = 3650;

// Parses an operator-supplied day count. nullopt unless it is a plain
// decimal in [1, kMaxRetentionDays].
std::optional<uint32_t> ParseRetentionDays(std::string_view text);

// REMOVED rows retired before this instant are eligible for purging.
// Never earlier than the Unix epoch.
util::TimePoint RetentionCutoff(util::TimePoint now, uint32_t days);

} // namespace mountsync::store
