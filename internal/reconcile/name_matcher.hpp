#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mountsync::reconcile {

// Case-insensitive similarity 0-100: round(100 * (len_a + len_b - d) / (len_a + len_b))
// where d is the edit distance with substitutions costing 2.
int NameRatio(std::string_view a, std::string_view b);

// Highest-scoring candidate at or above threshold; ties keep the first.
std::optional<std::string> BestNameMatch(std::string_view name, const std::vector<std::string>& candidates, int threshold);

} // namespace mountsync::reconcile
