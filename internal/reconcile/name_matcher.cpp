#include "name_matcher.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace mountsync::reconcile {
namespace {

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

size_t WeightedDistance(const std::string& a, const std::string& b) {
  std::vector<size_t> prev(b.size() + 1);
  std::vector<size_t> curr(b.size() + 1);
  for (size_t j = 0; j <= b.size(); ++j) {
    prev[j] = j;
  }

  for (size_t i = 1; i <= a.size(); ++i) {
    curr[0] = i;
    for (size_t j = 1; j <= b.size(); ++j) {
      const size_t substitute = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 2);
      curr[j]                 = std::min({prev[j] + 1, curr[j - 1] + 1, substitute});
    }
    std::swap(prev, curr);
  }
  return prev[b.size()];
}

} // namespace

int NameRatio(std::string_view a, std::string_view b) {
  const size_t total = a.size() + b.size();
  if (total == 0) {
    return 100;
  }
  const size_t distance = WeightedDistance(Lower(a), Lower(b));
  return static_cast<int>(std::lround(100.0 * static_cast<double>(total - distance) / static_cast<double>(total)));
}

std::optional<std::string> BestNameMatch(std::string_view name, const std::vector<std::string>& candidates, int threshold) {
  std::optional<std::string> best;
  int                        best_score = -1;

  for (const auto& candidate : candidates) {
    const int score = NameRatio(name, candidate);
    if (score >= threshold && score > best_score) {
      best       = candidate;
      best_score = score;
    }
  }
  return best;
}

} // namespace mountsync::reconcile
