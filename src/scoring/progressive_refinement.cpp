// Progressive refinement of a tied group over ordered criteria.

#include "scoring/progressive_refinement.h"

#include <algorithm>
#include <numeric>

namespace majority {
namespace {

/// @brief True if at least two members hold different values.
bool hasVariation(const RefinementCriterion& criterion) {
  const auto& values = criterion.values;
  for (size_t idx = 1; idx < values.size(); ++idx) {
    if (values[idx] != values[0]) return true;
  }
  return false;
}

/// @brief Trail of one member through the varying criteria.
std::vector<TieBreakEntry> buildTrail(size_t member, size_t group_size,
                                      const std::vector<RefinementCriterion>& criteria,
                                      const std::vector<bool>& varies) {
  std::vector<TieBreakEntry> trail;

  std::vector<size_t> still_tied;
  for (size_t other = 0; other < group_size; ++other) {
    if (other != member) still_tied.push_back(other);
  }

  for (size_t crit = 0; crit < criteria.size(); ++crit) {
    if (!varies[crit]) continue;

    const double own = criteria[crit].values[member];
    trail.push_back({criteria[crit].level, own});

    still_tied.erase(std::remove_if(still_tied.begin(), still_tied.end(),
                                    [&](size_t other) {
                                      return criteria[crit].values[other] != own;
                                    }),
                     still_tied.end());
    if (still_tied.empty()) break;
  }
  return trail;
}

}  // namespace

RefinementResult refineGroup(size_t group_size, const std::vector<RefinementCriterion>& criteria) {
  RefinementResult result;
  result.order.resize(group_size);
  std::iota(result.order.begin(), result.order.end(), 0);

  std::stable_sort(result.order.begin(), result.order.end(), [&](size_t lhs, size_t rhs) {
    for (const auto& criterion : criteria) {
      const double lhs_val = criterion.values[lhs];
      const double rhs_val = criterion.values[rhs];
      if (lhs_val != rhs_val) return lhs_val > rhs_val;
    }
    return false;
  });

  result.trails.resize(group_size);
  result.summaries.resize(group_size);
  if (group_size < 2) return result;

  std::vector<bool> varies(criteria.size(), false);
  for (size_t crit = 0; crit < criteria.size(); ++crit) {
    varies[crit] = hasVariation(criteria[crit]);
  }

  for (size_t pos = 0; pos < group_size; ++pos) {
    const size_t member = result.order[pos];
    const size_t neighbour = pos + 1 < group_size ? result.order[pos + 1] : result.order[pos - 1];

    for (const auto& criterion : criteria) {
      if (criterion.values[member] != criterion.values[neighbour]) {
        result.summaries[member] = TieBreakEntry{criterion.level, criterion.values[member]};
        break;
      }
    }

    result.trails[member] = buildTrail(member, group_size, criteria, varies);
  }

  return result;
}

}  // namespace majority
