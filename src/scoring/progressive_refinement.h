// Progressive refinement of a tied group over ordered criteria.

#ifndef MAJORITY_SCORING_PROGRESSIVE_REFINEMENT_H
#define MAJORITY_SCORING_PROGRESSIVE_REFINEMENT_H

#include <cstddef>
#include <optional>
#include <vector>

#include "core/score_types.h"

namespace majority {

/// @brief One ordering criterion: a level and one value per group member.
///
/// Higher values rank first. `values[k]` belongs to group member k.
struct RefinementCriterion {
  TieBreakLevel level = TieBreakLevel::DirectComparison;
  std::vector<double> values;
};

/// @brief Outcome of refining a group. Per-member vectors use member positions.
struct RefinementResult {
  /// Member positions in final order (best first).
  std::vector<size_t> order;

  /// Per member: criteria consulted until it was separated from every peer.
  std::vector<std::vector<TieBreakEntry>> trails;

  /// Per member: first criterion separating it from its final-order
  /// neighbour, or std::nullopt when nothing does.
  std::vector<std::optional<TieBreakEntry>> summaries;
};

/// @brief Order a tied group by criteria consulted in sequence.
///
/// Sorting compares criterion 0 first and moves to the next criterion only
/// on exact equality. Members equal on every criterion keep their original
/// relative order.
///
/// Trails start at the first criterion on which any two members differ. A
/// member's trail gains an entry at every criterion that varies across the
/// group, and the set of peers still tied with it shrinks to those sharing
/// the value; the trail ends when no peer remains or the criteria run out.
///
/// @param group_size Number of members (every criterion holds this many values).
/// @param criteria Criteria in the order they are consulted.
/// @return Order, trails and summaries for the group.
RefinementResult refineGroup(size_t group_size, const std::vector<RefinementCriterion>& criteria);

}  // namespace majority

#endif  // MAJORITY_SCORING_PROGRESSIVE_REFINEMENT_H
