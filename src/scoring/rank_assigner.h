// Ranking by the majority system (Majoritaetssystem).

#ifndef MAJORITY_SCORING_RANK_ASSIGNER_H
#define MAJORITY_SCORING_RANK_ASSIGNER_H

#include <vector>

#include "core/score_types.h"

namespace majority {

/// @brief Rank competitors by pairwise majority victories.
///
/// Ranking criteria, in order:
///   1. Majority victories (M.V.) from pairwise judge comparisons.
///   2. Direct comparison score among the tied competitors only.
///   3. Sum of artistic (B) marks.
///   4. Comparison score against all competitors.
///   5. One-decimal total score.
///
/// Every competitor receives a distinct rank. Members of a tied group that
/// stay equal on every criterion are ranked in input order.
///
/// The call is pure: identical input yields identical output.
///
/// @param skaters Competitors in input order. Empty input yields an empty result.
/// @return Results ordered by rank (rank 1 first).
std::vector<SkaterResult> calculateRankings(const std::vector<SkaterInput>& skaters);

}  // namespace majority

#endif  // MAJORITY_SCORING_RANK_ASSIGNER_H
