// Four-level tie-break cascade for competitors with equal majority victories.

#ifndef MAJORITY_SCORING_TIE_BREAK_H
#define MAJORITY_SCORING_TIE_BREAK_H

#include <vector>

#include "core/score_types.h"
#include "scoring/pair_score_matrix.h"
#include "scoring/progressive_refinement.h"
#include "scoring/score_normalizer.h"

namespace majority {

/// @brief Build the cascade criteria for a tied group.
///
/// Criteria, in order:
///   1. direct-comparison: pair scores against the other group members.
///   2. b-score-sum: sum of present artistic marks.
///   3. comparison-all: pair scores against every other competitor.
///   4. total-score: one-decimal total score.
///
/// @param group Competitor indices in the group (input order).
/// @param skaters All normalized competitors, indexed by SkaterIndex.
/// @param matrix Pair scores for all competitors.
/// @return Four criteria with one value per group member.
std::vector<RefinementCriterion> buildTieBreakCriteria(const std::vector<SkaterIndex>& group,
                                                       const std::vector<NormalizedSkater>& skaters,
                                                       const PairScoreMatrix& matrix);

/// @brief Resolve the order of a tied group.
///
/// Member positions in the returned RefinementResult refer to `group`.
RefinementResult breakTie(const std::vector<SkaterIndex>& group,
                          const std::vector<NormalizedSkater>& skaters,
                          const PairScoreMatrix& matrix);

}  // namespace majority

#endif  // MAJORITY_SCORING_TIE_BREAK_H
