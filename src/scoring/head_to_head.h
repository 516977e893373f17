// Head-to-head judge vote tallies for explanatory output.

#ifndef MAJORITY_SCORING_HEAD_TO_HEAD_H
#define MAJORITY_SCORING_HEAD_TO_HEAD_H

#include <vector>

#include "core/score_types.h"
#include "scoring/score_normalizer.h"

namespace majority {

/// @brief Tally judge votes of one competitor against one opponent.
///
/// A strict per-judge win counts for the skater, a strict loss against it;
/// tied judges count for neither side, so votes_for + votes_against may be
/// smaller than the pair's judge count. Opponent identity fields are left
/// for the caller.
HeadToHeadResult tallyHeadToHead(const NormalizedSkater& skater, const NormalizedSkater& opponent);

/// @brief Head-to-head list of one competitor against every other one.
/// @param inputs Raw inputs (for opponent names), indexed by SkaterIndex.
/// @param skaters Normalized competitors, indexed by SkaterIndex.
/// @param self Index of the competitor to report on.
/// @return One entry per opponent, in input order.
std::vector<HeadToHeadResult> buildHeadToHead(const std::vector<SkaterInput>& inputs,
                                              const std::vector<NormalizedSkater>& skaters,
                                              SkaterIndex self);

}  // namespace majority

#endif  // MAJORITY_SCORING_HEAD_TO_HEAD_H
