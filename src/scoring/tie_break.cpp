/// @file
/// @brief Tie-break cascade criteria (Vergleichszahl, B-score sum, total score).

#include "scoring/tie_break.h"

namespace majority {
namespace {

/// @brief Sum of pair scores of `self` against each index in `opponents`.
double comparisonScore(SkaterIndex self, const std::vector<SkaterIndex>& opponents,
                       const PairScoreMatrix& matrix) {
  double sum = 0.0;
  for (SkaterIndex other : opponents) {
    if (other == self) continue;
    sum += matrix.score(self, other);
  }
  return sum;
}

}  // namespace

std::vector<RefinementCriterion> buildTieBreakCriteria(const std::vector<SkaterIndex>& group,
                                                       const std::vector<NormalizedSkater>& skaters,
                                                       const PairScoreMatrix& matrix) {
  std::vector<SkaterIndex> universe(skaters.size());
  for (SkaterIndex idx = 0; idx < universe.size(); ++idx) universe[idx] = idx;

  std::vector<RefinementCriterion> criteria(kTieBreakLevelCount);
  criteria[0].level = TieBreakLevel::DirectComparison;
  criteria[1].level = TieBreakLevel::BScoreSum;
  criteria[2].level = TieBreakLevel::ComparisonAll;
  criteria[3].level = TieBreakLevel::TotalScore;

  for (SkaterIndex member : group) {
    criteria[0].values.push_back(comparisonScore(member, group, matrix));
    criteria[1].values.push_back(skaters[member].b_score_sum);
    criteria[2].values.push_back(comparisonScore(member, universe, matrix));
    criteria[3].values.push_back(skaters[member].total_score);
  }
  return criteria;
}

RefinementResult breakTie(const std::vector<SkaterIndex>& group,
                          const std::vector<NormalizedSkater>& skaters,
                          const PairScoreMatrix& matrix) {
  return refineGroup(group.size(), buildTieBreakCriteria(group, skaters, matrix));
}

}  // namespace majority
