// Single-judge comparison of two competitors.

#include "scoring/judge_comparator.h"

#include <algorithm>

namespace majority {

double compareByJudge(double total_a, double b_score_a, double total_b, double b_score_b) {
  if (total_a > total_b) return kJudgeWin;
  if (total_b > total_a) return kJudgeLoss;

  if (b_score_a > b_score_b) return kJudgeWin;
  if (b_score_b > b_score_a) return kJudgeLoss;

  return kJudgeTie;
}

double compareAtJudge(const NormalizedSkater& lhs, const NormalizedSkater& rhs, size_t judge) {
  return compareByJudge(lhs.totalAt(judge), lhs.artisticAt(judge),
                        rhs.totalAt(judge), rhs.artisticAt(judge));
}

size_t pairJudgeCount(const NormalizedSkater& lhs, const NormalizedSkater& rhs) {
  return std::max(lhs.judgeCount(), rhs.judgeCount());
}

}  // namespace majority
