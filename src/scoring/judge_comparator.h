// Single-judge comparison of two competitors.

#ifndef MAJORITY_SCORING_JUDGE_COMPARATOR_H
#define MAJORITY_SCORING_JUDGE_COMPARATOR_H

#include <cstddef>

#include "scoring/score_normalizer.h"

namespace majority {

/// Comparator outcomes from the first skater's perspective.
constexpr double kJudgeWin = 1.0;
constexpr double kJudgeTie = 0.5;
constexpr double kJudgeLoss = 0.0;

/// @brief Compare two competitors for one judge.
///
/// Higher total wins; equal totals fall back to the higher artistic mark;
/// otherwise the judge is tied. Comparisons use exact floating-point
/// equality.
///
/// @return kJudgeWin, kJudgeLoss or kJudgeTie from A's perspective.
double compareByJudge(double total_a, double b_score_a, double total_b, double b_score_b);

/// @brief Compare two normalized competitors at one judge index.
double compareAtJudge(const NormalizedSkater& lhs, const NormalizedSkater& rhs, size_t judge);

/// @brief Number of judges consulted when comparing two competitors.
size_t pairJudgeCount(const NormalizedSkater& lhs, const NormalizedSkater& rhs);

}  // namespace majority

#endif  // MAJORITY_SCORING_JUDGE_COMPARATOR_H
