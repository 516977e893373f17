// Score normalization: per-judge totals, total score and B-score sum.

#ifndef MAJORITY_SCORING_SCORE_NORMALIZER_H
#define MAJORITY_SCORING_SCORE_NORMALIZER_H

#include <cstddef>
#include <vector>

#include "core/score_types.h"

namespace majority {

/// @brief Marks of one competitor reduced to the values the ranking consults.
///
/// Built once per ranking call. Every judge total is computed exactly once
/// here and reused by all comparisons, so equal totals always compare equal.
struct NormalizedSkater {
  std::vector<double> judge_totals;  ///< Length == effective judge count.
  std::vector<double> artistic;      ///< Raw B-marks, missing entries as 0.
  double total_score = 0.0;          ///< Sum of judge_totals, one decimal.
  double b_score_sum = 0.0;          ///< Sum of present B-marks.

  /// @brief Number of judges this skater counts for.
  size_t judgeCount() const { return judge_totals.size(); }

  /// @brief Judge total at index, 0 past the effective judge count.
  double totalAt(size_t judge) const;

  /// @brief Artistic mark at index, 0 when missing or out of range.
  double artisticAt(size_t judge) const;
};

/// @brief Count present (non-missing) marks.
size_t countPresentMarks(const std::vector<Mark>& marks);

/// @brief Effective judge count: the larger of the present technical and
///        present artistic mark counts.
size_t effectiveJudgeCount(const SkaterInput& skater);

/// @brief Compute per-judge totals (technical + artistic, missing as 0).
///
/// The result has exactly effectiveJudgeCount() entries. A skater without any
/// present mark yields an empty vector.
///
/// @param skater Competitor marks.
/// @return Judge totals in judge order.
std::vector<double> calculateJudgeTotals(const SkaterInput& skater);

/// @brief Sum of present artistic marks, accumulated in judge order.
double calculateBScoreSum(const SkaterInput& skater);

/// @brief Round half up to one decimal place.
double roundToOneDecimal(double value);

/// @brief Build the normalized view of a competitor.
NormalizedSkater normalizeSkater(const SkaterInput& skater);

}  // namespace majority

#endif  // MAJORITY_SCORING_SCORE_NORMALIZER_H
