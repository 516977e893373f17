// Majority evaluation: pair scores and majority victories for all competitors.

#ifndef MAJORITY_SCORING_PAIR_SCORE_MATRIX_H
#define MAJORITY_SCORING_PAIR_SCORE_MATRIX_H

#include <cstddef>
#include <vector>

#include "core/score_types.h"
#include "scoring/score_normalizer.h"

namespace majority {

/// @brief Pair score of `lhs` against `rhs`: sum of per-judge comparator results.
///
/// Result lies in [0, pairJudgeCount(lhs, rhs)].
double calculatePairScore(const NormalizedSkater& lhs, const NormalizedSkater& rhs);

/// @brief Pair scores for every ordered pair of competitors.
///
/// Only pairs (i, j) with i < j are evaluated; the reverse score is stored as
/// the complement judges(i, j) - score(i, j), so score(i, j) + score(j, i)
/// always equals the pair's judge count exactly.
class PairScoreMatrix {
 public:
  /// @brief Evaluate all pairs in canonical input order.
  /// @param skaters Normalized competitors indexed by SkaterIndex.
  explicit PairScoreMatrix(const std::vector<NormalizedSkater>& skaters);

  /// @brief Number of competitors.
  size_t size() const { return size_; }

  /// @brief Pair score of `lhs` against `rhs` (0 for lhs == rhs).
  double score(SkaterIndex lhs, SkaterIndex rhs) const;

  /// @brief Judges consulted for the pair (max of both effective counts).
  size_t judgeCount(SkaterIndex lhs, SkaterIndex rhs) const;

  /// @brief Majority-victory points awarded to `lhs` from its pair with `rhs`.
  /// @return 1, 0.5 or 0.
  double victoryPoints(SkaterIndex lhs, SkaterIndex rhs) const;

  /// @brief Majority victories per competitor, indexed by SkaterIndex.
  ///
  /// Accumulated over pairs (i < j) in input order.
  std::vector<double> majorityVictories() const;

 private:
  size_t size_ = 0;
  std::vector<double> scores_;       // size_ * size_, row-major
  std::vector<size_t> judge_counts_;  // size_ * size_, row-major
};

}  // namespace majority

#endif  // MAJORITY_SCORING_PAIR_SCORE_MATRIX_H
