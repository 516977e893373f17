/// @file
/// @brief Pair score evaluation over all competitor pairs.

#include "scoring/pair_score_matrix.h"

#include "scoring/judge_comparator.h"

namespace majority {

double calculatePairScore(const NormalizedSkater& lhs, const NormalizedSkater& rhs) {
  const size_t num_judges = pairJudgeCount(lhs, rhs);
  double score = 0.0;
  for (size_t judge = 0; judge < num_judges; ++judge) {
    score += compareAtJudge(lhs, rhs, judge);
  }
  return score;
}

PairScoreMatrix::PairScoreMatrix(const std::vector<NormalizedSkater>& skaters)
    : size_(skaters.size()),
      scores_(skaters.size() * skaters.size(), 0.0),
      judge_counts_(skaters.size() * skaters.size(), 0) {
  for (size_t row = 0; row < size_; ++row) {
    for (size_t col = row + 1; col < size_; ++col) {
      const size_t num_judges = pairJudgeCount(skaters[row], skaters[col]);
      const double forward = calculatePairScore(skaters[row], skaters[col]);

      scores_[row * size_ + col] = forward;
      scores_[col * size_ + row] = static_cast<double>(num_judges) - forward;
      judge_counts_[row * size_ + col] = num_judges;
      judge_counts_[col * size_ + row] = num_judges;
    }
  }
}

double PairScoreMatrix::score(SkaterIndex lhs, SkaterIndex rhs) const {
  return scores_[lhs * size_ + rhs];
}

size_t PairScoreMatrix::judgeCount(SkaterIndex lhs, SkaterIndex rhs) const {
  return judge_counts_[lhs * size_ + rhs];
}

double PairScoreMatrix::victoryPoints(SkaterIndex lhs, SkaterIndex rhs) const {
  const double own = score(lhs, rhs);
  const double other = score(rhs, lhs);
  if (own > other) return 1.0;
  if (other > own) return 0.0;
  return 0.5;
}

std::vector<double> PairScoreMatrix::majorityVictories() const {
  std::vector<double> victories(size_, 0.0);
  for (size_t row = 0; row < size_; ++row) {
    for (size_t col = row + 1; col < size_; ++col) {
      victories[row] += victoryPoints(row, col);
      victories[col] += victoryPoints(col, row);
    }
  }
  return victories;
}

}  // namespace majority
