// Tests for scoring/pair_score_matrix.h -- pair scores and majority victories.

#include "scoring/pair_score_matrix.h"

#include <gtest/gtest.h>

#include <vector>

#include "test_helpers.h"

namespace majority {
namespace {

using test_helpers::makeSkater;
using test_helpers::makeSymmetricSkater;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::vector<NormalizedSkater> normalizeAll(const std::vector<SkaterInput>& inputs) {
  std::vector<NormalizedSkater> result;
  for (const auto& input : inputs) result.push_back(normalizeSkater(input));
  return result;
}

// ---------------------------------------------------------------------------
// calculatePairScore
// ---------------------------------------------------------------------------

TEST(PairScoreTest, SplitDecision) {
  auto lhs = normalizeSkater(makeSymmetricSkater("A", {5.0, 4.0, 5.0}));
  auto rhs = normalizeSkater(makeSkater("B", {4.5, 4.5, 4.5}, {4.5, 5.5, 4.5}));
  EXPECT_DOUBLE_EQ(calculatePairScore(lhs, rhs), 2.0);
  EXPECT_DOUBLE_EQ(calculatePairScore(rhs, lhs), 1.0);
}

TEST(PairScoreTest, PerfectTieScoresHalfPerJudge) {
  auto lhs = normalizeSkater(makeSkater("A", {3, 3, 3}, {2, 2, 2}));
  auto rhs = normalizeSkater(makeSkater("B", {3, 3, 3}, {2, 2, 2}));
  EXPECT_DOUBLE_EQ(calculatePairScore(lhs, rhs), 1.5);
}

TEST(PairScoreTest, NoMarksOnEitherSide) {
  SkaterInput empty;
  empty.technical = {Mark(), Mark()};
  EXPECT_DOUBLE_EQ(calculatePairScore(normalizeSkater(empty), normalizeSkater(empty)), 0.0);
}

// ---------------------------------------------------------------------------
// PairScoreMatrix
// ---------------------------------------------------------------------------

TEST(PairScoreMatrixTest, ScoresSumToJudgeCount) {
  auto skaters = normalizeAll(test_helpers::randomField(17, 8, 5, 0.2));
  PairScoreMatrix matrix(skaters);
  ASSERT_EQ(matrix.size(), 8u);

  for (SkaterIndex lhs = 0; lhs < 8; ++lhs) {
    EXPECT_DOUBLE_EQ(matrix.score(lhs, lhs), 0.0);
    for (SkaterIndex rhs = 0; rhs < 8; ++rhs) {
      if (lhs == rhs) continue;
      EXPECT_EQ(matrix.judgeCount(lhs, rhs), matrix.judgeCount(rhs, lhs));
      EXPECT_EQ(matrix.score(lhs, rhs) + matrix.score(rhs, lhs),
                static_cast<double>(matrix.judgeCount(lhs, rhs)));
      EXPECT_GE(matrix.score(lhs, rhs), 0.0);
      EXPECT_LE(matrix.score(lhs, rhs), static_cast<double>(matrix.judgeCount(lhs, rhs)));
    }
  }
}

TEST(PairScoreMatrixTest, ReverseIsComplementOfForward) {
  std::vector<SkaterInput> inputs = {
      makeSymmetricSkater("A", {5.0, 4.0, 5.0}),
      makeSkater("B", {4.5, 4.5, 4.5}, {4.5, 5.5, 4.5}),
  };
  PairScoreMatrix matrix(normalizeAll(inputs));
  EXPECT_DOUBLE_EQ(matrix.score(0, 1), 2.0);
  EXPECT_DOUBLE_EQ(matrix.score(1, 0), 1.0);
  EXPECT_EQ(matrix.judgeCount(0, 1), 3u);
}

TEST(PairScoreMatrixTest, MixedJudgeCounts) {
  SkaterInput partial;
  partial.technical = {Mark(1.4), Mark(1.4), Mark()};
  partial.artistic = {Mark(), Mark(), Mark()};
  std::vector<SkaterInput> inputs = {partial, makeSymmetricSkater("Q", {1, 1, 1})};

  PairScoreMatrix matrix(normalizeAll(inputs));
  EXPECT_EQ(matrix.judgeCount(0, 1), 3u);
  EXPECT_DOUBLE_EQ(matrix.score(0, 1), 0.0);
  EXPECT_DOUBLE_EQ(matrix.score(1, 0), 3.0);
}

TEST(PairScoreMatrixTest, VictoryPoints) {
  std::vector<SkaterInput> inputs = {
      makeSymmetricSkater("A", {5.0, 4.0, 5.0}),
      makeSkater("B", {4.5, 4.5, 4.5}, {4.5, 5.5, 4.5}),
      makeSymmetricSkater("C", {5.0, 4.0, 5.0}),
  };
  PairScoreMatrix matrix(normalizeAll(inputs));
  EXPECT_DOUBLE_EQ(matrix.victoryPoints(0, 1), 1.0);
  EXPECT_DOUBLE_EQ(matrix.victoryPoints(1, 0), 0.0);
  EXPECT_DOUBLE_EQ(matrix.victoryPoints(0, 2), 0.5);
  EXPECT_DOUBLE_EQ(matrix.victoryPoints(2, 0), 0.5);
}

TEST(PairScoreMatrixTest, MajorityVictoriesHighestTotalLoses) {
  std::vector<SkaterInput> inputs = {
      makeSymmetricSkater("Alice", {4.0, 4.0, 3.0}),
      makeSymmetricSkater("Bob", {3.0, 3.0, 4.0}),
      makeSymmetricSkater("Carol", {2.0, 2.0, 5.0}),
  };
  auto victories = PairScoreMatrix(normalizeAll(inputs)).majorityVictories();
  ASSERT_EQ(victories.size(), 3u);
  EXPECT_DOUBLE_EQ(victories[0], 2.0);
  EXPECT_DOUBLE_EQ(victories[1], 1.0);
  EXPECT_DOUBLE_EQ(victories[2], 0.0);
}

TEST(PairScoreMatrixTest, MajorityVictoriesConserved) {
  const size_t count = 9;
  auto victories =
      PairScoreMatrix(normalizeAll(test_helpers::randomField(3, count, 3, 0.1))).majorityVictories();
  double sum = 0.0;
  for (double value : victories) {
    EXPECT_GE(value, 0.0);
    EXPECT_LE(value, static_cast<double>(count - 1));
    EXPECT_DOUBLE_EQ(value * 2.0, static_cast<double>(static_cast<int>(value * 2.0)));
    sum += value;
  }
  EXPECT_DOUBLE_EQ(sum, static_cast<double>(count * (count - 1) / 2));
}

TEST(PairScoreMatrixTest, EmptyAndSingle) {
  PairScoreMatrix empty(std::vector<NormalizedSkater>{});
  EXPECT_EQ(empty.size(), 0u);
  EXPECT_TRUE(empty.majorityVictories().empty());

  PairScoreMatrix single(normalizeAll({makeSymmetricSkater("Solo", {3, 3, 3})}));
  auto victories = single.majorityVictories();
  ASSERT_EQ(victories.size(), 1u);
  EXPECT_DOUBLE_EQ(victories[0], 0.0);
}

}  // namespace
}  // namespace majority
