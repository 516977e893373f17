// Tests for scoring/score_normalizer.h -- judge totals, B-score sum and rounding.

#include "scoring/score_normalizer.h"

#include <gtest/gtest.h>

#include <vector>

#include "test_helpers.h"

namespace majority {
namespace {

using test_helpers::makeSkater;

// ---------------------------------------------------------------------------
// Effective judge count
// ---------------------------------------------------------------------------

TEST(ScoreNormalizerTest, CountPresentMarks) {
  EXPECT_EQ(countPresentMarks({}), 0u);
  EXPECT_EQ(countPresentMarks({Mark(1.0), Mark(), Mark(2.0)}), 2u);
  EXPECT_EQ(countPresentMarks({Mark(), Mark()}), 0u);
}

TEST(ScoreNormalizerTest, EffectiveJudgeCountIsLargerPart) {
  SkaterInput skater;
  skater.technical = {Mark(1.0), Mark(1.0), Mark()};
  skater.artistic = {Mark(2.0), Mark(), Mark()};
  EXPECT_EQ(effectiveJudgeCount(skater), 2u);

  skater.artistic = {Mark(2.0), Mark(2.0), Mark(2.0), Mark(2.0)};
  EXPECT_EQ(effectiveJudgeCount(skater), 4u);
}

TEST(ScoreNormalizerTest, EffectiveJudgeCountWithoutMarks) {
  SkaterInput skater;
  skater.technical = {Mark(), Mark()};
  EXPECT_EQ(effectiveJudgeCount(skater), 0u);
  EXPECT_TRUE(calculateJudgeTotals(skater).empty());
}

// ---------------------------------------------------------------------------
// Judge totals
// ---------------------------------------------------------------------------

TEST(ScoreNormalizerTest, JudgeTotalsSumBothParts) {
  auto totals = calculateJudgeTotals(makeSkater("Anna", {3.9, 4.0, 4.1}, {3.9, 3.9, 4.0}));
  ASSERT_EQ(totals.size(), 3u);
  EXPECT_EQ(totals[0], 3.9 + 3.9);
  EXPECT_EQ(totals[1], 4.0 + 3.9);
  EXPECT_EQ(totals[2], 4.1 + 4.0);
}

TEST(ScoreNormalizerTest, MissingEntriesCountAsZero) {
  SkaterInput skater;
  skater.technical = {Mark(1.4), Mark(1.4), Mark()};
  skater.artistic = {Mark(), Mark(), Mark()};

  auto totals = calculateJudgeTotals(skater);
  ASSERT_EQ(totals.size(), 2u);
  EXPECT_DOUBLE_EQ(totals[0], 1.4);
  EXPECT_DOUBLE_EQ(totals[1], 1.4);

  NormalizedSkater normalized = normalizeSkater(skater);
  EXPECT_DOUBLE_EQ(normalized.totalAt(0), 1.4);
  EXPECT_DOUBLE_EQ(normalized.totalAt(1), 1.4);
  EXPECT_DOUBLE_EQ(normalized.totalAt(2), 0.0);
}

TEST(ScoreNormalizerTest, TotalsUseIndexRangeNotPresentPositions) {
  // Present marks sit at index 2 only; effective count 1 covers index 0.
  SkaterInput skater;
  skater.technical = {Mark(), Mark(), Mark(3.0)};
  skater.artistic = {Mark(), Mark(), Mark(2.0)};

  auto totals = calculateJudgeTotals(skater);
  ASSERT_EQ(totals.size(), 1u);
  EXPECT_DOUBLE_EQ(totals[0], 0.0);
}

TEST(ScoreNormalizerTest, ShorterPartPaddedWithZero) {
  SkaterInput skater;
  skater.technical = {Mark(2.0), Mark(2.0), Mark(2.0)};
  skater.artistic = {Mark(1.0)};

  auto totals = calculateJudgeTotals(skater);
  ASSERT_EQ(totals.size(), 3u);
  EXPECT_DOUBLE_EQ(totals[0], 3.0);
  EXPECT_DOUBLE_EQ(totals[1], 2.0);
  EXPECT_DOUBLE_EQ(totals[2], 2.0);
}

// ---------------------------------------------------------------------------
// B-score sum and rounding
// ---------------------------------------------------------------------------

TEST(ScoreNormalizerTest, BScoreSumSkipsMissing) {
  SkaterInput skater;
  skater.artistic = {Mark(2.5), Mark(), Mark(3.0)};
  EXPECT_DOUBLE_EQ(calculateBScoreSum(skater), 5.5);

  SkaterInput empty;
  EXPECT_DOUBLE_EQ(calculateBScoreSum(empty), 0.0);
}

TEST(ScoreNormalizerTest, RoundToOneDecimal) {
  EXPECT_DOUBLE_EQ(roundToOneDecimal(15.94), 15.9);
  EXPECT_DOUBLE_EQ(roundToOneDecimal(15.96), 16.0);
  EXPECT_DOUBLE_EQ(roundToOneDecimal(0.25), 0.3);
  EXPECT_DOUBLE_EQ(roundToOneDecimal(0.0), 0.0);
  EXPECT_DOUBLE_EQ(roundToOneDecimal(24.0), 24.0);
}

TEST(ScoreNormalizerTest, NormalizeSkater) {
  NormalizedSkater normalized =
      normalizeSkater(makeSkater("Julia", {2.5, 1.8, 2.3}, {2.7, 2.9, 3.3}));
  EXPECT_EQ(normalized.judgeCount(), 3u);
  EXPECT_DOUBLE_EQ(normalized.total_score, 15.5);
  EXPECT_DOUBLE_EQ(normalized.b_score_sum, 8.9);
  EXPECT_DOUBLE_EQ(normalized.artisticAt(1), 2.9);
  EXPECT_DOUBLE_EQ(normalized.artisticAt(7), 0.0);
}

TEST(ScoreNormalizerTest, ArtisticKeepsRawPositions) {
  SkaterInput skater;
  skater.technical = {Mark(3.0)};
  skater.artistic = {Mark(), Mark(4.0)};

  NormalizedSkater normalized = normalizeSkater(skater);
  EXPECT_EQ(normalized.judgeCount(), 1u);
  ASSERT_EQ(normalized.artistic.size(), 2u);
  EXPECT_DOUBLE_EQ(normalized.artisticAt(0), 0.0);
  EXPECT_DOUBLE_EQ(normalized.artisticAt(1), 4.0);
  EXPECT_DOUBLE_EQ(normalized.b_score_sum, 4.0);
}

}  // namespace
}  // namespace majority
