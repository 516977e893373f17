// Tests for scoring/progressive_refinement.h -- ordering and trails of tied groups.

#include "scoring/progressive_refinement.h"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

namespace majority {
namespace {

RefinementCriterion criterion(TieBreakLevel level, std::vector<double> values) {
  RefinementCriterion result;
  result.level = level;
  result.values = std::move(values);
  return result;
}

// ---------------------------------------------------------------------------
// Ordering
// ---------------------------------------------------------------------------

TEST(ProgressiveRefinementTest, FirstCriterionDecides) {
  auto result = refineGroup(3, {criterion(TieBreakLevel::DirectComparison, {1.0, 3.0, 2.0})});
  EXPECT_EQ(result.order, (std::vector<size_t>{1, 2, 0}));
}

TEST(ProgressiveRefinementTest, LaterCriterionOnlyOnEquality) {
  auto result = refineGroup(3, {
                                   criterion(TieBreakLevel::DirectComparison, {2.0, 2.0, 1.0}),
                                   criterion(TieBreakLevel::BScoreSum, {5.0, 9.0, 99.0}),
                               });
  EXPECT_EQ(result.order, (std::vector<size_t>{1, 0, 2}));
}

TEST(ProgressiveRefinementTest, FullyTiedKeepInputOrder) {
  auto result = refineGroup(4, {
                                   criterion(TieBreakLevel::DirectComparison, {1.0, 2.0, 1.0, 1.0}),
                                   criterion(TieBreakLevel::TotalScore, {7.0, 7.0, 7.0, 7.0}),
                               });
  EXPECT_EQ(result.order, (std::vector<size_t>{1, 0, 2, 3}));
}

TEST(ProgressiveRefinementTest, SingleMember) {
  auto result = refineGroup(1, {criterion(TieBreakLevel::DirectComparison, {4.0})});
  EXPECT_EQ(result.order, (std::vector<size_t>{0}));
  ASSERT_EQ(result.trails.size(), 1u);
  EXPECT_TRUE(result.trails[0].empty());
  EXPECT_FALSE(result.summaries[0].has_value());
}

// ---------------------------------------------------------------------------
// Trails
// ---------------------------------------------------------------------------

TEST(ProgressiveRefinementTest, TrailStopsWhenSeparated) {
  auto result = refineGroup(3, {
                                   criterion(TieBreakLevel::DirectComparison, {4.0, 4.0, 6.0}),
                                   criterion(TieBreakLevel::BScoreSum, {7.5, 7.5, 8.5}),
                                   criterion(TieBreakLevel::ComparisonAll, {17.0, 16.0, 20.0}),
                               });
  EXPECT_EQ(result.order, (std::vector<size_t>{2, 0, 1}));

  ASSERT_EQ(result.trails[2].size(), 1u);
  EXPECT_EQ(result.trails[2][0].level, TieBreakLevel::DirectComparison);
  EXPECT_DOUBLE_EQ(result.trails[2][0].value, 6.0);

  ASSERT_EQ(result.trails[0].size(), 3u);
  EXPECT_EQ(result.trails[0][1].level, TieBreakLevel::BScoreSum);
  EXPECT_EQ(result.trails[0][2].level, TieBreakLevel::ComparisonAll);
  EXPECT_DOUBLE_EQ(result.trails[0][2].value, 17.0);
  ASSERT_EQ(result.trails[1].size(), 3u);
  EXPECT_DOUBLE_EQ(result.trails[1][2].value, 16.0);
}

TEST(ProgressiveRefinementTest, NonVaryingCriteriaSkipped) {
  auto result = refineGroup(2, {
                                   criterion(TieBreakLevel::DirectComparison, {1.5, 1.5}),
                                   criterion(TieBreakLevel::BScoreSum, {8.0, 8.0}),
                                   criterion(TieBreakLevel::ComparisonAll, {3.5, 4.5}),
                                   criterion(TieBreakLevel::TotalScore, {16.0, 16.0}),
                               });
  EXPECT_EQ(result.order, (std::vector<size_t>{1, 0}));
  for (size_t member = 0; member < 2; ++member) {
    ASSERT_EQ(result.trails[member].size(), 1u);
    EXPECT_EQ(result.trails[member][0].level, TieBreakLevel::ComparisonAll);
  }
}

TEST(ProgressiveRefinementTest, NoVariationGivesEmptyTrails) {
  auto result = refineGroup(2, {
                                   criterion(TieBreakLevel::DirectComparison, {1.5, 1.5}),
                                   criterion(TieBreakLevel::TotalScore, {15.0, 15.0}),
                               });
  EXPECT_EQ(result.order, (std::vector<size_t>{0, 1}));
  EXPECT_TRUE(result.trails[0].empty());
  EXPECT_TRUE(result.trails[1].empty());
  EXPECT_FALSE(result.summaries[0].has_value());
  EXPECT_FALSE(result.summaries[1].has_value());
}

TEST(ProgressiveRefinementTest, TrailContinuesThroughUnseparatingCriteria) {
  // Members 0 and 1 are never separated; the trail covers every varying criterion.
  auto result = refineGroup(3, {
                                   criterion(TieBreakLevel::DirectComparison, {2.0, 2.0, 1.0}),
                                   criterion(TieBreakLevel::BScoreSum, {6.0, 6.0, 6.0}),
                                   criterion(TieBreakLevel::TotalScore, {12.0, 12.0, 13.0}),
                               });
  ASSERT_EQ(result.trails[0].size(), 2u);
  EXPECT_EQ(result.trails[0][0].level, TieBreakLevel::DirectComparison);
  EXPECT_EQ(result.trails[0][1].level, TieBreakLevel::TotalScore);
  ASSERT_EQ(result.trails[2].size(), 1u);
}

// ---------------------------------------------------------------------------
// Summaries
// ---------------------------------------------------------------------------

TEST(ProgressiveRefinementTest, SummaryComparesWithNextInOrder) {
  auto result = refineGroup(3, {
                                   criterion(TieBreakLevel::DirectComparison, {4.0, 4.0, 6.0}),
                                   criterion(TieBreakLevel::BScoreSum, {7.5, 6.3, 8.5}),
                               });
  EXPECT_EQ(result.order, (std::vector<size_t>{2, 0, 1}));

  ASSERT_TRUE(result.summaries[2].has_value());
  EXPECT_EQ(result.summaries[2]->level, TieBreakLevel::DirectComparison);
  EXPECT_DOUBLE_EQ(result.summaries[2]->value, 6.0);

  ASSERT_TRUE(result.summaries[0].has_value());
  EXPECT_EQ(result.summaries[0]->level, TieBreakLevel::BScoreSum);
  EXPECT_DOUBLE_EQ(result.summaries[0]->value, 7.5);

  // Last member compares with the previous one.
  ASSERT_TRUE(result.summaries[1].has_value());
  EXPECT_EQ(result.summaries[1]->level, TieBreakLevel::BScoreSum);
  EXPECT_DOUBLE_EQ(result.summaries[1]->value, 6.3);
}

TEST(ProgressiveRefinementTest, SummaryMissingForUnseparatedNeighbours) {
  auto result = refineGroup(3, {
                                   criterion(TieBreakLevel::DirectComparison, {3.0, 1.0, 1.0}),
                               });
  EXPECT_EQ(result.order, (std::vector<size_t>{0, 1, 2}));
  ASSERT_TRUE(result.summaries[0].has_value());
  EXPECT_FALSE(result.summaries[1].has_value());
  EXPECT_FALSE(result.summaries[2].has_value());
}

}  // namespace
}  // namespace majority
