/// @file
/// @brief Per-judge totals and derived sums for one competitor.

#include "scoring/score_normalizer.h"

#include <algorithm>
#include <cmath>

namespace majority {

double NormalizedSkater::totalAt(size_t judge) const {
  return judge < judge_totals.size() ? judge_totals[judge] : 0.0;
}

double NormalizedSkater::artisticAt(size_t judge) const {
  return judge < artistic.size() ? artistic[judge] : 0.0;
}

size_t countPresentMarks(const std::vector<Mark>& marks) {
  return static_cast<size_t>(
      std::count_if(marks.begin(), marks.end(),
                    [](const Mark& mark) { return mark.has_value(); }));
}

size_t effectiveJudgeCount(const SkaterInput& skater) {
  return std::max(countPresentMarks(skater.technical),
                  countPresentMarks(skater.artistic));
}

namespace {

/// @brief Mark value at index, 0 when missing or beyond the sequence.
double markOrZero(const std::vector<Mark>& marks, size_t idx) {
  if (idx >= marks.size() || !marks[idx].has_value()) return 0.0;
  return *marks[idx];
}

}  // namespace

std::vector<double> calculateJudgeTotals(const SkaterInput& skater) {
  const size_t num_judges = effectiveJudgeCount(skater);
  std::vector<double> totals;
  totals.reserve(num_judges);
  for (size_t idx = 0; idx < num_judges; ++idx) {
    totals.push_back(markOrZero(skater.technical, idx) + markOrZero(skater.artistic, idx));
  }
  return totals;
}

double calculateBScoreSum(const SkaterInput& skater) {
  double sum = 0.0;
  for (const auto& mark : skater.artistic) {
    if (mark.has_value()) sum += *mark;
  }
  return sum;
}

double roundToOneDecimal(double value) {
  // Marks are never negative, so half-away-from-zero equals half-up here.
  return std::round(value * 10.0) / 10.0;
}

NormalizedSkater normalizeSkater(const SkaterInput& skater) {
  NormalizedSkater normalized;
  normalized.judge_totals = calculateJudgeTotals(skater);

  normalized.artistic.reserve(skater.artistic.size());
  for (size_t idx = 0; idx < skater.artistic.size(); ++idx) {
    normalized.artistic.push_back(markOrZero(skater.artistic, idx));
  }

  double total = 0.0;
  for (double judge_total : normalized.judge_totals) {
    total += judge_total;
  }
  normalized.total_score = roundToOneDecimal(total);
  normalized.b_score_sum = calculateBScoreSum(skater);
  return normalized;
}

}  // namespace majority
