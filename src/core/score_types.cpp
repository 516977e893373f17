// Implementation of tie-break level conversions.

#include "core/score_types.h"

namespace majority {

const char* tieBreakLevelToString(TieBreakLevel level) {
  switch (level) {
    case TieBreakLevel::DirectComparison: return "direct-comparison";
    case TieBreakLevel::BScoreSum:        return "b-score-sum";
    case TieBreakLevel::ComparisonAll:    return "comparison-all";
    case TieBreakLevel::TotalScore:       return "total-score";
  }
  return "unknown";
}

std::optional<TieBreakLevel> tieBreakLevelFromString(const std::string& str) {
  if (str == "direct-comparison") return TieBreakLevel::DirectComparison;
  if (str == "b-score-sum") return TieBreakLevel::BScoreSum;
  if (str == "comparison-all") return TieBreakLevel::ComparisonAll;
  if (str == "total-score") return TieBreakLevel::TotalScore;
  return std::nullopt;
}

const char* tieBreakLevelLabel(TieBreakLevel level) {
  switch (level) {
    case TieBreakLevel::DirectComparison: return "Tied votes";
    case TieBreakLevel::BScoreSum:        return "B-Score";
    case TieBreakLevel::ComparisonAll:    return "Votes";
    case TieBreakLevel::TotalScore:       return "Total";
  }
  return "";
}

}  // namespace majority
