// Basic types for majority-system ranking.

#ifndef MAJORITY_CORE_SCORE_TYPES_H
#define MAJORITY_CORE_SCORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace majority {

/// Optional judge mark. std::nullopt means the judge gave no mark.
using Mark = std::optional<double>;

/// Stable position of a competitor in the input collection.
using SkaterIndex = size_t;

/// @brief Raw marks of one competitor, one entry per judge.
///
/// Technical ("A") and artistic ("B") sequences may differ in length and may
/// contain missing entries at any position.
struct SkaterInput {
  std::string name;             ///< Not required to be unique.
  std::vector<Mark> technical;  ///< A-marks.
  std::vector<Mark> artistic;   ///< B-marks.
};

/// Tie-break criteria, in the order the cascade consults them.
enum class TieBreakLevel : uint8_t {
  DirectComparison,  ///< Pair scores against the tied group only.
  BScoreSum,         ///< Sum of present artistic marks.
  ComparisonAll,     ///< Pair scores against every competitor.
  TotalScore         ///< One-decimal total score.
};

/// Number of tie-break levels.
constexpr uint8_t kTieBreakLevelCount = 4;

/// @brief Convert TieBreakLevel to its canonical string ("direct-comparison", ...).
/// @param level The tie-break level.
/// @return Null-terminated string representation.
const char* tieBreakLevelToString(TieBreakLevel level);

/// @brief Parse a TieBreakLevel from its canonical string.
/// @param str String such as "b-score-sum".
/// @return Parsed level, or std::nullopt on unrecognized input.
std::optional<TieBreakLevel> tieBreakLevelFromString(const std::string& str);

/// @brief Short display label used in reports ("Tied votes", "B-Score", ...).
const char* tieBreakLevelLabel(TieBreakLevel level);

/// One step of a tie-break trail.
struct TieBreakEntry {
  TieBreakLevel level = TieBreakLevel::DirectComparison;
  double value = 0.0;
};

/// Per-opponent judge vote tally, for explanatory output only.
struct HeadToHeadResult {
  SkaterIndex opponent_index = 0;
  std::string opponent;     ///< Opponent name (display only, may repeat).
  bool won = false;         ///< votes_for > votes_against.
  int votes_for = 0;        ///< Judges strictly preferring this skater.
  int votes_against = 0;    ///< Judges strictly preferring the opponent.
};

/// @brief Final ranking record for one competitor.
struct SkaterResult {
  SkaterInput input;
  SkaterIndex input_index = 0;
  double total_score = 0.0;         ///< Sum of judge totals, one decimal.
  double majority_victories = 0.0;  ///< Multiple of 0.5 in [0, n-1].
  int rank = 0;

  /// First level separating this skater from its neighbour in the final order.
  std::optional<TieBreakEntry> tie_break;

  /// Levels consulted until this skater was separated from every tied peer.
  std::vector<TieBreakEntry> tie_break_info;

  std::vector<HeadToHeadResult> head_to_head;
};

}  // namespace majority

#endif  // MAJORITY_CORE_SCORE_TYPES_H
