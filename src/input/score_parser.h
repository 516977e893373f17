// Score text parser: one competitor per line, "Name: a1 a2 a3 b1 b2 b3".

#ifndef MAJORITY_INPUT_SCORE_PARSER_H
#define MAJORITY_INPUT_SCORE_PARSER_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "core/score_types.h"

namespace majority {

/// Default number of technical (and artistic) marks per line.
constexpr size_t kDefaultMarksPerPart = 3;

/// @brief Options controlling line parsing.
struct ParserConfig {
  size_t marks_per_part = kDefaultMarksPerPart;  ///< Marks per part (A and B).
};

/// A line that produced no competitor.
struct SkippedLine {
  size_t line_number = 0;  ///< 1-based.
  std::string text;
  std::string reason;
};

/// @brief Parsed competitors plus the lines that were ignored.
struct ParseResult {
  std::vector<SkaterInput> skaters;
  std::vector<SkippedLine> skipped;
};

/// @brief Extract decimal numbers from free text.
///
/// Commas are decimal separators ("3,9" == 3.9). Numbers match `\d+\.?\d*`
/// or `\.\d+`; every other character separates numbers.
///
/// @param text Free text such as "3,9 4,0 und 4,1".
/// @return Numbers in order of appearance.
std::vector<double> extractNumbers(std::string_view text);

/// @brief Parse competitor lines.
///
/// Rules:
///   - Blank lines and lines starting with '#' or "//" are ignored.
///   - Text before the first ':' is the name. Lines without ':' are named
///     "Skater 1", "Skater 2", ... in order of appearance.
///   - The first marks_per_part numbers are technical marks, the next
///     marks_per_part are artistic marks, further numbers are dropped.
///   - Missing trailing marks are padded as missing entries.
///   - Lines without any number are reported in ParseResult::skipped.
///
/// @param text Full input text.
/// @param config Parser options.
/// @return Parsed competitors in line order.
ParseResult parseScoreText(std::string_view text, const ParserConfig& config = ParserConfig());

}  // namespace majority

#endif  // MAJORITY_INPUT_SCORE_PARSER_H
