// Text and JSON reports for ranking results.

#ifndef MAJORITY_REPORT_RESULT_REPORT_H
#define MAJORITY_REPORT_RESULT_REPORT_H

#include <string>
#include <vector>

#include "core/score_types.h"

namespace majority {

class JsonWriter;

/// @brief Format a tie-break value: no decimals when integral, else one decimal.
std::string formatTieBreakValue(double value);

/// @brief Human-readable tie-break trail, e.g. "Tied votes: 3, B-Score: 7.5".
/// @return Empty string for an empty trail.
std::string formatTieBreakTrail(const std::vector<TieBreakEntry>& trail);

/// @brief Write one result as a JSON object.
void writeResultJson(JsonWriter& writer, const SkaterResult& result);

/// @brief Serialize results (in the given order) as a JSON array.
/// @param results Ranking results.
/// @param pretty Pretty-print with two-space indentation.
std::string resultsToJson(const std::vector<SkaterResult>& results, bool pretty = false);

/// @brief Render results as a fixed-width text table.
///
/// Columns: rank, name, majority victories, total score and the tie-break
/// trail for competitors ranked through the cascade.
std::string resultsToText(const std::vector<SkaterResult>& results);

}  // namespace majority

#endif  // MAJORITY_REPORT_RESULT_REPORT_H
