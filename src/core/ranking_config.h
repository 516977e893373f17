// Ranking configuration shared by the CLI and the C API.

#ifndef MAJORITY_CORE_RANKING_CONFIG_H
#define MAJORITY_CORE_RANKING_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "input/score_parser.h"

namespace majority {

/// Report format.
enum class OutputFormat : uint8_t {
  Text,
  Json
};

/// Allowed range for marks per part.
constexpr size_t kMinMarksPerPart = 1;
constexpr size_t kMaxMarksPerPart = 10;

/// @brief Convert OutputFormat to string ("text", "json").
const char* outputFormatToString(OutputFormat format);

/// @brief Parse an OutputFormat. Defaults to OutputFormat::Text on unrecognized input.
OutputFormat outputFormatFromString(const std::string& str);

/// @brief Unified configuration for parsing, ranking and reporting.
struct RankingConfig {
  ParserConfig parser;                     ///< marks_per_part etc.
  OutputFormat format = OutputFormat::Text;
  bool pretty = false;   ///< Pretty-print JSON output.
  bool graph = false;    ///< Include the reduced victory graph.
  bool verbose = false;  ///< Log skipped lines and tie-break groups.
};

/// @brief Result of loading configuration from JSON.
struct ConfigLoadResult {
  RankingConfig config;
  bool success = false;
  std::string error_message;
};

/// @brief Clamp marks per part into [kMinMarksPerPart, kMaxMarksPerPart].
size_t clampMarksPerPart(double value);

/// @brief Apply a flat JSON object on top of an existing configuration.
///
/// Recognized keys: marks_per_part (number), format (string), pretty,
/// graph, verbose (booleans). Unknown keys are ignored. Values of the wrong
/// type leave the field unchanged.
///
/// @param base Configuration to start from.
/// @param json JSON text.
/// @return Updated configuration, or success == false on malformed JSON.
ConfigLoadResult applyJsonConfig(const RankingConfig& base, std::string_view json);

}  // namespace majority

#endif  // MAJORITY_CORE_RANKING_CONFIG_H
