/// @file
/// @brief RankingConfig string conversions and JSON loading.

#include "core/ranking_config.h"

#include <map>

#include "core/json_parser.h"

namespace majority {

const char* outputFormatToString(OutputFormat format) {
  switch (format) {
    case OutputFormat::Text: return "text";
    case OutputFormat::Json: return "json";
  }
  return "text";
}

OutputFormat outputFormatFromString(const std::string& str) {
  if (str == "json") return OutputFormat::Json;
  return OutputFormat::Text;
}

size_t clampMarksPerPart(double value) {
  if (!(value >= static_cast<double>(kMinMarksPerPart))) return kMinMarksPerPart;
  if (value > static_cast<double>(kMaxMarksPerPart)) return kMaxMarksPerPart;
  return static_cast<size_t>(value);
}

ConfigLoadResult applyJsonConfig(const RankingConfig& base, std::string_view json) {
  ConfigLoadResult result;
  result.config = base;

  JsonObjectResult parsed = parseJsonObject(json);
  if (!parsed.success) {
    result.error_message = "invalid config JSON: " + parsed.error_message;
    return result;
  }
  const std::map<std::string, JsonValue>& kv = parsed.values;
  RankingConfig& config = result.config;

  auto it = kv.find("marks_per_part");
  if (it != kv.end() && it->second.type == JsonValue::Number) {
    config.parser.marks_per_part = clampMarksPerPart(it->second.number_val);
  }

  it = kv.find("format");
  if (it != kv.end() && it->second.type == JsonValue::String) {
    config.format = outputFormatFromString(it->second.string_val);
  }

  it = kv.find("pretty");
  if (it != kv.end()) config.pretty = it->second.asBool(config.pretty);

  it = kv.find("graph");
  if (it != kv.end()) config.graph = it->second.asBool(config.graph);

  it = kv.find("verbose");
  if (it != kv.end()) config.verbose = it->second.asBool(config.verbose);

  result.success = true;
  return result;
}

}  // namespace majority
