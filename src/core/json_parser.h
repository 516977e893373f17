// Minimal flat-object JSON parser for configuration input (no external dependencies).
//
// Handles only the subset needed for RankingConfig: a flat object with
// string, number, boolean and null values. Nested objects and arrays are
// skipped.

#ifndef MAJORITY_CORE_JSON_PARSER_H
#define MAJORITY_CORE_JSON_PARSER_H

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace majority {

/// @brief A single JSON value (string, number, boolean or null).
struct JsonValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  /// @brief Get value as integer, with default.
  int asInt(int default_val = 0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;
};

/// @brief Result of parsing a flat JSON object.
struct JsonObjectResult {
  std::map<std::string, JsonValue> values;
  bool success = false;
  std::string error_message;  ///< Set when success is false; includes the byte offset.
};

/// @brief Parse a flat JSON object into a key-value map.
///
/// Nested objects and arrays are skipped without being stored. Duplicate
/// keys keep the last value.
///
/// @param json JSON text.
/// @return Parsed values, or success == false with an error message.
JsonObjectResult parseJsonObject(std::string_view json);

}  // namespace majority

#endif  // MAJORITY_CORE_JSON_PARSER_H
