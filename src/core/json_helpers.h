// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for ranking
// reports, the victory graph and the C API. Does not parse JSON.

#ifndef MAJORITY_CORE_JSON_HELPERS_H
#define MAJORITY_CORE_JSON_HELPERS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace majority {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("name");
///   writer.value("Anna");
///   writer.key("majority_victories");
///   writer.value(3.0);
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"name":"Anna","majority_victories":3}
/// @endcode
///
/// Supports nested objects and arrays. Tracks comma insertion automatically.
/// Does not validate structure (caller must match begin/end pairs).
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);

  /// @brief Write a C string value (JSON-escaped).
  void value(const char* val);

  void value(int val);
  void value(uint32_t val);

  /// @brief Write a floating-point value with up to 15 significant digits.
  /// NaN and infinities are written as null.
  void value(double val);

  void value(bool val);

  /// @brief Write an optional number, null when absent.
  void value(const std::optional<double>& val);

  /// @brief Write a floating-point value with a fixed number of decimals.
  /// @param val Value to write.
  /// @param decimals Digits after the decimal point.
  void valueFixed(double val, int decimals);

  void valueNull();

  /// @brief Get the accumulated JSON string.
  std::string toString() const;

  /// @brief Get the accumulated JSON string with pretty-print indentation.
  /// @param indent_size Number of spaces per indent level (default: 2).
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Write a comma if needed before the next value/key.
  void maybeComma();

  /// Append a raw scalar token and mark the current level as non-empty.
  void writeScalar(std::string_view token);

  /// Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open container: whether the next element needs a comma.
  std::vector<bool> needs_comma_;
};

}  // namespace majority

#endif  // MAJORITY_CORE_JSON_HELPERS_H
