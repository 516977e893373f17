/// @file
/// @brief Implementation of the minimal JSON writer for ranking reports.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>

namespace majority {

void JsonWriter::beginObject() {
  maybeComma();
  buffer_ += '{';
  needs_comma_.push_back(false);
}

void JsonWriter::endObject() {
  buffer_ += '}';
  if (!needs_comma_.empty()) needs_comma_.pop_back();
  if (!needs_comma_.empty()) needs_comma_.back() = true;
}

void JsonWriter::beginArray() {
  maybeComma();
  buffer_ += '[';
  needs_comma_.push_back(false);
}

void JsonWriter::endArray() {
  buffer_ += ']';
  if (!needs_comma_.empty()) needs_comma_.pop_back();
  if (!needs_comma_.empty()) needs_comma_.back() = true;
}

void JsonWriter::key(std::string_view name) {
  maybeComma();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
  // The value for this key follows without a comma.
  if (!needs_comma_.empty()) needs_comma_.back() = false;
}

void JsonWriter::value(std::string_view val) {
  writeScalar("\"" + escapeString(val) + "\"");
}

void JsonWriter::value(const char* val) {
  value(std::string_view(val ? val : ""));
}

void JsonWriter::value(int val) {
  writeScalar(std::to_string(val));
}

void JsonWriter::value(uint32_t val) {
  writeScalar(std::to_string(val));
}

void JsonWriter::value(double val) {
  if (!std::isfinite(val)) {
    writeScalar("null");
    return;
  }
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::max_digits10 - 2) << val;
  writeScalar(oss.str());
}

void JsonWriter::value(bool val) {
  writeScalar(val ? "true" : "false");
}

void JsonWriter::value(const std::optional<double>& val) {
  if (val.has_value()) {
    value(*val);
  } else {
    valueNull();
  }
}

void JsonWriter::valueFixed(double val, int decimals) {
  if (!std::isfinite(val)) {
    writeScalar("null");
    return;
  }
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, val);
  writeScalar(buf);
}

void JsonWriter::valueNull() {
  writeScalar("null");
}

std::string JsonWriter::toString() const {
  return buffer_;
}

std::string JsonWriter::toPrettyString(int indent_size) const {
  std::string result;
  result.reserve(buffer_.size() * 2);

  int depth = 0;
  bool in_string = false;
  bool escaped = false;

  auto indent = [&]() {
    result += '\n';
    result.append(static_cast<size_t>(depth * indent_size), ' ');
  };

  for (size_t pos = 0; pos < buffer_.size(); ++pos) {
    char chr = buffer_[pos];

    if (escaped) {
      result += chr;
      escaped = false;
      continue;
    }
    if (in_string) {
      if (chr == '\\') escaped = true;
      if (chr == '"') in_string = false;
      result += chr;
      continue;
    }

    switch (chr) {
      case '"':
        in_string = true;
        result += chr;
        break;

      case '{':
      case '[':
        result += chr;
        ++depth;
        // Keep empty containers compact: {} or [].
        if (pos + 1 < buffer_.size() && (buffer_[pos + 1] == '}' || buffer_[pos + 1] == ']')) {
          break;
        }
        indent();
        break;

      case '}':
      case ']':
        if (!result.empty() && (result.back() == '{' || result.back() == '[')) {
          --depth;
          result += chr;
        } else {
          --depth;
          indent();
          result += chr;
        }
        break;

      case ',':
        result += chr;
        indent();
        break;

      case ':':
        result += ": ";
        break;

      default:
        result += chr;
        break;
    }
  }

  return result;
}

void JsonWriter::maybeComma() {
  if (!needs_comma_.empty() && needs_comma_.back()) {
    buffer_ += ',';
    needs_comma_.back() = false;
  }
}

void JsonWriter::writeScalar(std::string_view token) {
  maybeComma();
  buffer_ += token;
  if (!needs_comma_.empty()) needs_comma_.back() = true;
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\b': result += "\\b";  break;
      case '\f': result += "\\f";  break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      default:
        // Control characters (0x00-0x1F) as \u00XX.
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          result += hex_buf;
        } else {
          result += chr;
        }
        break;
    }
  }

  return result;
}

}  // namespace majority
