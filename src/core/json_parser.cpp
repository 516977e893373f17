// Implementation of minimal flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>

namespace majority {

int JsonValue::asInt(int default_val) const {
  if (type == Number) return static_cast<int>(number_val);
  return default_val;
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

namespace {

/// @brief Cursor over the JSON text with error tracking.
struct Cursor {
  std::string_view json;
  size_t pos = 0;
  std::string error;

  bool atEnd() const { return pos >= json.size(); }
  char peek() const { return atEnd() ? '\0' : json[pos]; }

  void skipWhitespace() {
    while (!atEnd() && std::isspace(static_cast<unsigned char>(json[pos]))) ++pos;
  }

  bool fail(const std::string& message) {
    if (error.empty()) error = message + " at offset " + std::to_string(pos);
    return false;
  }
};

/// @brief Parse a JSON string literal (expects pos at opening quote).
bool parseString(Cursor& cur, std::string& out) {
  if (cur.peek() != '"') return cur.fail("expected string");
  ++cur.pos;

  out.clear();
  while (!cur.atEnd() && cur.json[cur.pos] != '"') {
    char chr = cur.json[cur.pos];
    if (chr == '\\' && cur.pos + 1 < cur.json.size()) {
      ++cur.pos;
      switch (cur.json[cur.pos]) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'n':  out += '\n'; break;
        case 't':  out += '\t'; break;
        case 'r':  out += '\r'; break;
        default:   out += cur.json[cur.pos]; break;
      }
    } else {
      out += chr;
    }
    ++cur.pos;
  }

  if (cur.atEnd()) return cur.fail("unterminated string");
  ++cur.pos;  // closing quote
  return true;
}

/// @brief Parse a JSON number (integer or floating point with optional exponent).
bool parseNumber(Cursor& cur, double& out) {
  const size_t start = cur.pos;
  if (cur.peek() == '-') ++cur.pos;
  while (std::isdigit(static_cast<unsigned char>(cur.peek()))) ++cur.pos;
  if (cur.peek() == '.') {
    ++cur.pos;
    while (std::isdigit(static_cast<unsigned char>(cur.peek()))) ++cur.pos;
  }
  if (cur.peek() == 'e' || cur.peek() == 'E') {
    ++cur.pos;
    if (cur.peek() == '+' || cur.peek() == '-') ++cur.pos;
    while (std::isdigit(static_cast<unsigned char>(cur.peek()))) ++cur.pos;
  }

  const std::string token(cur.json.substr(start, cur.pos - start));
  if (token.empty() || token == "-") {
    cur.pos = start;
    return cur.fail("invalid value");
  }
  out = std::strtod(token.c_str(), nullptr);
  return true;
}

/// @brief Consume a literal keyword such as "true".
bool consumeLiteral(Cursor& cur, std::string_view literal) {
  if (cur.json.substr(cur.pos, literal.size()) != literal) return cur.fail("invalid literal");
  cur.pos += literal.size();
  return true;
}

/// @brief Skip a nested object or array, honoring strings.
bool skipContainer(Cursor& cur) {
  int depth = 0;
  std::string ignored;
  while (!cur.atEnd()) {
    char chr = cur.json[cur.pos];
    if (chr == '"') {
      if (!parseString(cur, ignored)) return false;
      continue;
    }
    if (chr == '{' || chr == '[') ++depth;
    if (chr == '}' || chr == ']') --depth;
    ++cur.pos;
    if (depth == 0) return true;
  }
  return cur.fail("unterminated container");
}

}  // namespace

JsonObjectResult parseJsonObject(std::string_view json) {
  JsonObjectResult result;
  Cursor cur{json};

  cur.skipWhitespace();
  if (cur.peek() != '{') {
    cur.fail("expected '{'");
    result.error_message = cur.error;
    return result;
  }
  ++cur.pos;

  bool expect_member = false;
  while (true) {
    cur.skipWhitespace();
    if (cur.atEnd()) {
      cur.fail("unexpected end of input");
      break;
    }
    if (cur.peek() == '}' && !expect_member) {
      ++cur.pos;
      result.success = true;
      break;
    }

    std::string key;
    if (!parseString(cur, key)) break;

    cur.skipWhitespace();
    if (cur.peek() != ':') {
      cur.fail("expected ':'");
      break;
    }
    ++cur.pos;
    cur.skipWhitespace();

    JsonValue val;
    bool stored = true;
    const char chr = cur.peek();
    if (chr == '"') {
      val.type = JsonValue::String;
      if (!parseString(cur, val.string_val)) break;
    } else if (chr == 't') {
      val.type = JsonValue::Bool;
      val.bool_val = true;
      if (!consumeLiteral(cur, "true")) break;
    } else if (chr == 'f') {
      val.type = JsonValue::Bool;
      if (!consumeLiteral(cur, "false")) break;
    } else if (chr == 'n') {
      if (!consumeLiteral(cur, "null")) break;
    } else if (chr == '{' || chr == '[') {
      stored = false;
      if (!skipContainer(cur)) break;
    } else {
      val.type = JsonValue::Number;
      if (!parseNumber(cur, val.number_val)) break;
    }
    if (stored) result.values[key] = val;

    cur.skipWhitespace();
    if (cur.peek() == ',') {
      ++cur.pos;
      expect_member = true;
    } else if (cur.peek() == '}') {
      expect_member = false;
    } else {
      cur.fail("expected ',' or '}'");
      break;
    }
  }

  if (!result.success) {
    result.values.clear();
    result.error_message = cur.error;
  }
  return result;
}

}  // namespace majority
