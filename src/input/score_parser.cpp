/// @file
/// @brief Lenient line parser for competitor marks.

#include "input/score_parser.h"

#include <cctype>
#include <cstdlib>
#include <utility>

namespace majority {
namespace {

bool isDigit(char chr) {
  return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

/// @brief Strip leading and trailing whitespace.
std::string_view trim(std::string_view text) {
  size_t begin = 0;
  while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  size_t end = text.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}

bool isCommentLine(std::string_view line) {
  return line.substr(0, 1) == "#" || line.substr(0, 2) == "//";
}

}  // namespace

std::vector<double> extractNumbers(std::string_view text) {
  std::string normalized(text);
  for (char& chr : normalized) {
    if (chr == ',') chr = '.';
  }

  std::vector<double> numbers;
  size_t pos = 0;
  while (pos < normalized.size()) {
    const size_t start = pos;
    if (isDigit(normalized[pos])) {
      while (pos < normalized.size() && isDigit(normalized[pos])) ++pos;
      if (pos < normalized.size() && normalized[pos] == '.') {
        ++pos;
        while (pos < normalized.size() && isDigit(normalized[pos])) ++pos;
      }
    } else if (normalized[pos] == '.' && pos + 1 < normalized.size() &&
               isDigit(normalized[pos + 1])) {
      ++pos;
      while (pos < normalized.size() && isDigit(normalized[pos])) ++pos;
    } else {
      ++pos;
      continue;
    }

    const std::string token = normalized.substr(start, pos - start);
    numbers.push_back(std::strtod(token.c_str(), nullptr));
  }
  return numbers;
}

ParseResult parseScoreText(std::string_view text, const ParserConfig& config) {
  ParseResult result;
  const size_t per_part = config.marks_per_part;
  int unnamed_counter = 1;

  size_t line_number = 0;
  size_t line_start = 0;
  while (line_start <= text.size()) {
    size_t line_end = text.find('\n', line_start);
    if (line_end == std::string_view::npos) line_end = text.size();
    const std::string_view raw_line = text.substr(line_start, line_end - line_start);
    line_start = line_end + 1;
    ++line_number;

    const std::string_view line = trim(raw_line);
    if (line.empty() || isCommentLine(line)) continue;

    std::string name;
    std::string_view marks_text;
    const size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      name = "Skater " + std::to_string(unnamed_counter++);
      marks_text = line;
    } else {
      name = std::string(trim(line.substr(0, colon)));
      marks_text = line.substr(colon + 1);
    }

    const std::vector<double> numbers = extractNumbers(marks_text);
    if (numbers.empty()) {
      result.skipped.push_back({line_number, std::string(line), "no numbers found"});
      continue;
    }

    SkaterInput skater;
    skater.name = std::move(name);
    skater.technical.assign(per_part, std::nullopt);
    skater.artistic.assign(per_part, std::nullopt);
    for (size_t idx = 0; idx < numbers.size() && idx < per_part * 2; ++idx) {
      if (idx < per_part) {
        skater.technical[idx] = numbers[idx];
      } else {
        skater.artistic[idx - per_part] = numbers[idx];
      }
    }
    result.skaters.push_back(std::move(skater));
  }

  return result;
}

}  // namespace majority
