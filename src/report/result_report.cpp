/// @file
/// @brief Result table and JSON serialization.

#include "report/result_report.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

#include "core/json_helpers.h"

namespace majority {

std::string formatTieBreakValue(double value) {
  char buf[32];
  if (std::floor(value) == value) {
    std::snprintf(buf, sizeof(buf), "%.0f", value);
  } else {
    std::snprintf(buf, sizeof(buf), "%.1f", value);
  }
  return buf;
}

std::string formatTieBreakTrail(const std::vector<TieBreakEntry>& trail) {
  std::string text;
  for (const auto& entry : trail) {
    if (!text.empty()) text += ", ";
    text += tieBreakLevelLabel(entry.level);
    text += ": ";
    text += formatTieBreakValue(entry.value);
  }
  return text;
}

namespace {

void writeMarks(JsonWriter& writer, const std::vector<Mark>& marks) {
  writer.beginArray();
  for (const auto& mark : marks) {
    writer.value(mark);
  }
  writer.endArray();
}

}  // namespace

void writeResultJson(JsonWriter& writer, const SkaterResult& result) {
  writer.beginObject();
  writer.key("rank");
  writer.value(result.rank);
  writer.key("name");
  writer.value(result.input.name);
  writer.key("input_index");
  writer.value(static_cast<uint32_t>(result.input_index));
  writer.key("technical");
  writeMarks(writer, result.input.technical);
  writer.key("artistic");
  writeMarks(writer, result.input.artistic);
  writer.key("total_score");
  writer.valueFixed(result.total_score, 1);
  writer.key("majority_victories");
  writer.value(result.majority_victories);

  if (result.tie_break.has_value()) {
    writer.key("tie_break_level");
    writer.value(tieBreakLevelToString(result.tie_break->level));
    writer.key("tie_break_value");
    writer.value(result.tie_break->value);
  }

  writer.key("tie_break_info");
  writer.beginArray();
  for (const auto& entry : result.tie_break_info) {
    writer.beginObject();
    writer.key("level");
    writer.value(tieBreakLevelToString(entry.level));
    writer.key("value");
    writer.value(entry.value);
    writer.endObject();
  }
  writer.endArray();

  writer.key("head_to_head");
  writer.beginArray();
  for (const auto& h2h : result.head_to_head) {
    writer.beginObject();
    writer.key("opponent");
    writer.value(h2h.opponent);
    writer.key("opponent_index");
    writer.value(static_cast<uint32_t>(h2h.opponent_index));
    writer.key("won");
    writer.value(h2h.won);
    writer.key("votes_for");
    writer.value(h2h.votes_for);
    writer.key("votes_against");
    writer.value(h2h.votes_against);
    writer.endObject();
  }
  writer.endArray();

  writer.endObject();
}

std::string resultsToJson(const std::vector<SkaterResult>& results, bool pretty) {
  JsonWriter writer;
  writer.beginArray();
  for (const auto& result : results) {
    writeResultJson(writer, result);
  }
  writer.endArray();
  return pretty ? writer.toPrettyString() : writer.toString();
}

std::string resultsToText(const std::vector<SkaterResult>& results) {
  size_t name_width = 4;
  for (const auto& result : results) {
    name_width = std::max(name_width, result.input.name.size());
  }
  const int width = static_cast<int>(name_width);

  std::ostringstream oss;
  char buf[256];
  std::snprintf(buf, sizeof(buf), "%4s  %-*s  %5s  %6s  %s\n", "Rank", width, "Name", "M.V.",
                "Total", "Tie-break");
  oss << buf;

  for (const auto& result : results) {
    std::snprintf(buf, sizeof(buf), "%4d  ", result.rank);
    oss << buf << result.input.name;
    oss << std::string(name_width - result.input.name.size(), ' ');
    std::snprintf(buf, sizeof(buf), "  %5.1f  %6.1f", result.majority_victories, result.total_score);
    oss << buf;

    const std::string trail = formatTieBreakTrail(result.tie_break_info);
    if (!trail.empty()) oss << "  " << trail;
    oss << "\n";
  }
  return oss.str();
}

}  // namespace majority
