// Implementation of C API for WASM and FFI bindings.

#include "majority_c.h"

#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include "core/ranking_config.h"
#include "core/score_types.h"
#include "input/score_parser.h"
#include "report/result_report.h"
#include "report/victory_graph.h"
#include "scoring/rank_assigner.h"

namespace {

constexpr const char* kVersion = "0.1.0";

/// @brief Internal state held per MajorityHandle.
struct MajorityInstance {
  majority::RankingConfig config;
  std::vector<majority::SkaterResult> results;
  size_t skipped_lines = 0;
  std::string results_json;
  std::string graph_json;
  bool has_result = false;
};

/// @brief Count tied groups (runs of equal majority victories with 2+ members).
uint32_t countTiedGroups(const std::vector<majority::SkaterResult>& results) {
  uint32_t groups = 0;
  size_t idx = 0;
  while (idx < results.size()) {
    size_t end = idx + 1;
    while (end < results.size() &&
           results[end].majority_victories == results[idx].majority_victories) {
      ++end;
    }
    if (end - idx > 1) ++groups;
    idx = end;
  }
  return groups;
}

/// @brief Copy a string into a malloc'd MajorityJsonData.
MajorityJsonData* copyJson(const std::string& json) {
  auto* data = static_cast<MajorityJsonData*>(malloc(sizeof(MajorityJsonData)));
  if (!data) return nullptr;

  data->length = json.size();
  data->json = static_cast<char*>(malloc(data->length + 1));
  if (!data->json) {
    free(data);
    return nullptr;
  }
  memcpy(data->json, json.c_str(), data->length + 1);
  return data;
}

}  // namespace

extern "C" {

// ============================================================================
// Lifecycle
// ============================================================================

MajorityHandle majority_create(void) {
  return new MajorityInstance();
}

void majority_destroy(MajorityHandle handle) {
  delete static_cast<MajorityInstance*>(handle);
}

// ============================================================================
// Configuration and Ranking
// ============================================================================

MajorityError majority_configure_json(MajorityHandle handle, const char* json, size_t length) {
  if (!handle || !json) {
    return MAJORITY_ERROR_INVALID_PARAM;
  }
  auto* instance = static_cast<MajorityInstance*>(handle);

  majority::ConfigLoadResult loaded =
      majority::applyJsonConfig(instance->config, std::string_view(json, length));
  if (!loaded.success) {
    return MAJORITY_ERROR_INVALID_CONFIG;
  }
  instance->config = loaded.config;
  return MAJORITY_OK;
}

MajorityError majority_rank_text(MajorityHandle handle, const char* text, size_t length) {
  if (!handle || !text) {
    return MAJORITY_ERROR_INVALID_PARAM;
  }
  auto* instance = static_cast<MajorityInstance*>(handle);

  majority::ParseResult parsed =
      majority::parseScoreText(std::string_view(text, length), instance->config.parser);
  instance->skipped_lines = parsed.skipped.size();
  if (parsed.skaters.empty()) {
    instance->results.clear();
    instance->has_result = false;
    return MAJORITY_ERROR_NO_SKATERS;
  }

  instance->results = majority::calculateRankings(parsed.skaters);
  instance->results_json = majority::resultsToJson(instance->results, instance->config.pretty);
  instance->graph_json = majority::victoryGraphToJson(
      majority::buildVictoryGraph(instance->results), instance->config.pretty);
  instance->has_result = true;
  return MAJORITY_OK;
}

// ============================================================================
// Output Retrieval
// ============================================================================

MajorityJsonData* majority_get_results_json(MajorityHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<MajorityInstance*>(handle);
  if (!instance->has_result) return nullptr;
  return copyJson(instance->results_json);
}

MajorityJsonData* majority_get_graph_json(MajorityHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<MajorityInstance*>(handle);
  if (!instance->has_result) return nullptr;
  return copyJson(instance->graph_json);
}

void majority_free_json(MajorityJsonData* data) {
  if (data) {
    free(data->json);
    free(data);
  }
}

// Static buffer for info queries
static MajorityInfo s_info;

MajorityInfo* majority_get_info(MajorityHandle handle) {
  s_info = {};
  if (!handle) return &s_info;

  auto* instance = static_cast<MajorityInstance*>(handle);
  s_info.skipped_line_count = static_cast<uint32_t>(instance->skipped_lines);
  if (!instance->has_result) return &s_info;

  s_info.skater_count = static_cast<uint32_t>(instance->results.size());
  s_info.tied_group_count = countTiedGroups(instance->results);
  return &s_info;
}

// ============================================================================
// Tie-Break Level Enumeration
// ============================================================================

uint8_t majority_tie_break_level_count(void) {
  return majority::kTieBreakLevelCount;
}

const char* majority_tie_break_level_name(uint8_t id) {
  if (id >= majority::kTieBreakLevelCount) return "";
  return majority::tieBreakLevelToString(static_cast<majority::TieBreakLevel>(id));
}

// ============================================================================
// Error Handling and Utilities
// ============================================================================

const char* majority_error_string(MajorityError error) {
  switch (error) {
    case MAJORITY_OK:                   return "OK";
    case MAJORITY_ERROR_INVALID_PARAM:  return "Invalid parameter";
    case MAJORITY_ERROR_INVALID_CONFIG: return "Invalid config JSON";
    case MAJORITY_ERROR_NO_SKATERS:     return "No skater with marks found";
  }
  return "Unknown error";
}

const char* majority_version(void) {
  return kVersion;
}

}  // extern "C"
