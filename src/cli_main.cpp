/// @file
/// @brief CLI entry point for the majority-system ranking tool.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "core/ranking_config.h"
#include "input/score_parser.h"
#include "majority_c.h"
#include "report/result_report.h"
#include "report/victory_graph.h"
#include "scoring/rank_assigner.h"

namespace {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string input;        ///< Empty = stdin.
  std::string output;       ///< Empty = stdout.
  std::string config_path;  ///< Optional flat JSON config.
  bool json = false;
  bool pretty = false;
  bool graph = false;
  bool verbose = false;
  int marks = 0;  ///< 0 = keep config value.
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("majority_cli - Majority-system (Majoritaetssystem) ranking\n\n");
  std::printf("Usage: majority_cli [options] [FILE]\n\n");
  std::printf("Reads one skater per line from FILE (or stdin):\n");
  std::printf("  Name: a1 a2 a3 b1 b2 b3\n\n");
  std::printf("Options:\n");
  std::printf("  --json           JSON output\n");
  std::printf("  --pretty         Pretty-print JSON output\n");
  std::printf("  --graph          Include the reduced victory graph\n");
  std::printf("  --marks N        Marks per part per line (1-10, default 3)\n");
  std::printf("  --config FILE    Flat JSON config file\n");
  std::printf("  --verbose        Log skipped lines and tie-break groups\n");
  std::printf("  -o FILE          Output file path\n");
  std::printf("  --help           Show this help\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @return False if --help was requested (caller should exit cleanly).
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 || std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      return false;
    }
    if (std::strcmp(argv[idx], "--json") == 0) {
      opts.json = true;
    } else if (std::strcmp(argv[idx], "--pretty") == 0) {
      opts.pretty = true;
    } else if (std::strcmp(argv[idx], "--graph") == 0) {
      opts.graph = true;
    } else if (std::strcmp(argv[idx], "--verbose") == 0) {
      opts.verbose = true;
    } else if (std::strcmp(argv[idx], "--marks") == 0 && idx + 1 < argc) {
      opts.marks = std::atoi(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--config") == 0 && idx + 1 < argc) {
      opts.config_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "-o") == 0 && idx + 1 < argc) {
      opts.output = argv[++idx];
    } else if (argv[idx][0] != '-') {
      opts.input = argv[idx];
    } else {
      std::fprintf(stderr, "Warning: ignoring unknown option %s\n", argv[idx]);
    }
  }
  return true;
}

/// @brief Read a whole file (or stdin when path is empty).
bool readAll(const std::string& path, std::string& out) {
  if (path.empty()) {
    out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
  }
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return false;
  std::ostringstream oss;
  oss << file.rdbuf();
  out = oss.str();
  return true;
}

/// @brief Trace tied groups and how the cascade ordered them.
void logTieGroups(const std::vector<majority::SkaterResult>& results) {
  size_t idx = 0;
  while (idx < results.size()) {
    size_t end = idx + 1;
    while (end < results.size() &&
           results[end].majority_victories == results[idx].majority_victories) {
      ++end;
    }
    if (end - idx > 1) {
      std::fprintf(stderr, "[tie-break] M.V. %.1f: %zu skaters, ranks %d-%d\n",
                   results[idx].majority_victories, end - idx, results[idx].rank,
                   results[end - 1].rank);
      for (size_t pos = idx; pos < end; ++pos) {
        const auto& result = results[pos];
        std::fprintf(stderr, "[tie-break]   #%d %s: %s\n", result.rank, result.input.name.c_str(),
                     result.tie_break_info.empty()
                         ? "unresolved"
                         : majority::formatTieBreakTrail(result.tie_break_info).c_str());
      }
    }
    idx = end;
  }
}

/// @brief Build the report text for the selected format.
std::string buildReport(const std::vector<majority::SkaterResult>& results,
                        const majority::RankingConfig& config) {
  if (config.format == majority::OutputFormat::Json) {
    std::string report = majority::resultsToJson(results, config.pretty);
    if (config.graph) {
      report = "{\"results\":" + report + ",\"graph\":" +
               majority::victoryGraphToJson(majority::buildVictoryGraph(results), config.pretty) +
               "}";
    }
    return report + "\n";
  }

  std::string report = majority::resultsToText(results);
  if (config.graph) {
    const majority::VictoryGraph graph = majority::buildVictoryGraph(results);
    std::map<majority::SkaterIndex, std::string> names;
    for (const auto& node : graph.nodes) names[node.index] = node.name;

    report += "\nVictories (reduced):\n";
    for (const auto& edge : graph.edges) {
      report += "  " + names[edge.winner] + " -> " + names[edge.loser] + "\n";
    }
  }
  return report;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!parseArgs(argc, argv, opts)) {
    return 0;
  }

  majority::RankingConfig config;
  if (!opts.config_path.empty()) {
    std::string config_text;
    if (!readAll(opts.config_path, config_text)) {
      std::fprintf(stderr, "Error: failed to read config %s\n", opts.config_path.c_str());
      return 1;
    }
    majority::ConfigLoadResult loaded = majority::applyJsonConfig(config, config_text);
    if (!loaded.success) {
      std::fprintf(stderr, "Error: %s: %s\n", opts.config_path.c_str(),
                   loaded.error_message.c_str());
      return 1;
    }
    config = loaded.config;
  }
  if (opts.json) config.format = majority::OutputFormat::Json;
  if (opts.pretty) config.pretty = true;
  if (opts.graph) config.graph = true;
  if (opts.verbose) config.verbose = true;
  if (opts.marks != 0) config.parser.marks_per_part = majority::clampMarksPerPart(opts.marks);

  std::string text;
  if (!readAll(opts.input, text)) {
    std::fprintf(stderr, "Error: failed to read %s\n",
                 opts.input.empty() ? "stdin" : opts.input.c_str());
    return 1;
  }

  majority::ParseResult parsed = majority::parseScoreText(text, config.parser);
  for (const auto& skipped : parsed.skipped) {
    std::fprintf(stderr, "Warning: skipping line %zu \"%s\" - %s\n", skipped.line_number,
                 skipped.text.c_str(), skipped.reason.c_str());
  }
  if (parsed.skaters.empty()) {
    std::fprintf(stderr, "Error: no valid scores found (each line needs at least one number)\n");
    return 1;
  }

  if (config.verbose) {
    std::fprintf(stderr, "majority_cli v%s\n", majority_version());
    std::fprintf(stderr, "Skaters:    %zu\n", parsed.skaters.size());
    std::fprintf(stderr, "Marks/part: %zu\n", config.parser.marks_per_part);
    std::fprintf(stderr, "Format:     %s\n", majority::outputFormatToString(config.format));
  }

  const std::vector<majority::SkaterResult> results = majority::calculateRankings(parsed.skaters);
  if (config.verbose) {
    logTieGroups(results);
  }

  const std::string report = buildReport(results, config);
  if (opts.output.empty()) {
    std::fwrite(report.data(), 1, report.size(), stdout);
    return 0;
  }

  std::ofstream out_file(opts.output, std::ios::binary);
  if (!out_file.is_open()) {
    std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
    return 1;
  }
  out_file << report;
  out_file.close();
  if (!out_file) {
    std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
    return 1;
  }
  if (config.verbose) {
    std::fprintf(stderr, "Output:     %s\n", opts.output.c_str());
  }
  return 0;
}
