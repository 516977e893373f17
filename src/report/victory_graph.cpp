// Head-to-head victory graph with transitive reduction.

#include "report/victory_graph.h"

#include <algorithm>
#include <map>
#include <set>

#include "core/json_helpers.h"

namespace majority {
namespace {

using WinMap = std::map<SkaterIndex, std::set<SkaterIndex>>;

/// @brief True if source beats some intermediate ranked between source and
///        target that also beats target.
bool hasPathThrough(SkaterIndex source, SkaterIndex target, const WinMap& wins,
                    const std::map<SkaterIndex, int>& ranks) {
  auto source_it = wins.find(source);
  if (source_it == wins.end()) return false;

  const int source_rank = ranks.at(source);
  const int target_rank = ranks.at(target);

  for (SkaterIndex intermediate : source_it->second) {
    if (intermediate == target) continue;
    auto rank_it = ranks.find(intermediate);
    if (rank_it == ranks.end()) continue;
    const int mid_rank = rank_it->second;
    if (mid_rank <= source_rank || mid_rank >= target_rank) continue;

    auto mid_it = wins.find(intermediate);
    if (mid_it != wins.end() && mid_it->second.count(target) > 0) return true;
  }
  return false;
}

}  // namespace

VictoryGraph buildVictoryGraph(const std::vector<SkaterResult>& results) {
  VictoryGraph graph;

  std::vector<const SkaterResult*> by_rank;
  by_rank.reserve(results.size());
  for (const auto& result : results) by_rank.push_back(&result);
  std::stable_sort(by_rank.begin(), by_rank.end(),
                   [](const SkaterResult* lhs, const SkaterResult* rhs) {
                     return lhs->rank < rhs->rank;
                   });

  std::map<SkaterIndex, int> ranks;
  WinMap wins;
  for (const SkaterResult* result : by_rank) {
    graph.nodes.push_back(
        {result->input_index, result->input.name, result->rank, result->majority_victories});
    ranks[result->input_index] = result->rank;

    auto& beaten = wins[result->input_index];
    for (const auto& h2h : result->head_to_head) {
      if (h2h.won) beaten.insert(h2h.opponent_index);
    }
  }

  for (const SkaterResult* result : by_rank) {
    const SkaterIndex source = result->input_index;
    for (SkaterIndex target : wins[source]) {
      if (ranks.count(target) == 0) continue;
      if (!hasPathThrough(source, target, wins, ranks)) {
        graph.edges.push_back({source, target});
      }
    }
  }

  return graph;
}

std::string victoryGraphToJson(const VictoryGraph& graph, bool pretty) {
  JsonWriter writer;
  writer.beginObject();

  writer.key("nodes");
  writer.beginArray();
  for (const auto& node : graph.nodes) {
    writer.beginObject();
    writer.key("index");
    writer.value(static_cast<uint32_t>(node.index));
    writer.key("name");
    writer.value(node.name);
    writer.key("rank");
    writer.value(node.rank);
    writer.key("majority_victories");
    writer.value(node.majority_victories);
    writer.endObject();
  }
  writer.endArray();

  writer.key("edges");
  writer.beginArray();
  for (const auto& edge : graph.edges) {
    writer.beginObject();
    writer.key("winner");
    writer.value(static_cast<uint32_t>(edge.winner));
    writer.key("loser");
    writer.value(static_cast<uint32_t>(edge.loser));
    writer.endObject();
  }
  writer.endArray();

  writer.endObject();
  return pretty ? writer.toPrettyString() : writer.toString();
}

}  // namespace majority
