// Head-to-head victory graph with transitive reduction, for display.

#ifndef MAJORITY_REPORT_VICTORY_GRAPH_H
#define MAJORITY_REPORT_VICTORY_GRAPH_H

#include <string>
#include <vector>

#include "core/score_types.h"

namespace majority {

/// Graph node: one competitor.
struct VictoryNode {
  SkaterIndex index = 0;
  std::string name;
  int rank = 0;
  double majority_victories = 0.0;
};

/// Directed edge from winner to loser of a head-to-head pairing.
struct VictoryEdge {
  SkaterIndex winner = 0;
  SkaterIndex loser = 0;
};

/// @brief Reduced victory graph.
struct VictoryGraph {
  std::vector<VictoryNode> nodes;  ///< In rank order.
  std::vector<VictoryEdge> edges;  ///< Grouped by winner in rank order.
};

/// @brief Build the victory graph from ranking results.
///
/// Every head-to-head `won` entry yields an edge winner -> loser. An edge
/// A -> C is dropped when A beats some B ranked strictly between A and C
/// which also beats C. Redundancy is always checked against the full edge
/// set, not the partially reduced one.
///
/// @param results Ranking results (any order).
/// @return Nodes and reduced edges.
VictoryGraph buildVictoryGraph(const std::vector<SkaterResult>& results);

/// @brief Serialize a victory graph as {"nodes":[...],"edges":[...]}.
std::string victoryGraphToJson(const VictoryGraph& graph, bool pretty = false);

}  // namespace majority

#endif  // MAJORITY_REPORT_VICTORY_GRAPH_H
