/// @file
/// @brief Rank assignment: majority victories first, tie-break cascade per tied group.

#include "scoring/rank_assigner.h"

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <utility>

#include "scoring/head_to_head.h"
#include "scoring/pair_score_matrix.h"
#include "scoring/score_normalizer.h"
#include "scoring/tie_break.h"

namespace majority {

std::vector<SkaterResult> calculateRankings(const std::vector<SkaterInput>& skaters) {
  std::vector<SkaterResult> ranked;
  if (skaters.empty()) return ranked;

  const size_t count = skaters.size();

  std::vector<NormalizedSkater> normalized;
  normalized.reserve(count);
  for (const auto& skater : skaters) {
    normalized.push_back(normalizeSkater(skater));
  }

  const PairScoreMatrix matrix(normalized);
  const std::vector<double> victories = matrix.majorityVictories();

  std::vector<SkaterResult> results(count);
  for (SkaterIndex idx = 0; idx < count; ++idx) {
    results[idx].input = skaters[idx];
    results[idx].input_index = idx;
    results[idx].total_score = normalized[idx].total_score;
    results[idx].majority_victories = victories[idx];
    results[idx].head_to_head = buildHeadToHead(skaters, normalized, idx);
  }

  std::vector<SkaterIndex> order(count);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](SkaterIndex lhs, SkaterIndex rhs) {
    return victories[lhs] > victories[rhs];
  });

  int current_rank = 1;
  size_t run_start = 0;
  while (run_start < count) {
    size_t run_end = run_start + 1;
    while (run_end < count && victories[order[run_end]] == victories[order[run_start]]) {
      ++run_end;
    }

    std::vector<SkaterIndex> group(order.begin() + static_cast<std::ptrdiff_t>(run_start),
                                   order.begin() + static_cast<std::ptrdiff_t>(run_end));

    if (group.size() == 1) {
      results[group[0]].rank = current_rank;
    } else {
      const RefinementResult refined = breakTie(group, normalized, matrix);
      for (size_t pos = 0; pos < refined.order.size(); ++pos) {
        const size_t member = refined.order[pos];
        SkaterResult& result = results[group[member]];
        result.rank = current_rank + static_cast<int>(pos);
        result.tie_break = refined.summaries[member];
        result.tie_break_info = refined.trails[member];
        order[run_start + pos] = group[member];
      }
    }

    current_rank += static_cast<int>(group.size());
    run_start = run_end;
  }

  ranked.reserve(count);
  for (SkaterIndex idx : order) {
    ranked.push_back(std::move(results[idx]));
  }
  return ranked;
}

}  // namespace majority
