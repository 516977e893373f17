// Head-to-head judge vote tallies.

#include "scoring/head_to_head.h"

#include "scoring/judge_comparator.h"

namespace majority {

HeadToHeadResult tallyHeadToHead(const NormalizedSkater& skater, const NormalizedSkater& opponent) {
  HeadToHeadResult result;
  const size_t num_judges = pairJudgeCount(skater, opponent);
  for (size_t judge = 0; judge < num_judges; ++judge) {
    const double outcome = compareAtJudge(skater, opponent, judge);
    if (outcome == kJudgeWin) {
      ++result.votes_for;
    } else if (outcome == kJudgeLoss) {
      ++result.votes_against;
    }
  }
  result.won = result.votes_for > result.votes_against;
  return result;
}

std::vector<HeadToHeadResult> buildHeadToHead(const std::vector<SkaterInput>& inputs,
                                              const std::vector<NormalizedSkater>& skaters,
                                              SkaterIndex self) {
  std::vector<HeadToHeadResult> results;
  if (skaters.size() > 1) results.reserve(skaters.size() - 1);

  for (SkaterIndex other = 0; other < skaters.size(); ++other) {
    if (other == self) continue;
    HeadToHeadResult entry = tallyHeadToHead(skaters[self], skaters[other]);
    entry.opponent_index = other;
    entry.opponent = inputs[other].name;
    results.push_back(entry);
  }
  return results;
}

}  // namespace majority
