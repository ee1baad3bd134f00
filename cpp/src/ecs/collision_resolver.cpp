#include "collision_resolver.h"
#include <algorithm>
#include <map>

namespace wisp {

std::vector<uint32_t> resolve_collisions(const std::vector<EnemyRecord> &live) {
  // Cell -> indices into `live`. Insertion keeps creation order per cell.
  std::map<GridPos, std::vector<size_t>> groups;
  for (size_t i = 0; i < live.size(); ++i)
    groups[live[i].pos].push_back(i);

  std::vector<uint32_t> merged_away;
  for (const auto &kv : groups) {
    const std::vector<size_t> &members = kv.second;
    if (members.size() < 2)
      continue;

    EnemyColor color = live[members[0]].color;
    bool same_color =
        std::all_of(members.begin(), members.end(),
                    [&](size_t i) { return live[i].color == color; });
    if (!same_color)
      continue;

    for (size_t k = 1; k < members.size(); ++k)
      merged_away.push_back(live[members[k]].id);
  }

  std::sort(merged_away.begin(), merged_away.end());
  return merged_away;
}

} // namespace wisp
