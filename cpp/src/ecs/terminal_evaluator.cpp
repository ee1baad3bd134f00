#include "terminal_evaluator.h"
#include <algorithm>

namespace wisp {

bool is_captured(const GridPos &player, const std::vector<EnemyRecord> &live) {
  return std::any_of(live.begin(), live.end(), [&](const EnemyRecord &e) {
    return e.state == EnemyState::Active && e.pos == player;
  });
}

bool is_victory(const std::vector<EnemyRecord> &live) { return live.empty(); }

int rate_solution(MatchStatus status, uint32_t moves, int min_moves) {
  if (status != MatchStatus::Won)
    return 0;
  if (min_moves <= 0)
    return 1;
  uint32_t par = static_cast<uint32_t>(min_moves);
  if (moves <= par)
    return 3;
  if (moves <= par + 2)
    return 2;
  return 1;
}

} // namespace wisp
