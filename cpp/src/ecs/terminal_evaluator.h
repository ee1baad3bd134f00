#ifndef WISP_TERMINAL_EVALUATOR_H
#define WISP_TERMINAL_EVALUATOR_H

#include "snapshot.h"
#include <vector>

namespace wisp {

// Any Active enemy standing on the player. Dormant/Trapped never capture.
bool is_captured(const GridPos &player, const std::vector<EnemyRecord> &live);

// No live enemies left.
bool is_victory(const std::vector<EnemyRecord> &live);

// Star rating against the level par. 0 unless the match was won.
int rate_solution(MatchStatus status, uint32_t moves, int min_moves);

} // namespace wisp

#endif // WISP_TERMINAL_EVALUATOR_H
