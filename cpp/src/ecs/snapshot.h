#ifndef WISP_SNAPSHOT_H
#define WISP_SNAPSHOT_H

#include "wisp_components.h"
#include <cstdint>
#include <vector>

namespace wisp {

// Closed set. Only TurnEngine moves a match between these.
enum class MatchStatus : uint8_t { Playing = 0, Won = 1, Lost = 2 };

// Flattened view of one live enemy, in creation order.
struct EnemyRecord {
  uint32_t id;
  GridPos pos;
  EnemyColor color;
  EnemyState state;
  int32_t trapped_turns;
};

inline bool operator==(const EnemyRecord &a, const EnemyRecord &b) {
  return a.id == b.id && a.pos == b.pos && a.color == b.color &&
         a.state == b.state && a.trapped_turns == b.trapped_turns;
}
inline bool operator!=(const EnemyRecord &a, const EnemyRecord &b) {
  return !(a == b);
}

// Immutable end-of-turn state handed to the host after every call.
struct Snapshot {
  GridPos player{0, 0};
  std::vector<EnemyRecord> enemies;
  MatchStatus status = MatchStatus::Playing;
  uint32_t turn = 0;     // Accepted moves since setup/reset
  uint32_t purified = 0; // Enemies removed since setup/reset
};

inline bool operator==(const Snapshot &a, const Snapshot &b) {
  return a.player == b.player && a.enemies == b.enemies &&
         a.status == b.status && a.turn == b.turn && a.purified == b.purified;
}
inline bool operator!=(const Snapshot &a, const Snapshot &b) {
  return !(a == b);
}

// ─── Move results ─────────────────────────────────────────
enum class MoveResult : uint8_t {
  Accepted = 0,
  Rejected = 1,  // Normal outcome, state unchanged
  NotPlaying = 2 // Caller error: no level, or match already over
};

enum class RejectReason : uint8_t {
  None = 0,
  OutOfBounds,
  BlockedByEnemy,
  NoLevel,
  MatchOver
};

struct MoveOutcome {
  MoveResult result = MoveResult::Rejected;
  RejectReason reason = RejectReason::None;
  Snapshot snapshot;

  bool accepted() const { return result == MoveResult::Accepted; }
};

} // namespace wisp

#endif // WISP_SNAPSHOT_H
