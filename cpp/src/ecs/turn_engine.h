#ifndef WISP_TURN_ENGINE_H
#define WISP_TURN_ENGINE_H

#include "grid_model.h"
#include "level_config.h"
#include "snapshot.h"
#include "wisp_components.h"
#include <flecs.h>
#include <memory>
#include <vector>

namespace wisp {

// ═══════════════════════════════════════════════════════════════
// TURN ENGINE
//
// Sole entry point of the simulation. Owns one flecs world per
// loaded level plus the static GridModel. Constructed by the host
// and passed around by reference; there is no global instance.
//
// Not thread-safe. Every call runs to completion before returning,
// so the host only has to serialize calls (turn lock).
// ═══════════════════════════════════════════════════════════════
class TurnEngine {
public:
  explicit TurnEngine(const EngineConfig &rules = EngineConfig{});
  ~TurnEngine();

  TurnEngine(const TurnEngine &) = delete;
  TurnEngine &operator=(const TurnEngine &) = delete;

  // Validates the whole config first. On failure the previous level (if
  // any) is left untouched and err_out describes the problem.
  bool setup_level(const LevelConfig &cfg, ConfigError &err_out);

  // One player step followed by the full enemy turn.
  MoveOutcome attempt_move(Direction dir);

  // Re-applies the last successfully loaded level.
  Snapshot reset();

  Snapshot snapshot() const;

  bool has_level() const { return has_level_; }
  MatchStatus status() const { return status_; }
  const GridModel &grid() const { return grid_; }
  const LevelConfig &level() const { return level_; }
  const EngineConfig &rules() const { return rules_; }

private:
  void seed_world(const LevelConfig &cfg);
  void run_enemy_turn(const GridPos &player);
  std::vector<EnemyRecord> live_records() const;

  EngineConfig rules_;

  // Declared before live_q_: the query must be released first.
  std::unique_ptr<flecs::world> ecs_;
  flecs::query<const SpawnOrder> live_q_;

  GridModel grid_;
  LevelConfig level_;
  bool has_level_ = false;

  MatchStatus status_ = MatchStatus::Playing;
  uint32_t turn_ = 0;
  uint32_t purified_ = 0;
};

// Fresh engine, setup, then every move in order. Element 0 is the
// post-setup snapshot; element i is the state after move i. Empty if the
// level or rules fail validation.
std::vector<Snapshot> replay(const LevelConfig &cfg, const EngineConfig &rules,
                             const std::vector<Direction> &moves,
                             ConfigError &err_out);

} // namespace wisp

#endif // WISP_TURN_ENGINE_H
