#ifndef WISP_TURN_PHASES_H
#define WISP_TURN_PHASES_H

#include "grid_model.h"
#include "level_config.h"
#include "snapshot.h"
#include "wisp_components.h"
#include <flecs.h>
#include <vector>

namespace wisp {

// Component registration for a fresh world.
void register_components(flecs::world &ecs);

// Creates one enemy entity per spawn, in spawn-list order.
void spawn_enemies(flecs::world &ecs, const std::vector<EnemySpawn> &spawns);

// Live enemies, sorted by SpawnOrder (cached, order_by).
flecs::query<const SpawnOrder> build_live_query(flecs::world &ecs);

// Snapshot of the query into a plain vector so phases can mutate
// components (and remove IsAlive) without iterating a live table.
std::vector<flecs::entity>
live_in_order(const flecs::query<const SpawnOrder> &live_q);

// Skips entities that lost IsAlive since the vector was taken.
std::vector<EnemyRecord> to_records(const std::vector<flecs::entity> &enemies);

// Terminal transition. Idempotent.
void purify(flecs::entity e, const char *cause);

// ─── Turn phases (run in this order by TurnEngine) ─────────
// a. Trapped + counter 0 -> Active; Trapped + counter > 0 -> counter - 1.
void phase_trap_countdown(const std::vector<flecs::entity> &live);

// b. Woken enemies are tagged JustAwakened. Returns the number woken.
int phase_dormant_wake(const std::vector<flecs::entity> &live,
                       const GridPos &player, WakeRule rule);

// c. Sequential, creation order. Later movers see earlier moves.
// Consumes JustAwakened: those enemies stay put this turn.
// Returns the number of enemies that changed cell.
int phase_enemy_movement(const std::vector<flecs::entity> &live,
                         const GridPos &player, const GridModel &grid,
                         const EngineConfig &rules);

// d. Returns the number of enemies merged away.
int phase_collisions(const std::vector<flecs::entity> &live);

// e. Returns the number of enemies purified on the goal.
int phase_goal_purification(const std::vector<flecs::entity> &live,
                            const GridPos &goal);

} // namespace wisp

#endif // WISP_TURN_PHASES_H
