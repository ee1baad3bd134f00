#include "turn_phases.h"
#include "collision_resolver.h"
#include "pathfinding.h"
#include <algorithm>

namespace wisp {

void register_components(flecs::world &ecs) {
  ecs.component<GridPos>("GridPos");
  ecs.component<EnemyKind>("EnemyKind");
  ecs.component<Lifecycle>("Lifecycle");
  ecs.component<SpawnOrder>("SpawnOrder");
  ecs.component<Enemy>("Enemy");
  ecs.component<IsAlive>("IsAlive");
  ecs.component<JustAwakened>("JustAwakened");
  ecs.component<PlayerState>("PlayerState");
}

void spawn_enemies(flecs::world &ecs, const std::vector<EnemySpawn> &spawns) {
  uint32_t next_id = 0;
  for (const EnemySpawn &s : spawns) {
    EnemyState initial = s.dormant ? EnemyState::Dormant : EnemyState::Active;
    ecs.entity()
        .set<GridPos>(s.position)
        .set<EnemyKind>({s.color})
        .set<Lifecycle>({initial, 0})
        .set<SpawnOrder>({next_id})
        .add<Enemy>()
        .add<IsAlive>();
    flecs::log::dbg("spawn enemy #%u %s at (%d,%d) %s", next_id,
                    color_name(s.color), s.position.x, s.position.y,
                    state_name(initial));
    next_id++;
  }
}

static int compare_spawn_order(flecs::entity_t, const SpawnOrder *a,
                               flecs::entity_t, const SpawnOrder *b) {
  return (a->id > b->id) - (a->id < b->id);
}

flecs::query<const SpawnOrder> build_live_query(flecs::world &ecs) {
  return ecs.query_builder<const SpawnOrder>()
      .with<Enemy>()
      .with<IsAlive>()
      .order_by<SpawnOrder>(compare_spawn_order)
      .cached()
      .build();
}

std::vector<flecs::entity>
live_in_order(const flecs::query<const SpawnOrder> &live_q) {
  std::vector<flecs::entity> out;
  live_q.each([&](flecs::entity e, const SpawnOrder &) { out.push_back(e); });
  return out;
}

std::vector<EnemyRecord> to_records(const std::vector<flecs::entity> &enemies) {
  std::vector<EnemyRecord> out;
  out.reserve(enemies.size());
  for (flecs::entity e : enemies) {
    if (!e.has<IsAlive>())
      continue;
    const Lifecycle &lc = e.get<Lifecycle>();
    out.push_back({e.get<SpawnOrder>().id, e.get<GridPos>(),
                   e.get<EnemyKind>().color, lc.state, lc.trapped_turns});
  }
  return out;
}

void purify(flecs::entity e, const char *cause) {
  if (!e.has<IsAlive>())
    return;
  const GridPos &p = e.get<GridPos>();
  flecs::log::trace("enemy #%u purified at (%d,%d): %s",
                    e.get<SpawnOrder>().id, p.x, p.y, cause);
  e.set<Lifecycle>({EnemyState::Purified, 0});
  e.remove<IsAlive>();
}

// ═════════════════════════════════════════════════════════════
// PHASE A: Mud countdown
// ═════════════════════════════════════════════════════════════
void phase_trap_countdown(const std::vector<flecs::entity> &live) {
  for (flecs::entity e : live) {
    Lifecycle lc = e.get<Lifecycle>();
    if (lc.state != EnemyState::Trapped)
      continue;
    if (lc.trapped_turns > 0) {
      lc.trapped_turns--;
    } else {
      lc.state = EnemyState::Active;
      flecs::log::dbg("enemy #%u leaves the mud", e.get<SpawnOrder>().id);
    }
    e.set<Lifecycle>(lc);
  }
}

// ═════════════════════════════════════════════════════════════
// PHASE B: Dormant wake-up
//
// A woken enemy is Active immediately (it blocks and captures) but
// first moves on the next accepted turn.
//
// LegacyNeverWakes keeps the shipped "!active && !alive" scan:
// no live enemy can satisfy it, so dormant enemies sleep forever.
// ═════════════════════════════════════════════════════════════
int phase_dormant_wake(const std::vector<flecs::entity> &live,
                       const GridPos &player, WakeRule rule) {
  int woken = 0;
  for (flecs::entity e : live) {
    Lifecycle lc = e.get<Lifecycle>();
    bool dormant = lc.state == EnemyState::Dormant;
    bool alive = e.has<IsAlive>();
    bool candidate =
        rule == WakeRule::Adjacent ? (dormant && alive) : (dormant && !alive);
    if (!candidate)
      continue;
    if (!chebyshev_adjacent(player, e.get<GridPos>()))
      continue;

    lc.state = EnemyState::Active;
    e.set<Lifecycle>(lc);
    e.add<JustAwakened>();
    woken++;
    flecs::log::trace("enemy #%u awakened", e.get<SpawnOrder>().id);
  }
  return woken;
}

// ═════════════════════════════════════════════════════════════
// PHASE C: Pursuit
//
// A cell holding any other live enemy is closed to the mover,
// whatever its state or color. Positions are read live, so earlier
// movers this turn already occupy their new cells.
// ═════════════════════════════════════════════════════════════
int phase_enemy_movement(const std::vector<flecs::entity> &live,
                         const GridPos &player, const GridModel &grid,
                         const EngineConfig &rules) {
  int moved = 0;
  for (flecs::entity mover : live) {
    if (!mover.has<IsAlive>())
      continue;
    if (mover.has<JustAwakened>()) {
      mover.remove<JustAwakened>();
      continue;
    }
    Lifecycle lc = mover.get<Lifecycle>();
    if (lc.state != EnemyState::Active)
      continue;

    const GridPos from = mover.get<GridPos>();

    auto occupied = [&](const GridPos &cell) {
      for (flecs::entity other : live) {
        if (other.id() == mover.id() || !other.has<IsAlive>())
          continue;
        if (other.get<GridPos>() == cell)
          return true;
      }
      return false;
    };

    GridPos to = choose_next_cell(from, player, grid, occupied);
    if (to == from)
      continue;

    mover.set<GridPos>(to);
    moved++;

    if (grid.is_mud(to)) {
      lc.state = EnemyState::Trapped;
      lc.trapped_turns = rules.mud_trap_turns;
      mover.set<Lifecycle>(lc);
      flecs::log::trace("enemy #%u stuck in mud at (%d,%d) for %d turn(s)",
                        mover.get<SpawnOrder>().id, to.x, to.y,
                        rules.mud_trap_turns);
    }
  }
  return moved;
}

// ═════════════════════════════════════════════════════════════
// PHASE D: Merge same-color piles
// ═════════════════════════════════════════════════════════════
int phase_collisions(const std::vector<flecs::entity> &live) {
  std::vector<uint32_t> losers = resolve_collisions(to_records(live));
  for (uint32_t id : losers) {
    auto it = std::find_if(live.begin(), live.end(), [&](flecs::entity e) {
      return e.get<SpawnOrder>().id == id;
    });
    if (it != live.end())
      purify(*it, "merged");
  }
  return static_cast<int>(losers.size());
}

// ═════════════════════════════════════════════════════════════
// PHASE E: Goal purification
// ═════════════════════════════════════════════════════════════
int phase_goal_purification(const std::vector<flecs::entity> &live,
                            const GridPos &goal) {
  int count = 0;
  for (flecs::entity e : live) {
    if (!e.has<IsAlive>())
      continue;
    if (e.get<GridPos>() != goal)
      continue;
    purify(e, "reached goal");
    count++;
  }
  return count;
}

} // namespace wisp
