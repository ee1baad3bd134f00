#ifndef WISP_PATHFINDING_H
#define WISP_PATHFINDING_H

#include "grid_model.h"
#include "wisp_components.h"
#include <functional>

namespace wisp {

// Same-turn occupancy: true if another live enemy makes `cell` unenterable
// for the mover. Must reflect moves already applied this turn.
using OccupiedFn = std::function<bool(const GridPos &cell)>;

// Cardinal scan order. Significant: ties keep the first direction seen.
constexpr Direction PURSUIT_ORDER[4] = {Direction::Up, Direction::Down,
                                        Direction::Left, Direction::Right};

// Picks an enemy's next cell. Pure: reads only its arguments.
//
//   1. Any candidate strictly closer (Manhattan) to the player wins;
//      smallest distance first, first-seen on ties.
//   2. Otherwise a candidate at the same player distance is taken only if
//      it moves further from the goal than staying put; largest goal
//      distance wins, first-seen on ties.
//   3. Otherwise the enemy stays.
//
// Returns `from` or one cardinal neighbour of it.
GridPos choose_next_cell(const GridPos &from, const GridPos &player,
                         const GridModel &grid, const OccupiedFn &occupied);

} // namespace wisp

#endif // WISP_PATHFINDING_H
