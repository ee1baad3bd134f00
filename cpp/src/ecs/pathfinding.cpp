#include "pathfinding.h"

namespace wisp {

GridPos choose_next_cell(const GridPos &from, const GridPos &player,
                         const GridModel &grid, const OccupiedFn &occupied) {
  const GridPos &goal = grid.goal();
  const int d0 = manhattan(from, player);
  const int g0 = manhattan(from, goal);

  bool have_closer = false;
  GridPos closer = from;
  int closer_dist = d0;

  bool have_avoid = false;
  GridPos avoid = from;
  int avoid_goal_dist = g0;

  for (Direction dir : PURSUIT_ORDER) {
    GridPos step = delta(dir);
    GridPos c{from.x + step.x, from.y + step.y};

    if (!grid.in_bounds(c) || grid.is_obstacle(c))
      continue;
    if (occupied && occupied(c))
      continue;

    int d = manhattan(c, player);
    if (d < d0) {
      // Strict < keeps the first candidate on equal distance
      if (!have_closer || d < closer_dist) {
        have_closer = true;
        closer = c;
        closer_dist = d;
      }
    } else if (d == d0) {
      int g = manhattan(c, goal);
      if (g > avoid_goal_dist) {
        have_avoid = true;
        avoid = c;
        avoid_goal_dist = g;
      }
    }
  }

  if (have_closer)
    return closer;
  if (have_avoid)
    return avoid;
  return from;
}

} // namespace wisp
