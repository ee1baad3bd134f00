#ifndef WISP_COMPONENTS_H
#define WISP_COMPONENTS_H

#include <cstdint>
#include <cstdlib>
#include <optional>

/**
 * Will-o'-the-Wisp: ECS Component Definitions
 *
 * POD structs attached to enemy entities. No pointers, no std::vector,
 * no virtual functions. Per-level terrain lives in GridModel (grid_model.h),
 * not in components.
 */

namespace wisp {

// ─── Spatial ───────────────────────────────────────────────
struct GridPos {
  int x, y;
}; // 8 bytes

inline bool operator==(const GridPos &a, const GridPos &b) {
  return a.x == b.x && a.y == b.y;
}
inline bool operator!=(const GridPos &a, const GridPos &b) { return !(a == b); }
// Row-major ordering, only used to key position groups.
inline bool operator<(const GridPos &a, const GridPos &b) {
  return a.y != b.y ? a.y < b.y : a.x < b.x;
}

inline int manhattan(const GridPos &a, const GridPos &b) {
  return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

// King-move neighbour. The cell itself is NOT adjacent.
inline bool chebyshev_adjacent(const GridPos &a, const GridPos &b) {
  int dx = std::abs(a.x - b.x);
  int dy = std::abs(a.y - b.y);
  return dx <= 1 && dy <= 1 && !(dx == 0 && dy == 0);
}

// ─── Player input ─────────────────────────────────────────
// Up is +y (level files use a y-up convention).
enum class Direction : uint8_t {
  Up = 0,
  Down,
  Left,
  Right,
  UpLeft,
  UpRight,
  DownLeft,
  DownRight
};

inline GridPos delta(Direction d) {
  switch (d) {
  case Direction::Up:
    return {0, 1};
  case Direction::Down:
    return {0, -1};
  case Direction::Left:
    return {-1, 0};
  case Direction::Right:
    return {1, 0};
  case Direction::UpLeft:
    return {-1, 1};
  case Direction::UpRight:
    return {1, 1};
  case Direction::DownLeft:
    return {-1, -1};
  case Direction::DownRight:
    return {1, -1};
  }
  return {0, 0};
}

// Inverse of delta(). Only the 8 unit steps map to a direction.
inline std::optional<Direction> direction_from_delta(int dx, int dy) {
  if (dx == 0 && dy == 1)
    return Direction::Up;
  if (dx == 0 && dy == -1)
    return Direction::Down;
  if (dx == -1 && dy == 0)
    return Direction::Left;
  if (dx == 1 && dy == 0)
    return Direction::Right;
  if (dx == -1 && dy == 1)
    return Direction::UpLeft;
  if (dx == 1 && dy == 1)
    return Direction::UpRight;
  if (dx == -1 && dy == -1)
    return Direction::DownLeft;
  if (dx == 1 && dy == -1)
    return Direction::DownRight;
  return std::nullopt;
}

// ─── Enemy identity ───────────────────────────────────────
// Extensible: append new colors before COUNT, never reorder.
enum class EnemyColor : uint8_t { Red = 0, Purple = 1, Green = 2, COUNT };

struct EnemyKind {
  EnemyColor color;
}; // 1 byte

enum class EnemyState : uint8_t {
  Dormant = 0, // Waits for the player to step next to it
  Active = 1,  // Chases every turn
  Trapped = 2, // Stuck in mud, skips movement
  Purified = 3 // Terminal: reached the goal or merged away
};

struct Lifecycle {
  EnemyState state;
  int32_t trapped_turns; // Turns left in mud; 0 = leaves mud next countdown
}; // 8 bytes

// Creation index from the spawn list. Doubles as the stable enemy id and as
// the iteration order of every per-turn pass.
struct SpawnOrder {
  uint32_t id;
}; // 4 bytes

struct Enemy {};   // Tag
struct IsAlive {}; // Tag: removed on purification, never re-added
struct JustAwakened {}; // Tag: woken this turn, sits out movement once

// ─── Singletons ───────────────────────────────────────────
struct PlayerState {
  GridPos pos;
}; // 8 bytes

} // namespace wisp

#endif // WISP_COMPONENTS_H
