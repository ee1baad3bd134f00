#ifndef WISP_GRID_MODEL_H
#define WISP_GRID_MODEL_H

#include "level_config.h"
#include "wisp_components.h"
#include <cstdint>
#include <vector>

namespace wisp {

// ═══════════════════════════════════════════════════════════════
// STATIC TERRAIN
//
// Flat row-major cell flags, built once per level and never
// mutated. Same layout idea as the old CA grids: one byte per
// cell, index = y * width + x.
// ═══════════════════════════════════════════════════════════════
class GridModel {
public:
  static constexpr uint8_t CELL_OBSTACLE = 0x01;
  static constexpr uint8_t CELL_MUD = 0x02;

  GridModel() = default;
  // Expects a config that already passed validate_level().
  explicit GridModel(const LevelConfig &cfg);

  int width() const { return width_; }
  int height() const { return height_; }

  bool in_bounds(const GridPos &p) const {
    return p.x >= 0 && p.x < width_ && p.y >= 0 && p.y < height_;
  }
  bool is_obstacle(const GridPos &p) const {
    return in_bounds(p) && (cells_[idx(p)] & CELL_OBSTACLE) != 0;
  }
  bool is_mud(const GridPos &p) const {
    return in_bounds(p) && (cells_[idx(p)] & CELL_MUD) != 0;
  }
  const GridPos &goal() const { return goal_; }

private:
  int idx(const GridPos &p) const { return p.y * width_ + p.x; }

  int width_ = 0;
  int height_ = 0;
  GridPos goal_{0, 0};
  std::vector<uint8_t> cells_;
};

} // namespace wisp

#endif // WISP_GRID_MODEL_H
