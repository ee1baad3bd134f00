#include "grid_model.h"

namespace wisp {

GridModel::GridModel(const LevelConfig &cfg)
    : width_(cfg.width), height_(cfg.height), goal_(cfg.goal),
      cells_(static_cast<size_t>(cfg.width) * static_cast<size_t>(cfg.height),
             0) {
  for (const auto &o : cfg.obstacles) {
    if (in_bounds(o))
      cells_[idx(o)] |= CELL_OBSTACLE;
  }
  for (const auto &m : cfg.mud) {
    if (in_bounds(m))
      cells_[idx(m)] |= CELL_MUD;
  }
}

} // namespace wisp
