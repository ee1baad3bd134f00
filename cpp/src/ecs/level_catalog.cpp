#include "level_catalog.h"
#include "level_loader.h"
#include <flecs.h>

namespace wisp {

bool LevelCatalog::load_pack_json(const std::string &text,
                                  ConfigError &err_out) {
  std::vector<LevelConfig> levels;
  if (!parse_level_pack_json(text, levels, err_out))
    return false;
  set_levels(std::move(levels));
  flecs::log::trace("level pack loaded: %d levels", (int)levels_.size());
  return true;
}

void LevelCatalog::set_levels(std::vector<LevelConfig> levels) {
  levels_ = std::move(levels);
  index_ = 0;
  attached_ = true;
}

bool LevelCatalog::select(size_t index) {
  if (index >= levels_.size()) {
    flecs::log::warn("level index %d out of range (%d levels)", (int)index,
                     (int)levels_.size());
    return false;
  }
  index_ = index;
  attached_ = true;
  return true;
}

bool LevelCatalog::next() {
  if (index_ + 1 >= levels_.size())
    return false;
  index_++;
  attached_ = true;
  return true;
}

bool LevelCatalog::previous() {
  if (index_ == 0 || levels_.empty())
    return false;
  index_--;
  attached_ = true;
  return true;
}

} // namespace wisp
