#ifndef WISP_LEVEL_CATALOG_H
#define WISP_LEVEL_CATALOG_H

#include "level_config.h"
#include <string>
#include <vector>

namespace wisp {

// Ordered level list plus a cursor. Selection only moves the cursor;
// the host re-seeds the engine with current() afterwards.
class LevelCatalog {
public:
  // Replaces the whole list and resets the cursor to 0. Leaves the
  // catalog unchanged on failure.
  bool load_pack_json(const std::string &text, ConfigError &err_out);
  void set_levels(std::vector<LevelConfig> levels);

  size_t count() const { return levels_.size(); }
  bool empty() const { return levels_.empty(); }
  size_t current_index() const { return index_; }

  // Requires !empty().
  const LevelConfig &current() const { return levels_[index_]; }

  bool select(size_t index);
  bool next();
  bool previous();

  // True while the level in play is current(). Loading a pack or any
  // successful selection attaches; the host detaches when it seeds the
  // engine from elsewhere.
  bool attached() const { return attached_ && !levels_.empty(); }
  void detach() { attached_ = false; }

private:
  std::vector<LevelConfig> levels_;
  size_t index_ = 0;
  bool attached_ = false;
};

} // namespace wisp

#endif // WISP_LEVEL_CATALOG_H
