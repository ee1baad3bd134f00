#ifndef WISP_LEVEL_LOADER_H
#define WISP_LEVEL_LOADER_H

#include "level_config.h"
#include <string>
#include <vector>

namespace wisp {

// JSON text -> config. Shape errors (bad JSON, wrong types, unknown
// color names) are reported here; game-rule checks are left to
// validate_level / TurnEngine::setup_level.
bool parse_level_json(const std::string &text, LevelConfig &out,
                      ConfigError &err_out);

bool parse_rules_json(const std::string &text, EngineConfig &out,
                      ConfigError &err_out);

// {"levels": [...]}. All-or-nothing: out is untouched on failure.
bool parse_level_pack_json(const std::string &text,
                           std::vector<LevelConfig> &out,
                           ConfigError &err_out);

bool parse_color(const std::string &name, EnemyColor &out);

} // namespace wisp

#endif // WISP_LEVEL_LOADER_H
