#ifndef WISP_LEVEL_CONFIG_H
#define WISP_LEVEL_CONFIG_H

#include "wisp_components.h"
#include <cstdint>
#include <string>
#include <vector>

namespace wisp {

// ═══════════════════════════════════════════════════════════════
// LEVEL BLUEPRINT
//
// Everything the engine needs to seed a level. Supplied by the
// level-data collaborator (JSON loader, Godot binding, tests).
// Spawn-list order becomes enemy creation order.
// ═══════════════════════════════════════════════════════════════
struct EnemySpawn {
  GridPos position;
  EnemyColor color = EnemyColor::Red;
  bool dormant = false;
};

// Upper bound on width * height accepted by validate_level().
constexpr int64_t MAX_GRID_CELLS = int64_t(1) << 20;

struct LevelConfig {
  std::string name = "Level 1";
  int number = 1;
  int min_moves = 0; // Par for star rating, 0 = unknown

  int width = 5;
  int height = 5;
  GridPos player_start{0, 0};
  GridPos goal{4, 4};
  std::vector<GridPos> obstacles;
  std::vector<GridPos> mud;
  std::vector<EnemySpawn> enemies;
};

// ─── Rules ────────────────────────────────────────────────
enum class WakeRule : uint8_t {
  Adjacent = 0,        // Dormant + live enemies wake next to the player
  LegacyNeverWakes = 1 // Legacy "!active && !alive" scan: matches nothing
};

struct EngineConfig {
  int mud_trap_turns = 1;
  WakeRule wake_rule = WakeRule::Adjacent;
  int log_level = -1; // flecs::log level: -1 warn+err, 0 trace, 1 debug
};

// ─── Errors ───────────────────────────────────────────────
enum class ConfigErrorCode : uint8_t {
  None = 0,
  Malformed,
  BadDimensions,
  OutOfBounds,
  SpawnOnObstacle,
  MixedColorSpawn,
  UnknownColor,
  BadRule,
  NoLevel
};

struct ConfigError {
  ConfigErrorCode code = ConfigErrorCode::None;
  std::string message;
};

const char *error_code_name(ConfigErrorCode code);
const char *color_name(EnemyColor color);
const char *state_name(EnemyState state);

// Whole-config check. Never touches engine state.
bool validate_level(const LevelConfig &cfg, ConfigError &err_out);
bool validate_rules(const EngineConfig &rules, ConfigError &err_out);

} // namespace wisp

#endif // WISP_LEVEL_CONFIG_H
