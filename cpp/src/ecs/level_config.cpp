#include "level_config.h"
#include <map>

namespace wisp {

const char *error_code_name(ConfigErrorCode code) {
  switch (code) {
  case ConfigErrorCode::None:
    return "none";
  case ConfigErrorCode::Malformed:
    return "malformed";
  case ConfigErrorCode::BadDimensions:
    return "bad_dimensions";
  case ConfigErrorCode::OutOfBounds:
    return "out_of_bounds";
  case ConfigErrorCode::SpawnOnObstacle:
    return "spawn_on_obstacle";
  case ConfigErrorCode::MixedColorSpawn:
    return "mixed_color_spawn";
  case ConfigErrorCode::UnknownColor:
    return "unknown_color";
  case ConfigErrorCode::BadRule:
    return "bad_rule";
  case ConfigErrorCode::NoLevel:
    return "no_level";
  }
  return "unknown";
}

const char *color_name(EnemyColor color) {
  switch (color) {
  case EnemyColor::Red:
    return "red";
  case EnemyColor::Purple:
    return "purple";
  case EnemyColor::Green:
    return "green";
  default:
    return "unknown";
  }
}

const char *state_name(EnemyState state) {
  switch (state) {
  case EnemyState::Dormant:
    return "dormant";
  case EnemyState::Active:
    return "active";
  case EnemyState::Trapped:
    return "trapped";
  case EnemyState::Purified:
    return "purified";
  }
  return "unknown";
}

static std::string fmt_pos(const GridPos &p) {
  return "(" + std::to_string(p.x) + "," + std::to_string(p.y) + ")";
}

static bool fail(ConfigError &err_out, ConfigErrorCode code,
                 std::string message) {
  err_out.code = code;
  err_out.message = std::move(message);
  return false;
}

bool validate_level(const LevelConfig &cfg, ConfigError &err_out) {
  if (cfg.width < 1 || cfg.height < 1) {
    return fail(err_out, ConfigErrorCode::BadDimensions,
                "grid must be at least 1x1, got " + std::to_string(cfg.width) +
                    "x" + std::to_string(cfg.height));
  }
  const int64_t cells = int64_t(cfg.width) * int64_t(cfg.height);
  if (cells > MAX_GRID_CELLS) {
    return fail(err_out, ConfigErrorCode::BadDimensions,
                "grid " + std::to_string(cfg.width) + "x" +
                    std::to_string(cfg.height) + " exceeds " +
                    std::to_string(MAX_GRID_CELLS) + " cells");
  }

  auto in_bounds = [&](const GridPos &p) {
    return p.x >= 0 && p.x < cfg.width && p.y >= 0 && p.y < cfg.height;
  };

  if (!in_bounds(cfg.player_start))
    return fail(err_out, ConfigErrorCode::OutOfBounds,
                "player start " + fmt_pos(cfg.player_start) +
                    " is out of bounds");
  if (!in_bounds(cfg.goal))
    return fail(err_out, ConfigErrorCode::OutOfBounds,
                "goal " + fmt_pos(cfg.goal) + " is out of bounds");
  for (const auto &o : cfg.obstacles) {
    if (!in_bounds(o))
      return fail(err_out, ConfigErrorCode::OutOfBounds,
                  "obstacle " + fmt_pos(o) + " is out of bounds");
  }
  for (const auto &m : cfg.mud) {
    if (!in_bounds(m))
      return fail(err_out, ConfigErrorCode::OutOfBounds,
                  "mud patch " + fmt_pos(m) + " is out of bounds");
  }

  // Cell -> first color seen, to catch mixed piles at spawn time
  std::map<GridPos, EnemyColor> spawn_colors;
  for (size_t i = 0; i < cfg.enemies.size(); ++i) {
    const EnemySpawn &s = cfg.enemies[i];
    if (!in_bounds(s.position))
      return fail(err_out, ConfigErrorCode::OutOfBounds,
                  "enemy #" + std::to_string(i) + " at " +
                      fmt_pos(s.position) + " is out of bounds");
    if (s.color >= EnemyColor::COUNT)
      return fail(err_out, ConfigErrorCode::UnknownColor,
                  "enemy #" + std::to_string(i) + " has an unknown color");
    for (const auto &o : cfg.obstacles) {
      if (o == s.position)
        return fail(err_out, ConfigErrorCode::SpawnOnObstacle,
                    "enemy #" + std::to_string(i) + " spawns on obstacle " +
                        fmt_pos(o));
    }
    auto it = spawn_colors.find(s.position);
    if (it == spawn_colors.end()) {
      spawn_colors.emplace(s.position, s.color);
    } else if (it->second != s.color) {
      return fail(err_out, ConfigErrorCode::MixedColorSpawn,
                  "enemies of different colors share spawn cell " +
                      fmt_pos(s.position));
    }
  }

  err_out = ConfigError{};
  return true;
}

bool validate_rules(const EngineConfig &rules, ConfigError &err_out) {
  if (rules.mud_trap_turns < 0)
    return fail(err_out, ConfigErrorCode::BadRule,
                "mud_trap_turns must be >= 0, got " +
                    std::to_string(rules.mud_trap_turns));
  if (rules.wake_rule != WakeRule::Adjacent &&
      rules.wake_rule != WakeRule::LegacyNeverWakes)
    return fail(err_out, ConfigErrorCode::BadRule, "unknown wake rule");

  err_out = ConfigError{};
  return true;
}

} // namespace wisp
