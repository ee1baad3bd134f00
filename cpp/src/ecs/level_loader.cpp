#include "level_loader.h"
#include <algorithm>
#include <cctype>
#include <flecs.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace wisp {

bool parse_color(const std::string &name, EnemyColor &out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  for (uint8_t i = 0; i < (uint8_t)EnemyColor::COUNT; i++) {
    if (lower == color_name((EnemyColor)i)) {
      out = (EnemyColor)i;
      return true;
    }
  }
  return false;
}

static GridPos read_pos(const json &j) {
  if (!j.is_array() || j.size() != 2)
    throw std::invalid_argument("position must be [x, y]");
  return {j.at(0).get<int>(), j.at(1).get<int>()};
}

static std::vector<GridPos> read_pos_list(const json &j, const char *key) {
  std::vector<GridPos> out;
  if (!j.contains(key))
    return out;
  for (auto &p : j[key])
    out.push_back(read_pos(p));
  return out;
}

// Throws on shape errors; the public entry points translate.
static bool read_level(const json &j, LevelConfig &out, ConfigError &err_out) {
  if (!j.is_object())
    throw std::invalid_argument("level must be an object");

  LevelConfig cfg;
  cfg.name = j.value("name", cfg.name);
  cfg.number = j.value("number", cfg.number);
  cfg.min_moves = j.value("min_moves", cfg.min_moves);
  cfg.width = j.value("width", cfg.width);
  cfg.height = j.value("height", cfg.height);
  if (j.contains("player_start"))
    cfg.player_start = read_pos(j["player_start"]);
  if (j.contains("goal"))
    cfg.goal = read_pos(j["goal"]);
  cfg.obstacles = read_pos_list(j, "obstacles");
  cfg.mud = read_pos_list(j, "mud");

  if (j.contains("enemies")) {
    for (auto &e : j["enemies"]) {
      EnemySpawn spawn;
      spawn.position = read_pos(e.at("position"));
      std::string color = e.value("color", std::string("red"));
      if (!parse_color(color, spawn.color)) {
        err_out.code = ConfigErrorCode::UnknownColor;
        err_out.message = "unknown enemy color '" + color + "'";
        return false;
      }
      spawn.dormant = e.value("dormant", false);
      cfg.enemies.push_back(spawn);
    }
  }

  out = std::move(cfg);
  return true;
}

static void malformed(ConfigError &err_out, const char *what) {
  err_out.code = ConfigErrorCode::Malformed;
  err_out.message = what;
  flecs::log::warn("malformed level data: %s", what);
}

bool parse_level_json(const std::string &text, LevelConfig &out,
                      ConfigError &err_out) {
  try {
    json j = json::parse(text);
    return read_level(j, out, err_out);
  } catch (json::exception &e) {
    malformed(err_out, e.what());
  } catch (std::invalid_argument &e) {
    malformed(err_out, e.what());
  }
  return false;
}

bool parse_rules_json(const std::string &text, EngineConfig &out,
                      ConfigError &err_out) {
  try {
    json j = json::parse(text);
    if (!j.is_object())
      throw std::invalid_argument("rules must be an object");

    EngineConfig rules;
    rules.mud_trap_turns = j.value("mud_trap_turns", rules.mud_trap_turns);
    rules.log_level = j.value("log_level", rules.log_level);
    std::string wake = j.value("wake_rule", std::string("adjacent"));
    if (wake == "adjacent") {
      rules.wake_rule = WakeRule::Adjacent;
    } else if (wake == "legacy") {
      rules.wake_rule = WakeRule::LegacyNeverWakes;
    } else {
      err_out.code = ConfigErrorCode::BadRule;
      err_out.message = "unknown wake_rule '" + wake + "'";
      return false;
    }
    if (!validate_rules(rules, err_out))
      return false;
    out = rules;
    return true;
  } catch (json::exception &e) {
    malformed(err_out, e.what());
  } catch (std::invalid_argument &e) {
    malformed(err_out, e.what());
  }
  return false;
}

bool parse_level_pack_json(const std::string &text,
                           std::vector<LevelConfig> &out,
                           ConfigError &err_out) {
  try {
    json j = json::parse(text);
    if (!j.contains("levels") || !j["levels"].is_array())
      throw std::invalid_argument("pack needs a \"levels\" array");

    std::vector<LevelConfig> levels;
    for (auto &lvl : j["levels"]) {
      LevelConfig cfg;
      if (!read_level(lvl, cfg, err_out))
        return false;
      if (!validate_level(cfg, err_out)) {
        err_out.message = "'" + cfg.name + "': " + err_out.message;
        return false;
      }
      levels.push_back(std::move(cfg));
    }
    if (levels.empty()) {
      err_out.code = ConfigErrorCode::NoLevel;
      err_out.message = "pack contains no levels";
      return false;
    }
    out = std::move(levels);
    return true;
  } catch (json::exception &e) {
    malformed(err_out, e.what());
  } catch (std::invalid_argument &e) {
    malformed(err_out, e.what());
  }
  return false;
}

} // namespace wisp
