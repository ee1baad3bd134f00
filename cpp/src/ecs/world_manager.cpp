#include "world_manager.h"
#include "level_loader.h"
#include "terminal_evaluator.h"
#include <godot_cpp/classes/engine.hpp>
#include <godot_cpp/classes/file_access.hpp>
#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/variant/utility_functions.hpp>

using namespace godot;

namespace {

// Holds the turn lock for one call, including any signal handlers it
// triggers.
struct TurnLockGuard {
  bool &flag;
  explicit TurnLockGuard(bool &f) : flag(f) { flag = true; }
  ~TurnLockGuard() { flag = false; }
};

std::string to_std(const String &s) { return std::string(s.utf8().get_data()); }

} // namespace

WispServer::WispServer() : engine(std::make_unique<wisp::TurnEngine>()) {}

WispServer::~WispServer() {}

void WispServer::_bind_methods() {
  // --- Level loading ---
  ClassDB::bind_method(D_METHOD("load_rules_file", "path"),
                       &WispServer::load_rules_file);
  ClassDB::bind_method(D_METHOD("load_level_json", "text"),
                       &WispServer::load_level_json);
  ClassDB::bind_method(D_METHOD("load_level_file", "path"),
                       &WispServer::load_level_file);
  ClassDB::bind_method(D_METHOD("load_pack_file", "path"),
                       &WispServer::load_pack_file);
  ClassDB::bind_method(D_METHOD("next_level"), &WispServer::next_level);
  ClassDB::bind_method(D_METHOD("previous_level"),
                       &WispServer::previous_level);
  ClassDB::bind_method(D_METHOD("reload_level"), &WispServer::reload_level);

  // --- Turn API ---
  ClassDB::bind_method(D_METHOD("attempt_move", "dx", "dy"),
                       &WispServer::attempt_move);
  ClassDB::bind_method(D_METHOD("reset_level"), &WispServer::reset_level);

  // --- State readback ---
  ClassDB::bind_method(D_METHOD("get_status"), &WispServer::get_status);
  ClassDB::bind_method(D_METHOD("get_turn"), &WispServer::get_turn);
  ClassDB::bind_method(D_METHOD("get_purified"), &WispServer::get_purified);
  ClassDB::bind_method(D_METHOD("get_player_position"),
                       &WispServer::get_player_position);
  ClassDB::bind_method(D_METHOD("get_enemy_buffer"),
                       &WispServer::get_enemy_buffer);
  ClassDB::bind_method(D_METHOD("get_level_name"),
                       &WispServer::get_level_name);
  ClassDB::bind_method(D_METHOD("get_level_index"),
                       &WispServer::get_level_index);
  ClassDB::bind_method(D_METHOD("get_level_count"),
                       &WispServer::get_level_count);
  ClassDB::bind_method(D_METHOD("get_stars"), &WispServer::get_stars);
  ClassDB::bind_method(D_METHOD("get_last_error"),
                       &WispServer::get_last_error);

  ADD_SIGNAL(MethodInfo("level_loaded",
                        PropertyInfo(Variant::STRING, "level_name")));
  ADD_SIGNAL(MethodInfo("turn_resolved", PropertyInfo(Variant::INT, "turn")));
  ADD_SIGNAL(
      MethodInfo("match_ended", PropertyInfo(Variant::INT, "status"),
                 PropertyInfo(Variant::INT, "stars")));
}

void WispServer::_ready() {
  if (Engine::get_singleton()->is_editor_hint()) {
    return;
  }
  UtilityFunctions::print("[Wisp] Turn engine ready.");
}

void WispServer::report(const char *what) {
  UtilityFunctions::printerr("[Wisp] ", what, ": ",
                             String(last_error.message.c_str()), " (",
                             wisp::error_code_name(last_error.code), ")");
}

bool WispServer::apply_level(const wisp::LevelConfig &cfg) {
  if (!engine->setup_level(cfg, last_error)) {
    report("Level rejected");
    return false;
  }
  last_error = wisp::ConfigError{};
  UtilityFunctions::print("[Wisp] Level ", cfg.number, " '",
                          String(cfg.name.c_str()), "' loaded (",
                          cfg.width, "x", cfg.height, ", ",
                          (int)cfg.enemies.size(), " enemies)");
  emit_signal("level_loaded", String(cfg.name.c_str()));
  return true;
}

bool WispServer::load_rules_file(const String &path) {
  if (turn_locked)
    return false;
  if (!FileAccess::file_exists(path)) {
    UtilityFunctions::printerr("[Wisp] Failed to find ", path);
    return false;
  }
  String content = FileAccess::get_file_as_string(path);
  wisp::EngineConfig rules;
  if (!wisp::parse_rules_json(to_std(content), rules, last_error)) {
    report("Bad rules file");
    return false;
  }

  TurnLockGuard lock(turn_locked);
  bool had_level = engine->has_level();
  wisp::LevelConfig level = engine->level();
  engine = std::make_unique<wisp::TurnEngine>(rules);
  flecs::log::set_level(engine->rules().log_level);
  UtilityFunctions::print("[Wisp] Rules loaded from ", path);
  return had_level ? apply_level(level) : true;
}

bool WispServer::load_level_json(const String &text) {
  if (turn_locked)
    return false;
  wisp::LevelConfig cfg;
  if (!wisp::parse_level_json(to_std(text), cfg, last_error)) {
    report("Bad level data");
    return false;
  }
  TurnLockGuard lock(turn_locked);
  if (!apply_level(cfg))
    return false;
  catalog.detach();
  return true;
}

bool WispServer::load_level_file(const String &path) {
  if (!FileAccess::file_exists(path)) {
    UtilityFunctions::printerr("[Wisp] Failed to find ", path);
    return false;
  }
  return load_level_json(FileAccess::get_file_as_string(path));
}

bool WispServer::load_pack_file(const String &path) {
  if (turn_locked)
    return false;
  if (!FileAccess::file_exists(path)) {
    UtilityFunctions::printerr("[Wisp] Failed to find ", path);
    return false;
  }
  String content = FileAccess::get_file_as_string(path);
  if (!catalog.load_pack_json(to_std(content), last_error)) {
    report("Bad level pack");
    return false;
  }
  UtilityFunctions::print("[Wisp] Level pack ", path, ": ",
                          (int)catalog.count(), " levels");
  TurnLockGuard lock(turn_locked);
  return apply_level(catalog.current());
}

bool WispServer::next_level() {
  if (turn_locked || !catalog.next())
    return false;
  TurnLockGuard lock(turn_locked);
  return apply_level(catalog.current());
}

bool WispServer::previous_level() {
  if (turn_locked || !catalog.previous())
    return false;
  TurnLockGuard lock(turn_locked);
  return apply_level(catalog.current());
}

bool WispServer::reload_level() {
  if (turn_locked)
    return false;
  TurnLockGuard lock(turn_locked);
  if (catalog.attached())
    return apply_level(catalog.current());
  if (engine->has_level())
    return apply_level(engine->level());
  last_error = {wisp::ConfigErrorCode::NoLevel, "no level to reload"};
  report("Reload failed");
  return false;
}

int WispServer::attempt_move(int dx, int dy) {
  if (turn_locked)
    return MOVE_LOCKED;
  std::optional<wisp::Direction> dir = wisp::direction_from_delta(dx, dy);
  if (!dir) {
    UtilityFunctions::printerr("[Wisp] Invalid move (", dx, ", ", dy, ")");
    return MOVE_BAD_INPUT;
  }

  TurnLockGuard lock(turn_locked);
  wisp::MoveOutcome out = engine->attempt_move(*dir);
  switch (out.result) {
  case wisp::MoveResult::Accepted:
    break;
  case wisp::MoveResult::Rejected:
    return MOVE_REJECTED;
  case wisp::MoveResult::NotPlaying:
    return MOVE_NOT_PLAYING;
  }

  emit_signal("turn_resolved", (int)out.snapshot.turn);
  if (out.snapshot.status != wisp::MatchStatus::Playing) {
    int stars = get_stars();
    UtilityFunctions::print(
        "[Wisp] Match over: ",
        out.snapshot.status == wisp::MatchStatus::Won ? "won" : "lost",
        " after ", (int)out.snapshot.turn, " moves");
    emit_signal("match_ended", (int)out.snapshot.status, stars);
  }
  return MOVE_ACCEPTED;
}

void WispServer::reset_level() {
  if (turn_locked)
    return;
  TurnLockGuard lock(turn_locked);
  engine->reset();
}

int WispServer::get_status() const { return (int)engine->status(); }

int WispServer::get_turn() const { return (int)engine->snapshot().turn; }

int WispServer::get_purified() const {
  return (int)engine->snapshot().purified;
}

Vector2i WispServer::get_player_position() const {
  wisp::GridPos p = engine->snapshot().player;
  return Vector2i(p.x, p.y);
}

// 5 ints per live enemy: id, x, y, color, state.
PackedInt32Array WispServer::get_enemy_buffer() const {
  wisp::Snapshot snap = engine->snapshot();
  PackedInt32Array buf;
  buf.resize((int64_t)snap.enemies.size() * 5);
  int64_t i = 0;
  for (const wisp::EnemyRecord &e : snap.enemies) {
    buf.set(i++, (int32_t)e.id);
    buf.set(i++, e.pos.x);
    buf.set(i++, e.pos.y);
    buf.set(i++, (int32_t)e.color);
    buf.set(i++, (int32_t)e.state);
  }
  return buf;
}

String WispServer::get_level_name() const {
  if (!engine->has_level())
    return String();
  return String(engine->level().name.c_str());
}

// -1 while the level in play did not come from the pack.
int WispServer::get_level_index() const {
  return catalog.attached() ? (int)catalog.current_index() : -1;
}

int WispServer::get_level_count() const { return (int)catalog.count(); }

int WispServer::get_stars() const {
  wisp::Snapshot snap = engine->snapshot();
  return wisp::rate_solution(snap.status, snap.turn, engine->level().min_moves);
}

String WispServer::get_last_error() const {
  return String(last_error.message.c_str());
}
