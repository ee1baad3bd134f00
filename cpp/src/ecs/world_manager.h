#ifndef WISP_WORLD_MANAGER_H
#define WISP_WORLD_MANAGER_H

#include "level_catalog.h"
#include "turn_engine.h"
#include <godot_cpp/classes/node.hpp>
#include <godot_cpp/variant/packed_int32_array.hpp>
#include <godot_cpp/variant/string.hpp>
#include <godot_cpp/variant/vector2i.hpp>
#include <memory>

namespace godot {

// Scene-side owner of the TurnEngine. GDScript reads state back through
// the getters after every call; the engine itself knows nothing about
// Godot.
class WispServer : public Node {
  GDCLASS(WispServer, Node)

private:
  std::unique_ptr<wisp::TurnEngine> engine;
  wisp::LevelCatalog catalog;
  wisp::ConfigError last_error;

  // Input turn lock: a move (or level change) in flight rejects new input.
  bool turn_locked = false;

  bool apply_level(const wisp::LevelConfig &cfg);
  void report(const char *what);

protected:
  static void _bind_methods();

public:
  // attempt_move() return codes (GDScript side)
  enum MoveCode {
    MOVE_ACCEPTED = 0,
    MOVE_REJECTED = 1,
    MOVE_NOT_PLAYING = 2,
    MOVE_BAD_INPUT = 3,
    MOVE_LOCKED = 4,
  };

  WispServer();
  ~WispServer();

  void _ready() override;

  // --- Level loading ---
  bool load_rules_file(const String &path);
  bool load_level_json(const String &text);
  bool load_level_file(const String &path);
  bool load_pack_file(const String &path);
  bool next_level();
  bool previous_level();
  bool reload_level();

  // --- Turn API ---
  int attempt_move(int dx, int dy);
  void reset_level();

  // --- State readback ---
  int get_status() const;
  int get_turn() const;
  int get_purified() const;
  Vector2i get_player_position() const;
  PackedInt32Array get_enemy_buffer() const;
  String get_level_name() const;
  int get_level_index() const;
  int get_level_count() const;
  int get_stars() const;
  String get_last_error() const;
};

} // namespace godot

#endif // WISP_WORLD_MANAGER_H
