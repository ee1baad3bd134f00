#include "turn_engine.h"
#include "terminal_evaluator.h"
#include "turn_phases.h"

namespace wisp {

static const char *status_name(MatchStatus s) {
  switch (s) {
  case MatchStatus::Playing:
    return "playing";
  case MatchStatus::Won:
    return "won";
  case MatchStatus::Lost:
    return "lost";
  }
  return "unknown";
}

// log_level is left to the host: the flecs log level is process-wide.
TurnEngine::TurnEngine(const EngineConfig &rules) : rules_(rules) {
  ConfigError err;
  if (!validate_rules(rules_, err)) {
    flecs::log::warn("invalid rules (%s), falling back to defaults",
                     err.message.c_str());
    int level = rules_.log_level;
    rules_ = EngineConfig{};
    rules_.log_level = level;
  }
}

TurnEngine::~TurnEngine() {
  live_q_ = flecs::query<const SpawnOrder>();
  ecs_.reset();
}

void TurnEngine::seed_world(const LevelConfig &cfg) {
  // Query first: it belongs to the world being replaced.
  live_q_ = flecs::query<const SpawnOrder>();

  ecs_ = std::make_unique<flecs::world>();
  register_components(*ecs_);
  ecs_->set<PlayerState>({cfg.player_start});
  spawn_enemies(*ecs_, cfg.enemies);
  live_q_ = build_live_query(*ecs_);

  grid_ = GridModel(cfg);
  status_ = MatchStatus::Playing;
  turn_ = 0;
  purified_ = 0;
}

bool TurnEngine::setup_level(const LevelConfig &cfg, ConfigError &err_out) {
  if (!validate_level(cfg, err_out)) {
    flecs::log::warn("level '%s' rejected: %s (%s)", cfg.name.c_str(),
                     err_out.message.c_str(), error_code_name(err_out.code));
    return false;
  }

  // Nothing below can fail: the swap is all-or-nothing.
  level_ = cfg;
  seed_world(level_);
  has_level_ = true;

  flecs::log::trace("level '%s' ready: %dx%d, %d enemies", level_.name.c_str(),
                    level_.width, level_.height,
                    static_cast<int>(level_.enemies.size()));
  return true;
}

Snapshot TurnEngine::reset() {
  if (!has_level_) {
    flecs::log::warn("reset requested with no level loaded");
    return snapshot();
  }
  seed_world(level_);
  flecs::log::trace("level '%s' reset", level_.name.c_str());
  return snapshot();
}

std::vector<EnemyRecord> TurnEngine::live_records() const {
  if (!ecs_)
    return {};
  return to_records(live_in_order(live_q_));
}

Snapshot TurnEngine::snapshot() const {
  Snapshot snap;
  if (!ecs_)
    return snap;
  snap.player = ecs_->get<PlayerState>().pos;
  snap.enemies = live_records();
  snap.status = status_;
  snap.turn = turn_;
  snap.purified = purified_;
  return snap;
}

MoveOutcome TurnEngine::attempt_move(Direction dir) {
  MoveOutcome out;

  if (!has_level_) {
    flecs::log::err("attempt_move called with no level loaded");
    out.result = MoveResult::NotPlaying;
    out.reason = RejectReason::NoLevel;
    out.snapshot = snapshot();
    return out;
  }
  if (status_ != MatchStatus::Playing) {
    flecs::log::err("attempt_move called after the match ended (%s)",
                    status_name(status_));
    out.result = MoveResult::NotPlaying;
    out.reason = RejectReason::MatchOver;
    out.snapshot = snapshot();
    return out;
  }

  // ── 1. Candidate ──
  const GridPos from = ecs_->get<PlayerState>().pos;
  const GridPos step = delta(dir);
  const GridPos to{from.x + step.x, from.y + step.y};

  // ── 2. Reject without mutating anything ──
  if (!grid_.in_bounds(to)) {
    flecs::log::dbg("move to (%d,%d) rejected: out of bounds", to.x, to.y);
    out.result = MoveResult::Rejected;
    out.reason = RejectReason::OutOfBounds;
    out.snapshot = snapshot();
    return out;
  }
  for (const EnemyRecord &e : live_records()) {
    if (e.pos == to && e.state == EnemyState::Active) {
      flecs::log::dbg("move to (%d,%d) rejected: enemy #%u blocks", to.x, to.y,
                      e.id);
      out.result = MoveResult::Rejected;
      out.reason = RejectReason::BlockedByEnemy;
      out.snapshot = snapshot();
      return out;
    }
  }

  // ── 3. Commit and run the enemy turn ──
  ecs_->set<PlayerState>({to});
  turn_++;
  run_enemy_turn(to);

  out.result = MoveResult::Accepted;
  out.snapshot = snapshot();
  return out;
}

void TurnEngine::run_enemy_turn(const GridPos &player) {
  flecs::log::push("turn %u", turn_);

  // a-c see the same live set; nothing dies before phase d.
  std::vector<flecs::entity> live = live_in_order(live_q_);
  phase_trap_countdown(live);
  phase_dormant_wake(live, player, rules_.wake_rule);
  phase_enemy_movement(live, player, grid_, rules_);

  int merged = phase_collisions(live);
  int cleansed = phase_goal_purification(live, grid_.goal());
  purified_ += static_cast<uint32_t>(merged + cleansed);

  std::vector<EnemyRecord> remaining = to_records(live);
  if (is_captured(player, remaining)) {
    status_ = MatchStatus::Lost;
    flecs::log::trace("player caught at (%d,%d)", player.x, player.y);
  } else if (is_victory(remaining)) {
    status_ = MatchStatus::Won;
    flecs::log::trace("all enemies purified in %u moves", turn_);
  }

  flecs::log::pop();
}

std::vector<Snapshot> replay(const LevelConfig &cfg, const EngineConfig &rules,
                             const std::vector<Direction> &moves,
                             ConfigError &err_out) {
  std::vector<Snapshot> out;
  if (!validate_rules(rules, err_out))
    return out;

  TurnEngine engine(rules);
  if (!engine.setup_level(cfg, err_out))
    return out;

  out.reserve(moves.size() + 1);
  out.push_back(engine.snapshot());
  for (Direction d : moves) {
    if (engine.status() != MatchStatus::Playing) {
      out.push_back(engine.snapshot());
      continue;
    }
    out.push_back(engine.attempt_move(d).snapshot);
  }
  return out;
}

} // namespace wisp
