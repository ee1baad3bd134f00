// ═════════════════════════════════════════════════════════════
// Category 4: INVARIANTS: determinism, bounds, pursuit, reset
// ═════════════════════════════════════════════════════════════

TEST_CASE("Cat4: Replaying the same moves gives identical snapshots") {
  wisp::LevelConfig cfg = busy_level();
  wisp::EngineConfig rules;
  for (uint32_t seed = 1; seed <= 8; seed++) {
    auto moves = random_moves(seed, 80);
    wisp::ConfigError e1, e2;
    auto a = wisp::replay(cfg, rules, moves, e1);
    auto b = wisp::replay(cfg, rules, moves, e2);
    REQUIRE(a.size() == moves.size() + 1);
    REQUIRE(a.size() == b.size());
    for (size_t i = 0; i < a.size(); i++)
      CHECK(a[i] == b[i]);
  }
}

TEST_CASE("Cat4: Replay starts from the setup snapshot") {
  wisp::LevelConfig cfg = busy_level();
  wisp::TurnEngine engine;
  wisp::ConfigError err;
  REQUIRE(engine.setup_level(cfg, err));

  std::vector<Direction> moves = {Direction::Left, Direction::Up,
                                  Direction::Down};
  auto trace = wisp::replay(cfg, wisp::EngineConfig{}, moves, err);
  REQUIRE(trace.size() == 4);
  CHECK(trace[0] == engine.snapshot());
  CHECK(trace[1] == trace[0]); // Left from (0,0) is rejected
  CHECK(trace[2].player == GridPos{0, 1});
  CHECK(trace[2].turn == 1);
  CHECK(trace[3].player == GridPos{0, 0});
}

TEST_CASE("Cat4: Replay of a bad level reports the error") {
  wisp::LevelConfig cfg;
  cfg.width = 0;
  wisp::ConfigError err;
  auto trace = wisp::replay(cfg, wisp::EngineConfig{}, {Direction::Up}, err);
  CHECK(trace.empty());
  CHECK(err.code == wisp::ConfigErrorCode::BadDimensions);
}

TEST_CASE("Cat4: Enemies stay in bounds, off obstacles, and never retreat") {
  wisp::LevelConfig cfg = busy_level();
  wisp::TurnEngine engine;
  wisp::ConfigError err;
  REQUIRE(engine.setup_level(cfg, err));
  const wisp::GridModel &grid = engine.grid();

  int checked = 0;
  for (Direction d : random_moves(42, 600)) {
    if (engine.status() != MatchStatus::Playing)
      engine.reset();

    wisp::Snapshot before = engine.snapshot();
    wisp::MoveOutcome out = engine.attempt_move(d);
    const wisp::Snapshot &after = out.snapshot;

    CHECK(grid.in_bounds(after.player));
    for (const auto &e : after.enemies) {
      CHECK(grid.in_bounds(e.pos));
      CHECK_FALSE(grid.is_obstacle(e.pos));
    }
    if (!out.accepted())
      continue;

    for (const auto &e : after.enemies) {
      for (const auto &old : before.enemies) {
        if (old.id != e.id)
          continue;
        CHECK(wisp::manhattan(e.pos, after.player) <=
              wisp::manhattan(old.pos, after.player));
        CHECK(wisp::manhattan(e.pos, old.pos) <= 1);
        checked++;
      }
    }
  }
  CHECK(checked > 0);
}

TEST_CASE_FIXTURE(WispTestHarness,
                  "Cat4: A pile of N same-color enemies loses exactly N-1") {
  enemy(3, 1, EnemyColor::Red, true);
  enemy(3, 1, EnemyColor::Red, true);
  enemy(3, 1, EnemyColor::Red, true);
  enemy(1, 4, EnemyColor::Green, true);
  enemy(1, 4, EnemyColor::Green, true);
  load();
  REQUIRE(snap().enemies.size() == 5);

  auto out = move(Direction::Up);
  REQUIRE(out.accepted());
  REQUIRE(out.snapshot.enemies.size() == 2);
  CHECK(out.snapshot.enemies[0].id == 0);
  CHECK(out.snapshot.enemies[1].id == 3);
  CHECK(out.snapshot.purified == 3);
}

TEST_CASE_FIXTURE(WispTestHarness, "Cat4: Reset reproduces the setup snapshot") {
  level = busy_level();
  load();
  const wisp::Snapshot initial = snap();

  for (Direction d : random_moves(7, 25)) {
    if (engine->status() != MatchStatus::Playing)
      break;
    move(d);
  }

  CHECK(engine->reset() == initial);
  CHECK(snap() == initial);
  CHECK(engine->reset() == initial);
}

TEST_CASE_FIXTURE(WispTestHarness, "Cat4: Reset revives a finished match") {
  enemy(0, 2);
  load();
  const wisp::Snapshot initial = snap();
  play({Direction::Right, Direction::Up});
  REQUIRE(engine->status() == MatchStatus::Lost);

  CHECK(engine->reset() == initial);
  CHECK(move(Direction::Right).accepted());
}

TEST_CASE_FIXTURE(WispTestHarness, "Cat4: Reset with no level is a no-op") {
  wisp::Snapshot s = engine->reset();
  CHECK(s.enemies.empty());
  CHECK_FALSE(engine->has_level());
}

TEST_CASE_FIXTURE(WispTestHarness,
                  "Cat4: Failed setup leaves the running level intact") {
  enemy(4, 0);
  load();
  move(Direction::Up);
  const wisp::Snapshot mid = snap();

  wisp::LevelConfig bad = level;
  bad.name = "bad";
  bad.enemies.push_back({{2, 2}, EnemyColor::Red, false});
  bad.enemies.push_back({{2, 2}, EnemyColor::Purple, false});
  CHECK_FALSE(engine->setup_level(bad, err));
  CHECK(err.code == wisp::ConfigErrorCode::MixedColorSpawn);

  CHECK(snap() == mid);
  CHECK(engine->level().name == "fixture");
  CHECK(move(Direction::Up).accepted());
}

TEST_CASE_FIXTURE(WispTestHarness, "Cat4: Setup replaces the previous level") {
  enemy(4, 0);
  load();
  move(Direction::Up);

  wisp::LevelConfig next;
  next.name = "second";
  next.width = 3;
  next.height = 3;
  next.goal = {2, 2};
  next.player_start = {1, 1};
  REQUIRE(engine->setup_level(next, err));

  wisp::Snapshot s = snap();
  CHECK(s.player == GridPos{1, 1});
  CHECK(s.enemies.empty());
  CHECK(s.turn == 0);
  CHECK(s.status == MatchStatus::Playing);
  CHECK(engine->grid().width() == 3);
}
