// ═════════════════════════════════════════════════════════════
// Category 1: TERRAIN & PURSUIT: GridModel, choose_next_cell
// ═════════════════════════════════════════════════════════════

static wisp::GridModel open_grid(int w = 5, int h = 5, GridPos goal = {4, 4}) {
  wisp::LevelConfig cfg;
  cfg.width = w;
  cfg.height = h;
  cfg.goal = goal;
  return wisp::GridModel(cfg);
}

static bool nobody(const GridPos &) { return false; }

TEST_CASE("Cat1: GridModel answers terrain queries") {
  wisp::LevelConfig cfg;
  cfg.width = 4;
  cfg.height = 3;
  cfg.goal = {3, 2};
  cfg.obstacles = {{1, 1}};
  cfg.mud = {{2, 0}};
  wisp::GridModel grid(cfg);

  CHECK(grid.width() == 4);
  CHECK(grid.height() == 3);
  CHECK(grid.in_bounds({0, 0}));
  CHECK(grid.in_bounds({3, 2}));
  CHECK_FALSE(grid.in_bounds({4, 0}));
  CHECK_FALSE(grid.in_bounds({0, 3}));
  CHECK_FALSE(grid.in_bounds({-1, 1}));

  CHECK(grid.is_obstacle({1, 1}));
  CHECK_FALSE(grid.is_obstacle({2, 0}));
  CHECK(grid.is_mud({2, 0}));
  CHECK_FALSE(grid.is_mud({1, 1}));
  CHECK_FALSE(grid.is_mud({9, 9}));
  CHECK(grid.goal() == GridPos{3, 2});
}

TEST_CASE("Cat1: Chebyshev adjacency excludes the cell itself") {
  CHECK(wisp::chebyshev_adjacent({2, 2}, {1, 1}));
  CHECK(wisp::chebyshev_adjacent({2, 2}, {3, 2}));
  CHECK(wisp::chebyshev_adjacent({2, 2}, {3, 3}));
  CHECK_FALSE(wisp::chebyshev_adjacent({2, 2}, {2, 2}));
  CHECK_FALSE(wisp::chebyshev_adjacent({2, 2}, {4, 2}));
  CHECK(wisp::manhattan({0, 0}, {3, 4}) == 7);
}

TEST_CASE("Cat1: Pursuit takes the single closer step") {
  auto grid = open_grid();
  CHECK(wisp::choose_next_cell({2, 2}, {2, 0}, grid, nobody) == GridPos{2, 1});
  CHECK(wisp::choose_next_cell({2, 2}, {4, 2}, grid, nobody) == GridPos{3, 2});
}

TEST_CASE("Cat1: Equal closer steps resolve up, down, left, right") {
  auto grid = open_grid();
  // Down and Left both reach distance 3; Down is scanned first
  CHECK(wisp::choose_next_cell({2, 2}, {0, 0}, grid, nobody) == GridPos{2, 1});
  // Up and Right both reach distance 3; Up is scanned first
  CHECK(wisp::choose_next_cell({1, 1}, {3, 3}, grid, nobody) == GridPos{1, 2});
  // Up and Left both reach distance 1; Up wins again
  CHECK(wisp::choose_next_cell({3, 1}, {2, 2}, grid, nobody) == GridPos{3, 2});
}

TEST_CASE("Cat1: Blocked candidates are skipped") {
  wisp::LevelConfig cfg;
  cfg.obstacles = {{2, 1}};
  wisp::GridModel grid(cfg);

  // Down is a tree: Left is the remaining closer step
  CHECK(wisp::choose_next_cell({2, 2}, {0, 0}, grid, nobody) == GridPos{1, 2});

  // Occupancy callback closes Left too: no closer step left
  auto left_taken = [](const GridPos &c) { return c == GridPos{1, 2}; };
  CHECK(wisp::choose_next_cell({2, 2}, {0, 0}, grid, left_taken) ==
        GridPos{2, 2});
}

TEST_CASE("Cat1: Pursuit never retreats when every closer step is closed") {
  wisp::LevelConfig cfg;
  cfg.obstacles = {{2, 1}};
  wisp::GridModel grid(cfg);

  // Up, Left and Right all lead away from the player (and away from the
  // goal for Left); the enemy holds its cell.
  CHECK(wisp::choose_next_cell({2, 2}, {2, 0}, grid, nobody) == GridPos{2, 2});
}

TEST_CASE("Cat1: Edges and corners never produce out-of-bounds moves") {
  auto grid = open_grid(3, 3, {2, 2});
  CHECK(wisp::choose_next_cell({0, 0}, {0, 0}, grid, nobody) == GridPos{0, 0});
  CHECK(wisp::choose_next_cell({0, 2}, {0, 0}, grid, nobody) == GridPos{0, 1});

  auto single = open_grid(1, 1, {0, 0});
  CHECK(wisp::choose_next_cell({0, 0}, {0, 0}, single, nobody) ==
        GridPos{0, 0});
}

TEST_CASE("Cat1: Result is always a cardinal neighbour or the start") {
  wisp::LevelConfig cfg = busy_level();
  wisp::GridModel grid(cfg);
  for (int fx = 0; fx < cfg.width; fx++)
    for (int fy = 0; fy < cfg.height; fy++)
      for (int px = 0; px < cfg.width; px += 3)
        for (int py = 0; py < cfg.height; py += 3) {
          GridPos from{fx, fy};
          GridPos to = wisp::choose_next_cell(from, {px, py}, grid, nobody);
          int step = wisp::manhattan(from, to);
          CHECK(step <= 1);
          CHECK(grid.in_bounds(to));
          if (step == 1)
            CHECK_FALSE(grid.is_obstacle(to));
        }
}
