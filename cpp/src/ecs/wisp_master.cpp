// ═════════════════════════════════════════════════════════════════════════════
// WILL-O'-THE-WISP: CORE UNITY BUILD
// ═════════════════════════════════════════════════════════════════════════════
// The Godot-free core compiles as this single TU. Flecs caches component
// IDs in per-TU static template variables; one TU keeps registration and
// every query on the same IDs.
//
// ORDER MATTERS: data and validation first, then the turn pipeline, then
// the engine that drives it.
// ═════════════════════════════════════════════════════════════════════════════

// 1. Data (level blueprint, validation, JSON loader, catalog)
#include "level_config.cpp"
#include "level_loader.cpp"
#include "level_catalog.cpp"

// 2. Static terrain + pure rules
#include "grid_model.cpp"
#include "pathfinding.cpp"
#include "collision_resolver.cpp"
#include "terminal_evaluator.cpp"

// 3. ECS turn phases
#include "turn_phases.cpp"

// 4. Engine (setup, move, reset, replay)
#include "turn_engine.cpp"
