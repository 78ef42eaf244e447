#include "sim/Sim.hpp"

#include <cmath>
#include <utility>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "sim/Collision.hpp"
#include "sim/Difficulty.hpp"
#include "sim/Spawner.hpp"

namespace {

uint32_t NormalizeSeed(const uint32_t seed) { return (seed == 0) ? 1u : seed; }

SimEvent MakePlayerEvent(const SimulationState &state,
                         const SimEventType type) {
  SimEvent e{};
  e.type = type;
  e.id = kPlayerEntityId;
  e.kind = EntityKind::Player;
  e.transform = GetPlayerTransform(state.player);
  e.visible = state.player.visible;
  e.score = state.score;
  e.lives = state.lives;
  return e;
}

void StepObstacles(SimulationState &state, const float dt) {
  SpawnObstaclesIfDue(state);
  AdvanceObstacles(state.entities, state.speed, dt, state.events);

  // Scoring is for getting past a block, hit or not. It runs before the
  // collision check so a game-ending hit reports this slice's passes too.
  const int passed = MarkPassedObstacles(state.entities);
  if (passed > 0) {
    state.score += passed * cfg::kPointsPerObstacle;
    state.stats.obstaclesPassed += passed;
  }

  CheckCollisions(state);
  if (state.gameOver) {
    return;
  }
  state.stats.obstaclesRetired += RetireObstacles(state.entities, state.events);
}

// One slice of a frame, never longer than cfg::kMaxSimSubstep.
void StepSlice(SimulationState &state, const float dt) {
  state.clockMs += static_cast<double>(dt) * 1000.0;

  UpdateDifficulty(state);

  ConsumeIntents(state.player, state.clockMs);
  UpdatePlayer(state.player, state.clockMs, dt, state.events);

  SpawnDecorationsIfDue(state);
  state.stats.decorationsRetired +=
      AdvanceDecorations(state.entities, state.speed, dt, state.events);

  StepObstacles(state, dt);
}

} // namespace

float SanitizeDelta(const float dt) {
  if (!std::isfinite(dt) || dt <= 0.0f) {
    return 0.0f;
  }
  if (dt > cfg::kMaxFrameTime) {
    return cfg::kMaxFrameTime;
  }
  return dt;
}

void ResetSimulation(SimulationState &state, const uint32_t seed) {
  // Previous session's renderer handles are released before anything new
  // is announced, all within this call.
  ClearEntities(state.entities, state.events);
  if (state.playerSpawned) {
    state.events.push_back(MakePlayerEvent(state, SimEventType::Removed));
  }

  ResetPlayer(state.player);
  state.score = 0;
  state.lives = cfg::kStartLives;
  state.gameOver = false;
  state.paused = false;
  state.speed = cfg::kStartSpeed;
  state.clockMs = 0.0;
  state.lastObstacleSpawnMs = 0.0;
  state.lastDecorationSpawnMs = 0.0;
  state.seed = NormalizeSeed(seed);
  state.rngState = state.seed;
  state.stats = SimStats{};

  state.events.push_back(MakePlayerEvent(state, SimEventType::Spawned));
  state.playerSpawned = true;
  LOG_INFO("Session reset (seed 0x{:08X})", state.seed);
}

void SimStep(SimulationState &state, const float dt) {
  if (!IsSimulationRunning(state)) {
    return;
  }

  ++state.stats.frames;

  // A long frame is split into slices so a fast block cannot jump over the
  // collision band. A zero frame still runs once to apply intents.
  float remaining = SanitizeDelta(dt);
  do {
    const float slice =
        (remaining > cfg::kMaxSimSubstep) ? cfg::kMaxSimSubstep : remaining;
    StepSlice(state, slice);
    remaining -= slice;
  } while (remaining > 0.0f && !state.gameOver);
}

void SubmitGesture(SimulationState &state, const GestureSymbol gesture) {
  if (!IsSimulationRunning(state)) {
    return;
  }
  QueueGesture(state.player, gesture);
}

void PauseSimulation(SimulationState &state) {
  if (state.paused || state.gameOver) {
    return;
  }
  state.paused = true;
  LOG_INFO("Simulation paused at {:.1f}s", state.clockMs / 1000.0);
}

void ResumeSimulation(SimulationState &state) {
  if (!state.paused) {
    return;
  }
  state.paused = false;
  LOG_INFO("Simulation resumed at {:.1f}s", state.clockMs / 1000.0);
}

bool IsSimulationRunning(const SimulationState &state) {
  return !state.paused && !state.gameOver;
}

SimEventList TakeEvents(SimulationState &state) {
  SimEventList out;
  out.swap(state.events);
  return out;
}
