#pragma once

#include <cstdint>

#include "core/Config.hpp"
#include "sim/EntityStore.hpp"
#include "sim/Gesture.hpp"
#include "sim/Player.hpp"
#include "sim/SimTypes.hpp"

struct SimStats {
  uint64_t frames = 0;
  int obstaclesSpawned = 0;
  int obstaclesPassed = 0;
  int obstaclesRetired = 0;
  int decorationsSpawned = 0;
  int decorationsRetired = 0;
  int hitsTaken = 0;
};

// Everything one session needs. Owned by the caller (game shell, headless
// runner, tests) and passed by reference into every simulation call.
struct SimulationState {
  PlayerState player{};
  EntityStore entities{};

  int score = 0;
  int lives = cfg::kStartLives;
  bool gameOver = false;
  bool paused = false;
  bool playerSpawned = false;
  float speed = cfg::kStartSpeed;

  // Simulation clock; advances only by simulated delta, so paused wall time
  // never reaches the world.
  double clockMs = 0.0;
  double lastObstacleSpawnMs = 0.0;
  double lastDecorationSpawnMs = 0.0;

  uint32_t seed = 1u;
  uint32_t rngState = 1u;

  SimStats stats{};

  // Appended by every call below; drained by the consumer with TakeEvents.
  SimEventList events;
};

// Starts a fresh session. Live entities (and the previous player) are
// reported as Removed before the new player's Spawned event.
void ResetSimulation(SimulationState& state, uint32_t seed);

// One frame. Non-positive or non-finite dt is treated as 0; dt is clamped to
// cfg::kMaxFrameTime. Does nothing while paused or after game over.
void SimStep(SimulationState& state, float dt);

// Records a gesture as the player's pending intent. Ignored while paused or
// after game over.
void SubmitGesture(SimulationState& state, GestureSymbol gesture);

void PauseSimulation(SimulationState& state);
void ResumeSimulation(SimulationState& state);

bool IsSimulationRunning(const SimulationState& state);

SimEventList TakeEvents(SimulationState& state);

float SanitizeDelta(float dt);
