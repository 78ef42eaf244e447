#include "sim/Spawner.hpp"

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "core/Rng.hpp"
#include "sim/Sim.hpp"

namespace {
constexpr float kTwoPi = 6.28318531f;
}

float ObstacleSpawnIntervalMs(const float speed) {
  const float baseMs = cfg::kSpawnIntervalBase * 1000.0f;
  if (!(speed > 0.0f)) {
    return baseMs;
  }
  return baseMs / (speed / cfg::kStartSpeed);
}

float DecorationSpawnIntervalMs(const float speed) {
  return ObstacleSpawnIntervalMs(speed) /
         static_cast<float>(cfg::kDecorationCadenceDivisor);
}

DecorationKind PickDecorationKind(const float roll) {
  if (roll < cfg::kDecorationGrassWeight) {
    return DecorationKind::Grass;
  }
  if (roll < cfg::kDecorationGrassWeight + cfg::kDecorationFlowerWeight) {
    return DecorationKind::Flower;
  }
  return DecorationKind::Tree;
}

Obstacle &SpawnObstacle(SimulationState &state) {
  const int lane = core::NextIndex(state.rngState, cfg::kLaneCount);
  Obstacle &o =
      AddObstacle(state.entities, lane, cfg::kSpawnDistance, state.events);
  ++state.stats.obstaclesSpawned;
  LOG_TRACE("Spawned obstacle {} in lane {}", o.id, o.lane);
  return o;
}

Decoration &SpawnDecoration(SimulationState &state) {
  const bool isLeft = core::NextFloat01(state.rngState) > 0.5f;
  const float offset = cfg::kDecorationBaseOffset +
                       core::NextRange(state.rngState, 0.0f,
                                       cfg::kDecorationSpread);
  const float x = isLeft ? -offset : offset;
  const DecorationKind kind =
      PickDecorationKind(core::NextRange(state.rngState, 0.0f, 1.0f));
  const float rotation = core::NextRange(state.rngState, 0.0f, kTwoPi);
  const float scale =
      cfg::kDecorationScaleMin +
      core::NextRange(state.rngState, 0.0f, cfg::kDecorationScaleRange);

  Decoration &d = AddDecoration(state.entities, x, cfg::kSpawnDistance, kind,
                                rotation, scale, state.events);
  ++state.stats.decorationsSpawned;
  return d;
}

int SpawnObstaclesIfDue(SimulationState &state) {
  const double elapsed = state.clockMs - state.lastObstacleSpawnMs;
  if (elapsed <= ObstacleSpawnIntervalMs(state.speed)) {
    return 0;
  }
  SpawnObstacle(state);
  state.lastObstacleSpawnMs = state.clockMs;
  return 1;
}

int SpawnDecorationsIfDue(SimulationState &state) {
  const double elapsed = state.clockMs - state.lastDecorationSpawnMs;
  if (elapsed <= DecorationSpawnIntervalMs(state.speed)) {
    return 0;
  }
  for (int i = 0; i < cfg::kDecorationsPerSpawn; ++i) {
    SpawnDecoration(state);
  }
  state.lastDecorationSpawnMs = state.clockMs;
  return cfg::kDecorationsPerSpawn;
}
