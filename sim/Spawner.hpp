#pragma once

#include "sim/EntityStore.hpp"

struct SimulationState;

// Milliseconds between obstacle spawns: base interval scaled down by
// speed / START_SPEED. Non-positive speed falls back to the base interval.
float ObstacleSpawnIntervalMs(float speed);

// Decorations run on a faster cadence derived from the obstacle interval.
float DecorationSpawnIntervalMs(float speed);

// Maps a [0,1) roll onto the decoration kind weights.
DecorationKind PickDecorationKind(float roll);

// Creates one obstacle in a uniformly random lane at the spawn distance.
Obstacle& SpawnObstacle(SimulationState& state);

// Creates one decoration on a random side outside the corridor.
Decoration& SpawnDecoration(SimulationState& state);

// Spawns when the stream's interval has elapsed since its last spawn. Return
// how many entities were created.
int SpawnObstaclesIfDue(SimulationState& state);
int SpawnDecorationsIfDue(SimulationState& state);
