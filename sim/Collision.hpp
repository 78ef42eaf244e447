#pragma once

#include "sim/EntityStore.hpp"
#include "sim/Player.hpp"

struct SimulationState;

// Obstacle is inside the longitudinal band treated as "at the player".
bool IsInCollisionBand(const Obstacle& obstacle);

// In-band, same logical lane and the player is below the jump clearance.
bool IsConfirmedHit(const Obstacle& obstacle, const PlayerState& player);

// Applies damage for a confirmed hit unless the player is invincible at
// state.clockMs. Returns true if a life was taken.
bool ApplyHit(SimulationState& state, Obstacle& obstacle);

// Tests every live obstacle against the player. Safe to call more than once
// per frame: the invincibility window gates repeated hits at the same time.
// Returns the number of hits applied.
int CheckCollisions(SimulationState& state);
