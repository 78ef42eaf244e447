#pragma once

struct SimulationState;

// START_SPEED + score / 50, clamped to [START_SPEED, MAX_SPEED]. Pure.
float ComputeSpeed(int score);

void UpdateDifficulty(SimulationState& state);
