#include "sim/Difficulty.hpp"

#include "core/Config.hpp"
#include "sim/Sim.hpp"

float ComputeSpeed(const int score) {
  const float speed =
      cfg::kStartSpeed + static_cast<float>(score) / cfg::kScorePerSpeedUnit;
  if (speed < cfg::kStartSpeed) {
    return cfg::kStartSpeed;
  }
  if (speed > cfg::kMaxSpeed) {
    return cfg::kMaxSpeed;
  }
  return speed;
}

void UpdateDifficulty(SimulationState& state) {
  state.speed = ComputeSpeed(state.score);
}
