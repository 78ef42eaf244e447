#include "sim/Collision.hpp"

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "sim/Sim.hpp"

bool IsInCollisionBand(const Obstacle &obstacle) {
  return obstacle.z > cfg::kCollisionBandMin &&
         obstacle.z < cfg::kCollisionBandMax;
}

bool IsConfirmedHit(const Obstacle &obstacle, const PlayerState &player) {
  if (!IsInCollisionBand(obstacle) || obstacle.lane != player.lane) {
    return false;
  }
  // A high enough jump clears any in-lane block.
  return player.yPosition < cfg::kJumpClearance;
}

bool ApplyHit(SimulationState &state, Obstacle &obstacle) {
  if (state.gameOver || state.lives <= 0) {
    return false;
  }
  if (IsInvincible(state.player, state.clockMs)) {
    return false;
  }

  --state.lives;
  state.player.lastHitMs = state.clockMs;
  obstacle.hit = true;
  ++state.stats.hitsTaken;

  SimEvent damaged{};
  damaged.type = SimEventType::Damaged;
  damaged.id = kPlayerEntityId;
  damaged.kind = EntityKind::Player;
  damaged.transform = GetPlayerTransform(state.player);
  damaged.score = state.score;
  damaged.lives = state.lives;
  state.events.push_back(damaged);
  LOG_DEBUG("Hit by obstacle {} in lane {}, {} lives left", obstacle.id,
            obstacle.lane, state.lives);

  if (state.lives == 0) {
    state.gameOver = true;
    SimEvent over = damaged;
    over.type = SimEventType::GameOver;
    state.events.push_back(over);
    LOG_INFO("Game over: score {} after {:.1f}s", state.score,
             state.clockMs / 1000.0);
  }
  return true;
}

int CheckCollisions(SimulationState &state) {
  int hits = 0;
  for (auto &o : state.entities.obstacles) {
    if (state.gameOver) {
      break;
    }
    if (IsConfirmedHit(o, state.player) && ApplyHit(state, o)) {
      ++hits;
    }
  }
  return hits;
}
