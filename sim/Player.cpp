#include "sim/Player.hpp"

#include <cmath>

#include "core/Config.hpp"

namespace {

float Clamp01(const float value) {
  if (value < 0.0f) {
    return 0.0f;
  }
  if (value > 1.0f) {
    return 1.0f;
  }
  return value;
}

} // namespace

void ResetPlayer(PlayerState& player) { player = PlayerState{}; }

void QueueGesture(PlayerState& player, const GestureSymbol gesture) {
  switch (gesture) {
  case GestureSymbol::Jump:
    player.pendingJump = true;
    break;
  case GestureSymbol::Left:
    player.pendingLaneDelta = -1;
    break;
  case GestureSymbol::Right:
    player.pendingLaneDelta = 1;
    break;
  case GestureSymbol::None:
    break;
  }
}

void ConsumeIntents(PlayerState& player, const double nowMs) {
  if (player.pendingJump) {
    StartJump(player, nowMs);
  }
  if (player.pendingLaneDelta != 0) {
    ShiftLane(player, player.pendingLaneDelta);
  }
  player.pendingJump = false;
  player.pendingLaneDelta = 0;
}

bool StartJump(PlayerState& player, const double nowMs) {
  if (player.isJumping) {
    return false;
  }
  player.isJumping = true;
  player.jumpStartMs = nowMs;
  return true;
}

bool ShiftLane(PlayerState& player, const int delta) {
  int target = player.lane + delta;
  if (target < kLaneLeft)
    target = kLaneLeft;
  if (target > kLaneRight)
    target = kLaneRight;
  if (target == player.lane) {
    return false;
  }
  player.lane = target;
  return true;
}

float JumpHeightAt(const float elapsedSeconds) {
  if (elapsedSeconds < 0.0f || elapsedSeconds >= cfg::kJumpDuration) {
    return 0.0f;
  }
  const float t = elapsedSeconds / cfg::kJumpDuration;
  return cfg::kJumpHeight * 4.0f * t * (1.0f - t);
}

bool IsInvincible(const PlayerState& player, const double nowMs) {
  return (nowMs - player.lastHitMs) <= cfg::kInvincibilityDurationMs;
}

bool ComputeVisibility(const PlayerState& player, const double nowMs) {
  if (!IsInvincible(player, nowMs)) {
    return true;
  }
  const auto phase = static_cast<long long>(std::floor(nowMs / cfg::kBlinkPeriodMs));
  return (phase % 2) == 0;
}

PlayerPose ComputePose(const PlayerState& player, const double nowMs) {
  PlayerPose pose{};
  if (player.isJumping) {
    pose.leftArm = cfg::kJumpArmAngle;
    pose.rightArm = cfg::kJumpArmAngle;
    pose.leftLeg = -cfg::kJumpLegAngle;
    pose.rightLeg = cfg::kJumpLegAngle;
    return pose;
  }
  const float angle =
      std::sin(static_cast<float>(nowMs) * cfg::kRunSwingFrequency) *
      cfg::kRunSwingAmplitude;
  pose.leftArm = angle;
  pose.rightArm = -angle;
  pose.leftLeg = -angle;
  pose.rightLeg = angle;
  return pose;
}

void UpdatePlayer(PlayerState& player, const double nowMs, const float dt,
                  SimEventList& events) {
  if (player.isJumping) {
    const float elapsed =
        static_cast<float>((nowMs - player.jumpStartMs) / 1000.0);
    if (elapsed < cfg::kJumpDuration) {
      player.yPosition = JumpHeightAt(elapsed);
    } else {
      player.isJumping = false;
      player.yPosition = 0.0f;
    }
  }

  const float targetX = LaneToX(player.lane);
  player.visualX += (targetX - player.visualX) * Clamp01(cfg::kLaneLerpRate * dt);

  player.pose = ComputePose(player, nowMs);

  SimEvent moved{};
  moved.type = SimEventType::Moved;
  moved.id = kPlayerEntityId;
  moved.kind = EntityKind::Player;
  moved.transform = GetPlayerTransform(player);
  moved.visible = player.visible;
  events.push_back(moved);

  const bool visible = ComputeVisibility(player, nowMs);
  if (visible != player.visible) {
    player.visible = visible;
    SimEvent blink = moved;
    blink.type = SimEventType::VisibilityChanged;
    blink.visible = visible;
    events.push_back(blink);
  }
}

EntityTransform GetPlayerTransform(const PlayerState& player) {
  EntityTransform t{};
  t.x = player.visualX;
  t.y = player.yPosition;
  t.z = 0.0f;
  return t;
}
