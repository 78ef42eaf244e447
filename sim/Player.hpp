#pragma once

#include "sim/Gesture.hpp"
#include "sim/SimTypes.hpp"

// Limb swing angles (radians around X) for the runner model.
struct PlayerPose {
  float leftArm = 0.0f;
  float rightArm = 0.0f;
  float leftLeg = 0.0f;
  float rightLeg = 0.0f;
};

// Far enough in the past that a fresh player is never invincible.
constexpr double kNeverHitMs = -1.0e9;

struct PlayerState {
  int lane = kLaneCenter;
  bool isJumping = false;
  double jumpStartMs = 0.0;
  float yPosition = 0.0f;
  double lastHitMs = kNeverHitMs;

  float visualX = 0.0f;  // smoothed toward the lane center each frame
  bool visible = true;   // blink state during invincibility
  PlayerPose pose{};

  // Latest-wins intents, consumed at the start of the next frame.
  bool pendingJump = false;
  int pendingLaneDelta = 0;  // -1, 0 or +1
};

void ResetPlayer(PlayerState& player);

// Records the gesture as a pending intent. NONE leaves intents untouched.
void QueueGesture(PlayerState& player, GestureSymbol gesture);

// Applies at most one jump and one lane intent, then clears them.
void ConsumeIntents(PlayerState& player, double nowMs);

// Grounded -> Jumping. Returns false if already airborne.
bool StartJump(PlayerState& player, double nowMs);

// Moves the logical lane by delta, clamped to the corridor. Returns false when
// the lane did not change.
bool ShiftLane(PlayerState& player, int delta);

// Closed-form jump arc: JUMP_HEIGHT * 4t(1-t) with t = elapsed / duration.
// Zero outside [0, duration).
float JumpHeightAt(float elapsedSeconds);

bool IsInvincible(const PlayerState& player, double nowMs);

// Blink visibility for the given time; always true outside the window.
bool ComputeVisibility(const PlayerState& player, double nowMs);

PlayerPose ComputePose(const PlayerState& player, double nowMs);

// Advances jump, lateral smoothing, pose and blink. Emits a Moved event for
// the player and a VisibilityChanged event when the blink state flips.
void UpdatePlayer(PlayerState& player, double nowMs, float dt,
                  SimEventList& events);

EntityTransform GetPlayerTransform(const PlayerState& player);
