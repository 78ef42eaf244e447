#pragma once

namespace cfg {
constexpr int kScreenWidth = 1280;
constexpr int kScreenHeight = 720;

constexpr float kMaxFrameTime = 0.25f;

// --- Corridor ---
constexpr int kLaneCount = 3;
constexpr float kLaneWidth = 3.5f;
constexpr float kLaneLerpRate = 10.0f; // visual strafe smoothing, per second

// --- Jump ---
constexpr float kJumpHeight = 3.5f;
constexpr float kJumpDuration = 0.7f; // seconds
constexpr float kJumpClearance =
    1.1f; // below this height an in-lane obstacle hits

// --- Difficulty ---
constexpr float kStartSpeed = 15.0f; // world units per second
constexpr float kMaxSpeed = 40.0f;
constexpr float kScorePerSpeedUnit = 50.0f; // +1 speed per 50 points

// --- Spawning ---
constexpr float kSpawnDistance = -60.0f; // negative Z is ahead of the player
constexpr float kSpawnIntervalBase = 1.5f; // seconds at start speed
constexpr int kDecorationCadenceDivisor = 5;
constexpr int kDecorationsPerSpawn = 1;
constexpr float kDecorationBaseOffset = 6.0f;
constexpr float kDecorationSpread = 20.0f;
constexpr float kDecorationScaleMin = 0.8f;
constexpr float kDecorationScaleRange = 0.4f;
// Cumulative thresholds on a [0,1) draw: grass below, flower, then tree.
constexpr float kDecorationGrassWeight = 0.6f;
constexpr float kDecorationFlowerWeight = 0.2f;

// --- Entity lifetime ---
constexpr float kCollisionBandMin = -1.0f;
constexpr float kCollisionBandMax = 1.0f;
constexpr float kObstaclePassZ = 5.0f;
constexpr float kObstacleRetireZ = 10.0f;
constexpr float kDecorationRetireZ = 20.0f;

// Longest slice one frame is simulated in. At max speed a block moves half
// the collision band per slice, so no in-lane block can cross the band
// between two collision checks.
constexpr float kMaxSimSubstep =
    0.5f * (kCollisionBandMax - kCollisionBandMin) / kMaxSpeed;

// --- Lives & damage ---
constexpr int kStartLives = 3;
constexpr int kPointsPerObstacle = 10;
constexpr float kInvincibilityDurationMs = 2000.0f;
constexpr float kBlinkPeriodMs = 100.0f;

// --- Gesture source cooldowns (keyboard source only) ---
constexpr float kLaneChangeCooldownMs = 400.0f;
constexpr float kJumpCooldownMs = 800.0f;

// --- Running pose ---
constexpr float kRunSwingFrequency = 0.01f; // radians per ms
constexpr float kRunSwingAmplitude = 0.8f;
constexpr float kJumpArmAngle = -3.14159265f;
constexpr float kJumpLegAngle = 0.5f;

// --- Camera / scene (render-only) ---
constexpr float kCameraHeight = 6.0f;
constexpr float kCameraDistance = 9.0f;
constexpr float kCameraFov = 60.0f;
constexpr float kTrackLength = 200.0f;
constexpr float kTrackCenterZ = -50.0f;
constexpr int kCloudCount = 24;
constexpr float kCloudDriftSpeed = 0.5f;
constexpr float kCloudWrapX = 100.0f;
constexpr float kDamageFlashDuration = 0.35f;

// --- Controls ---
struct KeyConfig {
  int left = 263;       // KEY_LEFT
  int leftAlt = 65;     // KEY_A
  int right = 262;      // KEY_RIGHT
  int rightAlt = 68;    // KEY_D
  int jump = 32;        // KEY_SPACE
  int jumpAlt = 265;    // KEY_UP
  int pause = 80;       // KEY_P
  int back = 256;       // KEY_ESCAPE
  int confirm = 257;    // KEY_ENTER
  int restart = 82;     // KEY_R
  int screenshot = 301; // KEY_F12
};

extern KeyConfig keys;

} // namespace cfg
