#pragma once

// Discrete intent symbol produced by a gesture source (pose classifier,
// keyboard, bot or script). The simulation only ever sees these four values.
enum class GestureSymbol : int {
  None = 0,
  Jump = 1,
  Left = 2,
  Right = 3,
};

const char* GetGestureName(GestureSymbol gesture);

// Accepts "JUMP", "LEFT", "RIGHT", "NONE" in any letter case. Null, empty or
// unknown text maps to GestureSymbol::None.
GestureSymbol ParseGesture(const char* text);

// Per-source debounce: suppresses lane gestures arriving within the lane
// cooldown of the last accepted lane gesture, and jumps within the jump
// cooldown of the last accepted jump. Times are in milliseconds on any
// monotonic clock the caller chooses.
struct GestureGate {
  float laneCooldownMs = 0.0f;
  float jumpCooldownMs = 0.0f;
  double lastLaneMs = -1.0e12;
  double lastJumpMs = -1.0e12;
};

void InitGestureGate(GestureGate& gate, float laneCooldownMs,
                     float jumpCooldownMs);

// Returns the gesture if it passes the gate (and records it), otherwise
// GestureSymbol::None.
GestureSymbol FilterGesture(GestureGate& gate, GestureSymbol gesture, double nowMs);
