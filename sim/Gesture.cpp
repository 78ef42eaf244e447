#include "sim/Gesture.hpp"

#include <cctype>
#include <cstring>

namespace {

bool EqualsIgnoreCase(const char* a, const char* b) {
  while (*a != '\0' && *b != '\0') {
    if (std::toupper(static_cast<unsigned char>(*a)) !=
        std::toupper(static_cast<unsigned char>(*b))) {
      return false;
    }
    ++a;
    ++b;
  }
  return *a == *b;
}

} // namespace

const char* GetGestureName(const GestureSymbol gesture) {
  switch (gesture) {
  case GestureSymbol::Jump:
    return "JUMP";
  case GestureSymbol::Left:
    return "LEFT";
  case GestureSymbol::Right:
    return "RIGHT";
  case GestureSymbol::None:
    break;
  }
  return "NONE";
}

GestureSymbol ParseGesture(const char* text) {
  if (text == nullptr || text[0] == '\0') {
    return GestureSymbol::None;
  }
  if (EqualsIgnoreCase(text, "JUMP"))
    return GestureSymbol::Jump;
  if (EqualsIgnoreCase(text, "LEFT"))
    return GestureSymbol::Left;
  if (EqualsIgnoreCase(text, "RIGHT"))
    return GestureSymbol::Right;
  return GestureSymbol::None;
}

void InitGestureGate(GestureGate& gate, const float laneCooldownMs,
                     const float jumpCooldownMs) {
  gate = GestureGate{};
  gate.laneCooldownMs = laneCooldownMs;
  gate.jumpCooldownMs = jumpCooldownMs;
}

GestureSymbol FilterGesture(GestureGate& gate, const GestureSymbol gesture,
                      const double nowMs) {
  switch (gesture) {
  case GestureSymbol::Jump:
    if (nowMs - gate.lastJumpMs < gate.jumpCooldownMs) {
      return GestureSymbol::None;
    }
    gate.lastJumpMs = nowMs;
    return gesture;
  case GestureSymbol::Left:
  case GestureSymbol::Right:
    if (nowMs - gate.lastLaneMs < gate.laneCooldownMs) {
      return GestureSymbol::None;
    }
    gate.lastLaneMs = nowMs;
    return gesture;
  case GestureSymbol::None:
    break;
  }
  return GestureSymbol::None;
}
