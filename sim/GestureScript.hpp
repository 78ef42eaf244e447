#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "sim/Gesture.hpp"

struct ScriptedGesture {
  double atMs = 0.0; // simulation clock time
  GestureSymbol gesture = GestureSymbol::None;
};

// A recorded gesture timeline, replayed against the simulation clock.
//
// File format (JSON):
//   {
//     "name": "dodge-left",          optional
//     "seed": 12345,                 optional, run seed
//     "gestures": [
//       { "at": 1.25, "gesture": "LEFT" },   "at" in seconds
//       { "at": 2.0,  "gesture": "JUMP" }
//     ]
//   }
// Entries whose gesture is not recognised are dropped with a warning, as a
// missing pose is treated as no gesture.
struct GestureScript {
  std::string name;
  bool hasSeed = false;
  uint32_t seed = 0u;
  std::vector<ScriptedGesture> entries; // sorted by atMs
  size_t cursor = 0;
};

bool ParseGestureScript(GestureScript &script, const std::string &text);
bool LoadGestureScript(GestureScript &script, const char *path);

// Returns the next gesture due at or before nowMs and advances past it;
// GestureSymbol::None once nothing more is due.
GestureSymbol PopDueGesture(GestureScript &script, double nowMs);

bool IsScriptFinished(const GestureScript &script);
void RewindScript(GestureScript &script);
