#pragma once

#include <cstdint>

namespace core {

// Xorshift32 over caller-owned state. A zero state is remapped to a fixed
// non-zero constant so the generator never sticks.
uint32_t NextU32(uint32_t& state);

// Uniform in [0, 1].
float NextFloat01(uint32_t& state);

// Uniform in [minValue, maxValue).
float NextRange(uint32_t& state, float minValue, float maxValue);

// Uniform integer in [0, count). Returns 0 when count <= 0.
int NextIndex(uint32_t& state, int count);

}  // namespace core
