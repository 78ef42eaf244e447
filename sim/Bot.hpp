#pragma once

#include <cstdint>

#include "sim/Gesture.hpp"

struct SimulationState;

// Bot behavior presets.
enum class BotStyle {
    Cautious,  // dodges into a free lane, jumps only when boxed in
    Jumper,    // never strafes, times a jump over every block in its lane
    Random,    // seeded random gestures for stress testing
    Idle,      // never gestures
};

// Deterministic gesture source for headless runs and tests.
// Uses its own RNG state so it doesn't pollute the simulation's.
struct Bot {
    BotStyle style = BotStyle::Cautious;
    uint32_t rng = 1u;
    GestureGate gate{};
};

void InitBot(Bot& bot, BotStyle style, uint32_t seed);

// Chooses this frame's gesture from the visible world. Gestures already
// filtered through the bot's cooldown gate.
GestureSymbol BotDecide(Bot& bot, const SimulationState& state);

const char* GetBotStyleName(BotStyle style);
bool ParseBotStyle(const char* text, BotStyle& out);
