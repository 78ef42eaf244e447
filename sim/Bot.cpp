#include "sim/Bot.hpp"

#include <cstring>

#include "core/Config.hpp"
#include "core/Rng.hpp"
#include "sim/Sim.hpp"

namespace {

constexpr float kLookAheadZ = -28.0f;   // farthest block the bot reacts to
constexpr float kLaneClearBehindZ = 1.5f;
constexpr float kJumpApexFraction = 0.5f;
constexpr float kRandomGestureChance = 0.04f;

// Returns the nearest block ahead in `lane`, or nullptr.
const Obstacle* NearestAhead(const SimulationState& state, const int lane) {
    const Obstacle* best = nullptr;
    for (const auto& o : state.entities.obstacles) {
        if (o.lane != lane || o.passed) continue;
        if (o.z < kLookAheadZ || o.z >= cfg::kCollisionBandMax) continue;
        if (!best || o.z > best->z) best = &o;
    }
    return best;
}

// A lane is clear if nothing occupies it between the look-ahead and the
// player plane.
bool LaneClear(const SimulationState& state, const int lane) {
    if (!IsValidLane(lane)) return false;
    for (const auto& o : state.entities.obstacles) {
        if (o.lane != lane) continue;
        if (o.z >= kLookAheadZ && o.z <= kLaneClearBehindZ) return false;
    }
    return true;
}

// True once the block is close enough that a jump started now peaks as it
// reaches the player.
bool JumpWindowOpen(const SimulationState& state, const Obstacle& o) {
    const float secondsToPlayer = -o.z / state.speed;
    return secondsToPlayer <= cfg::kJumpDuration * kJumpApexFraction;
}

GestureSymbol DecideCautious(const SimulationState& state) {
    const PlayerState& p = state.player;
    const Obstacle* threat = NearestAhead(state, p.lane);
    if (!threat) return GestureSymbol::None;

    // Prefer the side closer to center.
    const int first = (p.lane == kLaneRight) ? -1 : ((p.lane == kLaneLeft) ? 1 : -1);
    const int second = -first;
    if (LaneClear(state, p.lane + first)) {
        return first < 0 ? GestureSymbol::Left : GestureSymbol::Right;
    }
    if (LaneClear(state, p.lane + second)) {
        return second < 0 ? GestureSymbol::Left : GestureSymbol::Right;
    }
    if (!p.isJumping && JumpWindowOpen(state, *threat)) return GestureSymbol::Jump;
    return GestureSymbol::None;
}

GestureSymbol DecideJumper(const SimulationState& state) {
    const PlayerState& p = state.player;
    const Obstacle* threat = NearestAhead(state, p.lane);
    if (threat && !p.isJumping && JumpWindowOpen(state, *threat)) return GestureSymbol::Jump;
    return GestureSymbol::None;
}

GestureSymbol DecideRandom(Bot& bot) {
    if (core::NextFloat01(bot.rng) > kRandomGestureChance) return GestureSymbol::None;
    switch (core::NextIndex(bot.rng, 3)) {
        case 0: return GestureSymbol::Jump;
        case 1: return GestureSymbol::Left;
        default: return GestureSymbol::Right;
    }
}

}  // namespace

void InitBot(Bot& bot, const BotStyle style, const uint32_t seed) {
    bot.style = style;
    bot.rng = (seed == 0u) ? 1u : seed;
    InitGestureGate(bot.gate, cfg::kLaneChangeCooldownMs, cfg::kJumpCooldownMs);
}

GestureSymbol BotDecide(Bot& bot, const SimulationState& state) {
    GestureSymbol g = GestureSymbol::None;
    switch (bot.style) {
        case BotStyle::Cautious: g = DecideCautious(state); break;
        case BotStyle::Jumper:   g = DecideJumper(state); break;
        case BotStyle::Random:   g = DecideRandom(bot); break;
        case BotStyle::Idle:     break;
    }
    return FilterGesture(bot.gate, g, state.clockMs);
}

const char* GetBotStyleName(const BotStyle style) {
    switch (style) {
        case BotStyle::Cautious: return "cautious";
        case BotStyle::Jumper:   return "jumper";
        case BotStyle::Random:   return "random";
        case BotStyle::Idle:     return "idle";
    }
    return "unknown";
}

bool ParseBotStyle(const char* text, BotStyle& out) {
    if (text == nullptr) return false;
    if (std::strcmp(text, "cautious") == 0) { out = BotStyle::Cautious; return true; }
    if (std::strcmp(text, "jumper") == 0)   { out = BotStyle::Jumper;   return true; }
    if (std::strcmp(text, "random") == 0)   { out = BotStyle::Random;   return true; }
    if (std::strcmp(text, "idle") == 0)     { out = BotStyle::Idle;     return true; }
    return false;
}
