#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <set>
#include <string>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "render/RenderWorld.hpp"
#include "sim/Bot.hpp"
#include "sim/Collision.hpp"
#include "sim/Difficulty.hpp"
#include "sim/GestureScript.hpp"
#include "sim/Sim.hpp"
#include "sim/Spawner.hpp"

namespace {
constexpr float kFrameDt = 1.0f / 60.0f;

bool NearlyEqual(const float a, const float b, const float eps = 1e-4f) {
  return std::fabs(a - b) <= eps;
}

SimulationState MakeSession(const uint32_t seed = 0xC0FFEEu) {
  SimulationState state{};
  ResetSimulation(state, seed);
  state.events.clear();
  return state;
}

// Keeps the center lane clear so the player never takes damage.
void ClearPlayerLane(SimulationState &state) {
  for (auto &o : state.entities.obstacles) {
    if (o.lane == state.player.lane) {
      o.lane = (state.player.lane == kLaneLeft) ? kLaneRight : kLaneLeft;
    }
  }
}

bool TestLivesAndScoreBounds() {
  SimulationState state = MakeSession(0x1234u);
  Bot bot{};
  InitBot(bot, BotStyle::Random, 77u);

  int lastScore = 0;
  for (int i = 0; i < 60 * 90 && !state.gameOver; ++i) {
    SubmitGesture(state, BotDecide(bot, state));
    SimStep(state, kFrameDt);
    state.events.clear();
    if (state.lives < 0 || state.lives > cfg::kStartLives) {
      return false;
    }
    if (state.score < lastScore) {
      return false;
    }
    if (state.speed < cfg::kStartSpeed || state.speed > cfg::kMaxSpeed) {
      return false;
    }
    lastScore = state.score;
  }
  return true;
}

bool TestSpeedFromScore() {
  return NearlyEqual(ComputeSpeed(0), 15.0f) &&
         NearlyEqual(ComputeSpeed(50), 16.0f) &&
         NearlyEqual(ComputeSpeed(125), 17.5f) &&
         NearlyEqual(ComputeSpeed(100000), cfg::kMaxSpeed) &&
         NearlyEqual(ComputeSpeed(-10), cfg::kStartSpeed) &&
         NearlyEqual(ComputeSpeed(300), ComputeSpeed(300));
}

bool TestJumpCurve() {
  const float half = cfg::kJumpDuration * 0.5f;
  return NearlyEqual(JumpHeightAt(0.0f), 0.0f) &&
         NearlyEqual(JumpHeightAt(half), cfg::kJumpHeight) &&
         JumpHeightAt(cfg::kJumpDuration - 0.01f) < 0.25f &&
         NearlyEqual(JumpHeightAt(cfg::kJumpDuration), 0.0f) &&
         NearlyEqual(JumpHeightAt(-0.1f), 0.0f);
}

bool TestJumpLandsAfterDuration() {
  SimulationState state = MakeSession();
  SubmitGesture(state, GestureSymbol::Jump);
  SimStep(state, kFrameDt);
  if (!state.player.isJumping) {
    return false;
  }
  float peak = 0.0f;
  for (int i = 0; i < 60; ++i) {
    SimStep(state, kFrameDt);
    if (state.player.yPosition > peak) {
      peak = state.player.yPosition;
    }
  }
  return !state.player.isJumping && state.player.yPosition == 0.0f &&
         peak > 3.0f && peak <= cfg::kJumpHeight;
}

bool TestJumpIgnoredWhileAirborne() {
  PlayerState player{};
  if (!StartJump(player, 1000.0)) {
    return false;
  }
  return !StartJump(player, 1100.0) && player.jumpStartMs == 1000.0;
}

bool TestHitTakesOneLife() {
  SimulationState state = MakeSession();
  state.clockMs = 5000.0;
  AddObstacle(state.entities, kLaneCenter, 0.0f, state.events);

  const int hits = CheckCollisions(state);
  bool damaged = false;
  for (const auto &e : state.events) {
    if (e.type == SimEventType::Damaged && e.lives == 2) {
      damaged = true;
    }
  }
  return hits == 1 && state.lives == cfg::kStartLives - 1 &&
         state.player.lastHitMs == 5000.0 &&
         state.entities.obstacles.front().hit && damaged;
}

bool TestCollisionCheckIdempotent() {
  SimulationState state = MakeSession();
  state.clockMs = 5000.0;
  AddObstacle(state.entities, kLaneCenter, 0.2f, state.events);
  AddObstacle(state.entities, kLaneCenter, -0.4f, state.events);

  int hits = CheckCollisions(state);
  hits += CheckCollisions(state);
  return hits == 1 && state.lives == cfg::kStartLives - 1;
}

bool TestInvincibilityWindow() {
  PlayerState player{};
  if (IsInvincible(player, 0.0)) {
    return false;
  }
  player.lastHitMs = 1000.0;
  return IsInvincible(player, 1000.0) && IsInvincible(player, 3000.0) &&
         !IsInvincible(player, 3001.0);
}

bool TestBlinkVisibility() {
  PlayerState player{};
  player.lastHitMs = 0.0;
  return ComputeVisibility(player, 50.0) && !ComputeVisibility(player, 150.0) &&
         ComputeVisibility(player, 250.0) && ComputeVisibility(player, 2500.0);
}

bool TestJumpApexClearsObstacle() {
  SimulationState state = MakeSession();
  state.clockMs = 5000.0;
  state.player.isJumping = true;
  state.player.yPosition = 2.0f;
  AddObstacle(state.entities, kLaneCenter, 0.0f, state.events);
  return CheckCollisions(state) == 0 && state.lives == cfg::kStartLives;
}

bool TestOtherLaneNeverHits() {
  SimulationState state = MakeSession();
  state.clockMs = 5000.0;
  AddObstacle(state.entities, kLaneLeft, 0.0f, state.events);
  AddObstacle(state.entities, kLaneRight, 0.0f, state.events);
  return CheckCollisions(state) == 0;
}

bool TestCollisionBandEdges() {
  Obstacle o{};
  o.z = -1.0f;
  const bool atMin = IsInCollisionBand(o);
  o.z = 1.0f;
  const bool atMax = IsInCollisionBand(o);
  o.z = 0.99f;
  const bool inside = IsInCollisionBand(o);
  return !atMin && !atMax && inside;
}

bool TestHitObstacleStillScores() {
  SimulationState state = MakeSession();
  AddObstacle(state.entities, kLaneCenter, -1.5f, state.events);

  // One second carries the block through the player and past the pass line,
  // before the first spawned block could arrive.
  for (int i = 0; i < 60; ++i) {
    SimStep(state, kFrameDt);
  }
  return state.stats.hitsTaken == 1 && state.lives == cfg::kStartLives - 1 &&
         state.stats.obstaclesPassed == 1 &&
         state.score == cfg::kPointsPerObstacle;
}

bool TestLongFrameCannotSkipHit() {
  SimulationState state = MakeSession();
  AddObstacle(state.entities, kLaneCenter, -1.5f, state.events);

  // 0.2 s at start speed moves a block 3 units, farther than the hit band.
  SimStep(state, 0.2f);
  return state.lives == cfg::kStartLives - 1 && state.stats.hitsTaken == 1 &&
         NearlyEqual(static_cast<float>(state.clockMs), 200.0f, 0.01f);
}

bool TestLongFrameAtMaxSpeedCannotSkipHit() {
  SimulationState state = MakeSession();
  state.score = 100000;
  AddObstacle(state.entities, kLaneCenter, -1.2f, state.events);

  SimStep(state, cfg::kMaxFrameTime);
  return NearlyEqual(state.speed, cfg::kMaxSpeed) &&
         state.lives == cfg::kStartLives - 1;
}

bool TestGameOverFrameScoresPasses() {
  SimulationState state = MakeSession();
  state.lives = 1;
  AddObstacle(state.entities, kLaneCenter, -0.1f, state.events);
  AddObstacle(state.entities, kLaneLeft, 4.9f, state.events);

  SimStep(state, kFrameDt);

  int reported = -1;
  for (const auto &e : state.events) {
    if (e.type == SimEventType::GameOver) {
      reported = e.score;
    }
  }
  const Obstacle *side = nullptr;
  for (const auto &o : state.entities.obstacles) {
    if (o.lane == kLaneLeft) {
      side = &o;
    }
  }
  return state.gameOver && state.score == cfg::kPointsPerObstacle &&
         reported == state.score && side != nullptr && side->passed;
}

bool TestCleanRunFiftySeconds() {
  SimulationState state = MakeSession(0xBEEFu);
  float lastSpeed = state.speed;
  for (int i = 0; i < 60 * 50; ++i) {
    ClearPlayerLane(state);
    SimStep(state, kFrameDt);
    state.events.clear();
    if (state.speed < lastSpeed) {
      return false;
    }
    lastSpeed = state.speed;
  }
  return state.lives == cfg::kStartLives && !state.gameOver &&
         state.speed > cfg::kStartSpeed && state.score > 0 &&
         state.score % cfg::kPointsPerObstacle == 0;
}

bool TestFirstObstacleTiming() {
  SimulationState state = MakeSession();
  for (int i = 0; i < 14; ++i) {
    SimStep(state, 0.1f);
  }
  if (!state.entities.obstacles.empty()) {
    return false;
  }
  for (int i = 0; i < 6; ++i) {
    SimStep(state, 0.1f);
  }
  return state.entities.obstacles.size() == 1;
}

bool TestSpawnIntervalScaling() {
  return NearlyEqual(ObstacleSpawnIntervalMs(15.0f), 1500.0f, 0.01f) &&
         NearlyEqual(ObstacleSpawnIntervalMs(30.0f), 750.0f, 0.01f) &&
         NearlyEqual(ObstacleSpawnIntervalMs(0.0f), 1500.0f, 0.01f) &&
         NearlyEqual(DecorationSpawnIntervalMs(15.0f), 300.0f, 0.01f);
}

bool TestDecorationWeights() {
  return PickDecorationKind(0.0f) == DecorationKind::Grass &&
         PickDecorationKind(0.59f) == DecorationKind::Grass &&
         PickDecorationKind(0.7f) == DecorationKind::Flower &&
         PickDecorationKind(0.95f) == DecorationKind::Tree;
}

bool TestEntityIdsUnique() {
  SimulationState state = MakeSession();
  std::set<EntityId> ids;
  for (int i = 0; i < 20; ++i) {
    const Obstacle &o = SpawnObstacle(state);
    const Decoration &d = SpawnDecoration(state);
    if (o.id == kPlayerEntityId || !ids.insert(o.id).second ||
        !ids.insert(d.id).second) {
      return false;
    }
  }
  return true;
}

bool TestEntityIdsSurviveReset() {
  SimulationState state = MakeSession();
  const EntityId before = SpawnObstacle(state).id;
  ResetSimulation(state, 5u);
  const EntityId after = SpawnObstacle(state).id;
  return after > before;
}

bool TestRenderHandlesDistinct() {
  RenderWorld world{};
  const RenderHandle a = AddEntity(world, EntityKind::Obstacle, EntityTransform{});
  if (!RemoveEntity(world, a)) {
    return false;
  }
  const RenderHandle b = AddEntity(world, EntityKind::Obstacle, EntityTransform{});
  const RenderHandle c = AddEntity(world, EntityKind::Tree, EntityTransform{});
  return a != kInvalidRenderHandle && b != kInvalidRenderHandle && a != b &&
         b != c && world.liveCount == 2;
}

bool TestStaleHandleIsNoOp() {
  RenderWorld world{};
  EntityTransform t{};
  const RenderHandle h = AddEntity(world, EntityKind::Grass, t);
  RemoveEntity(world, h);
  t.z = 4.0f;
  const bool updated = UpdateTransform(world, h, t);
  const bool removed = RemoveEntity(world, h);
  const bool shown = SetVisible(world, h, false);
  return !updated && !removed && !shown && world.liveCount == 0 &&
         GetRenderEntity(world, h) == nullptr &&
         GetRenderEntity(world, kInvalidRenderHandle) == nullptr &&
         world.ignoredCommands == 3;
}

bool TestRenderWorldTracksSimulation() {
  SimulationState state{};
  ResetSimulation(state, 0x42u);
  RenderWorld world{};
  ApplySimEvents(world, TakeEvents(state));

  for (int i = 0; i < 60 * 20; ++i) {
    ClearPlayerLane(state);
    SimStep(state, kFrameDt);
    ApplySimEvents(world, TakeEvents(state));
  }
  const int expected = GetLiveEntityCount(state.entities) + 1;
  if (world.liveCount != expected || world.ignoredCommands != 0) {
    return false;
  }

  for (const auto &o : state.entities.obstacles) {
    const RenderEntity *e = GetRenderEntity(world, FindHandle(world, o.id));
    if (e == nullptr || e->kind != EntityKind::Obstacle ||
        !NearlyEqual(e->transform.z, o.z)) {
      return false;
    }
  }
  return true;
}

bool TestResetReleasesHandles() {
  SimulationState state{};
  ResetSimulation(state, 0x99u);
  RenderWorld world{};
  ApplySimEvents(world, TakeEvents(state));

  for (int i = 0; i < 60 * 10; ++i) {
    SimStep(state, kFrameDt);
    ApplySimEvents(world, TakeEvents(state));
  }
  if (world.liveCount <= 1) {
    return false;
  }

  ResetSimulation(state, 0x99u);
  const SimEventList events = TakeEvents(state);
  ApplySimEvents(world, events);

  // The new player's Spawned must come after every Removed.
  bool seenSpawn = false;
  for (const auto &e : events) {
    if (e.type == SimEventType::Spawned) {
      seenSpawn = true;
    } else if (e.type == SimEventType::Removed && seenSpawn) {
      return false;
    }
  }
  return seenSpawn && world.liveCount == 1 && world.ignoredCommands == 0 &&
         FindHandle(world, kPlayerEntityId) != kInvalidRenderHandle;
}

bool TestEventOrderPerEntity() {
  SimulationState state = MakeSession(0x7777u);
  std::set<EntityId> live{kPlayerEntityId};
  std::set<EntityId> removed;

  for (int i = 0; i < 60 * 30; ++i) {
    ClearPlayerLane(state);
    SimStep(state, kFrameDt);
    for (const auto &e : TakeEvents(state)) {
      if (removed.count(e.id) != 0) {
        return false;
      }
      if (e.type == SimEventType::Spawned) {
        if (!live.insert(e.id).second) {
          return false;
        }
      } else if (live.count(e.id) == 0) {
        return false;
      } else if (e.type == SimEventType::Removed) {
        live.erase(e.id);
        removed.insert(e.id);
      }
    }
  }
  return !removed.empty();
}

bool TestDeterministicSeed() {
  SimulationState a = MakeSession(0xABCDu);
  SimulationState b = MakeSession(0xABCDu);
  Bot botA{};
  Bot botB{};
  InitBot(botA, BotStyle::Random, 9u);
  InitBot(botB, BotStyle::Random, 9u);

  for (int i = 0; i < 60 * 40; ++i) {
    SubmitGesture(a, BotDecide(botA, a));
    SubmitGesture(b, BotDecide(botB, b));
    SimStep(a, kFrameDt);
    SimStep(b, kFrameDt);
    a.events.clear();
    b.events.clear();
  }
  if (a.score != b.score || a.lives != b.lives || a.gameOver != b.gameOver ||
      a.player.lane != b.player.lane ||
      a.entities.obstacles.size() != b.entities.obstacles.size()) {
    return false;
  }
  for (size_t i = 0; i < a.entities.obstacles.size(); ++i) {
    if (a.entities.obstacles[i].lane != b.entities.obstacles[i].lane ||
        a.entities.obstacles[i].z != b.entities.obstacles[i].z) {
      return false;
    }
  }
  return true;
}

bool TestPauseFreezesWorld() {
  SimulationState state = MakeSession();
  for (int i = 0; i < 120; ++i) {
    SimStep(state, kFrameDt);
  }
  state.events.clear();
  const double clock = state.clockMs;
  const size_t obstacles = state.entities.obstacles.size();

  PauseSimulation(state);
  SubmitGesture(state, GestureSymbol::Left);
  for (int i = 0; i < 300; ++i) {
    SimStep(state, kFrameDt);
  }
  if (state.clockMs != clock || !state.events.empty() ||
      state.entities.obstacles.size() != obstacles ||
      state.player.pendingLaneDelta != 0) {
    return false;
  }

  ResumeSimulation(state);
  SimStep(state, kFrameDt);
  return state.clockMs > clock && state.player.lane == kLaneCenter;
}

bool TestPauseKeepsPendingIntents() {
  SimulationState state = MakeSession();
  SubmitGesture(state, GestureSymbol::Jump);
  SubmitGesture(state, GestureSymbol::Left);
  PauseSimulation(state);
  ResumeSimulation(state);
  SimStep(state, kFrameDt);
  return state.player.isJumping && state.player.lane == kLaneLeft;
}

bool TestLaneClamp() {
  SimulationState state = MakeSession();
  for (int i = 0; i < 3; ++i) {
    SubmitGesture(state, GestureSymbol::Left);
    SimStep(state, kFrameDt);
  }
  if (state.player.lane != kLaneLeft) {
    return false;
  }
  for (int i = 0; i < 4; ++i) {
    SubmitGesture(state, GestureSymbol::Right);
    SimStep(state, kFrameDt);
  }
  return state.player.lane == kLaneRight;
}

bool TestLatestLaneIntentWins() {
  SimulationState state = MakeSession();
  SubmitGesture(state, GestureSymbol::Left);
  SubmitGesture(state, GestureSymbol::Right);
  SimStep(state, kFrameDt);
  return state.player.lane == kLaneRight;
}

bool TestVisualXConverges() {
  SimulationState state = MakeSession();
  SubmitGesture(state, GestureSymbol::Right);
  SimStep(state, kFrameDt);
  const float first = state.player.visualX;
  for (int i = 0; i < 120; ++i) {
    SimStep(state, kFrameDt);
  }
  return first > 0.0f && first < cfg::kLaneWidth &&
         NearlyEqual(state.player.visualX, LaneToX(kLaneRight), 0.01f);
}

bool TestGestureGateCooldowns() {
  GestureGate gate{};
  InitGestureGate(gate, cfg::kLaneChangeCooldownMs, cfg::kJumpCooldownMs);
  return FilterGesture(gate, GestureSymbol::Left, 0.0) == GestureSymbol::Left &&
         FilterGesture(gate, GestureSymbol::Right, 100.0) == GestureSymbol::None &&
         FilterGesture(gate, GestureSymbol::Jump, 100.0) == GestureSymbol::Jump &&
         FilterGesture(gate, GestureSymbol::Right, 401.0) == GestureSymbol::Right &&
         FilterGesture(gate, GestureSymbol::Jump, 500.0) == GestureSymbol::None &&
         FilterGesture(gate, GestureSymbol::Jump, 901.0) == GestureSymbol::Jump &&
         FilterGesture(gate, GestureSymbol::None, 5000.0) == GestureSymbol::None;
}

bool TestParseGesture() {
  return ParseGesture("JUMP") == GestureSymbol::Jump &&
         ParseGesture("left") == GestureSymbol::Left &&
         ParseGesture("Right") == GestureSymbol::Right &&
         ParseGesture("NONE") == GestureSymbol::None &&
         ParseGesture("sideways") == GestureSymbol::None &&
         ParseGesture("") == GestureSymbol::None &&
         ParseGesture(nullptr) == GestureSymbol::None;
}

bool TestGameOverFreezes() {
  SimulationState state = MakeSession();
  state.lives = 1;
  state.clockMs = 8000.0;
  AddObstacle(state.entities, kLaneCenter, 0.0f, state.events);
  CheckCollisions(state);
  if (!state.gameOver || state.lives != 0) {
    return false;
  }
  bool sawGameOver = false;
  for (const auto &e : state.events) {
    if (e.type == SimEventType::GameOver && e.lives == 0) {
      sawGameOver = true;
    }
  }
  state.events.clear();

  const int score = state.score;
  SubmitGesture(state, GestureSymbol::Jump);
  SimStep(state, kFrameDt);
  return sawGameOver && state.clockMs == 8000.0 && state.score == score &&
         state.events.empty() && !state.player.pendingJump &&
         !IsSimulationRunning(state);
}

bool TestBadDeltaIgnored() {
  SimulationState state = MakeSession();
  SimStep(state, -1.0f);
  SimStep(state, std::numeric_limits<float>::quiet_NaN());
  const bool frozen = state.clockMs == 0.0;
  SimStep(state, 10.0f);
  return frozen && NearlyEqual(static_cast<float>(state.clockMs),
                               cfg::kMaxFrameTime * 1000.0f, 0.01f) &&
         SanitizeDelta(-0.5f) == 0.0f;
}

bool TestRemoveUnknownEntity() {
  EntityStore store{};
  SimEventList events;
  const bool obstacle = RemoveObstacle(store, 1234u, events);
  const bool decoration = RemoveDecoration(store, 1234u, events);
  return !obstacle && !decoration && events.empty();
}

bool TestRemoveDecorationById() {
  EntityStore store{};
  SimEventList events;
  const EntityId id =
      AddDecoration(store, 8.0f, -60.0f, DecorationKind::Tree, 0.0f, 1.0f, events).id;
  if (FindDecoration(store, id) == nullptr) {
    return false;
  }
  const bool removed = RemoveDecoration(store, id, events);
  return removed && FindDecoration(store, id) == nullptr &&
         events.size() == 2 && events.back().type == SimEventType::Removed &&
         events.back().kind == EntityKind::Tree;
}

bool TestDecorationsRetire() {
  SimulationState state = MakeSession();
  for (int i = 0; i < 60 * 15; ++i) {
    ClearPlayerLane(state);
    SimStep(state, kFrameDt);
    state.events.clear();
  }
  for (const auto &d : state.entities.decorations) {
    if (d.z > cfg::kDecorationRetireZ || std::fabs(d.x) < cfg::kDecorationBaseOffset) {
      return false;
    }
  }
  return state.stats.decorationsRetired > 0;
}

bool TestBotRespectsCooldown() {
  SimulationState state = MakeSession(0x51u);
  Bot bot{};
  InitBot(bot, BotStyle::Random, 3u);
  double lastLane = -1.0e9;
  for (int i = 0; i < 60 * 30 && !state.gameOver; ++i) {
    const GestureSymbol g = BotDecide(bot, state);
    if (g == GestureSymbol::Left || g == GestureSymbol::Right) {
      if (state.clockMs - lastLane < cfg::kLaneChangeCooldownMs) {
        return false;
      }
      lastLane = state.clockMs;
    }
    SubmitGesture(state, g);
    SimStep(state, kFrameDt);
    state.events.clear();
  }
  return true;
}

bool TestGestureScriptReplay() {
  GestureScript script{};
  const std::string text = R"({
    "name": "weave",
    "seed": 99,
    "gestures": [
      { "at": 2.0, "gesture": "JUMP" },
      { "at": 0.5, "gesture": "left" },
      { "at": 1.0, "gesture": "wave" }
    ]
  })";
  if (!ParseGestureScript(script, text)) {
    return false;
  }
  if (script.name != "weave" || !script.hasSeed || script.seed != 99u ||
      script.entries.size() != 2) {
    return false;
  }
  const bool early = PopDueGesture(script, 100.0) == GestureSymbol::None;
  const bool left = PopDueGesture(script, 600.0) == GestureSymbol::Left;
  const bool none = PopDueGesture(script, 600.0) == GestureSymbol::None;
  const bool jump = PopDueGesture(script, 2500.0) == GestureSymbol::Jump;
  const bool done = IsScriptFinished(script);
  RewindScript(script);
  return early && left && none && jump && done && !IsScriptFinished(script);
}

bool TestGestureScriptRejectsMalformed() {
  GestureScript script{};
  return !ParseGestureScript(script, "{ not json") &&
         !ParseGestureScript(script, R"({"gestures": 5})");
}

} // namespace

int main() {
  Log::Init(false);
  Log::SetLevel(spdlog::level::warn);
  int failed = 0;

  auto run = [&](const char *name, const bool ok) {
    if (!ok) {
      std::cerr << "[FAIL] " << name << '\n';
      ++failed;
    } else {
      std::cout << "[PASS] " << name << '\n';
    }
  };

  run("lives_and_score_bounds", TestLivesAndScoreBounds());
  run("speed_from_score", TestSpeedFromScore());
  run("jump_curve", TestJumpCurve());
  run("jump_lands_after_duration", TestJumpLandsAfterDuration());
  run("jump_ignored_while_airborne", TestJumpIgnoredWhileAirborne());
  run("hit_takes_one_life", TestHitTakesOneLife());
  run("collision_check_idempotent", TestCollisionCheckIdempotent());
  run("invincibility_window", TestInvincibilityWindow());
  run("blink_visibility", TestBlinkVisibility());
  run("jump_apex_clears_obstacle", TestJumpApexClearsObstacle());
  run("other_lane_never_hits", TestOtherLaneNeverHits());
  run("collision_band_edges", TestCollisionBandEdges());
  run("hit_obstacle_still_scores", TestHitObstacleStillScores());
  run("long_frame_cannot_skip_hit", TestLongFrameCannotSkipHit());
  run("long_frame_at_max_speed_cannot_skip_hit",
      TestLongFrameAtMaxSpeedCannotSkipHit());
  run("game_over_frame_scores_passes", TestGameOverFrameScoresPasses());
  run("clean_run_fifty_seconds", TestCleanRunFiftySeconds());
  run("first_obstacle_timing", TestFirstObstacleTiming());
  run("spawn_interval_scaling", TestSpawnIntervalScaling());
  run("decoration_weights", TestDecorationWeights());
  run("entity_ids_unique", TestEntityIdsUnique());
  run("entity_ids_survive_reset", TestEntityIdsSurviveReset());
  run("render_handles_distinct", TestRenderHandlesDistinct());
  run("stale_handle_is_no_op", TestStaleHandleIsNoOp());
  run("render_world_tracks_simulation", TestRenderWorldTracksSimulation());
  run("reset_releases_handles", TestResetReleasesHandles());
  run("event_order_per_entity", TestEventOrderPerEntity());
  run("deterministic_seed", TestDeterministicSeed());
  run("pause_freezes_world", TestPauseFreezesWorld());
  run("pause_keeps_pending_intents", TestPauseKeepsPendingIntents());
  run("lane_clamp", TestLaneClamp());
  run("latest_lane_intent_wins", TestLatestLaneIntentWins());
  run("visual_x_converges", TestVisualXConverges());
  run("gesture_gate_cooldowns", TestGestureGateCooldowns());
  run("parse_gesture", TestParseGesture());
  run("game_over_freezes", TestGameOverFreezes());
  run("bad_delta_ignored", TestBadDeltaIgnored());
  run("remove_unknown_entity", TestRemoveUnknownEntity());
  run("remove_decoration_by_id", TestRemoveDecorationById());
  run("decorations_retire", TestDecorationsRetire());
  run("bot_respects_cooldown", TestBotRespectsCooldown());
  run("gesture_script_replay", TestGestureScriptReplay());
  run("gesture_script_rejects_malformed", TestGestureScriptRejectsMalformed());

  Log::Shutdown();
  return (failed == 0) ? 0 : 1;
}
