#pragma once

#include <cstdint>
#include <vector>

using EntityId = uint32_t;

// The player owns a fixed id; spawned entities count up from 1.
constexpr EntityId kPlayerEntityId = 0u;

constexpr int kLaneLeft = 0;
constexpr int kLaneCenter = 1;
constexpr int kLaneRight = 2;

enum class EntityKind : int {
  Player = 0,
  Obstacle = 1,
  Tree = 2,
  Grass = 3,
  Flower = 4,
};

struct EntityTransform {
  float x = 0.0f;
  float y = 0.0f;
  float z = 0.0f;
  float rotation = 0.0f; // radians around Y
  float scale = 1.0f;
};

// Commands the simulation hands to whatever presents it. Entity events come
// in Spawned -> Moved* -> Removed order per id; Damaged and GameOver carry the
// player id and the session counters at the time they happened.
enum class SimEventType : int {
  Spawned = 0,
  Moved = 1,
  Removed = 2,
  VisibilityChanged = 3,
  Damaged = 4,
  GameOver = 5,
};

struct SimEvent {
  SimEventType type = SimEventType::Moved;
  EntityId id = kPlayerEntityId;
  EntityKind kind = EntityKind::Player;
  EntityTransform transform{};
  bool visible = true;
  int score = 0;
  int lives = 0;
};

using SimEventList = std::vector<SimEvent>;

const char* GetEntityKindName(EntityKind kind);
const char* GetSimEventTypeName(SimEventType type);

inline bool IsValidLane(const int lane) {
  return lane >= kLaneLeft && lane <= kLaneRight;
}

// Lateral world position of a lane center.
float LaneToX(int lane);
