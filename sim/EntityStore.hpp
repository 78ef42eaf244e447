#pragma once

#include <vector>

#include "sim/SimTypes.hpp"

enum class DecorationKind : int {
  Tree = 0,
  Grass = 1,
  Flower = 2,
};

// A lava block occupying one lane. Sits on the floor (y = 0.5 center).
struct Obstacle {
  EntityId id = 0u;
  int lane = kLaneCenter;
  float z = 0.0f;
  bool passed = false;  // already scored
  bool hit = false;     // caused a confirmed hit; does not affect scoring
};

// Cosmetic scenery beside the corridor. Never collides.
struct Decoration {
  EntityId id = 0u;
  float x = 0.0f;
  float z = 0.0f;
  DecorationKind kind = DecorationKind::Grass;
  float rotation = 0.0f;
  float scale = 1.0f;
};

// Live entity records. Storage order is irrelevant; ids are unique for the
// lifetime of the store, including across Clear().
struct EntityStore {
  std::vector<Obstacle> obstacles;
  std::vector<Decoration> decorations;
  EntityId nextId = 1u;
};

EntityKind ToEntityKind(DecorationKind kind);

EntityTransform GetObstacleTransform(const Obstacle& obstacle);
EntityTransform GetDecorationTransform(const Decoration& decoration);

EntityId AllocateEntityId(EntityStore& store);

Obstacle& AddObstacle(EntityStore& store, int lane, float z,
                      SimEventList& events);
Decoration& AddDecoration(EntityStore& store, float x, float z,
                          DecorationKind kind, float rotation, float scale,
                          SimEventList& events);

Obstacle* FindObstacle(EntityStore& store, EntityId id);
const Obstacle* FindObstacle(const EntityStore& store, EntityId id);
Decoration* FindDecoration(EntityStore& store, EntityId id);

// Unknown ids are ignored and return false without emitting anything.
bool RemoveObstacle(EntityStore& store, EntityId id, SimEventList& events);
bool RemoveDecoration(EntityStore& store, EntityId id, SimEventList& events);

// z += speed * dt for every obstacle, one Moved event each.
void AdvanceObstacles(EntityStore& store, float speed, float dt,
                      SimEventList& events);

// Flags obstacles past the pass line. Returns how many crossed this call.
int MarkPassedObstacles(EntityStore& store);

// Removes obstacles past the retirement line. Returns how many were retired.
int RetireObstacles(EntityStore& store, SimEventList& events);

// Moves decorations and retires those past their line in one sweep.
// Returns how many were retired.
int AdvanceDecorations(EntityStore& store, float speed, float dt,
                       SimEventList& events);

// Removes every live entity, emitting Removed for each. Keeps nextId.
void ClearEntities(EntityStore& store, SimEventList& events);

int GetLiveEntityCount(const EntityStore& store);
