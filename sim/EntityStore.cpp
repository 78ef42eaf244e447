#include "sim/EntityStore.hpp"

#include <algorithm>

#include "core/Config.hpp"

namespace {

constexpr float kObstacleCenterY = 0.5f;

SimEvent MakeEvent(const SimEventType type, const EntityId id,
                   const EntityKind kind, const EntityTransform &transform) {
  SimEvent e{};
  e.type = type;
  e.id = id;
  e.kind = kind;
  e.transform = transform;
  return e;
}

} // namespace

EntityKind ToEntityKind(const DecorationKind kind) {
  switch (kind) {
  case DecorationKind::Tree:
    return EntityKind::Tree;
  case DecorationKind::Flower:
    return EntityKind::Flower;
  case DecorationKind::Grass:
    break;
  }
  return EntityKind::Grass;
}

EntityTransform GetObstacleTransform(const Obstacle &obstacle) {
  EntityTransform t{};
  t.x = LaneToX(obstacle.lane);
  t.y = kObstacleCenterY;
  t.z = obstacle.z;
  return t;
}

EntityTransform GetDecorationTransform(const Decoration &decoration) {
  EntityTransform t{};
  t.x = decoration.x;
  t.y = 0.0f;
  t.z = decoration.z;
  t.rotation = decoration.rotation;
  t.scale = decoration.scale;
  return t;
}

EntityId AllocateEntityId(EntityStore &store) { return store.nextId++; }

Obstacle &AddObstacle(EntityStore &store, const int lane, const float z,
                      SimEventList &events) {
  Obstacle o{};
  o.id = AllocateEntityId(store);
  o.lane = IsValidLane(lane) ? lane : kLaneCenter;
  o.z = z;
  store.obstacles.push_back(o);
  events.push_back(MakeEvent(SimEventType::Spawned, o.id, EntityKind::Obstacle,
                             GetObstacleTransform(o)));
  return store.obstacles.back();
}

Decoration &AddDecoration(EntityStore &store, const float x, const float z,
                          const DecorationKind kind, const float rotation,
                          const float scale, SimEventList &events) {
  Decoration d{};
  d.id = AllocateEntityId(store);
  d.x = x;
  d.z = z;
  d.kind = kind;
  d.rotation = rotation;
  d.scale = scale;
  store.decorations.push_back(d);
  events.push_back(MakeEvent(SimEventType::Spawned, d.id, ToEntityKind(kind),
                             GetDecorationTransform(d)));
  return store.decorations.back();
}

Obstacle *FindObstacle(EntityStore &store, const EntityId id) {
  for (auto &o : store.obstacles) {
    if (o.id == id) {
      return &o;
    }
  }
  return nullptr;
}

const Obstacle *FindObstacle(const EntityStore &store, const EntityId id) {
  for (const auto &o : store.obstacles) {
    if (o.id == id) {
      return &o;
    }
  }
  return nullptr;
}

Decoration *FindDecoration(EntityStore &store, const EntityId id) {
  for (auto &d : store.decorations) {
    if (d.id == id) {
      return &d;
    }
  }
  return nullptr;
}

bool RemoveObstacle(EntityStore &store, const EntityId id,
                    SimEventList &events) {
  auto it = std::find_if(store.obstacles.begin(), store.obstacles.end(),
                         [id](const Obstacle &o) { return o.id == id; });
  if (it == store.obstacles.end()) {
    return false;
  }
  events.push_back(MakeEvent(SimEventType::Removed, it->id,
                             EntityKind::Obstacle, GetObstacleTransform(*it)));
  store.obstacles.erase(it);
  return true;
}

bool RemoveDecoration(EntityStore &store, const EntityId id,
                      SimEventList &events) {
  auto it = std::find_if(store.decorations.begin(), store.decorations.end(),
                         [id](const Decoration &d) { return d.id == id; });
  if (it == store.decorations.end()) {
    return false;
  }
  events.push_back(MakeEvent(SimEventType::Removed, it->id,
                             ToEntityKind(it->kind),
                             GetDecorationTransform(*it)));
  store.decorations.erase(it);
  return true;
}

void AdvanceObstacles(EntityStore &store, const float speed, const float dt,
                      SimEventList &events) {
  const float step = speed * dt;
  for (auto &o : store.obstacles) {
    o.z += step;
    events.push_back(MakeEvent(SimEventType::Moved, o.id, EntityKind::Obstacle,
                               GetObstacleTransform(o)));
  }
}

int MarkPassedObstacles(EntityStore &store) {
  int passed = 0;
  for (auto &o : store.obstacles) {
    if (!o.passed && o.z > cfg::kObstaclePassZ) {
      o.passed = true;
      ++passed;
    }
  }
  return passed;
}

int RetireObstacles(EntityStore &store, SimEventList &events) {
  int writeIdx = 0;
  int retired = 0;
  const int count = static_cast<int>(store.obstacles.size());
  for (int i = 0; i < count; ++i) {
    const Obstacle &o = store.obstacles[i];
    if (o.z > cfg::kObstacleRetireZ) {
      events.push_back(MakeEvent(SimEventType::Removed, o.id,
                                 EntityKind::Obstacle,
                                 GetObstacleTransform(o)));
      ++retired;
      continue;
    }
    if (writeIdx != i) {
      store.obstacles[writeIdx] = o;
    }
    ++writeIdx;
  }
  store.obstacles.resize(static_cast<size_t>(writeIdx));
  return retired;
}

int AdvanceDecorations(EntityStore &store, const float speed, const float dt,
                       SimEventList &events) {
  const float step = speed * dt;
  int writeIdx = 0;
  int retired = 0;
  const int count = static_cast<int>(store.decorations.size());
  for (int i = 0; i < count; ++i) {
    Decoration &d = store.decorations[i];
    d.z += step;
    const EntityKind kind = ToEntityKind(d.kind);
    if (d.z > cfg::kDecorationRetireZ) {
      events.push_back(MakeEvent(SimEventType::Removed, d.id, kind,
                                 GetDecorationTransform(d)));
      ++retired;
      continue;
    }
    events.push_back(
        MakeEvent(SimEventType::Moved, d.id, kind, GetDecorationTransform(d)));
    if (writeIdx != i) {
      store.decorations[writeIdx] = d;
    }
    ++writeIdx;
  }
  store.decorations.resize(static_cast<size_t>(writeIdx));
  return retired;
}

void ClearEntities(EntityStore &store, SimEventList &events) {
  for (const auto &o : store.obstacles) {
    events.push_back(MakeEvent(SimEventType::Removed, o.id,
                               EntityKind::Obstacle, GetObstacleTransform(o)));
  }
  for (const auto &d : store.decorations) {
    events.push_back(MakeEvent(SimEventType::Removed, d.id,
                               ToEntityKind(d.kind),
                               GetDecorationTransform(d)));
  }
  store.obstacles.clear();
  store.decorations.clear();
}

int GetLiveEntityCount(const EntityStore &store) {
  return static_cast<int>(store.obstacles.size() + store.decorations.size());
}
