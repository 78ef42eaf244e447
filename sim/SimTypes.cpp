#include "sim/SimTypes.hpp"

#include "core/Config.hpp"

const char* GetEntityKindName(const EntityKind kind) {
  switch (kind) {
  case EntityKind::Player:
    return "player";
  case EntityKind::Obstacle:
    return "obstacle";
  case EntityKind::Tree:
    return "tree";
  case EntityKind::Grass:
    return "grass";
  case EntityKind::Flower:
    return "flower";
  }
  return "unknown";
}

const char* GetSimEventTypeName(const SimEventType type) {
  switch (type) {
  case SimEventType::Spawned:
    return "spawned";
  case SimEventType::Moved:
    return "moved";
  case SimEventType::Removed:
    return "removed";
  case SimEventType::VisibilityChanged:
    return "visibility";
  case SimEventType::Damaged:
    return "damaged";
  case SimEventType::GameOver:
    return "game_over";
  }
  return "unknown";
}

float LaneToX(const int lane) {
  return static_cast<float>(lane - kLaneCenter) * cfg::kLaneWidth;
}
