#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include "sim/SimTypes.hpp"

// Renderer-side scene table fed by simulation events. Kept free of raylib so
// handle bookkeeping can be tested headless; Render.cpp only reads it.
//
// Handles pack a slot index (low 16 bits) with the slot's generation (high
// 16 bits), so a reused slot never hands out a handle that was seen before.
using RenderHandle = uint32_t;
constexpr RenderHandle kInvalidRenderHandle = 0u;

struct RenderEntity {
  EntityKind kind = EntityKind::Player;
  EntityId entityId = 0u;
  EntityTransform transform{};
  bool visible = true;
};

struct RenderSlot {
  RenderEntity entity{};
  uint32_t generation = 0u;
  bool alive = false;
};

struct RenderWorld {
  std::vector<RenderSlot> slots;
  std::vector<uint32_t> freeSlots;
  std::unordered_map<EntityId, RenderHandle> byEntity;
  int liveCount = 0;
  int ignoredCommands = 0; // updates/removals aimed at dead handles
};

RenderHandle AddEntity(RenderWorld& world, EntityKind kind,
                       const EntityTransform& initial);

// The three calls below are no-ops (returning false) for stale handles.
bool UpdateTransform(RenderWorld& world, RenderHandle handle,
                     const EntityTransform& transform);
bool RemoveEntity(RenderWorld& world, RenderHandle handle);
bool SetVisible(RenderWorld& world, RenderHandle handle, bool visible);

const RenderEntity* GetRenderEntity(const RenderWorld& world,
                                    RenderHandle handle);
RenderHandle FindHandle(const RenderWorld& world, EntityId id);

// Applies Spawned/Moved/Removed/VisibilityChanged; other event types are
// left to the caller.
void ApplySimEvents(RenderWorld& world, const SimEventList& events);

template <typename Fn> void ForEachRenderEntity(const RenderWorld& world, Fn&& fn) {
  for (const auto& slot : world.slots) {
    if (slot.alive) {
      fn(slot.entity);
    }
  }
}
