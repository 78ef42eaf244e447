#include "render/RenderWorld.hpp"

#include "core/Log.hpp"

namespace {

constexpr uint32_t kSlotBits = 16u;
constexpr uint32_t kSlotMask = (1u << kSlotBits) - 1u;

RenderHandle MakeHandle(const uint32_t slot, const uint32_t generation) {
  return (generation << kSlotBits) | slot;
}

// Slot index of a live handle, or -1.
int ResolveSlot(const RenderWorld& world, const RenderHandle handle) {
  if (handle == kInvalidRenderHandle) {
    return -1;
  }
  const uint32_t slot = handle & kSlotMask;
  const uint32_t generation = handle >> kSlotBits;
  if (slot >= world.slots.size()) {
    return -1;
  }
  const RenderSlot& s = world.slots[slot];
  if (!s.alive || s.generation != generation) {
    return -1;
  }
  return static_cast<int>(slot);
}

RenderSlot* Resolve(RenderWorld& world, const RenderHandle handle) {
  const int slot = ResolveSlot(world, handle);
  return (slot >= 0) ? &world.slots[slot] : nullptr;
}

} // namespace

RenderHandle AddEntity(RenderWorld& world, const EntityKind kind,
                       const EntityTransform& initial) {
  uint32_t slot = 0u;
  if (!world.freeSlots.empty()) {
    slot = world.freeSlots.back();
    world.freeSlots.pop_back();
  } else {
    if (world.slots.size() > kSlotMask) {
      LOG_ERROR("Render world is full ({} slots)", world.slots.size());
      return kInvalidRenderHandle;
    }
    slot = static_cast<uint32_t>(world.slots.size());
    world.slots.push_back(RenderSlot{});
  }

  RenderSlot& s = world.slots[slot];
  // Generation 0 is never issued so slot 0 cannot produce handle 0.
  s.generation = ((s.generation + 1u) & kSlotMask) == 0u ? 1u : s.generation + 1u;
  s.alive = true;
  s.entity = RenderEntity{};
  s.entity.kind = kind;
  s.entity.transform = initial;
  ++world.liveCount;
  return MakeHandle(slot, s.generation);
}

bool UpdateTransform(RenderWorld& world, const RenderHandle handle,
                     const EntityTransform& transform) {
  RenderSlot* s = Resolve(world, handle);
  if (!s) {
    ++world.ignoredCommands;
    return false;
  }
  s->entity.transform = transform;
  return true;
}

bool RemoveEntity(RenderWorld& world, const RenderHandle handle) {
  RenderSlot* s = Resolve(world, handle);
  if (!s) {
    ++world.ignoredCommands;
    return false;
  }
  s->alive = false;
  world.freeSlots.push_back(handle & kSlotMask);
  --world.liveCount;
  return true;
}

bool SetVisible(RenderWorld& world, const RenderHandle handle,
                const bool visible) {
  RenderSlot* s = Resolve(world, handle);
  if (!s) {
    ++world.ignoredCommands;
    return false;
  }
  s->entity.visible = visible;
  return true;
}

const RenderEntity* GetRenderEntity(const RenderWorld& world,
                                    const RenderHandle handle) {
  const int slot = ResolveSlot(world, handle);
  return (slot >= 0) ? &world.slots[slot].entity : nullptr;
}

RenderHandle FindHandle(const RenderWorld& world, const EntityId id) {
  auto it = world.byEntity.find(id);
  return (it != world.byEntity.end()) ? it->second : kInvalidRenderHandle;
}

void ApplySimEvents(RenderWorld& world, const SimEventList& events) {
  for (const auto& e : events) {
    switch (e.type) {
    case SimEventType::Spawned: {
      const RenderHandle stale = FindHandle(world, e.id);
      if (stale != kInvalidRenderHandle) {
        LOG_WARN("{} {} spawned twice; dropping old handle",
                 GetEntityKindName(e.kind), e.id);
        RemoveEntity(world, stale);
      }
      const RenderHandle h = AddEntity(world, e.kind, e.transform);
      if (h != kInvalidRenderHandle) {
        world.slots[h & kSlotMask].entity.entityId = e.id;
        world.slots[h & kSlotMask].entity.visible = e.visible;
        world.byEntity[e.id] = h;
      }
      break;
    }
    case SimEventType::Moved:
      UpdateTransform(world, FindHandle(world, e.id), e.transform);
      break;
    case SimEventType::Removed: {
      const RenderHandle h = FindHandle(world, e.id);
      RemoveEntity(world, h);
      world.byEntity.erase(e.id);
      break;
    }
    case SimEventType::VisibilityChanged:
      SetVisible(world, FindHandle(world, e.id), e.visible);
      break;
    case SimEventType::Damaged:
    case SimEventType::GameOver:
      break;
    }
  }
}
