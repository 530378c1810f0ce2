/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/EntityRegistry.hpp"
#include "core/Logger.hpp"
#include "render/IPresentationSurface.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace TesselEngine {

namespace {

void eraseHandle(std::vector<EntityHandle>& family, EntityHandle handle) {
    auto it = std::find(family.begin(), family.end(), handle);
    if (it != family.end()) {
        family.erase(it);
    }
}

} // anonymous namespace

EntityRegistry::EntityRegistry(IPresentationSurface& surface)
    : m_surface(surface) {}

EntityRegistry::~EntityRegistry() {
    // Drawables still on the surface belong to entities of this registry
    for (const auto& slot : m_slots) {
        if (slot.alive && slot.renderable && slot.renderable->drawable) {
            m_surface.removeDrawable(slot.renderable->drawable);
        }
    }
}

EntityHandle EntityRegistry::createSpawnRequest(SpawnRequest request) {
    EntityHandle handle = allocateSlot(EntityKind::SpawnRequest);
    m_slots[handle.index].spawnRequest = std::move(request);
    m_spawnRequests.push_back(handle);
    return handle;
}

EntityHandle EntityRegistry::createAnimatedImage(RenderableImage image, AnimationState animation) {
    if (!image.drawable) {
        throw std::invalid_argument("createAnimatedImage: RenderableImage has no drawable");
    }

    EntityHandle handle = allocateSlot(EntityKind::AnimatedImage);
    Slot& slot = m_slots[handle.index];
    slot.renderable = std::move(image);
    slot.animation = std::move(animation);

    try {
        m_surface.addDrawable(slot.renderable->drawable);
    } catch (...) {
        freeSlot(handle.index);
        throw;
    }

    m_renderables.push_back(handle);
    m_animated.push_back(handle);
    ENTITY_DEBUG(std::format("Created {}", handle.toString()));
    return handle;
}

void EntityRegistry::destroyEntity(EntityHandle handle) {
    Slot* slot = findSlot(handle);
    if (slot == nullptr) {
        ENTITY_DEBUG(std::format("destroyEntity: ignoring stale {}", handle.toString()));
        return;
    }
    if (slot->pendingDestruction) {
        return;
    }
    slot->pendingDestruction = true;
    m_destructionQueue.push_back(handle);
}

size_t EntityRegistry::processDestructionQueue() {
    // Use member buffer to avoid per-frame allocation
    m_destroyBuffer.clear();
    std::swap(m_destroyBuffer, m_destructionQueue);

    if (m_destroyBuffer.empty()) {
        return 0;
    }

    size_t destroyed = 0;
    for (const auto& handle : m_destroyBuffer) {
        Slot* slot = findSlot(handle);
        if (slot == nullptr) {
            continue;
        }

        if (slot->renderable && slot->renderable->drawable) {
            m_surface.removeDrawable(slot->renderable->drawable);
            eraseHandle(m_renderables, handle);
        }
        if (slot->animation) {
            eraseHandle(m_animated, handle);
        }
        if (slot->spawnRequest) {
            eraseHandle(m_spawnRequests, handle);
        }

        freeSlot(handle.index);
        ++destroyed;
    }

    ENTITY_DEBUG(std::format("Processed {} entity destructions", destroyed));
    return destroyed;
}

bool EntityRegistry::isValidHandle(EntityHandle handle) const {
    return findSlot(handle) != nullptr;
}

bool EntityRegistry::isPendingDestruction(EntityHandle handle) const {
    const Slot* slot = findSlot(handle);
    return slot != nullptr && slot->pendingDestruction;
}

SpawnRequest* EntityRegistry::getSpawnRequest(EntityHandle handle) {
    Slot* slot = findSlot(handle);
    return slot != nullptr && slot->spawnRequest ? &*slot->spawnRequest : nullptr;
}

const SpawnRequest* EntityRegistry::getSpawnRequest(EntityHandle handle) const {
    const Slot* slot = findSlot(handle);
    return slot != nullptr && slot->spawnRequest ? &*slot->spawnRequest : nullptr;
}

RenderableImage* EntityRegistry::getRenderable(EntityHandle handle) {
    Slot* slot = findSlot(handle);
    return slot != nullptr && slot->renderable ? &*slot->renderable : nullptr;
}

const RenderableImage* EntityRegistry::getRenderable(EntityHandle handle) const {
    const Slot* slot = findSlot(handle);
    return slot != nullptr && slot->renderable ? &*slot->renderable : nullptr;
}

AnimationState* EntityRegistry::getAnimation(EntityHandle handle) {
    Slot* slot = findSlot(handle);
    return slot != nullptr && slot->animation ? &*slot->animation : nullptr;
}

const AnimationState* EntityRegistry::getAnimation(EntityHandle handle) const {
    const Slot* slot = findSlot(handle);
    return slot != nullptr && slot->animation ? &*slot->animation : nullptr;
}

EntityHandle EntityRegistry::allocateSlot(EntityKind kind) {
    uint32_t index;
    if (!m_freeSlots.empty()) {
        index = m_freeSlots.back();
        m_freeSlots.pop_back();
    } else {
        index = static_cast<uint32_t>(m_slots.size());
        m_slots.emplace_back();
    }

    Slot& slot = m_slots[index];
    slot.alive = true;
    slot.pendingDestruction = false;
    slot.kind = kind;
    ++m_entityCount;
    return EntityHandle(index, slot.generation, kind);
}

void EntityRegistry::freeSlot(uint32_t index) {
    Slot& slot = m_slots[index];
    slot.alive = false;
    slot.pendingDestruction = false;
    slot.spawnRequest.reset();
    slot.renderable.reset();
    slot.animation.reset();

    // Generation 0 is reserved for invalid handles
    ++slot.generation;
    if (slot.generation == EntityHandle::INVALID_GENERATION) {
        slot.generation = 1;
    }

    m_freeSlots.push_back(index);
    --m_entityCount;
}

EntityRegistry::Slot* EntityRegistry::findSlot(EntityHandle handle) {
    return const_cast<Slot*>(std::as_const(*this).findSlot(handle));
}

const EntityRegistry::Slot* EntityRegistry::findSlot(EntityHandle handle) const {
    if (!handle.isValid() || handle.index >= m_slots.size()) {
        return nullptr;
    }
    const Slot& slot = m_slots[handle.index];
    if (!slot.alive || slot.generation != handle.generation || slot.kind != handle.kind) {
        return nullptr;
    }
    return &slot;
}

} // namespace TesselEngine
