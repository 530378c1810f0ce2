/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_REGISTRY_HPP
#define ENTITY_REGISTRY_HPP

#include "entities/Components.hpp"
#include "entities/EntityHandle.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace TesselEngine {

class IPresentationSurface;

/**
 * @brief Owns every entity and its components for the active session
 *
 * Entities live in generational slots. Destruction is deferred: destroyEntity()
 * only queues the handle and processDestructionQueue() (called once at the end
 * of each World tick) deregisters drawables and frees the slots, so systems can
 * iterate the family lists while marking entities for removal.
 *
 * The family lists keep creation order, which is the tie-break order for the
 * render sort.
 */
class EntityRegistry {
public:
    explicit EntityRegistry(IPresentationSurface& surface);
    ~EntityRegistry();

    EntityRegistry(const EntityRegistry&) = delete;
    EntityRegistry& operator=(const EntityRegistry&) = delete;

    EntityHandle createSpawnRequest(SpawnRequest request);

    /**
     * @brief Creates an entity with both visual components attached
     *
     * The drawable is added to the presentation surface only after both
     * components are in place.
     * @throws std::invalid_argument if image carries no drawable
     */
    EntityHandle createAnimatedImage(RenderableImage image, AnimationState animation);

    /**
     * @brief Queues an entity for destruction at the end of the tick
     *
     * Stale handles and entities already queued are ignored.
     */
    void destroyEntity(EntityHandle handle);

    /**
     * @brief Destroys every queued entity
     * @return Number of entities destroyed
     */
    size_t processDestructionQueue();

    [[nodiscard]] bool isValidHandle(EntityHandle handle) const;
    [[nodiscard]] bool isPendingDestruction(EntityHandle handle) const;

    // Component access, nullptr for stale handles or missing components
    SpawnRequest* getSpawnRequest(EntityHandle handle);
    const SpawnRequest* getSpawnRequest(EntityHandle handle) const;
    RenderableImage* getRenderable(EntityHandle handle);
    const RenderableImage* getRenderable(EntityHandle handle) const;
    AnimationState* getAnimation(EntityHandle handle);
    const AnimationState* getAnimation(EntityHandle handle) const;

    // Family lists, in creation order, including entities pending destruction
    const std::vector<EntityHandle>& getRenderables() const { return m_renderables; }
    const std::vector<EntityHandle>& getAnimated() const { return m_animated; }
    const std::vector<EntityHandle>& getSpawnRequests() const { return m_spawnRequests; }

    size_t getEntityCount() const { return m_entityCount; }
    size_t getPendingDestructionCount() const { return m_destructionQueue.size(); }

private:
    struct Slot {
        EntityHandle::Generation generation{1};
        bool alive{false};
        bool pendingDestruction{false};
        EntityKind kind{EntityKind::SpawnRequest};
        std::optional<SpawnRequest> spawnRequest;
        std::optional<RenderableImage> renderable;
        std::optional<AnimationState> animation;
    };

    EntityHandle allocateSlot(EntityKind kind);
    void freeSlot(uint32_t index);
    Slot* findSlot(EntityHandle handle);
    const Slot* findSlot(EntityHandle handle) const;

    IPresentationSurface& m_surface;
    std::vector<Slot> m_slots;
    std::vector<uint32_t> m_freeSlots;
    std::vector<EntityHandle> m_destructionQueue;
    std::vector<EntityHandle> m_destroyBuffer;  // Reused in processDestructionQueue

    std::vector<EntityHandle> m_renderables;
    std::vector<EntityHandle> m_animated;
    std::vector<EntityHandle> m_spawnRequests;
    size_t m_entityCount{0};
};

} // namespace TesselEngine

#endif // ENTITY_REGISTRY_HPP
