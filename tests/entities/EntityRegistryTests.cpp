/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EntityRegistryTests
#include <boost/test/unit_test.hpp>

#include "entities/EntityRegistry.hpp"
#include "mocks/MockPresentationSurface.hpp"

#include <memory>
#include <stdexcept>
#include <unordered_set>

using namespace TesselEngine;

namespace {

// Surface whose addDrawable always fails
class RejectingSurface : public MockPresentationSurface {
public:
    void addDrawable(std::shared_ptr<Drawable>) override {
        throw std::runtime_error("surface full");
    }
};

RenderableImage makeImage(int layer = 0) {
    return RenderableImage{layer, std::make_shared<Drawable>()};
}

} // anonymous namespace

struct RegistryFixture {
    MockPresentationSurface surface;
    EntityRegistry registry{surface};
};

BOOST_AUTO_TEST_SUITE(EntityHandleTests)

BOOST_AUTO_TEST_CASE(DefaultHandleIsInvalid) {
    EntityHandle handle;
    BOOST_CHECK(!handle.isValid());
    BOOST_CHECK(handle == INVALID_ENTITY_HANDLE);
    BOOST_CHECK_EQUAL(handle.toString(), "EntityHandle::INVALID");
}

BOOST_AUTO_TEST_CASE(ToStringShowsSlotKindAndGeneration) {
    EntityHandle handle(3, 2, EntityKind::AnimatedImage);
    BOOST_CHECK(handle.isValid());
    BOOST_CHECK_EQUAL(handle.toString(), "EntityHandle(3:AnimatedImage:2)");
}

BOOST_AUTO_TEST_CASE(HashDistinguishesGenerations) {
    std::unordered_set<EntityHandle> handles;
    handles.insert(EntityHandle(0, 1, EntityKind::SpawnRequest));
    handles.insert(EntityHandle(0, 2, EntityKind::SpawnRequest));
    handles.insert(EntityHandle(0, 1, EntityKind::SpawnRequest));
    BOOST_CHECK_EQUAL(handles.size(), 2u);
}

BOOST_AUTO_TEST_CASE(HashCoversGenerationAndKind) {
    const EntityHandle base(7, 1, EntityKind::SpawnRequest);
    BOOST_CHECK_NE(base.hash(), EntityHandle(7, 2, EntityKind::SpawnRequest).hash());
    BOOST_CHECK_NE(base.hash(), EntityHandle(7, 1, EntityKind::AnimatedImage).hash());
    BOOST_CHECK_NE(base.hash(), EntityHandle(8, 1, EntityKind::SpawnRequest).hash());
    BOOST_CHECK_EQUAL(base.hash(), std::hash<EntityHandle>{}(base));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(EntityLifecycleTests, RegistryFixture)

BOOST_AUTO_TEST_CASE(SpawnRequestHasOnlyItsComponent) {
    EntityHandle handle = registry.createSpawnRequest(SpawnRequest{"Player", Vector2D(1.0f, 2.0f)});

    BOOST_CHECK(registry.isValidHandle(handle));
    BOOST_CHECK(handle.getKind() == EntityKind::SpawnRequest);
    BOOST_REQUIRE(registry.getSpawnRequest(handle) != nullptr);
    BOOST_CHECK_EQUAL(registry.getSpawnRequest(handle)->entityType, "Player");
    BOOST_CHECK(registry.getRenderable(handle) == nullptr);
    BOOST_CHECK(registry.getAnimation(handle) == nullptr);
    BOOST_CHECK_EQUAL(registry.getSpawnRequests().size(), 1u);
    BOOST_CHECK_EQUAL(surface.addCount, 0);
}

BOOST_AUTO_TEST_CASE(AnimatedImageRegistersDrawable) {
    RenderableImage image = makeImage(4);
    auto drawable = image.drawable;

    EntityHandle handle = registry.createAnimatedImage(std::move(image), AnimationState{});

    BOOST_CHECK(surface.contains(drawable));
    BOOST_CHECK_EQUAL(registry.getRenderable(handle)->layer, 4);
    BOOST_CHECK(registry.getAnimation(handle) != nullptr);
    BOOST_CHECK(registry.getSpawnRequest(handle) == nullptr);
    BOOST_CHECK_EQUAL(registry.getRenderables().size(), 1u);
    BOOST_CHECK_EQUAL(registry.getAnimated().size(), 1u);
}

BOOST_AUTO_TEST_CASE(MissingDrawableIsRejected) {
    BOOST_CHECK_THROW(registry.createAnimatedImage(RenderableImage{0, nullptr}, AnimationState{}),
                      std::invalid_argument);
    BOOST_CHECK_EQUAL(registry.getEntityCount(), 0u);
}

BOOST_AUTO_TEST_CASE(DestructionIsDeferred) {
    RenderableImage image = makeImage();
    auto drawable = image.drawable;
    EntityHandle handle = registry.createAnimatedImage(std::move(image), AnimationState{});

    registry.destroyEntity(handle);
    BOOST_CHECK(registry.isValidHandle(handle));
    BOOST_CHECK(registry.isPendingDestruction(handle));
    BOOST_CHECK(surface.contains(drawable));
    BOOST_CHECK_EQUAL(registry.getRenderables().size(), 1u);

    BOOST_CHECK_EQUAL(registry.processDestructionQueue(), 1u);
    BOOST_CHECK(!registry.isValidHandle(handle));
    BOOST_CHECK(!surface.contains(drawable));
    BOOST_CHECK(registry.getRenderables().empty());
    BOOST_CHECK(registry.getAnimated().empty());
    BOOST_CHECK_EQUAL(registry.getEntityCount(), 0u);
}

BOOST_AUTO_TEST_CASE(DoubleDestroyIsQueuedOnce) {
    EntityHandle handle = registry.createSpawnRequest(SpawnRequest{"Slime"});
    registry.destroyEntity(handle);
    registry.destroyEntity(handle);
    BOOST_CHECK_EQUAL(registry.getPendingDestructionCount(), 1u);
    BOOST_CHECK_EQUAL(registry.processDestructionQueue(), 1u);
    BOOST_CHECK_EQUAL(registry.processDestructionQueue(), 0u);
}

BOOST_AUTO_TEST_CASE(StaleHandleAfterSlotReuse) {
    EntityHandle old = registry.createSpawnRequest(SpawnRequest{"Slime"});
    registry.destroyEntity(old);
    registry.processDestructionQueue();

    EntityHandle reused = registry.createSpawnRequest(SpawnRequest{"Player"});
    BOOST_CHECK_EQUAL(reused.getIndex(), old.getIndex());
    BOOST_CHECK_NE(reused.getGeneration(), old.getGeneration());

    BOOST_CHECK(registry.getSpawnRequest(old) == nullptr);
    registry.destroyEntity(old);
    BOOST_CHECK_EQUAL(registry.getPendingDestructionCount(), 0u);
    BOOST_CHECK(registry.isValidHandle(reused));
}

BOOST_AUTO_TEST_CASE(FamilyListsKeepCreationOrder) {
    EntityHandle a = registry.createAnimatedImage(makeImage(), AnimationState{});
    EntityHandle b = registry.createAnimatedImage(makeImage(), AnimationState{});
    EntityHandle c = registry.createAnimatedImage(makeImage(), AnimationState{});

    registry.destroyEntity(b);
    registry.processDestructionQueue();
    EntityHandle d = registry.createAnimatedImage(makeImage(), AnimationState{});

    const std::vector<EntityHandle> expected{a, c, d};
    BOOST_CHECK(registry.getRenderables() == expected);
    BOOST_CHECK(registry.getAnimated() == expected);
}

BOOST_AUTO_TEST_CASE(DestroyDuringIterationIsSafe) {
    for (int i = 0; i < 4; ++i) {
        registry.createSpawnRequest(SpawnRequest{"Slime"});
    }
    for (const EntityHandle& handle : registry.getSpawnRequests()) {
        registry.destroyEntity(handle);
    }
    BOOST_CHECK_EQUAL(registry.getSpawnRequests().size(), 4u);
    BOOST_CHECK_EQUAL(registry.processDestructionQueue(), 4u);
    BOOST_CHECK(registry.getSpawnRequests().empty());
}

BOOST_AUTO_TEST_CASE(DestructorDeregistersLiveDrawables) {
    MockPresentationSurface localSurface;
    {
        EntityRegistry local(localSurface);
        local.createAnimatedImage(makeImage(), AnimationState{});
        local.createAnimatedImage(makeImage(), AnimationState{});
        BOOST_CHECK_EQUAL(localSurface.getDrawableCount(), 2u);
    }
    BOOST_CHECK_EQUAL(localSurface.getDrawableCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_CASE(FailedSurfaceRegistrationLeavesNoEntity) {
    RejectingSurface rejecting;
    EntityRegistry registry(rejecting);

    BOOST_CHECK_THROW(registry.createAnimatedImage(makeImage(), AnimationState{}), std::runtime_error);
    BOOST_CHECK_EQUAL(registry.getEntityCount(), 0u);
    BOOST_CHECK(registry.getRenderables().empty());
    BOOST_CHECK(registry.getAnimated().empty());
}
