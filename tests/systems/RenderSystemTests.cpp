/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE RenderSystemTests
#include <boost/test/unit_test.hpp>

#include "core/EngineConfig.hpp"
#include "entities/EntityRegistry.hpp"
#include "systems/RenderSystem.hpp"
#include "mocks/MockPresentationSurface.hpp"
#include "mocks/MockTileLayerRenderer.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace TesselEngine;

namespace {

TileLayer namedLayer(const std::string& name) {
    TileLayer layer;
    layer.name = name;
    layer.width = 1;
    layer.height = 1;
    layer.gids = {0};
    return layer;
}

} // anonymous namespace

struct RenderSystemFixture {
    std::vector<std::string> callLog;
    MockPresentationSurface surface{&callLog};
    MockTileLayerRenderer tileRenderer{&callLog};
    EngineConfig config;
    EntityRegistry registry{surface};
    RenderSystem system{registry, surface, tileRenderer, config};

    EntityHandle spawnAt(int layer, float x) {
        auto drawable = std::make_shared<Drawable>();
        drawable->position = Vector2D(x, 0.0f);
        return registry.createAnimatedImage(RenderableImage{layer, std::move(drawable)},
                                            AnimationState{});
    }

    std::shared_ptr<Drawable> drawableOf(EntityHandle handle) {
        return registry.getRenderable(handle)->drawable;
    }

    std::shared_ptr<TileMap> mapWithLayers(const std::vector<std::string>& names) {
        auto map = std::make_shared<TileMap>();
        for (const auto& name : names) {
            map->tileLayers.push_back(namedLayer(name));
        }
        return map;
    }
};

BOOST_FIXTURE_TEST_SUITE(DrawOrderTests, RenderSystemFixture)

BOOST_AUTO_TEST_CASE(LowerLayersDrawFirst) {
    EntityHandle top = spawnAt(2, 0.0f);
    EntityHandle bottom = spawnAt(0, 0.0f);
    EntityHandle middle = spawnAt(1, 0.0f);

    system.update(0.016f);

    const std::vector<EntityHandle> expected{bottom, middle, top};
    BOOST_CHECK(system.getDrawOrder() == expected);
}

BOOST_AUTO_TEST_CASE(RightmostDrawsFirstWithinLayer) {
    EntityHandle left = spawnAt(0, 1.0f);
    EntityHandle right = spawnAt(0, 5.0f);
    EntityHandle centre = spawnAt(0, 3.0f);

    system.update(0.016f);

    const std::vector<EntityHandle> expected{right, centre, left};
    BOOST_CHECK(system.getDrawOrder() == expected);

    // toFront in draw order leaves the stage in the same order
    BOOST_REQUIRE_EQUAL(surface.stage.size(), 3u);
    BOOST_CHECK(surface.stage[0] == drawableOf(right));
    BOOST_CHECK(surface.stage[1] == drawableOf(centre));
    BOOST_CHECK(surface.stage[2] == drawableOf(left));
}

BOOST_AUTO_TEST_CASE(EqualKeysKeepCreationOrder) {
    EntityHandle first = spawnAt(1, 2.0f);
    EntityHandle second = spawnAt(1, 2.0f);
    EntityHandle third = spawnAt(1, 2.0f);

    for (int frame = 0; frame < 3; ++frame) {
        system.update(0.016f);
        const std::vector<EntityHandle> expected{first, second, third};
        BOOST_CHECK(system.getDrawOrder() == expected);
    }
}

BOOST_AUTO_TEST_CASE(MovedEntityIsResortedNextFrame) {
    EntityHandle a = spawnAt(0, 1.0f);
    EntityHandle b = spawnAt(0, 2.0f);
    system.update(0.016f);
    BOOST_CHECK(system.getDrawOrder().front() == b);

    drawableOf(a)->position = Vector2D(3.0f, 0.0f);
    system.update(0.016f);
    BOOST_CHECK(system.getDrawOrder().front() == a);
}

BOOST_AUTO_TEST_CASE(EveryRenderableIsBroughtToFront) {
    spawnAt(0, 1.0f);
    spawnAt(3, 1.0f);
    system.update(0.016f);
    BOOST_CHECK_EQUAL(surface.frontCalls.size(), 2u);
    BOOST_CHECK_EQUAL(surface.drawCount, 1);
    BOOST_CHECK_CLOSE(surface.lastActDelta, 0.016f, 0.001f);
}

BOOST_AUTO_TEST_CASE(DestroyedEntityLeavesDrawOrder) {
    EntityHandle keep = spawnAt(0, 1.0f);
    EntityHandle gone = spawnAt(0, 2.0f);
    registry.destroyEntity(gone);
    registry.processDestructionQueue();

    system.update(0.016f);
    BOOST_REQUIRE_EQUAL(system.getDrawOrder().size(), 1u);
    BOOST_CHECK(system.getDrawOrder().front() == keep);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(LayerPartitionTests, RenderSystemFixture)

BOOST_AUTO_TEST_CASE(ForegroundPrefixSplitsLayers) {
    auto map = mapWithLayers({"ground", "fgd_roof"});
    BOOST_CHECK(system.handle(GameEvent{MapChangeEvent{map}}));

    BOOST_REQUIRE_EQUAL(system.getBackgroundLayers().size(), 1u);
    BOOST_REQUIRE_EQUAL(system.getForegroundLayers().size(), 1u);
    BOOST_CHECK_EQUAL(system.getBackgroundLayers()[0]->name, "ground");
    BOOST_CHECK_EQUAL(system.getForegroundLayers()[0]->name, "fgd_roof");
}

BOOST_AUTO_TEST_CASE(DeclarationOrderDoesNotMatter) {
    auto map = mapWithLayers({"fgd_roof", "ground"});
    system.handle(GameEvent{MapChangeEvent{map}});

    BOOST_REQUIRE_EQUAL(system.getBackgroundLayers().size(), 1u);
    BOOST_REQUIRE_EQUAL(system.getForegroundLayers().size(), 1u);
    BOOST_CHECK_EQUAL(system.getBackgroundLayers()[0]->name, "ground");
    BOOST_CHECK_EQUAL(system.getForegroundLayers()[0]->name, "fgd_roof");
}

BOOST_AUTO_TEST_CASE(PrefixMustLeadTheName) {
    auto map = mapWithLayers({"walls_fgd_", "fgd", "fgd_trees", "fgd_roof"});
    system.handle(GameEvent{MapChangeEvent{map}});

    BOOST_REQUIRE_EQUAL(system.getBackgroundLayers().size(), 2u);
    BOOST_CHECK_EQUAL(system.getBackgroundLayers()[0]->name, "walls_fgd_");
    BOOST_CHECK_EQUAL(system.getBackgroundLayers()[1]->name, "fgd");
    BOOST_REQUIRE_EQUAL(system.getForegroundLayers().size(), 2u);
    BOOST_CHECK_EQUAL(system.getForegroundLayers()[0]->name, "fgd_trees");
    BOOST_CHECK_EQUAL(system.getForegroundLayers()[1]->name, "fgd_roof");
}

BOOST_AUTO_TEST_CASE(NewMapReplacesPreviousLayers) {
    system.handle(GameEvent{MapChangeEvent{mapWithLayers({"ground", "fgd_roof"})}});
    system.handle(GameEvent{MapChangeEvent{mapWithLayers({"water"})}});

    BOOST_REQUIRE_EQUAL(system.getBackgroundLayers().size(), 1u);
    BOOST_CHECK_EQUAL(system.getBackgroundLayers()[0]->name, "water");
    BOOST_CHECK(system.getForegroundLayers().empty());
}

BOOST_AUTO_TEST_CASE(NullMapClearsLayers) {
    system.handle(GameEvent{MapChangeEvent{mapWithLayers({"ground"})}});
    BOOST_CHECK(system.handle(GameEvent{MapChangeEvent{nullptr}}));
    BOOST_CHECK(system.getBackgroundLayers().empty());

    system.update(0.016f);
    BOOST_CHECK(tileRenderer.renderedLayers.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(FrameSequenceTests, RenderSystemFixture)

BOOST_AUTO_TEST_CASE(TileLayersWrapTheEntityPass) {
    system.handle(GameEvent{MapChangeEvent{mapWithLayers({"fgd_roof", "ground", "path"})}});
    spawnAt(0, 1.0f);

    system.update(0.016f);

    const std::vector<std::string> expected{
        "applyViewport", "tile:ground", "tile:path", "act", "draw", "tile:fgd_roof"};
    BOOST_CHECK_EQUAL_COLLECTIONS(callLog.begin(), callLog.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(NoMapStillDrawsEntities) {
    spawnAt(0, 1.0f);
    system.update(0.016f);

    const std::vector<std::string> expected{"applyViewport", "act", "draw"};
    BOOST_CHECK_EQUAL_COLLECTIONS(callLog.begin(), callLog.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_SUITE_END()
