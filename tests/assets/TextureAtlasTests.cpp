/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TextureAtlasTests
#include <boost/test/unit_test.hpp>

#include "assets/TextureAtlas.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace TesselEngine;

namespace {

const char* const kManifest = R"({
  "image": "game.png",
  "regions": [
    {"name": "player/idle", "index": 1, "x": 16, "y": 0, "width": 16, "height": 24},
    {"name": "player/idle", "index": 0, "x": 0,  "y": 0, "width": 16, "height": 24,
     "originalWidth": 20, "originalHeight": 28},
    {"name": "player/run",  "index": 0, "x": 32, "y": 0, "width": 16, "height": 24},
    {"name": "",            "index": 0, "x": 0,  "y": 0, "width": 8,  "height": 8},
    {"name": "player/idle", "index": 2, "x": 48, "y": 0, "width": 16, "height": 24}
  ]
})";

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(TextureAtlasTests)

BOOST_AUTO_TEST_CASE(RegionsAreGroupedAndSortedByIndex) {
    TextureAtlas atlas("game");
    BOOST_REQUIRE(atlas.loadFromString(kManifest));

    const auto idle = atlas.findRegions("player/idle");
    BOOST_REQUIRE_EQUAL(idle.size(), 3u);
    BOOST_CHECK_EQUAL(idle[0].index, 0);
    BOOST_CHECK_EQUAL(idle[1].index, 1);
    BOOST_CHECK_EQUAL(idle[2].index, 2);
    BOOST_CHECK_EQUAL(idle[2].x, 48);
    BOOST_CHECK_EQUAL(idle[0].textureId, "game");
}

BOOST_AUTO_TEST_CASE(UnnamedRegionsAreSkipped) {
    TextureAtlas atlas;
    BOOST_REQUIRE(atlas.loadFromString(kManifest));
    BOOST_CHECK_EQUAL(atlas.getRegionCount(), 4u);
    BOOST_CHECK(atlas.findRegions("").empty());
}

BOOST_AUTO_TEST_CASE(OriginalSizeDefaultsToPackedSize) {
    TextureAtlas atlas;
    BOOST_REQUIRE(atlas.loadFromString(kManifest));

    const auto idle = atlas.findRegions("player/idle");
    BOOST_CHECK_EQUAL(idle[0].originalWidth, 20);
    BOOST_CHECK_EQUAL(idle[0].originalHeight, 28);
    BOOST_CHECK_EQUAL(idle[1].originalWidth, 16);
    BOOST_CHECK_EQUAL(idle[1].originalHeight, 24);
}

BOOST_AUTO_TEST_CASE(UnknownKeyReturnsNothing) {
    TextureAtlas atlas;
    BOOST_REQUIRE(atlas.loadFromString(kManifest));
    BOOST_CHECK(atlas.findRegions("slime/idle").empty());
    // Lookup is exact, a prefix does not match
    BOOST_CHECK(atlas.findRegions("player").empty());
}

BOOST_AUTO_TEST_CASE(ManifestWithoutRegionsIsRejected) {
    TextureAtlas atlas;
    BOOST_CHECK(!atlas.loadFromString(R"({"image": "game.png"})"));
    BOOST_CHECK(!atlas.getLastError().empty());
    BOOST_CHECK(!atlas.loadFromString("{not json"));
    BOOST_CHECK(!atlas.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(ReloadReplacesRegions) {
    TextureAtlas atlas;
    BOOST_REQUIRE(atlas.loadFromString(kManifest));
    BOOST_REQUIRE(atlas.loadFromString(R"({"regions": [{"name": "slime/idle", "width": 8, "height": 8}]})"));
    BOOST_CHECK_EQUAL(atlas.getRegionCount(), 1u);
    BOOST_CHECK(atlas.findRegions("player/idle").empty());
    BOOST_CHECK_EQUAL(atlas.findRegions("slime/idle").size(), 1u);
}

BOOST_AUTO_TEST_CASE(ImagePathIsRelativeToManifest) {
    const std::filesystem::path dir = "texture_atlas_test_dir";
    std::filesystem::create_directories(dir);
    const std::filesystem::path manifest = dir / "game.atlas.json";
    {
        std::ofstream out(manifest);
        out << kManifest;
    }

    TextureAtlas atlas;
    BOOST_REQUIRE(atlas.loadFromFile(manifest.string()));
    BOOST_CHECK(std::filesystem::path(atlas.getImagePath()) == dir / "game.png");
    std::filesystem::remove_all(dir);
}

BOOST_AUTO_TEST_CASE(MissingFileFails) {
    TextureAtlas atlas;
    BOOST_CHECK(!atlas.loadFromFile("missing/game.atlas.json"));
    BOOST_CHECK(!atlas.getLastError().empty());
}

BOOST_AUTO_TEST_SUITE_END()
