/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE AnimationClipTests
#include <boost/test/unit_test.hpp>

#include "animation/AnimationCache.hpp"
#include "animation/AnimationClip.hpp"
#include "animation/AnimationState.hpp"
#include "core/EngineErrors.hpp"
#include "mocks/CountingAssetCatalog.hpp"

#include <stdexcept>
#include <vector>

using namespace TesselEngine;

namespace {

// Binary-exact so frame boundaries are hit precisely
constexpr float FRAME = 0.125f;

std::vector<AtlasRegion> makeFrames(const std::string& name, int count) {
    std::vector<AtlasRegion> frames;
    for (int i = 0; i < count; ++i) {
        AtlasRegion region;
        region.name = name;
        region.index = i;
        region.x = i * 16;
        region.width = 16;
        region.height = 16;
        frames.push_back(region);
    }
    return frames;
}

} // anonymous namespace

// ============================================================================
// PLAY MODES
// ============================================================================

BOOST_AUTO_TEST_SUITE(PlayModeTests)

BOOST_AUTO_TEST_CASE(NormalClampsToLastFrame) {
    AnimationClip clip("hero/run", makeFrames("hero/run", 4), FRAME);

    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(0.0f, PlayMode::NORMAL), 0u);
    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(0.125f, PlayMode::NORMAL), 1u);
    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(0.3f, PlayMode::NORMAL), 2u);
    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(0.49f, PlayMode::NORMAL), 3u);
    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(10.0f, PlayMode::NORMAL), 3u);
}

BOOST_AUTO_TEST_CASE(LoopWrapsAround) {
    AnimationClip clip("hero/run", makeFrames("hero/run", 4), FRAME);

    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(0.375f, PlayMode::LOOP), 3u);
    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(0.5f, PlayMode::LOOP), 0u);
    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(0.625f, PlayMode::LOOP), 1u);
}

BOOST_AUTO_TEST_CASE(ReversedPlaysFromTheEndAndHoldsFirstFrame) {
    AnimationClip clip("hero/run", makeFrames("hero/run", 4), FRAME);

    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(0.0f, PlayMode::REVERSED), 3u);
    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(0.125f, PlayMode::REVERSED), 2u);
    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(0.375f, PlayMode::REVERSED), 0u);
    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(5.0f, PlayMode::REVERSED), 0u);
}

BOOST_AUTO_TEST_CASE(LoopReversedWrapsFromTheEnd) {
    AnimationClip clip("hero/run", makeFrames("hero/run", 4), FRAME);

    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(0.0f, PlayMode::LOOP_REVERSED), 3u);
    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(0.375f, PlayMode::LOOP_REVERSED), 0u);
    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(0.5f, PlayMode::LOOP_REVERSED), 3u);
    BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(0.625f, PlayMode::LOOP_REVERSED), 2u);
}

BOOST_AUTO_TEST_CASE(SingleFrameClipAlwaysShowsFrameZero) {
    AnimationClip clip("chest/idle", makeFrames("chest/idle", 1), FRAME);

    for (PlayMode mode : {PlayMode::NORMAL, PlayMode::REVERSED, PlayMode::LOOP, PlayMode::LOOP_REVERSED}) {
        BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(0.0f, mode), 0u);
        BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(3.7f, mode), 0u);
    }
}

BOOST_AUTO_TEST_CASE(LoopIsPeriodicOverClipDuration) {
    const int frameCount = 4;
    AnimationClip clip("hero/run", makeFrames("hero/run", frameCount), FRAME);
    const float period = frameCount * FRAME;

    for (float t : {0.0f, 0.0625f, 0.125f, 0.1875f, 0.25f, 0.4375f}) {
        const size_t reference = clip.getKeyFrameIndex(t, PlayMode::LOOP);
        for (int k = 0; k <= 6; ++k) {
            BOOST_CHECK_EQUAL(clip.getKeyFrameIndex(k * period + t, PlayMode::LOOP), reference);
        }
    }
}

BOOST_AUTO_TEST_CASE(GetKeyFrameReturnsRegionAtIndex) {
    AnimationClip clip("hero/run", makeFrames("hero/run", 4), FRAME);
    BOOST_CHECK_EQUAL(clip.getKeyFrame(0.25f, PlayMode::LOOP).index, 2);
    BOOST_CHECK_EQUAL(clip.getKeyFrame(0.25f, PlayMode::LOOP).x, 32);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// FINISHED STATE
// ============================================================================

BOOST_AUTO_TEST_SUITE(FinishedTests)

BOOST_AUTO_TEST_CASE(NormalFinishesAtClipDuration) {
    AnimationClip clip("slime/death", makeFrames("slime/death", 4), FRAME);
    BOOST_CHECK_CLOSE(clip.getDuration(), 0.5f, 0.0001f);

    for (float t : {0.0f, 0.1f, 0.25f, 0.375f, 0.49f, 0.4999f}) {
        BOOST_CHECK_MESSAGE(!clip.isFinished(t, PlayMode::NORMAL), "finished too early at " << t);
    }
    for (float t : {0.5f, 0.51f, 1.0f, 100.0f}) {
        BOOST_CHECK_MESSAGE(clip.isFinished(t, PlayMode::NORMAL), "not finished at " << t);
    }
}

BOOST_AUTO_TEST_CASE(ReversedFinishesAtClipDuration) {
    AnimationClip clip("slime/death", makeFrames("slime/death", 2), FRAME);
    BOOST_CHECK(!clip.isFinished(0.2f, PlayMode::REVERSED));
    BOOST_CHECK(clip.isFinished(0.25f, PlayMode::REVERSED));
}

BOOST_AUTO_TEST_CASE(LoopModesNeverFinish) {
    AnimationClip clip("slime/idle", makeFrames("slime/idle", 4), FRAME);
    BOOST_CHECK(!clip.isFinished(100.0f, PlayMode::LOOP));
    BOOST_CHECK(!clip.isFinished(100.0f, PlayMode::LOOP_REVERSED));
}

BOOST_AUTO_TEST_CASE(ClipRejectsEmptyFramesAndBadDuration) {
    BOOST_CHECK_THROW(AnimationClip("empty", {}, FRAME), std::invalid_argument);
    BOOST_CHECK_THROW(AnimationClip("zero", makeFrames("zero", 2), 0.0f), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// ANIMATION STATE
// ============================================================================

BOOST_AUTO_TEST_SUITE(AnimationStateTests)

BOOST_AUTO_TEST_CASE(NextAnimationBuildsClipIdFromAtlasKey) {
    AnimationState state;
    state.nextAnimation("slime", AnimationType::ATTACK);
    BOOST_CHECK_EQUAL(state.atlasKey, "slime");
    BOOST_CHECK_EQUAL(state.nextClipId, "slime/attack");
    BOOST_CHECK(state.isSwitching());

    state.nextAnimation(AnimationType::DEATH);
    BOOST_CHECK_EQUAL(state.nextClipId, "slime/death");

    state.clearAnimation();
    BOOST_CHECK_EQUAL(state.nextClipId, AnimationState::NO_ANIMATION);
    BOOST_CHECK(!state.isSwitching());
}

BOOST_AUTO_TEST_CASE(DefaultsToLoopWithoutClip) {
    AnimationState state;
    BOOST_CHECK_EQUAL(state.playMode, PlayMode::LOOP);
    BOOST_CHECK(state.clip == nullptr);
    BOOST_CHECK(!state.isAnimationFinished());
}

BOOST_AUTO_TEST_CASE(FinishedFollowsClipAndPlayMode) {
    AnimationClip clip("chest/open", makeFrames("chest/open", 3), FRAME);
    AnimationState state;
    state.clip = &clip;
    state.playMode = PlayMode::NORMAL;
    state.stateTime = 0.25f;
    BOOST_CHECK(!state.isAnimationFinished());

    state.stateTime = 0.375f;
    BOOST_CHECK(state.isAnimationFinished());

    state.playMode = PlayMode::LOOP;
    BOOST_CHECK(!state.isAnimationFinished());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// CLIP CACHE
// ============================================================================

BOOST_AUTO_TEST_SUITE(AnimationCacheTests)

BOOST_AUTO_TEST_CASE(CacheHitReturnsSameClipWithoutRescan) {
    CountingAssetCatalog catalog;
    catalog.addStrip("player/idle", 4);
    AnimationCache cache(catalog, FRAME);

    auto first = cache.getOrBuildClip("player/idle");
    auto second = cache.getOrBuildClip("player/idle");

    BOOST_CHECK(first.get() == second.get());
    BOOST_CHECK_EQUAL(catalog.lookupCount("player/idle"), 1);
    BOOST_CHECK_EQUAL(cache.size(), 1u);
    BOOST_CHECK_EQUAL(first->getFrameCount(), 4u);
    BOOST_CHECK_CLOSE(first->getFrameDuration(), FRAME, 0.0001f);
}

BOOST_AUTO_TEST_CASE(ClipFramesFollowRegionIndexOrder) {
    CountingAssetCatalog catalog;
    catalog.addStrip("player/run", 3);
    AnimationCache cache(catalog, FRAME);

    auto clip = cache.getOrBuildClip("player/run");
    for (size_t i = 0; i < clip->getFrameCount(); ++i) {
        BOOST_CHECK_EQUAL(clip->getFrames()[i].index, static_cast<int>(i));
    }
}

BOOST_AUTO_TEST_CASE(MissingClipThrowsAssetError) {
    CountingAssetCatalog catalog;
    AnimationCache cache(catalog, FRAME);

    BOOST_CHECK_THROW(cache.getOrBuildClip("ghost/idle"), AssetError);
    BOOST_CHECK(!cache.contains("ghost/idle"));
    BOOST_CHECK_EQUAL(cache.size(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
