/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMPONENTS_HPP
#define COMPONENTS_HPP

#include "animation/AnimationState.hpp"
#include "render/Drawable.hpp"
#include "utils/Color.hpp"
#include "utils/Vector2D.hpp"
#include <memory>
#include <string>

namespace TesselEngine {

/**
 * @brief Declarative request to create one visual entity
 *
 * Lives on a transient entity for at most one tick.
 */
struct SpawnRequest {
    std::string entityType;
    Vector2D location{};
    Color tint{Color::white()};
};

/**
 * @brief Resolved spawn parameters for one entity type
 */
struct SpawnConfig {
    std::string atlasKey;

    bool operator==(const SpawnConfig& other) const = default;
};

/**
 * @brief Visual component: depth layer plus the drawable registered on the surface
 *
 * Draw order is layer ascending, then x descending (entities further right are
 * drawn first so left-hand neighbours overlap them).
 */
struct RenderableImage {
    int layer{0};
    std::shared_ptr<Drawable> drawable;
};

} // namespace TesselEngine

#endif // COMPONENTS_HPP
