/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DRAWABLE_HPP
#define DRAWABLE_HPP

#include "assets/IAssetCatalog.hpp"
#include "utils/Color.hpp"
#include "utils/Vector2D.hpp"

namespace TesselEngine {

/**
 * @brief Presentation handle of one visual entity, in world units
 *
 * position is the top-left corner of the image, y pointing down as in map
 * coordinates. frame points into a clip owned by the AnimationCache and is
 * null until the first animation tick.
 */
struct Drawable {
    Vector2D position{};
    Vector2D size{};
    Color tint{Color::white()};
    const AtlasRegion* frame{nullptr};
    bool visible{true};
};

} // namespace TesselEngine

#endif // DRAWABLE_HPP
