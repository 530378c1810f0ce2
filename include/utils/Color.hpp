/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COLOR_HPP
#define COLOR_HPP

#include <optional>
#include <ostream>
#include <string_view>

namespace TesselEngine {

/**
 * @brief RGBA tint with float channels in [0, 1]
 */
struct Color {
    float r{1.0f};
    float g{1.0f};
    float b{1.0f};
    float a{1.0f};

    bool operator==(const Color& other) const = default;

    static constexpr Color white() { return Color{1.0f, 1.0f, 1.0f, 1.0f}; }

    /**
     * @brief Parses a Tiled colour string
     * @param text "#RRGGBB" or "#AARRGGBB" (leading '#' optional)
     * @return Parsed colour, or std::nullopt when the text is malformed
     */
    static std::optional<Color> fromTiledString(std::string_view text);
};

// Stream operator for Boost.Test diagnostics
inline std::ostream& operator<<(std::ostream& os, const Color& color) {
    return os << "Color(" << color.r << ", " << color.g << ", " << color.b
              << ", " << color.a << ")";
}

} // namespace TesselEngine

#endif // COLOR_HPP
