/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/Color.hpp"
#include <charconv>
#include <cstdint>

namespace TesselEngine {

namespace {

bool parseByte(std::string_view hex, float& out) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), value, 16);
    if (ec != std::errc{} || ptr != hex.data() + hex.size()) {
        return false;
    }
    out = static_cast<float>(value) / 255.0f;
    return true;
}

} // anonymous namespace

std::optional<Color> Color::fromTiledString(std::string_view text) {
    if (!text.empty() && text.front() == '#') {
        text.remove_prefix(1);
    }

    Color color;
    // Tiled writes alpha first: #AARRGGBB
    if (text.size() == 8) {
        if (!parseByte(text.substr(0, 2), color.a)) {
            return std::nullopt;
        }
        text.remove_prefix(2);
    } else if (text.size() != 6) {
        return std::nullopt;
    }

    if (!parseByte(text.substr(0, 2), color.r) ||
        !parseByte(text.substr(2, 2), color.g) ||
        !parseByte(text.substr(4, 2), color.b)) {
        return std::nullopt;
    }
    return color;
}

} // namespace TesselEngine
