/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENGINE_CONFIG_HPP
#define ENGINE_CONFIG_HPP

#include "core/Logger.hpp"
#include <cstddef>
#include <map>
#include <string>

namespace TesselEngine {

/**
 * @brief Tunables shared by the entity pipeline and the SDL frontend
 *
 * Defaults are usable as-is; loadFromFile() overrides them from a JSON file:
 * @code
 * {
 *   "world":     { "unitScale": 0.0625 },
 *   "animation": { "framesPerSecond": 8 },
 *   "spawn":     { "entitiesLayer": "entities", "aliases": { "Player": "player" } },
 *   "render":    { "foregroundPrefix": "fgd_", "defaultLayer": 0,
 *                  "viewportWidth": 16, "viewportHeight": 9 },
 *   "window":    { "width": 1280, "height": 720, "title": "Tessel" },
 *   "assets":    { "map": "res/maps/map-02.tmj", "atlas": "res/graphics/game.atlas.json" },
 *   "logging":   { "level": "info", "directory": "logs", "keepFiles": 5 }
 * }
 * @endcode
 */
struct EngineConfig {
    // Native pixels to world units (16px tiles -> 1 unit)
    float unitScale{1.0f / 16.0f};
    // Per-frame duration used when building a clip (8 frames per second)
    float frameDuration{1.0f / 8.0f};

    std::string entitiesLayerName{"entities"};
    std::map<std::string, std::string> spawnAliases{
        {"Player", "player"},
        {"Slime", "slime"}};

    std::string foregroundLayerPrefix{"fgd_"};
    int defaultRenderLayer{0};
    float viewportWidth{16.0f};
    float viewportHeight{9.0f};

    int windowWidth{1280};
    int windowHeight{720};
    std::string windowTitle{"Tessel"};

    std::string mapPath{"res/maps/map-02.tmj"};
    std::string atlasPath{"res/graphics/game.atlas.json"};

    // Applied to Logger at startup; directory and keepFiles only matter in release builds
    LogLevel logLevel{LogLevel::DEBUG_LEVEL};
    std::string logDirectory{"logs"};
    size_t logFilesKept{5};

    /**
     * @brief Overrides fields of config from a JSON file
     * @param filepath Path to the JSON config file
     * @param config Config to update; untouched keys keep their current value
     * @return false if the file is missing or not a JSON object
     */
    static bool loadFromFile(const std::string& filepath, EngineConfig& config);

    /**
     * @brief Same as loadFromFile() but from an in-memory JSON string
     */
    static bool loadFromString(const std::string& json, EngineConfig& config);
};

} // namespace TesselEngine

#endif // ENGINE_CONFIG_HPP
