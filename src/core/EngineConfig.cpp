/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/EngineConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <format>

namespace TesselEngine {

namespace {

void readFloat(const JsonValue& category, const char* key, float& out) {
    const JsonValue& value = category[key];
    if (value.isNull()) {
        return;
    }
    if (auto number = value.tryAsFloat()) {
        out = *number;
    } else {
        CONFIG_WARN(std::format("Setting '{}' is not a number, skipping", key));
    }
}

void readInt(const JsonValue& category, const char* key, int& out) {
    const JsonValue& value = category[key];
    if (value.isNull()) {
        return;
    }
    if (auto number = value.tryAsInt()) {
        out = *number;
    } else {
        CONFIG_WARN(std::format("Setting '{}' is not a number, skipping", key));
    }
}

void readString(const JsonValue& category, const char* key, std::string& out) {
    const JsonValue& value = category[key];
    if (value.isNull()) {
        return;
    }
    if (auto text = value.tryAsString()) {
        out = *text;
    } else {
        CONFIG_WARN(std::format("Setting '{}' is not a string, skipping", key));
    }
}

void applyRoot(const JsonValue& root, EngineConfig& config) {
    const JsonValue& world = root["world"];
    readFloat(world, "unitScale", config.unitScale);

    const JsonValue& animation = root["animation"];
    float framesPerSecond = 0.0f;
    readFloat(animation, "framesPerSecond", framesPerSecond);
    if (framesPerSecond > 0.0f) {
        config.frameDuration = 1.0f / framesPerSecond;
    } else if (animation.hasKey("framesPerSecond")) {
        CONFIG_WARN("animation.framesPerSecond must be positive, keeping default");
    }

    const JsonValue& spawn = root["spawn"];
    readString(spawn, "entitiesLayer", config.entitiesLayerName);
    if (const JsonObject* aliases = spawn["aliases"].tryAsObject()) {
        for (const auto& [type, atlasKey] : *aliases) {
            if (auto key = atlasKey.tryAsString()) {
                config.spawnAliases[type] = *key;
            } else {
                CONFIG_WARN(std::format("Alias for spawn type '{}' is not a string, skipping", type));
            }
        }
    }

    const JsonValue& render = root["render"];
    readString(render, "foregroundPrefix", config.foregroundLayerPrefix);
    readInt(render, "defaultLayer", config.defaultRenderLayer);
    readFloat(render, "viewportWidth", config.viewportWidth);
    readFloat(render, "viewportHeight", config.viewportHeight);

    const JsonValue& window = root["window"];
    readInt(window, "width", config.windowWidth);
    readInt(window, "height", config.windowHeight);
    readString(window, "title", config.windowTitle);

    const JsonValue& assets = root["assets"];
    readString(assets, "map", config.mapPath);
    readString(assets, "atlas", config.atlasPath);

    const JsonValue& logging = root["logging"];
    std::string level;
    readString(logging, "level", level);
    if (!level.empty()) {
        if (auto parsed = parseLogLevel(level)) {
            config.logLevel = *parsed;
        } else {
            CONFIG_WARN(std::format("Unknown log level '{}', keeping {}", level,
                                    logLevelName(config.logLevel)));
        }
    }
    readString(logging, "directory", config.logDirectory);
    int keepFiles = 0;
    readInt(logging, "keepFiles", keepFiles);
    if (keepFiles > 0) {
        config.logFilesKept = static_cast<size_t>(keepFiles);
    }
}

} // anonymous namespace

bool EngineConfig::loadFromFile(const std::string& filepath, EngineConfig& config) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        CONFIG_WARN("Using default engine config, failed to load " + filepath + " - " + reader.getLastError());
        return false;
    }

    if (!reader.getRoot().isObject()) {
        CONFIG_ERROR("Config file root is not a JSON object: " + filepath);
        return false;
    }

    applyRoot(reader.getRoot(), config);
    CONFIG_INFO("Loaded engine config from file: " + filepath);
    return true;
}

bool EngineConfig::loadFromString(const std::string& json, EngineConfig& config) {
    JsonReader reader;
    if (!reader.parse(json)) {
        CONFIG_ERROR("Failed to parse engine config - " + reader.getLastError());
        return false;
    }

    if (!reader.getRoot().isObject()) {
        CONFIG_ERROR("Config root is not a JSON object");
        return false;
    }

    applyRoot(reader.getRoot(), config);
    return true;
}

} // namespace TesselEngine
