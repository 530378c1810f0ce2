/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/TileMapLoader.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <format>

namespace TesselEngine {

namespace {

std::string resolvePath(const std::string& baseDirectory, const std::string& relative) {
    if (relative.empty() || baseDirectory.empty()) {
        return relative;
    }
    return (std::filesystem::path(baseDirectory) / relative).lexically_normal().string();
}

// Tiled property values are typed; keep their textual form
std::string propertyText(const JsonValue& value) {
    switch (value.getType()) {
    case JsonType::String:
        return value.asString();
    case JsonType::Boolean:
        return value.asBool() ? "true" : "false";
    case JsonType::Number:
        return std::format("{}", value.asNumber());
    default:
        return "";
    }
}

bool parseCsvGids(const std::string& text, std::vector<uint32_t>& out) {
    const char* cursor = text.data();
    const char* end = text.data() + text.size();
    while (cursor < end) {
        while (cursor < end && (*cursor == ',' || *cursor == ' ' || *cursor == '\n' ||
                                *cursor == '\r' || *cursor == '\t')) {
            ++cursor;
        }
        if (cursor == end) {
            break;
        }
        uint32_t gid = 0;
        auto [next, ec] = std::from_chars(cursor, end, gid);
        if (ec != std::errc()) {
            return false;
        }
        out.push_back(gid);
        cursor = next;
    }
    return true;
}

} // anonymous namespace

std::shared_ptr<TileMap> TileMapLoader::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        fail(std::format("Failed to read map {}: {}", path, reader.getLastError()));
        return nullptr;
    }

    m_baseDirectory = std::filesystem::path(path).parent_path().string();
    auto map = std::make_shared<TileMap>();
    map->name = std::filesystem::path(path).stem().string();
    if (!readMap(reader.getRoot(), *map)) {
        TILEMAP_ERROR(std::format("Invalid map {}: {}", path, m_lastError));
        return nullptr;
    }

    TILEMAP_INFO(std::format("Loaded map {} ({}x{} tiles, {} tile layers, {} object layers)",
                             path, map->width, map->height, map->tileLayers.size(),
                             map->objectLayers.size()));
    return map;
}

std::shared_ptr<TileMap> TileMapLoader::loadFromString(const std::string& json,
                                                       const std::string& baseDirectory) {
    JsonReader reader;
    if (!reader.parse(json)) {
        fail(reader.getLastError());
        return nullptr;
    }

    m_baseDirectory = baseDirectory;
    auto map = std::make_shared<TileMap>();
    if (!readMap(reader.getRoot(), *map)) {
        return nullptr;
    }
    return map;
}

bool TileMapLoader::readMap(const JsonValue& root, TileMap& map) {
    m_lastError.clear();
    if (!root.isObject()) {
        return fail("Map root is not a JSON object");
    }

    auto orientation = root["orientation"].tryAsString();
    if (orientation && *orientation != "orthogonal") {
        return fail("Unsupported map orientation: " + *orientation);
    }

    map.width = root["width"].tryAsInt().value_or(0);
    map.height = root["height"].tryAsInt().value_or(0);
    map.tileWidth = root["tilewidth"].tryAsInt().value_or(0);
    map.tileHeight = root["tileheight"].tryAsInt().value_or(0);
    if (map.width <= 0 || map.height <= 0 || map.tileWidth <= 0 || map.tileHeight <= 0) {
        return fail("Map is missing width, height, tilewidth or tileheight");
    }

    if (const JsonArray* tilesets = root["tilesets"].tryAsArray()) {
        for (const auto& entry : *tilesets) {
            if (!readTileset(entry, map)) {
                return false;
            }
        }
    }
    std::sort(map.tilesets.begin(), map.tilesets.end(),
              [](const Tileset& a, const Tileset& b) { return a.firstGid < b.firstGid; });

    return readLayers(root["layers"], map);
}

bool TileMapLoader::readLayers(const JsonValue& layers, TileMap& map) {
    const JsonArray* entries = layers.tryAsArray();
    if (entries == nullptr) {
        return true;
    }

    for (const auto& layer : *entries) {
        const std::string type = layer["type"].tryAsString().value_or("");
        if (type == "tilelayer") {
            if (!readTileLayer(layer, map)) {
                return false;
            }
        } else if (type == "objectgroup") {
            readObjectLayer(layer, map);
        } else if (type == "group") {
            if (!readLayers(layer["layers"], map)) {
                return false;
            }
        } else {
            TILEMAP_DEBUG("Skipping layer '" + layer["name"].tryAsString().value_or("") +
                          "' of type '" + type + "'");
        }
    }
    return true;
}

bool TileMapLoader::readTileLayer(const JsonValue& layer, TileMap& map) {
    TileLayer tileLayer;
    tileLayer.name = layer["name"].tryAsString().value_or("");
    tileLayer.width = layer["width"].tryAsInt().value_or(map.width);
    tileLayer.height = layer["height"].tryAsInt().value_or(map.height);
    tileLayer.visible = layer["visible"].tryAsBool().value_or(true);
    tileLayer.opacity = layer["opacity"].tryAsFloat().value_or(1.0f);

    auto encoding = layer["encoding"].tryAsString();
    if (encoding && *encoding != "csv") {
        return fail(std::format("Tile layer '{}' uses unsupported encoding '{}'",
                                tileLayer.name, *encoding));
    }

    const JsonValue& data = layer["data"];
    if (const JsonArray* cells = data.tryAsArray()) {
        tileLayer.gids.reserve(cells->size());
        for (const auto& cell : *cells) {
            auto gid = cell.tryAsNumber();
            if (!gid || *gid < 0) {
                return fail(std::format("Tile layer '{}' has a non-numeric cell", tileLayer.name));
            }
            tileLayer.gids.push_back(static_cast<uint32_t>(*gid));
        }
    } else if (auto csv = data.tryAsString()) {
        if (!parseCsvGids(*csv, tileLayer.gids)) {
            return fail(std::format("Tile layer '{}' has malformed CSV data", tileLayer.name));
        }
    } else {
        return fail(std::format("Tile layer '{}' has no data (chunked maps are not supported)",
                                tileLayer.name));
    }

    const size_t expected = static_cast<size_t>(tileLayer.width) * tileLayer.height;
    if (tileLayer.gids.size() != expected) {
        return fail(std::format("Tile layer '{}' has {} cells, expected {}",
                                tileLayer.name, tileLayer.gids.size(), expected));
    }

    map.tileLayers.push_back(std::move(tileLayer));
    return true;
}

void TileMapLoader::readObjectLayer(const JsonValue& layer, TileMap& map) {
    ObjectLayer objectLayer;
    objectLayer.name = layer["name"].tryAsString().value_or("");

    if (const JsonArray* objects = layer["objects"].tryAsArray()) {
        objectLayer.objects.reserve(objects->size());
        for (const auto& entry : *objects) {
            MapObject object;
            object.id = entry["id"].tryAsInt().value_or(0);
            object.name = entry["name"].tryAsString().value_or("");
            object.x = entry["x"].tryAsFloat().value_or(0.0f);
            object.y = entry["y"].tryAsFloat().value_or(0.0f);
            object.width = entry["width"].tryAsFloat().value_or(0.0f);
            object.height = entry["height"].tryAsFloat().value_or(0.0f);

            // Tiled 1.9 renamed "type" to "class"; both write "" for untyped objects
            auto type = entry["type"].tryAsString();
            if (!type || type->empty()) {
                type = entry["class"].tryAsString();
            }
            if (type && !type->empty()) {
                object.type = *type;
            }

            if (const JsonArray* properties = entry["properties"].tryAsArray()) {
                for (const auto& property : *properties) {
                    auto key = property["name"].tryAsString();
                    if (key) {
                        object.properties[*key] = propertyText(property["value"]);
                    }
                }
            }
            objectLayer.objects.push_back(std::move(object));
        }
    }

    map.objectLayers.push_back(std::move(objectLayer));
}

bool TileMapLoader::readTileset(const JsonValue& entry, TileMap& map) {
    Tileset tileset;
    tileset.firstGid = static_cast<uint32_t>(entry["firstgid"].tryAsInt().value_or(1));

    // External tilesets keep firstgid in the map and everything else in a .tsj file
    JsonReader external;
    const JsonValue* source = &entry;
    std::string imageBase = m_baseDirectory;
    if (auto sourcePath = entry["source"].tryAsString()) {
        const std::string path = resolvePath(m_baseDirectory, *sourcePath);
        if (!external.loadFromFile(path)) {
            return fail(std::format("Failed to read tileset {}: {}", path, external.getLastError()));
        }
        source = &external.getRoot();
        imageBase = std::filesystem::path(path).parent_path().string();
    }

    tileset.name = (*source)["name"].tryAsString().value_or("");
    tileset.imagePath = resolvePath(imageBase, (*source)["image"].tryAsString().value_or(""));
    tileset.tileWidth = (*source)["tilewidth"].tryAsInt().value_or(map.tileWidth);
    tileset.tileHeight = (*source)["tileheight"].tryAsInt().value_or(map.tileHeight);
    tileset.columns = (*source)["columns"].tryAsInt().value_or(0);
    tileset.tileCount = (*source)["tilecount"].tryAsInt().value_or(0);
    tileset.margin = (*source)["margin"].tryAsInt().value_or(0);
    tileset.spacing = (*source)["spacing"].tryAsInt().value_or(0);

    map.tilesets.push_back(std::move(tileset));
    return true;
}

bool TileMapLoader::fail(const std::string& message) {
    m_lastError = message;
    return false;
}

} // namespace TesselEngine
