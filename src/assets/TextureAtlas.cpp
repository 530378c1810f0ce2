/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "assets/TextureAtlas.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <filesystem>
#include <format>

namespace TesselEngine {

TextureAtlas::TextureAtlas(std::string textureId)
    : m_textureId(std::move(textureId)) {}

bool TextureAtlas::loadFromFile(const std::string& manifestPath) {
    JsonReader reader;
    if (!reader.loadFromFile(manifestPath)) {
        m_lastError = reader.getLastError();
        ATLAS_ERROR("Failed to load atlas manifest " + manifestPath + " - " + m_lastError);
        return false;
    }

    if (!applyManifest(reader.getRoot())) {
        ATLAS_ERROR("Invalid atlas manifest " + manifestPath + " - " + m_lastError);
        return false;
    }

    // Image path is stored relative to the manifest
    std::filesystem::path base = std::filesystem::path(manifestPath).parent_path();
    m_imagePath = (base / m_imagePath).string();
    ATLAS_INFO(std::format("Loaded {} regions from {}", m_regionCount, manifestPath));
    return true;
}

bool TextureAtlas::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        m_lastError = reader.getLastError();
        return false;
    }
    return applyManifest(reader.getRoot());
}

bool TextureAtlas::applyManifest(const JsonValue& root) {
    const JsonArray* regions = root["regions"].tryAsArray();
    if (regions == nullptr) {
        m_lastError = "Manifest has no 'regions' array";
        return false;
    }

    clear();
    m_imagePath = root["image"].tryAsString().value_or("");

    for (size_t i = 0; i < regions->size(); ++i) {
        const JsonValue& entry = (*regions)[i];
        auto name = entry["name"].tryAsString();
        if (!name || name->empty()) {
            ATLAS_WARN(std::format("Region #{} has no name, skipping", i));
            continue;
        }

        AtlasRegion region;
        region.name = *name;
        region.index = entry["index"].tryAsInt().value_or(0);
        region.x = entry["x"].tryAsInt().value_or(0);
        region.y = entry["y"].tryAsInt().value_or(0);
        region.width = entry["width"].tryAsInt().value_or(0);
        region.height = entry["height"].tryAsInt().value_or(0);
        region.originalWidth = entry["originalWidth"].tryAsInt().value_or(region.width);
        region.originalHeight = entry["originalHeight"].tryAsInt().value_or(region.height);
        addRegion(std::move(region));
    }
    return true;
}

void TextureAtlas::addRegion(AtlasRegion region) {
    region.textureId = m_textureId;
    auto& strip = m_regions[region.name];
    // upper_bound keeps insertion order among equal indices
    auto pos = std::upper_bound(strip.begin(), strip.end(), region.index,
                                [](int index, const AtlasRegion& r) { return index < r.index; });
    strip.insert(pos, std::move(region));
    ++m_regionCount;
}

std::vector<AtlasRegion> TextureAtlas::findRegions(const std::string& key) const {
    auto it = m_regions.find(key);
    if (it == m_regions.end()) {
        return {};
    }
    return it->second;
}

void TextureAtlas::clear() {
    m_regions.clear();
    m_regionCount = 0;
    m_imagePath.clear();
    m_lastError.clear();
}

} // namespace TesselEngine
