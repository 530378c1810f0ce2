/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_HANDLE_HPP
#define ENTITY_HANDLE_HPP

#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <string>

namespace TesselEngine {

/**
 * @brief Entity type enumeration for fast type checking without RTTI
 *
 * - SpawnRequest: transient, carries only a SpawnRequest component
 * - AnimatedImage: carries RenderableImage and AnimationState
 */
enum class EntityKind : uint8_t {
    SpawnRequest = 0,
    AnimatedImage = 1,

    COUNT
};

constexpr const char* kindToString(EntityKind kind) noexcept {
    switch (kind) {
        case EntityKind::SpawnRequest:  return "SpawnRequest";
        case EntityKind::AnimatedImage: return "AnimatedImage";
        default:                        return "Unknown";
    }
}

/**
 * @brief Lightweight handle for referencing entities in EntityRegistry
 *
 * The index addresses a registry slot, the generation detects stale
 * references once a slot has been freed and reused.
 *
 * Usage:
 *   EntityHandle request = registry.createSpawnRequest(spawn);
 *   if (const SpawnRequest* data = registry.getSpawnRequest(request)) {
 *       ...
 *   }
 */
struct EntityHandle {
    using IndexType = uint32_t;
    using Generation = uint32_t;

    static constexpr IndexType INVALID_INDEX = UINT32_MAX;
    static constexpr Generation INVALID_GENERATION = 0;

    IndexType index{INVALID_INDEX};
    Generation generation{INVALID_GENERATION};
    EntityKind kind{EntityKind::SpawnRequest};

    constexpr EntityHandle() noexcept = default;

    constexpr EntityHandle(IndexType slot, Generation gen, EntityKind entityKind) noexcept
        : index(slot), generation(gen), kind(entityKind) {}

    [[nodiscard]] constexpr bool isValid() const noexcept {
        return index != INVALID_INDEX && generation != INVALID_GENERATION;
    }

    [[nodiscard]] constexpr IndexType getIndex() const noexcept { return index; }
    [[nodiscard]] constexpr Generation getGeneration() const noexcept { return generation; }
    [[nodiscard]] constexpr EntityKind getKind() const noexcept { return kind; }

    [[nodiscard]] constexpr bool
    operator==(const EntityHandle& other) const noexcept {
        return index == other.index && generation == other.generation && kind == other.kind;
    }

    [[nodiscard]] constexpr bool
    operator!=(const EntityHandle& other) const noexcept {
        return !(*this == other);
    }

    // Packs the fields into 64 bits, then folds down on 32-bit size_t
    [[nodiscard]] std::size_t hash() const noexcept {
        uint64_t h = static_cast<uint64_t>(index);
        h ^= static_cast<uint64_t>(generation) << 32;
        h ^= static_cast<uint64_t>(kind) << 60;
        if constexpr (sizeof(std::size_t) < sizeof(uint64_t)) {
            h ^= h >> 32;
        }
        return static_cast<std::size_t>(h);
    }

    [[nodiscard]] std::string toString() const {
        if (!isValid()) {
            return "EntityHandle::INVALID";
        }
        return std::format("EntityHandle({}:{}:{})", index, kindToString(kind), generation);
    }
};

inline constexpr EntityHandle INVALID_ENTITY_HANDLE{};

// Stream output operator for debugging and logging
inline std::ostream& operator<<(std::ostream& os, const EntityHandle& handle) {
    return os << handle.toString();
}

} // namespace TesselEngine

// Hash function for std::unordered_map support
namespace std {
template <>
struct hash<TesselEngine::EntityHandle> {
    std::size_t operator()(const TesselEngine::EntityHandle& handle) const noexcept {
        return handle.hash();
    }
};
} // namespace std

#endif // ENTITY_HANDLE_HPP
