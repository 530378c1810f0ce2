/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENGINE_ERRORS_HPP
#define ENGINE_ERRORS_HPP

/**
 * @file EngineErrors.hpp
 * @brief Exception types raised by the entity pipeline
 *
 * Both kinds are content bugs, not transient conditions: they abort the single
 * operation that raised them (one spawn, one clip build) and propagate to the
 * caller. Nothing in the core retries.
 */

#include <stdexcept>
#include <string>

namespace TesselEngine {

class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Bad or missing spawn descriptor (blank type, untyped map object, missing layer)
 */
class ConfigError : public EngineError {
public:
    explicit ConfigError(const std::string& message)
        : EngineError(message) {}
};

/**
 * @brief Atlas key or clip id with no matching regions in the asset catalog
 */
class AssetError : public EngineError {
public:
    explicit AssetError(const std::string& message)
        : EngineError(message) {}
};

} // namespace TesselEngine

#endif // ENGINE_ERRORS_HPP
