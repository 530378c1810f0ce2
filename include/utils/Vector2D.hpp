/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <ostream>

namespace TesselEngine {

// World-space position or size, in world units unless stated otherwise
class Vector2D {
public:
    Vector2D() : m_x(0.0f), m_y(0.0f) {}
    Vector2D(float x, float y) : m_x(x), m_y(y) {}

    float getX() const { return m_x; }
    float getY() const { return m_y; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }

    Vector2D operator+(const Vector2D& v2) const {
        return Vector2D(m_x + v2.m_x, m_y + v2.m_y);
    }

    Vector2D operator-(const Vector2D& v2) const {
        return Vector2D(m_x - v2.m_x, m_y - v2.m_y);
    }

    Vector2D operator*(float scalar) const {
        return Vector2D(m_x * scalar, m_y * scalar);
    }

    Vector2D& operator*=(float scalar) {
        m_x *= scalar;
        m_y *= scalar;
        return *this;
    }

    bool operator==(const Vector2D& other) const = default;

private:
    float m_x{0.0f};
    float m_y{0.0f};
};

// Stream operator for Boost.Test diagnostics
inline std::ostream& operator<<(std::ostream& os, const Vector2D& v) {
    return os << "Vector2D(" << v.getX() << ", " << v.getY() << ")";
}

} // namespace TesselEngine

#endif  // VECTOR_2D_HPP
