/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MATHS_HPP
#define MATHS_HPP

#include "utils/Vector2D.hpp"
#include <cmath>
#include <vector>

namespace PolyForge {
namespace Maths {

// Two floats closer than this are considered equal
constexpr float FloatPrecision = 0.000001f;

/**
 * @brief Random float in [min, max).
 * @throws std::invalid_argument if min >= max
 */
float random(float min, float max);

bool randomBoolean();

/**
 * @brief Picks one of the two edges at random.
 * @throws std::invalid_argument if leftEdge >= rightEdge
 */
float randomAtEdge(float leftEdge, float rightEdge);

/**
 * @brief Snaps num to the closest edge. Equidistant values snap right.
 * @throws std::invalid_argument if leftEdge >= rightEdge
 */
float snap(float num, float leftEdge, float rightEdge);

inline float magnitude(float x, float y) { return std::sqrt(x * x + y * y); }
inline float magnitude(const Vector2D& p) { return magnitude(p.getX(), p.getY()); }

inline bool floatEquals(float a, float b) { return std::abs(a - b) < FloatPrecision; }

inline bool floatEquals(const Vector2D& a, const Vector2D& b) {
    return floatEquals(a.getX(), b.getX()) && floatEquals(a.getY(), b.getY());
}

/**
 * @brief Average of the given points. Returns (0, 0) for an empty set.
 */
Vector2D centerOf(const std::vector<Vector2D>& points);

} // namespace Maths
} // namespace PolyForge

#endif // MATHS_HPP
