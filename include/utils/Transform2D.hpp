/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TRANSFORM_2D_HPP
#define TRANSFORM_2D_HPP

#include "utils/Vector2D.hpp"
#include <array>

namespace PolyForge {

/**
 * @brief 2D affine transform stored as the top two rows of a 3x3 matrix.
 *
 * Layout is row-major: | m00 m01 m02 |
 *                      | m10 m11 m12 |
 *
 * Composition follows matrix order: (a * b).apply(p) == a.apply(b.apply(p)),
 * so translation(t) * rotation(r) * scaling(s) scales first and translates
 * last. Angles are in degrees; positive angles turn +x towards +y, which is
 * clockwise on a y-down screen.
 */
class Transform2D {
public:
    Transform2D() = default;
    Transform2D(float m00, float m01, float m02, float m10, float m11, float m12)
        : m_matrix{m00, m01, m02, m10, m11, m12} {}

    static Transform2D identity() { return Transform2D(); }
    static Transform2D translation(const Vector2D& offset);
    static Transform2D rotation(float degrees);
    static Transform2D rotationAround(float degrees, const Vector2D& pivot);
    static Transform2D scaling(const Vector2D& factors);
    static Transform2D scalingAround(const Vector2D& factors, const Vector2D& pivot);

    Transform2D operator*(const Transform2D& other) const;
    Transform2D& operator*=(const Transform2D& other) {
        *this = *this * other;
        return *this;
    }

    Vector2D apply(const Vector2D& point) const;

    // Applies the linear part only (no translation)
    Vector2D applyDirection(const Vector2D& direction) const;

    float get(int row, int column) const { return m_matrix[row * 3 + column]; }
    Vector2D getTranslation() const { return Vector2D(m_matrix[2], m_matrix[5]); }
    const std::array<float, 6>& getMatrix() const { return m_matrix; }

    bool isIdentity() const;

private:
    std::array<float, 6> m_matrix{1.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f};
};

} // namespace PolyForge

#endif // TRANSFORM_2D_HPP
