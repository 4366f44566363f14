/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/Transform2D.hpp"
#include "utils/Maths.hpp"
#include <cmath>
#include <numbers>

namespace PolyForge {

Transform2D Transform2D::translation(const Vector2D& offset) {
    return Transform2D(1.0f, 0.0f, offset.getX(),
                       0.0f, 1.0f, offset.getY());
}

Transform2D Transform2D::rotation(float degrees) {
    const double radians = static_cast<double>(degrees) * std::numbers::pi / 180.0;
    const float c = static_cast<float>(std::cos(radians));
    const float s = static_cast<float>(std::sin(radians));
    return Transform2D(c, -s, 0.0f,
                       s, c, 0.0f);
}

Transform2D Transform2D::rotationAround(float degrees, const Vector2D& pivot) {
    return translation(pivot) * rotation(degrees) * translation(-pivot);
}

Transform2D Transform2D::scaling(const Vector2D& factors) {
    return Transform2D(factors.getX(), 0.0f, 0.0f,
                       0.0f, factors.getY(), 0.0f);
}

Transform2D Transform2D::scalingAround(const Vector2D& factors, const Vector2D& pivot) {
    return translation(pivot) * scaling(factors) * translation(-pivot);
}

Transform2D Transform2D::operator*(const Transform2D& o) const {
    const auto& m = m_matrix;
    const auto& n = o.m_matrix;
    return Transform2D(
        m[0] * n[0] + m[1] * n[3],
        m[0] * n[1] + m[1] * n[4],
        m[0] * n[2] + m[1] * n[5] + m[2],
        m[3] * n[0] + m[4] * n[3],
        m[3] * n[1] + m[4] * n[4],
        m[3] * n[2] + m[4] * n[5] + m[5]);
}

Vector2D Transform2D::apply(const Vector2D& p) const {
    return Vector2D(m_matrix[0] * p.getX() + m_matrix[1] * p.getY() + m_matrix[2],
                    m_matrix[3] * p.getX() + m_matrix[4] * p.getY() + m_matrix[5]);
}

Vector2D Transform2D::applyDirection(const Vector2D& d) const {
    return Vector2D(m_matrix[0] * d.getX() + m_matrix[1] * d.getY(),
                    m_matrix[3] * d.getX() + m_matrix[4] * d.getY());
}

bool Transform2D::isIdentity() const {
    static const Transform2D kIdentity;
    for (size_t i = 0; i < m_matrix.size(); ++i) {
        if (!Maths::floatEquals(m_matrix[i], kIdentity.m_matrix[i])) {
            return false;
        }
    }
    return true;
}

} // namespace PolyForge
