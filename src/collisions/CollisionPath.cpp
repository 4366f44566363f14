/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionPath.hpp"
#include "core/Logger.hpp"
#include <boost/geometry/algorithms/append.hpp>
#include <boost/geometry/algorithms/area.hpp>
#include <boost/geometry/algorithms/clear.hpp>
#include <boost/geometry/algorithms/correct.hpp>
#include <boost/geometry/algorithms/envelope.hpp>
#include <boost/geometry/algorithms/intersection.hpp>
#include <boost/geometry/algorithms/within.hpp>
#include <boost/geometry/core/exception.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <format>

namespace bg = boost::geometry;

namespace PolyForge {

namespace {
// Intersections smaller than this are numerical noise from touching edges
constexpr double kMinimumOverlapArea = 1e-9;

using PathBox = bg::model::box<CollisionPath::PathPoint>;
using PathMultiPolygon = bg::model::multi_polygon<CollisionPath::PathPolygon>;
} // anonymous namespace

CollisionPath::CollisionPath(const std::vector<Vector2D>& points) {
    if (points.size() < 3) {
        return;
    }

    for (const auto& point : points) {
        bg::append(m_polygon.outer(), PathPoint(point.getX(), point.getY()));
    }
    bg::correct(m_polygon);
}

bool CollisionPath::isEmpty() const {
    return m_polygon.outer().empty();
}

void CollisionPath::reset() {
    bg::clear(m_polygon);
}

size_t CollisionPath::getPointCount() const {
    const auto& ring = m_polygon.outer();
    return ring.empty() ? 0 : ring.size() - 1;
}

std::vector<Vector2D> CollisionPath::getPoints() const {
    std::vector<Vector2D> points;
    const size_t count = getPointCount();
    points.reserve(count);

    const auto& ring = m_polygon.outer();
    for (size_t i = 0; i < count; ++i) {
        points.emplace_back(static_cast<float>(ring[i].x()), static_cast<float>(ring[i].y()));
    }
    return points;
}

void CollisionPath::translate(const Vector2D& offset) {
    for (auto& point : m_polygon.outer()) {
        point.x(point.x() + offset.getX());
        point.y(point.y() + offset.getY());
    }
}

void CollisionPath::transform(const Transform2D& transformation) {
    for (auto& point : m_polygon.outer()) {
        const Vector2D moved = transformation.apply(
            Vector2D(static_cast<float>(point.x()), static_cast<float>(point.y())));
        point.x(moved.getX());
        point.y(moved.getY());
    }
    // A mirroring scale flips the winding order
    bg::correct(m_polygon);
}

bool CollisionPath::contains(const Vector2D& point) const {
    if (isEmpty()) {
        return false;
    }
    return bg::within(PathPoint(point.getX(), point.getY()), m_polygon);
}

float CollisionPath::getArea() const {
    return static_cast<float>(bg::area(m_polygon));
}

std::array<Vector2D, 4> CollisionPath::getBounds() const {
    if (isEmpty()) {
        return {};
    }

    PathBox box = bg::return_envelope<PathBox>(m_polygon);
    const float left = static_cast<float>(box.min_corner().x());
    const float top = static_cast<float>(box.min_corner().y());
    const float right = static_cast<float>(box.max_corner().x());
    const float bottom = static_cast<float>(box.max_corner().y());

    return {Vector2D(left, top), Vector2D(right, top),
            Vector2D(right, bottom), Vector2D(left, bottom)};
}

float CollisionPath::intersectionArea(const CollisionPath& other) const {
    if (isEmpty() || other.isEmpty()) {
        return 0.0f;
    }

    PathMultiPolygon overlap;
    try {
        bg::intersection(m_polygon, other.m_polygon, overlap);
    } catch (const bg::exception& e) {
        // Overlay rejects some invalid outlines; treat them as disjoint
        COLLISION_WARN(std::format("Intersection failed: {}", e.what()));
        return 0.0f;
    }
    return static_cast<float>(bg::area(overlap));
}

bool CollisionPath::intersects(const CollisionPath& other) const {
    return intersectionArea(other) > kMinimumOverlapArea;
}

} // namespace PolyForge
