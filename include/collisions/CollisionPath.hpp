/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_PATH_HPP
#define COLLISION_PATH_HPP

#include "utils/Transform2D.hpp"
#include "utils/Vector2D.hpp"
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <array>
#include <cstddef>
#include <vector>

namespace PolyForge {

/**
 * @brief Closed polygon outline used for exact narrow-phase collision.
 *
 * Backed by a Boost.Geometry polygon in double precision. The outline is
 * corrected on construction (winding order and closing point), so callers can
 * pass points in either orientation without repeating the first point.
 */
class CollisionPath {
public:
    using PathPoint = boost::geometry::model::d2::point_xy<double>;
    using PathPolygon = boost::geometry::model::polygon<PathPoint>;

    CollisionPath() = default;

    /**
     * @brief Builds the outline from an ordered list of vertices.
     *
     * Fewer than three vertices produce an empty path, which never
     * intersects anything.
     */
    explicit CollisionPath(const std::vector<Vector2D>& points);

    bool isEmpty() const;
    void reset();

    // Vertex count without the closing duplicate
    size_t getPointCount() const;
    std::vector<Vector2D> getPoints() const;

    void translate(const Vector2D& offset);
    void transform(const Transform2D& transformation);

    bool contains(const Vector2D& point) const;
    float getArea() const;

    /**
     * @brief Axis-aligned envelope as four corners in Boundary order
     * (top-left, top-right, bottom-right, bottom-left).
     */
    std::array<Vector2D, 4> getBounds() const;

    /**
     * @brief Area of the region shared by both outlines.
     */
    float intersectionArea(const CollisionPath& other) const;

    /**
     * @brief True when the two outlines share a region of positive area.
     *
     * Outlines that only touch along an edge or at a corner do not
     * intersect. Self-intersecting outlines give an approximate result, and
     * outlines Boost.Geometry refuses to overlay are reported as disjoint.
     */
    bool intersects(const CollisionPath& other) const;

    const PathPolygon& getPolygon() const { return m_polygon; }

private:
    PathPolygon m_polygon;
};

} // namespace PolyForge

#endif // COLLISION_PATH_HPP
