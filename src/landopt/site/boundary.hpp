//
// Site boundary: the immutable parcel outline every layout is cut from.
//

#ifndef LANDOPT_BOUNDARY_HPP
#define LANDOPT_BOUNDARY_HPP

#include "../geometry.hpp"

#include <vector>

namespace landopt::site {

/**
 * @class Boundary
 * @brief Closed, simple, positive-area polygon in planar coordinates.
 *
 * @details The constructor normalizes the ring (drops a repeated closing vertex
 * and consecutive duplicates, orients it counter-clockwise) and validates it.
 * A Boundary that exists is always valid.
 *
 * @throws InvalidBoundary for fewer than three distinct vertices, non-finite
 * coordinates, self-intersections or zero area.
 */
class Boundary {
public:
    explicit Boundary(const std::vector<geom::Point2>& vertices);

    const geom::Polygon& vertices() const { return m_ring; }

    geom::Bounds2 getBounds() const { return m_bounds; }

    double getArea() const { return m_area; }

    geom::Point2 getCentroid() const { return m_centroid; }

    bool isInside(const geom::Point2& p) const;

    /// Direction (radians) of the longest edge, folded into (-pi/2, pi/2].
    double longestEdgeAngle() const;

private:
    geom::Polygon m_ring;
    geom::Bounds2 m_bounds;
    geom::Point2  m_centroid;
    double        m_area = 0.0;
};

/**
 * @brief Normalizes and validates any ring the way Boundary does.
 * @param what Name used in the exception message.
 * @throws InvalidBoundary when the ring is unusable.
 */
geom::Polygon normalizeRing(const std::vector<geom::Point2>& vertices, const char* what);

} // namespace landopt::site

#endif // LANDOPT_BOUNDARY_HPP
