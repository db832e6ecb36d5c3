//
// Planar geometry primitives shared by the site, layout and evaluation modules.
//

#ifndef LANDOPT_GEOMETRY_HPP
#define LANDOPT_GEOMETRY_HPP

#include <cstddef>
#include <vector>

namespace landopt::geom {

struct Point2
{
    double x = 0.0;
    double y = 0.0;
};

inline bool operator==(const Point2& a, const Point2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) { return !(a == b); }

/// Closed ring stored without repeating the first vertex.
using Polygon  = std::vector<Point2>;
using Polyline = std::vector<Point2>;

/**
 * @brief Axis-aligned box. An empty box has min > max on at least one axis.
 */
class Bounds2
{
public:
    Bounds2() = default;
    Bounds2(double min_x, double min_y, double max_x, double max_y)
        : m_min_x(min_x), m_min_y(min_y), m_max_x(max_x), m_max_y(max_y) {}

    double minX() const { return m_min_x; }
    double minY() const { return m_min_y; }
    double maxX() const { return m_max_x; }
    double maxY() const { return m_max_y; }

    double width()  const { return m_max_x - m_min_x; }
    double height() const { return m_max_y - m_min_y; }
    double area()   const { return empty() ? 0.0 : width() * height(); }
    bool   empty()  const { return !(m_max_x > m_min_x) || !(m_max_y > m_min_y); }

    Point2 center() const { return {0.5 * (m_min_x + m_max_x), 0.5 * (m_min_y + m_max_y)}; }

    Bounds2 expanded(double d) const { return {m_min_x - d, m_min_y - d, m_max_x + d, m_max_y + d}; }
    Bounds2 shrunk(double d)   const { return expanded(-d); }

    bool contains(const Point2& p) const
    {
        return p.x >= m_min_x && p.x <= m_max_x && p.y >= m_min_y && p.y <= m_max_y;
    }

    /// Corners in counter-clockwise order starting at (min_x, min_y).
    Polygon toPolygon() const
    {
        return {{m_min_x, m_min_y}, {m_max_x, m_min_y}, {m_max_x, m_max_y}, {m_min_x, m_max_y}};
    }

private:
    double m_min_x = 0.0;
    double m_min_y = 0.0;
    double m_max_x = 0.0;
    double m_max_y = 0.0;
};

double distance(const Point2& a, const Point2& b);

/// Shoelace area, positive for counter-clockwise rings.
double signedArea(const Polygon& poly);
double area(const Polygon& poly);
double perimeter(const Polygon& poly);
Point2 centroid(const Polygon& poly);
Bounds2 boundsOf(const Polygon& poly);

Point2  rotate(const Point2& p, double angle_rad, const Point2& pivot);
Polygon rotate(const Polygon& poly, double angle_rad, const Point2& pivot);

/// Strict interior test; points on an edge are outside.
bool pointInPolygon(const Point2& p, const Polygon& poly);

/// True when the ring has no self-intersections or spikes and at least three vertices.
bool isSimple(const Polygon& poly);

/**
 * @brief Intersection of two rings as its connected pieces.
 * @details Either ring may be concave and in either orientation. Pieces are
 * counter-clockwise outer rings; a piece never bridges two disjoint regions.
 */
std::vector<Polygon> intersection(const Polygon& subject, const Polygon& clip);
std::vector<Polygon> clipToRect(const Polygon& subject, const Bounds2& rect);

/// Parts of the segment [a,b] inside the ring, ordered from a to b.
std::vector<Polyline> clipSegment(const Point2& a, const Point2& b, const Polygon& poly);

double overlapArea(const Polygon& subject, const Bounds2& rect);
double overlapArea(const Polygon& subject, const Polygon& clip);

/// True when the rectangle lies inside the ring (up to a relative area tolerance).
bool containsRect(const Polygon& poly, const Bounds2& rect, double rel_tol = 1e-7);

} // namespace landopt::geom

#endif // LANDOPT_GEOMETRY_HPP
