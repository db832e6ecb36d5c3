// geometry.cpp
#include "geometry.hpp"

#include <algorithm>
#include <cmath>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_linestring.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/register/point.hpp>

BOOST_GEOMETRY_REGISTER_POINT_2D(landopt::geom::Point2, double, boost::geometry::cs::cartesian, x, y)

namespace landopt::geom {

namespace bg = boost::geometry;

namespace {

// Counter-clockwise, closed
using BgPolygon      = bg::model::polygon<Point2, false, true>;
using BgMultiPolygon = bg::model::multi_polygon<BgPolygon>;
using BgLine         = bg::model::linestring<Point2>;
using BgMultiLine    = bg::model::multi_linestring<BgLine>;
using BgRing         = bg::model::ring<Point2, false, false>;

BgRing toRing(const Polygon& poly)
{
    return BgRing(poly.begin(), poly.end());
}

// Closed polygon with the orientation fixed; the ring is otherwise left as given.
BgPolygon toPolygon(const Polygon& poly)
{
    BgPolygon out;
    auto& outer = out.outer();
    outer.assign(poly.begin(), poly.end());
    if (!poly.empty()) outer.push_back(poly.front());
    if (bg::area(out) < 0.0) std::reverse(outer.begin(), outer.end());
    return out;
}

Polygon fromRing(const BgPolygon::ring_type& ring)
{
    Polygon out(ring.begin(), ring.end());
    if (out.size() > 1 && out.front() == out.back()) out.pop_back();
    return out;
}

} // namespace

double distance(const Point2& a, const Point2& b)
{
    return bg::distance(a, b);
}

double signedArea(const Polygon& poly)
{
    if (poly.size() < 3) return 0.0;
    return bg::area(toRing(poly));
}

double area(const Polygon& poly)
{
    return std::abs(signedArea(poly));
}

double perimeter(const Polygon& poly)
{
    if (poly.size() < 2) return 0.0;
    return bg::perimeter(toRing(poly));
}

Point2 centroid(const Polygon& poly)
{
    const std::size_t n = poly.size();
    if (n == 0) return {};

    if (std::abs(signedArea(poly)) < 1e-12) {
        // Degenerate ring: fall back to the vertex average
        Point2 c;
        for (const auto& p : poly) { c.x += p.x; c.y += p.y; }
        c.x /= static_cast<double>(n);
        c.y /= static_cast<double>(n);
        return c;
    }
    Point2 c;
    bg::centroid(toPolygon(poly), c);
    return c;
}

Bounds2 boundsOf(const Polygon& poly)
{
    if (poly.empty()) return {};
    bg::model::box<Point2> box;
    bg::envelope(toRing(poly), box);
    return {box.min_corner().x, box.min_corner().y, box.max_corner().x, box.max_corner().y};
}

Point2 rotate(const Point2& p, double angle_rad, const Point2& pivot)
{
    const double c = std::cos(angle_rad);
    const double s = std::sin(angle_rad);
    const double dx = p.x - pivot.x;
    const double dy = p.y - pivot.y;
    return {pivot.x + c * dx - s * dy, pivot.y + s * dx + c * dy};
}

Polygon rotate(const Polygon& poly, double angle_rad, const Point2& pivot)
{
    Polygon out;
    out.reserve(poly.size());
    for (const auto& p : poly) out.push_back(rotate(p, angle_rad, pivot));
    return out;
}

bool pointInPolygon(const Point2& p, const Polygon& poly)
{
    if (poly.size() < 3) return false;
    return bg::within(p, toPolygon(poly));
}

bool isSimple(const Polygon& poly)
{
    if (poly.size() < 3) return false;
    for (std::size_t i = 0; i < poly.size(); ++i) {
        if (poly[i] == poly[(i + 1) % poly.size()]) return false;
    }
    return bg::is_valid(toPolygon(poly));
}

std::vector<Polygon> intersection(const Polygon& subject, const Polygon& clip)
{
    if (subject.size() < 3 || clip.size() < 3) return {};

    BgMultiPolygon result;
    bg::intersection(toPolygon(subject), toPolygon(clip), result);

    std::vector<Polygon> pieces;
    pieces.reserve(result.size());
    for (const auto& piece : result) {
        Polygon ring = fromRing(piece.outer());
        if (ring.size() >= 3) pieces.push_back(std::move(ring));
    }
    return pieces;
}

std::vector<Polygon> clipToRect(const Polygon& subject, const Bounds2& rect)
{
    if (rect.empty()) return {};
    return intersection(subject, rect.toPolygon());
}

std::vector<Polyline> clipSegment(const Point2& a, const Point2& b, const Polygon& poly)
{
    if (poly.size() < 3 || a == b) return {};

    BgLine line;
    line.push_back(a);
    line.push_back(b);
    BgMultiLine result;
    bg::intersection(line, toPolygon(poly), result);

    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    auto along = [&](const Point2& p) { return (p.x - a.x) * dx + (p.y - a.y) * dy; };

    std::vector<Polyline> parts;
    for (const auto& piece : result) {
        if (piece.size() < 2) continue;
        Polyline part(piece.begin(), piece.end());
        if (along(part.front()) > along(part.back())) std::reverse(part.begin(), part.end());
        if (part.front() == part.back()) continue;
        parts.push_back(std::move(part));
    }
    std::sort(parts.begin(), parts.end(), [&](const Polyline& l, const Polyline& r) {
        return along(l.front()) < along(r.front());
    });
    return parts;
}

double overlapArea(const Polygon& subject, const Bounds2& rect)
{
    double sum = 0.0;
    for (const auto& piece : clipToRect(subject, rect)) sum += area(piece);
    return sum;
}

double overlapArea(const Polygon& subject, const Polygon& clip)
{
    double sum = 0.0;
    for (const auto& piece : intersection(subject, clip)) sum += area(piece);
    return sum;
}

bool containsRect(const Polygon& poly, const Bounds2& rect, double rel_tol)
{
    if (rect.empty()) return false;
    const double rect_area = rect.area();
    return overlapArea(poly, rect) >= rect_area * (1.0 - rel_tol);
}

} // namespace landopt::geom
