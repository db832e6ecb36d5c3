// boundary.cpp
#include "boundary.hpp"
#include "../errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace landopt::site {

geom::Polygon normalizeRing(const std::vector<geom::Point2>& vertices, const char* what)
{
    geom::Polygon ring;
    ring.reserve(vertices.size());
    for (const auto& p : vertices) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
            throw InvalidBoundary(std::string(what) + " has a non-finite coordinate.");
        }
        if (ring.empty() || ring.back() != p) ring.push_back(p);
    }
    while (ring.size() > 1 && ring.front() == ring.back()) ring.pop_back();

    if (ring.size() < 3) {
        throw InvalidBoundary(std::string(what) + " needs at least three distinct vertices.");
    }
    if (!geom::isSimple(ring)) {
        throw InvalidBoundary(std::string(what) + " ring is self-intersecting.");
    }

    const double a = geom::signedArea(ring);
    if (!(std::abs(a) > 1e-9)) {
        throw InvalidBoundary(std::string(what) + " has zero area.");
    }
    if (a < 0.0) std::reverse(ring.begin(), ring.end());
    return ring;
}

Boundary::Boundary(const std::vector<geom::Point2>& vertices)
    : m_ring(normalizeRing(vertices, "boundary"))
{
    m_bounds   = geom::boundsOf(m_ring);
    m_area     = geom::area(m_ring);
    m_centroid = geom::centroid(m_ring);
}

bool Boundary::isInside(const geom::Point2& p) const
{
    if (!m_bounds.contains(p)) return false;
    return geom::pointInPolygon(p, m_ring);
}

double Boundary::longestEdgeAngle() const
{
    const std::size_t n = m_ring.size();
    double best_len = -1.0;
    double angle = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const geom::Point2& a = m_ring[i];
        const geom::Point2& b = m_ring[(i + 1) % n];
        const double len = geom::distance(a, b);
        // strict comparison keeps the first longest edge, so the result is stable
        if (len > best_len + 1e-9) {
            best_len = len;
            angle = std::atan2(b.y - a.y, b.x - a.x);
        }
    }
    const double half_pi = 0.5 * M_PI;
    while (angle > half_pi) angle -= M_PI;
    while (angle <= -half_pi) angle += M_PI;
    return angle;
}

} // namespace landopt::site
