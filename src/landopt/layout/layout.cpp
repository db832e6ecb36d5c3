// layout.cpp
#include "layout.hpp"

#include <algorithm>
#include <cmath>

namespace landopt::layout {

const char* toString(RoadHierarchy h)
{
    switch (h) {
        case RoadHierarchy::Primary:   return "primary";
        case RoadHierarchy::Collector: return "collector";
        case RoadHierarchy::Secondary: return "secondary";
    }
    return "?";
}

std::size_t RoadNetwork::addNode(const geom::Point2& p)
{
    nodes.push_back(p);
    return nodes.size() - 1;
}

void RoadNetwork::addEdge(std::size_t from, std::size_t to, double width, RoadHierarchy h)
{
    if (from == to) return;
    edges.push_back({from, to, width, h});
}

double RoadNetwork::edgeLength(const RoadEdge& e) const
{
    return geom::distance(nodes[e.from], nodes[e.to]);
}

double RoadNetwork::totalLength() const
{
    double sum = 0.0;
    for (const auto& e : edges) sum += edgeLength(e);
    return sum;
}

double RoadNetwork::surfaceArea() const
{
    double sum = 0.0;
    for (const auto& s : surfaces) sum += geom::area(s);
    return sum;
}

double Layout::sellableArea() const
{
    double sum = 0.0;
    for (const auto& lot : lots) sum += lot.area;
    return sum;
}

double Layout::greenRatio() const
{
    return boundary_area > 0.0 ? green_area / boundary_area : 0.0;
}

double Layout::sellableRatio() const
{
    return boundary_area > 0.0 ? sellableArea() / boundary_area : 0.0;
}

std::size_t Layout::cornerLots() const
{
    return static_cast<std::size_t>(
        std::count_if(lots.begin(), lots.end(), [](const Lot& l) { return l.corner; }));
}

double Layout::totalFrontage() const
{
    double sum = 0.0;
    for (const auto& lot : lots) sum += lot.frontage;
    return sum;
}

double regularityScore(const Lot& lot, const QualityParams& params)
{
    const double box = lot.width * lot.depth;
    const double rectangularity = box > 0.0 ? std::min(1.0, lot.area / box) : 0.0;

    double aspect_fit = 0.0;
    const double r = lot.aspect_ratio;
    if (r > 0.0) {
        if (r < params.aspect_min)      aspect_fit = r / params.aspect_min;
        else if (r > params.aspect_max) aspect_fit = params.aspect_max / r;
        else                            aspect_fit = 1.0;
    }
    return 100.0 * (0.7 * rectangularity + 0.3 * aspect_fit);
}

double frontageScore(const Lot& lot, const QualityParams& params)
{
    const double preferred = params.min_frontage * params.preferred_frontage_factor;
    if (preferred <= 0.0) return lot.frontage > 0.0 ? 100.0 : 0.0;
    return 100.0 * std::clamp(lot.frontage / preferred, 0.0, 1.0);
}

double cornerScore(const Lot& lot)
{
    return lot.corner ? 100.0 : 0.0;
}

double lotQuality(const Lot& lot, const QualityParams& params)
{
    const double wsum = params.regularity_weight + params.frontage_weight + params.corner_weight;
    if (wsum <= 0.0) return 0.0;
    const double q = (params.regularity_weight * regularityScore(lot, params) +
                      params.frontage_weight   * frontageScore(lot, params) +
                      params.corner_weight     * cornerScore(lot)) / wsum;
    return std::clamp(q, 0.0, 100.0);
}

} // namespace landopt::layout
