//
// Decoded land-use layout: lots, road network, green space.
//

#ifndef LANDOPT_LAYOUT_HPP
#define LANDOPT_LAYOUT_HPP

#include "zones.hpp"
#include "../geometry.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace landopt::layout {

enum class RoadHierarchy { Primary, Collector, Secondary };

const char* toString(RoadHierarchy h);

struct RoadEdge {
    std::size_t   from = 0;        // index into RoadNetwork::nodes
    std::size_t   to   = 0;
    double        width = 0.0;
    RoadHierarchy hierarchy = RoadHierarchy::Secondary;
};

/**
 * @brief Road network as a node arena plus an edge list of index pairs.
 * Surfaces hold the paved area clipped to the boundary; they never overlap.
 */
struct RoadNetwork {
    std::vector<geom::Point2>  nodes;
    std::vector<RoadEdge>      edges;
    std::vector<geom::Polygon> surfaces;

    std::size_t addNode(const geom::Point2& p);
    void addEdge(std::size_t from, std::size_t to, double width, RoadHierarchy h);

    double edgeLength(const RoadEdge& e) const;
    double totalLength() const;
    double surfaceArea() const;
};

struct Lot {
    geom::Polygon shape;
    double  area         = 0.0;
    double  width        = 0.0;   // along the fronting road
    double  depth        = 0.0;
    double  frontage     = 0.0;   // boundary length adjacent to roads
    double  aspect_ratio = 0.0;   // depth / width
    bool    corner          = false;
    bool    fronts_primary  = false;
    ZoneTag zone;
    double  quality      = 0.0;   // [0,100]
};

/**
 * @brief Read-only result of decoding one genome.
 *
 * @details Lots are pairwise disjoint and disjoint from road surfaces. Lots,
 * road surfaces and green polygons lie inside the boundary.
 */
struct Layout {
    std::vector<Lot>           lots;
    RoadNetwork                roads;
    std::vector<geom::Polygon> green_spaces;

    double boundary_area    = 0.0;
    double green_area       = 0.0;
    double unallocated_area = 0.0;
    double buffer_width     = 0.0;
    double orientation_deg  = 0.0;

    std::uint64_t genome_hash = 0;   // key for genome-keyed caches

    double sellableArea() const;
    double greenRatio() const;
    double sellableRatio() const;
    std::size_t cornerLots() const;
    double totalFrontage() const;
};

/// Parameters of the per-lot quality score.
struct QualityParams {
    double min_frontage = 0.0;
    double preferred_frontage_factor = 1.5;
    double aspect_min = 1.5;
    double aspect_max = 2.0;

    double regularity_weight = 0.5;
    double frontage_weight   = 0.35;
    double corner_weight     = 0.15;
};

double regularityScore(const Lot& lot, const QualityParams& params);
double frontageScore(const Lot& lot, const QualityParams& params);
double cornerScore(const Lot& lot);

/// Weighted mean of the regularity, frontage and corner scores, in [0,100].
double lotQuality(const Lot& lot, const QualityParams& params);

} // namespace landopt::layout

#endif // LANDOPT_LAYOUT_HPP
