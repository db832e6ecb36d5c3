// layoutDecoder.cpp
#include "layoutDecoder.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace landopt::layout {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr std::size_t kNoNode = std::numeric_limits<std::size_t>::max();
constexpr double kMinPieceArea = 1e-9;
constexpr double kMinRunLength = 1e-9;

double lerp(double a, double b, double t) { return a + (b - a) * t; }

double foldHalfTurn(double angle)
{
    const double half_pi = 0.5 * M_PI;
    while (angle > half_pi) angle -= M_PI;
    while (angle <= -half_pi) angle += M_PI;
    return angle;
}

// Lower threshold a generated value has to respect. An upper-only rule caps the default.
double resolveMinimum(const site::ConstraintSet& cs, const char* name, double fallback)
{
    const site::ConstraintRule* rule = cs.find(name);
    if (!rule) return fallback;
    if (rule->hasLowerBound()) return rule->lowerBound();
    return std::min(fallback, rule->upperBound());
}

struct HBand {
    double y0 = 0.0, y1 = 0.0;
    RoadHierarchy hierarchy = RoadHierarchy::Collector;
    double width = 0.0;
};

struct Row {
    double y0 = 0.0, y1 = 0.0;
    RoadHierarchy front = RoadHierarchy::Collector;
};

struct Segment {
    double x0 = 0.0, x1 = 0.0;
    bool road_left = false;
    bool road_right = false;
};

struct Cut {
    double x = 0.0;
    double x0 = 0.0, x1 = 0.0;
};

struct LotDraft {
    Lot  lot;
    bool green = false;
};

/**
 * Stacks lot rows and collector bands outward from a road edge.
 * @param dir +1 stacks towards larger y, -1 towards smaller y.
 */
void stackRows(double edge, double room, int dir, double depth, double collector_width,
               double edge_factor, RoadHierarchy first_front,
               std::vector<HBand>& bands, std::vector<Row>& rows,
               std::vector<std::pair<double, double>>& leftovers)
{
    auto span = [&](double s0, double s1) {
        return dir > 0 ? std::make_pair(edge + s0, edge + s1)
                       : std::make_pair(edge - s1, edge - s0);
    };

    double s = 0.0;
    RoadHierarchy front = first_front;
    if (depth <= 0.0 || room <= 0.0) return;

    while (room - s >= 2.0 * depth + collector_width) {
        auto r0 = span(s, s + depth);
        auto r1 = span(s + depth, s + 2.0 * depth);
        auto c  = span(s + 2.0 * depth, s + 2.0 * depth + collector_width);
        rows.push_back({r0.first, r0.second, front});
        rows.push_back({r1.first, r1.second, RoadHierarchy::Collector});
        HBand band;
        band.y0 = c.first;
        band.y1 = c.second;
        band.hierarchy = RoadHierarchy::Collector;
        band.width = collector_width;
        bands.push_back(std::move(band));
        s += 2.0 * depth + collector_width;
        front = RoadHierarchy::Collector;
    }

    const double rest = room - s;
    const double edge_depth = std::min(rest, depth * edge_factor);
    if (edge_depth > 0.0) {
        auto r = span(s, s + edge_depth);
        rows.push_back({r.first, r.second, front});
    }
    if (rest - edge_depth > 0.0) {
        leftovers.push_back(span(s + edge_depth, room));
    }
}

void addSurfaces(RoadNetwork& net, std::vector<geom::Polygon> pieces)
{
    for (auto& piece : pieces) {
        if (geom::area(piece) > kMinPieceArea) net.surfaces.push_back(std::move(piece));
    }
}

bool touchesAny(const std::vector<geom::Polygon>& zones, const geom::Bounds2& rect)
{
    for (const auto& z : zones) {
        const geom::Bounds2 zb = geom::boundsOf(z);
        if (zb.maxX() <= rect.minX() || zb.minX() >= rect.maxX() ||
            zb.maxY() <= rect.minY() || zb.minY() >= rect.maxY()) continue;
        if (geom::overlapArea(z, rect) > 1e-9) return true;
    }
    return false;
}

} // namespace

LayoutDecoder::LayoutDecoder(const site::Site& site,
                             const DecoderConfig& config,
                             const GenomeSchema& schema)
    : m_site(site), m_config(config), m_schema(schema)
{
    namespace rules = site::rules;
    const site::ConstraintSet& cs = site.constraints;

    m_params.buffer_width    = std::max(0.0, resolveMinimum(cs, rules::BufferWidth, config.buffer_width));
    m_params.primary_width   = std::max(1e-3, resolveMinimum(cs, rules::RoadWidth, config.primary_road_width));
    m_params.secondary_width = std::max(1e-3, resolveMinimum(cs, rules::SecondaryRoadWidth,
                                                             config.secondary_road_width));

    m_params.min_lot_area = std::max(1e-6, resolveMinimum(cs, rules::LotArea, config.min_lot_area));
    m_params.max_lot_area = std::max(m_params.min_lot_area, cs.upperOr(rules::LotArea, kInf));
    m_params.min_frontage = std::max(0.0, resolveMinimum(cs, rules::Frontage, config.min_frontage));

    double a_lo = config.aspect_min;
    double a_hi = config.aspect_max;
    if (const site::ConstraintRule* rule = cs.find(rules::AspectRatio)) {
        a_lo = rule->hasLowerBound() ? rule->lowerBound() : std::min(a_lo, rule->upperBound());
        a_hi = rule->hasUpperBound() ? rule->upperBound() : std::max(a_lo, a_hi);
    }
    m_params.aspect_min = std::max(1e-3, a_lo);
    m_params.aspect_max = std::max(m_params.aspect_min, a_hi);

    m_params.green_target = std::max(0.0, cs.lowerOr(rules::GreenSpaceRatio, 0.0));

    m_quality.min_frontage = m_params.min_frontage;
    m_quality.preferred_frontage_factor = config.preferred_frontage_factor;
    m_quality.aspect_min = m_params.aspect_min;
    m_quality.aspect_max = m_params.aspect_max;

    double reference = site.boundary.longestEdgeAngle();
    for (const auto& guide : site.road_guides) {
        if (guide.size() < 2) continue;
        const geom::Point2& a = guide.front();
        const geom::Point2& b = guide.back();
        if (a == b) continue;
        reference = foldHalfTurn(std::atan2(b.y - a.y, b.x - a.x));
        break;
    }
    m_reference_deg = reference * 180.0 / M_PI;
}

Layout LayoutDecoder::decode(const Genome& raw) const
{
    const Genome g = repair(raw, m_schema);
    const DecodeParameters& p = m_params;

    Layout out;
    out.boundary_area = m_site.boundary.getArea();
    out.buffer_width  = p.buffer_width;
    out.genome_hash   = g.hash();
    out.orientation_deg = m_reference_deg + (2.0 * g[Orientation] - 1.0) * m_config.max_angle_deg;

    const double theta = out.orientation_deg * M_PI / 180.0;
    const geom::Point2 pivot = m_site.boundary.getCentroid();

    // 1. local frame: primary axis along X
    const geom::Polygon ring = geom::rotate(m_site.boundary.vertices(), -theta, pivot);
    std::vector<geom::Polygon> exclusions;
    exclusions.reserve(m_site.exclusion_zones.size());
    for (const auto& z : m_site.exclusion_zones) exclusions.push_back(geom::rotate(z, -theta, pivot));

    const geom::Bounds2 local = geom::boundsOf(ring);
    const geom::Bounds2 box = local.shrunk(p.buffer_width);

    if (box.empty() || box.height() < p.primary_width) {
        out.unallocated_area = out.boundary_area;
        return out;
    }

    // target lot shape
    const double area_hi = std::max(p.min_lot_area, std::min(p.max_lot_area, p.min_lot_area * m_config.lot_size_span));
    const double target_area = lerp(p.min_lot_area, area_hi, g[LotSize]);
    const double ratio = lerp(p.aspect_min, p.aspect_max, g[AspectRatio]);
    const double base_width = std::max(p.min_frontage, std::sqrt(target_area / ratio));
    const double row_depth = (target_area / base_width) *
                             lerp(1.0, std::max(1.0, m_config.max_row_stretch), g[RowStretch]);

    // 3. primary road and 4. collectors
    std::vector<HBand> bands;
    std::vector<Row> rows;
    std::vector<std::pair<double, double>> leftovers;

    const double offset = lerp(m_config.primary_offset_min, m_config.primary_offset_max, g[PrimaryOffset]);
    const double yc = box.minY() + offset * box.height();
    const double p0 = std::clamp(yc - 0.5 * p.primary_width, box.minY(), box.maxY() - p.primary_width);
    {
        HBand primary;
        primary.y0 = p0;
        primary.y1 = p0 + p.primary_width;
        primary.hierarchy = RoadHierarchy::Primary;
        primary.width = p.primary_width;
        bands.push_back(std::move(primary));
    }
    stackRows(p0 + p.primary_width, box.maxY() - (p0 + p.primary_width), +1, row_depth, p.secondary_width,
              m_config.edge_row_depth_factor, RoadHierarchy::Primary, bands, rows, leftovers);
    stackRows(p0, p0 - box.minY(), -1, row_depth, p.secondary_width,
              m_config.edge_row_depth_factor, RoadHierarchy::Primary, bands, rows, leftovers);

    std::sort(bands.begin(), bands.end(), [](const HBand& a, const HBand& b) { return a.y0 < b.y0; });

    // 5. secondary cuts
    std::vector<Cut> cuts;
    const std::size_t active = g.activeCuts(m_schema);
    const double half_sw = 0.5 * p.secondary_width;
    for (std::size_t i = 0; i < active; ++i) {
        const double x = box.minX() + g[FirstCut + i] * box.width();
        Cut c{x, x - half_sw, x + half_sw};
        if (c.x0 <= box.minX() || c.x1 >= box.maxX()) continue;
        if (!cuts.empty() && c.x0 < cuts.back().x1) continue;
        cuts.push_back(c);
    }

    std::vector<Segment> segments;
    {
        double x = box.minX();
        bool road = false;
        for (const auto& c : cuts) {
            segments.push_back({x, c.x0, road, true});
            x = c.x1;
            road = true;
        }
        segments.push_back({x, box.maxX(), road, false});
    }

    // road surfaces, one per connected piece inside the ring
    auto bandExtent = [&](const HBand& b) {
        const bool primary = b.hierarchy == RoadHierarchy::Primary;
        return std::make_pair(primary ? local.minX() : box.minX(), primary ? local.maxX() : box.maxX());
    };
    for (const auto& b : bands) {
        const auto [x0, x1] = bandExtent(b);
        addSurfaces(out.roads, geom::clipToRect(ring, geom::Bounds2(x0, b.y0, x1, b.y1)));
    }
    for (const auto& c : cuts) {
        double y = box.minY();
        for (const auto& b : bands) {
            if (b.y0 > y) addSurfaces(out.roads, geom::clipToRect(ring, geom::Bounds2(c.x0, y, c.x1, b.y0)));
            y = std::max(y, b.y1);
        }
        if (box.maxY() > y) addSurfaces(out.roads, geom::clipToRect(ring, geom::Bounds2(c.x0, y, c.x1, box.maxY())));
    }

    // road graph: centerline runs inside the ring, nodes at run ends and crossings
    RoadNetwork& net = out.roads;
    std::vector<std::vector<std::size_t>> crossing(bands.size(), std::vector<std::size_t>(cuts.size(), kNoNode));
    for (std::size_t bi = 0; bi < bands.size(); ++bi) {
        const HBand& b = bands[bi];
        const auto [x0, x1] = bandExtent(b);
        const double y = 0.5 * (b.y0 + b.y1);

        for (const auto& run : geom::clipSegment({x0, y}, {x1, y}, ring)) {
            const double ra = run.front().x;
            const double rb = run.back().x;
            if (rb - ra <= kMinRunLength) continue;

            std::size_t prev = net.addNode({ra, y});
            for (std::size_t ci = 0; ci < cuts.size(); ++ci) {
                if (cuts[ci].x <= ra || cuts[ci].x >= rb) continue;
                const std::size_t node = net.addNode({cuts[ci].x, y});
                crossing[bi][ci] = node;
                net.addEdge(prev, node, b.width, b.hierarchy);
                prev = node;
            }
            const std::size_t end = net.addNode({rb, y});
            net.addEdge(prev, end, b.width, b.hierarchy);
        }
    }
    for (std::size_t ci = 0; ci < cuts.size(); ++ci) {
        const double x = cuts[ci].x;
        for (const auto& run : geom::clipSegment({x, box.minY()}, {x, box.maxY()}, ring)) {
            const double ya = run.front().y;
            const double yb = run.back().y;
            if (yb - ya <= kMinRunLength) continue;

            std::size_t prev = net.addNode({x, ya});
            double prev_y = ya;
            for (std::size_t bi = 0; bi < bands.size(); ++bi) {
                if (crossing[bi][ci] == kNoNode) continue;
                const double y = net.nodes[crossing[bi][ci]].y;
                if (y <= prev_y || y >= yb) continue;
                net.addEdge(prev, crossing[bi][ci], p.secondary_width, RoadHierarchy::Secondary);
                prev = crossing[bi][ci];
                prev_y = y;
            }
            const std::size_t end = net.addNode({x, yb});
            net.addEdge(prev, end, p.secondary_width, RoadHierarchy::Secondary);
        }
    }

    // 6. lots
    std::vector<LotDraft> drafts;
    std::vector<geom::Bounds2> fragments;

    for (const auto& row : rows) {
        for (const auto& seg : segments) {
            const geom::Bounds2 strip(seg.x0, row.y0, seg.x1, row.y1);
            const double L = strip.width();
            const double D = strip.height();
            if (!(L > 0.0) || !(D > 0.0)) continue;

            const double w_min = std::max(p.min_frontage, target_area / D);
            auto n = static_cast<std::size_t>(std::floor(L / w_min + 1e-9));
            if (n > 0 && std::isfinite(p.max_lot_area)) {
                const auto n_cap = static_cast<std::size_t>(std::ceil(L * D / p.max_lot_area - 1e-9));
                n = std::max(n, n_cap);
            }
            if (n == 0) {
                fragments.push_back(strip);
                continue;
            }

            for (std::size_t k = 0; k < n; ++k) {
                const double x0 = seg.x0 + L * static_cast<double>(k) / static_cast<double>(n);
                const double x1 = (k + 1 == n) ? seg.x1
                                               : seg.x0 + L * static_cast<double>(k + 1) / static_cast<double>(n);
                const geom::Bounds2 rect(x0, row.y0, x1, row.y1);

                if (!geom::containsRect(ring, rect.expanded(p.buffer_width)) || touchesAny(exclusions, rect)) {
                    fragments.push_back(rect);
                    continue;
                }

                LotDraft d;
                Lot& lot = d.lot;
                lot.shape = rect.toPolygon();
                lot.width = rect.width();
                lot.depth = D;
                lot.area = lot.width * lot.depth;
                lot.aspect_ratio = lot.depth / lot.width;
                const bool left  = k == 0 && seg.road_left;
                const bool right = k + 1 == n && seg.road_right;
                lot.corner = left || right;
                lot.frontage = lot.width + (left ? D : 0.0) + (right ? D : 0.0);
                lot.fronts_primary = row.front == RoadHierarchy::Primary;
                lot.quality = lotQuality(lot, m_quality);
                drafts.push_back(std::move(d));
            }
        }
    }
    for (const auto& band : leftovers) {
        for (const auto& seg : segments) fragments.emplace_back(seg.x0, band.first, seg.x1, band.second);
    }

    // 7. green space
    std::vector<geom::Polygon> green;
    double green_area = 0.0;
    for (const auto& f : fragments) {
        if (touchesAny(exclusions, f)) continue;
        for (auto& piece : geom::clipToRect(ring, f)) {
            const double a = geom::area(piece);
            if (a < m_config.min_fragment_area) continue;
            green_area += a;
            green.push_back(std::move(piece));
        }
    }

    const double threshold = g[GreenThreshold] * m_config.max_green_threshold;
    for (auto& d : drafts) {
        if (d.lot.quality < threshold) {
            d.green = true;
            green_area += d.lot.area;
        }
    }

    if (p.green_target > 0.0 && out.boundary_area > 0.0 &&
        green_area / out.boundary_area < p.green_target) {
        double available = 0.0;
        for (const auto& d : drafts) if (!d.green) available += d.lot.area;

        if ((green_area + available) / out.boundary_area >= p.green_target) {
            std::vector<std::size_t> order(drafts.size());
            std::iota(order.begin(), order.end(), std::size_t{0});
            std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
                return drafts[a].lot.quality < drafts[b].lot.quality;
            });
            for (std::size_t idx : order) {
                if (green_area / out.boundary_area >= p.green_target) break;
                if (drafts[idx].green) continue;
                drafts[idx].green = true;
                green_area += drafts[idx].lot.area;
            }
        }
    }

    // 8-9. zones and world coordinates
    const FactoryZone factory;
    for (auto& d : drafts) {
        if (d.green) {
            green.push_back(d.lot.shape);
            continue;
        }
        Lot lot = std::move(d.lot);
        lot.shape = geom::rotate(lot.shape, theta, pivot);

        const geom::Point2 c = geom::centroid(lot.shape);
        bool preferred = false;
        for (const auto& pz : m_site.preferred_zones) {
            if (geom::pointInPolygon(c, pz.area)) {
                lot.zone = pz.zone;
                preferred = true;
                break;
            }
        }
        if (!preferred) {
            if (lot.area >= factory.min_area_factor * p.min_lot_area) lot.zone = factory;
            else if (lot.fronts_primary) lot.zone = OfficeZone{};
            else lot.zone = WarehouseZone{};
        }
        out.lots.push_back(std::move(lot));
    }

    for (auto& poly : green) poly = geom::rotate(poly, theta, pivot);
    for (auto& s : net.surfaces) s = geom::rotate(s, theta, pivot);
    for (auto& n : net.nodes) n = geom::rotate(n, theta, pivot);

    out.green_spaces = std::move(green);
    out.green_area = green_area;
    out.unallocated_area = std::max(0.0, out.boundary_area - out.sellableArea() -
                                         net.surfaceArea() - out.green_area);
    return out;
}

} // namespace landopt::layout
