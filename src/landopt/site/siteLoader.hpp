//
// Site description (boundary, constraints, optional zones and guides) and its
// plain-text loader.
//

#ifndef LANDOPT_SITELOADER_HPP
#define LANDOPT_SITELOADER_HPP

#include "boundary.hpp"
#include "constraints.hpp"
#include "../geometry.hpp"
#include "../layout/zones.hpp"

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace landopt::site {

struct PreferredZone {
    geom::Polygon   area;
    layout::ZoneTag zone;
};

/**
 * @brief Everything the optimizer needs to know about one parcel.
 * Created once per run and never mutated afterwards.
 */
struct Site {
    explicit Site(Boundary b, ConstraintSet c = {})
        : boundary(std::move(b)), constraints(std::move(c)) {}

    Boundary                   boundary;
    ConstraintSet              constraints;
    std::vector<geom::Polygon> exclusion_zones;
    std::vector<PreferredZone> preferred_zones;
    std::vector<geom::Polyline> road_guides;
};

/**
 * @class SiteLoader
 * @brief Reads the line-oriented site format.
 *
 * @code
 * # comment
 * boundary   0,0 1000,0 1000,500 0,500
 * exclusion  400,200 450,200 450,260 400,260
 * preferred  office 0,0 200,0 200,100 0,100
 * guide      0,0 1000,0
 * rule       lot_area >= 2000 hard
 * rule       aspect_ratio range 1.5 2.0 soft
 * @endcode
 *
 * Rule priority defaults to hard.
 */
class SiteLoader {
public:
    /// @throws std::runtime_error when the file cannot be opened.
    static Site load(const std::string& filename);

    /**
     * @throws InvalidBoundary for a missing or degenerate boundary.
     * @throws std::invalid_argument for malformed lines, with the line number.
     */
    static Site parse(std::istream& in);
};

} // namespace landopt::site

#endif // LANDOPT_SITELOADER_HPP
