//
// Land-use zone tags carried by every lot.
//

#ifndef LANDOPT_ZONES_HPP
#define LANDOPT_ZONES_HPP

#include <string>
#include <variant>

namespace landopt::layout {

struct WarehouseZone {
    double revenue_weight = 0.85;
};

struct FactoryZone {
    double revenue_weight  = 1.0;
    double min_area_factor = 2.0;   // lot area / minimum lot area needed for a factory
};

struct OfficeZone {
    double revenue_weight = 1.3;
};

using ZoneTag = std::variant<WarehouseZone, FactoryZone, OfficeZone>;

const char* zoneName(const ZoneTag& zone);

double revenueWeight(const ZoneTag& zone);

/// @throws std::invalid_argument for an unrecognised name.
ZoneTag zoneFromName(const std::string& name);

} // namespace landopt::layout

#endif // LANDOPT_ZONES_HPP
