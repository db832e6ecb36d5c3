// zones.cpp
#include "zones.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace landopt::layout {

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

const char* zoneName(const ZoneTag& zone)
{
    return std::visit(Overloaded{
        [](const WarehouseZone&) { return "warehouse"; },
        [](const FactoryZone&)   { return "factory"; },
        [](const OfficeZone&)    { return "office"; }
    }, zone);
}

double revenueWeight(const ZoneTag& zone)
{
    return std::visit([](const auto& z) { return z.revenue_weight; }, zone);
}

ZoneTag zoneFromName(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "warehouse") return WarehouseZone{};
    if (lower == "factory")   return FactoryZone{};
    if (lower == "office")    return OfficeZone{};
    throw std::invalid_argument("Unknown zone type: '" + name + "'.");
}

} // namespace landopt::layout
