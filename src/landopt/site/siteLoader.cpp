// siteLoader.cpp
#include "siteLoader.hpp"
#include "../errors.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace landopt::site {

namespace {

std::string lineError(std::size_t line_no, const std::string& msg)
{
    return "Site line " + std::to_string(line_no) + ": " + msg;
}

double parseNumber(const std::string& token, std::size_t line_no)
{
    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(token, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(lineError(line_no, "expected a number, got '" + token + "'."));
    }
    if (used != token.size()) {
        throw std::invalid_argument(lineError(line_no, "trailing characters in '" + token + "'."));
    }
    return v;
}

geom::Point2 parsePoint(const std::string& token, std::size_t line_no)
{
    const auto comma = token.find(',');
    if (comma == std::string::npos) {
        throw std::invalid_argument(lineError(line_no, "expected x,y but got '" + token + "'."));
    }
    return {parseNumber(token.substr(0, comma), line_no),
            parseNumber(token.substr(comma + 1), line_no)};
}

std::vector<geom::Point2> parsePoints(std::istringstream& ss, std::size_t line_no)
{
    std::vector<geom::Point2> pts;
    std::string token;
    while (ss >> token) pts.push_back(parsePoint(token, line_no));
    return pts;
}

geom::Polygon parseRing(std::istringstream& ss, std::size_t line_no, const char* what)
{
    try {
        return normalizeRing(parsePoints(ss, line_no), what);
    } catch (const InvalidBoundary& e) {
        throw std::invalid_argument(lineError(line_no, e.what()));
    }
}

RuleOperator parseOperator(const std::string& token, std::size_t line_no)
{
    if (token == ">=") return RuleOperator::AtLeast;
    if (token == "<=") return RuleOperator::AtMost;
    if (token == "=" || token == "==") return RuleOperator::Equal;
    if (token == "range") return RuleOperator::Range;
    throw std::invalid_argument(lineError(line_no, "unknown operator '" + token + "'."));
}

std::pair<std::string, ConstraintRule> parseRule(std::istringstream& ss, std::size_t line_no)
{
    std::string name, op_token, first;
    if (!(ss >> name >> op_token >> first)) {
        throw std::invalid_argument(lineError(line_no, "rule needs a name, an operator and a threshold."));
    }

    ConstraintRule rule;
    rule.op = parseOperator(op_token, line_no);
    const double v = parseNumber(first, line_no);
    switch (rule.op) {
        case RuleOperator::AtLeast: rule.lo = v; break;
        case RuleOperator::AtMost:  rule.hi = v; break;
        case RuleOperator::Equal:   rule.lo = v; rule.hi = v; break;
        case RuleOperator::Range: {
            std::string second;
            if (!(ss >> second)) {
                throw std::invalid_argument(lineError(line_no, "range needs two thresholds."));
            }
            rule.lo = v;
            rule.hi = parseNumber(second, line_no);
            break;
        }
    }

    std::string priority;
    if (ss >> priority) {
        if (priority == "hard") rule.priority = RulePriority::Hard;
        else if (priority == "soft") rule.priority = RulePriority::Soft;
        else throw std::invalid_argument(lineError(line_no, "priority must be hard or soft."));
    }
    std::string extra;
    if (ss >> extra) {
        throw std::invalid_argument(lineError(line_no, "unexpected token '" + extra + "'."));
    }
    return {name, rule};
}

} // namespace

Site SiteLoader::load(const std::string& filename)
{
    std::ifstream in(filename);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open site file: " + filename);
    }
    return parse(in);
}

Site SiteLoader::parse(std::istream& in)
{
    std::optional<std::vector<geom::Point2>> boundary_pts;
    ConstraintSet constraints;
    std::vector<geom::Polygon> exclusions;
    std::vector<PreferredZone> preferred;
    std::vector<geom::Polyline> guides;

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        std::istringstream ss(line);
        std::string keyword;
        if (!(ss >> keyword)) continue;

        if (keyword == "boundary") {
            if (boundary_pts) {
                throw std::invalid_argument(lineError(line_no, "boundary given twice."));
            }
            boundary_pts = parsePoints(ss, line_no);
        } else if (keyword == "exclusion") {
            exclusions.push_back(parseRing(ss, line_no, "exclusion zone"));
        } else if (keyword == "preferred") {
            std::string zone_name;
            if (!(ss >> zone_name)) {
                throw std::invalid_argument(lineError(line_no, "preferred zone needs a zone type."));
            }
            PreferredZone pz{{}, layout::WarehouseZone{}};
            try {
                pz.zone = layout::zoneFromName(zone_name);
            } catch (const std::invalid_argument& e) {
                throw std::invalid_argument(lineError(line_no, e.what()));
            }
            pz.area = parseRing(ss, line_no, "preferred zone");
            preferred.push_back(std::move(pz));
        } else if (keyword == "guide") {
            geom::Polyline guide = parsePoints(ss, line_no);
            if (guide.size() < 2 || guide.front() == guide.back()) {
                throw std::invalid_argument(lineError(line_no, "guide needs two distinct points."));
            }
            guides.push_back(std::move(guide));
        } else if (keyword == "rule") {
            auto [name, rule] = parseRule(ss, line_no);
            try {
                constraints.set(name, rule);
            } catch (const std::invalid_argument& e) {
                throw std::invalid_argument(lineError(line_no, e.what()));
            }
        } else {
            throw std::invalid_argument(lineError(line_no, "unknown directive '" + keyword + "'."));
        }
    }

    if (!boundary_pts) {
        throw InvalidBoundary("site file has no boundary line.");
    }

    Site site(Boundary(*boundary_pts), std::move(constraints));
    site.exclusion_zones = std::move(exclusions);
    site.preferred_zones = std::move(preferred);
    site.road_guides     = std::move(guides);
    return site;
}

} // namespace landopt::site
