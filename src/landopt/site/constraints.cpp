// constraints.cpp
#include "constraints.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace landopt::site {

namespace {

double tolerance(double threshold)
{
    return 1e-9 * std::max(1.0, std::abs(threshold));
}

double normalized(double gap, double threshold)
{
    return std::abs(gap) / std::max(1.0, std::abs(threshold));
}

} // namespace

ConstraintRule ConstraintRule::atLeast(double v, RulePriority p) { return {RuleOperator::AtLeast, v, 0.0, p}; }
ConstraintRule ConstraintRule::atMost(double v, RulePriority p)  { return {RuleOperator::AtMost, 0.0, v, p}; }
ConstraintRule ConstraintRule::equal(double v, RulePriority p)   { return {RuleOperator::Equal, v, v, p}; }
ConstraintRule ConstraintRule::range(double lo, double hi, RulePriority p) { return {RuleOperator::Range, lo, hi, p}; }

bool ConstraintRule::satisfiedBy(double value) const
{
    if (!std::isfinite(value)) return false;
    switch (op) {
        case RuleOperator::AtLeast: return value >= lo - tolerance(lo);
        case RuleOperator::AtMost:  return value <= hi + tolerance(hi);
        case RuleOperator::Equal:   return std::abs(value - lo) <= tolerance(lo);
        case RuleOperator::Range:   return value >= lo - tolerance(lo) && value <= hi + tolerance(hi);
    }
    return false;
}

double ConstraintRule::requiredFor(double value) const
{
    switch (op) {
        case RuleOperator::AtLeast: return lo;
        case RuleOperator::AtMost:  return hi;
        case RuleOperator::Equal:   return lo;
        case RuleOperator::Range:   return value < lo ? lo : hi;
    }
    return lo;
}

double ConstraintRule::shortfall(double value) const
{
    if (satisfiedBy(value)) return 0.0;
    if (!std::isfinite(value)) return 1.0;
    const double required = requiredFor(value);
    return normalized(value - required, required);
}

void ConstraintSet::set(const std::string& name, const ConstraintRule& rule)
{
    if (!isKnownName(name)) {
        throw std::invalid_argument("Unknown constraint parameter: '" + name + "'.");
    }
    if (!std::isfinite(rule.lo) || !std::isfinite(rule.hi)) {
        throw std::invalid_argument("Constraint '" + name + "' has a non-finite threshold.");
    }
    if (rule.op == RuleOperator::Range && rule.lo > rule.hi) {
        throw std::invalid_argument("Constraint '" + name + "' has an empty range.");
    }
    m_rules[name] = rule;
}

const ConstraintRule* ConstraintSet::find(const std::string& name) const
{
    auto it = m_rules.find(name);
    return it == m_rules.end() ? nullptr : &it->second;
}

double ConstraintSet::lowerOr(const std::string& name, double fallback) const
{
    const ConstraintRule* rule = find(name);
    if (!rule || !rule->hasLowerBound()) return fallback;
    return rule->lowerBound();
}

double ConstraintSet::upperOr(const std::string& name, double fallback) const
{
    const ConstraintRule* rule = find(name);
    if (!rule || !rule->hasUpperBound()) return fallback;
    return rule->upperBound();
}

const std::vector<std::string>& ConstraintSet::knownNames()
{
    static const std::vector<std::string> names = {
        rules::LotArea, rules::Frontage, rules::AspectRatio, rules::GreenSpaceRatio,
        rules::BufferWidth, rules::RoadWidth, rules::SecondaryRoadWidth, rules::Slope,
        rules::SellableRatio, rules::LotCount
    };
    return names;
}

bool ConstraintSet::isKnownName(const std::string& name)
{
    const auto& names = knownNames();
    return std::find(names.begin(), names.end(), name) != names.end();
}

const char* toString(RuleOperator op)
{
    switch (op) {
        case RuleOperator::AtLeast: return ">=";
        case RuleOperator::AtMost:  return "<=";
        case RuleOperator::Equal:   return "=";
        case RuleOperator::Range:   return "range";
    }
    return "?";
}

const char* toString(RulePriority p)
{
    return p == RulePriority::Hard ? "hard" : "soft";
}

} // namespace landopt::site
