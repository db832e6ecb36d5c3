// constraintValidator.cpp
#include "constraintValidator.hpp"

#include <algorithm>

namespace landopt::evaluation {

namespace {

// Accumulates offending values of one rule.
class RuleCheck {
public:
    RuleCheck(const std::string& name, const site::ConstraintRule& rule)
        : m_name(name), m_rule(rule) {}

    void check(double value)
    {
        if (m_rule.satisfiedBy(value)) return;
        const double s = m_rule.shortfall(value);
        ++m_count;
        m_shortfall += s;
        if (m_count == 1 || s > m_worst_shortfall) {
            m_worst_shortfall = s;
            m_worst = value;
        }
    }

    void commit(ConstraintReport& report) const
    {
        if (m_count == 0) return;
        report.violations.push_back({m_name, m_worst, m_rule.requiredFor(m_worst), m_count, m_rule.priority});
        if (m_rule.isHard()) report.feasible = false;
        else report.soft_penalty += m_shortfall;
    }

private:
    const std::string&          m_name;
    const site::ConstraintRule& m_rule;
    std::size_t m_count = 0;
    double      m_shortfall = 0.0;
    double      m_worst_shortfall = 0.0;
    double      m_worst = 0.0;
};

} // namespace

std::size_t ConstraintReport::hardViolationCount() const
{
    return static_cast<std::size_t>(std::count_if(violations.begin(), violations.end(),
        [](const Violation& v) { return v.priority == site::RulePriority::Hard; }));
}

const Violation* ConstraintReport::find(const std::string& rule) const
{
    for (const auto& v : violations) {
        if (v.rule == rule) return &v;
    }
    return nullptr;
}

ConstraintReport validate(const layout::Layout& layout,
                          const site::ConstraintSet& constraints,
                          const TerrainScore* terrain)
{
    namespace rules = site::rules;
    using layout::RoadHierarchy;

    ConstraintReport report;

    for (const auto& [name, rule] : constraints.all()) {
        RuleCheck rc(name, rule);

        if (name == rules::LotArea) {
            for (const auto& lot : layout.lots) rc.check(lot.area);
        } else if (name == rules::Frontage) {
            for (const auto& lot : layout.lots) rc.check(lot.frontage);
        } else if (name == rules::AspectRatio) {
            for (const auto& lot : layout.lots) rc.check(lot.aspect_ratio);
        } else if (name == rules::GreenSpaceRatio) {
            rc.check(layout.greenRatio());
        } else if (name == rules::BufferWidth) {
            rc.check(layout.buffer_width);
        } else if (name == rules::RoadWidth) {
            for (const auto& e : layout.roads.edges) {
                if (e.hierarchy == RoadHierarchy::Primary) rc.check(e.width);
            }
        } else if (name == rules::SecondaryRoadWidth) {
            for (const auto& e : layout.roads.edges) {
                if (e.hierarchy != RoadHierarchy::Primary) rc.check(e.width);
            }
        } else if (name == rules::Slope) {
            if (!terrain || terrain->slope_violations == 0) continue;
            // the terrain oracle reports offending cells, each counts as one unit of shortfall
            Violation v{name, static_cast<double>(terrain->slope_violations),
                        rule.hasUpperBound() ? rule.upperBound() : rule.lowerBound(),
                        terrain->slope_violations, rule.priority};
            if (rule.isHard()) report.feasible = false;
            else report.soft_penalty += static_cast<double>(terrain->slope_violations);
            report.violations.push_back(std::move(v));
            continue;
        } else if (name == rules::SellableRatio) {
            rc.check(layout.sellableRatio());
        } else if (name == rules::LotCount) {
            rc.check(static_cast<double>(layout.lots.size()));
        }

        rc.commit(report);
    }
    return report;
}

} // namespace landopt::evaluation
