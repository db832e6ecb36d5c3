//
// Regulatory constraint set: parameter name -> rule.
//

#ifndef LANDOPT_CONSTRAINTS_HPP
#define LANDOPT_CONSTRAINTS_HPP

#include <map>
#include <string>
#include <vector>

namespace landopt::site {

/// Recognised parameter names.
namespace rules {
    inline constexpr const char* LotArea            = "lot_area";
    inline constexpr const char* Frontage           = "frontage";
    inline constexpr const char* AspectRatio        = "aspect_ratio";
    inline constexpr const char* GreenSpaceRatio    = "green_space_ratio";
    inline constexpr const char* BufferWidth        = "buffer_width";
    inline constexpr const char* RoadWidth          = "road_width";
    inline constexpr const char* SecondaryRoadWidth = "secondary_road_width";
    inline constexpr const char* Slope              = "slope";
    inline constexpr const char* SellableRatio      = "sellable_ratio";
    inline constexpr const char* LotCount           = "lot_count";
} // namespace rules

enum class RuleOperator { AtLeast, AtMost, Equal, Range };
enum class RulePriority { Hard, Soft };

struct ConstraintRule {
    RuleOperator op = RuleOperator::AtLeast;
    double       lo = 0.0;   // threshold for >=, = and the lower end of a range
    double       hi = 0.0;   // threshold for <= and the upper end of a range
    RulePriority priority = RulePriority::Hard;

    static ConstraintRule atLeast(double v, RulePriority p = RulePriority::Hard);
    static ConstraintRule atMost(double v, RulePriority p = RulePriority::Hard);
    static ConstraintRule equal(double v, RulePriority p = RulePriority::Hard);
    static ConstraintRule range(double lo, double hi, RulePriority p = RulePriority::Hard);

    bool isHard() const { return priority == RulePriority::Hard; }

    bool satisfiedBy(double value) const;

    /// Bound the value should have met (nearest violated threshold).
    double requiredFor(double value) const;

    /// Normalized distance to the nearest satisfying value, 0 when satisfied.
    double shortfall(double value) const;

    bool hasLowerBound() const { return op != RuleOperator::AtMost; }
    bool hasUpperBound() const { return op != RuleOperator::AtLeast; }
    double lowerBound() const { return lo; }
    double upperBound() const { return op == RuleOperator::Equal ? lo : hi; }
};

/**
 * @class ConstraintSet
 * @brief Immutable-after-load mapping from parameter name to rule.
 */
class ConstraintSet {
public:
    /// @throws std::invalid_argument for unknown names or inconsistent thresholds.
    void set(const std::string& name, const ConstraintRule& rule);

    const ConstraintRule* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    /// Lower threshold of the named rule, or the fallback when the rule has none.
    double lowerOr(const std::string& name, double fallback) const;
    /// Upper threshold of the named rule, or the fallback when the rule has none.
    double upperOr(const std::string& name, double fallback) const;

    const std::map<std::string, ConstraintRule>& all() const { return m_rules; }
    std::size_t size() const { return m_rules.size(); }

    static bool isKnownName(const std::string& name);
    static const std::vector<std::string>& knownNames();

private:
    std::map<std::string, ConstraintRule> m_rules;
};

const char* toString(RuleOperator op);
const char* toString(RulePriority p);

} // namespace landopt::site

#endif // LANDOPT_CONSTRAINTS_HPP
