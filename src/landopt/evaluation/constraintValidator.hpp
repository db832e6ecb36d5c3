//
// Classifies a layout against the site's constraint set.
//

#ifndef LANDOPT_CONSTRAINTVALIDATOR_HPP
#define LANDOPT_CONSTRAINTVALIDATOR_HPP

#include "oracles.hpp"
#include "../layout/layout.hpp"
#include "../site/constraints.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace landopt::evaluation {

/// One entry per failing rule.
struct Violation {
    std::string        rule;
    double             actual   = 0.0;   // worst offending value
    double             required = 0.0;   // threshold that value missed
    std::size_t        count    = 0;     // offending items (lots, roads, ...)
    site::RulePriority priority = site::RulePriority::Hard;
};

struct ConstraintReport {
    bool                   feasible     = true;
    std::vector<Violation> violations;
    double                 soft_penalty = 0.0;

    std::size_t hardViolationCount() const;
    const Violation* find(const std::string& rule) const;
};

/**
 * @brief Evaluates every rule of the set against the layout.
 *
 * @details Per-lot and per-road rules are checked item by item; site-wide
 * rules once. A hard failure clears `feasible`; a soft failure adds the
 * normalized shortfall of each offending item to `soft_penalty`. The slope
 * rule is only checked when terrain data is given and passes iff the terrain
 * oracle reported no slope violations. The layout is never modified.
 */
ConstraintReport validate(const layout::Layout& layout,
                          const site::ConstraintSet& constraints,
                          const TerrainScore* terrain = nullptr);

} // namespace landopt::evaluation

#endif // LANDOPT_CONSTRAINTVALIDATOR_HPP
