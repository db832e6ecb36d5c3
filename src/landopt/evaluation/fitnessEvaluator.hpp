//
// Objective vector of a decoded layout.
//

#ifndef LANDOPT_FITNESSEVALUATOR_HPP
#define LANDOPT_FITNESSEVALUATOR_HPP

#include "constraintValidator.hpp"
#include "oracles.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <string>

namespace landopt::evaluation {

/// Fixed objective order. Every objective is maximized.
enum Objective : std::size_t {
    LotCountObjective      = 0,
    MeanQualityObjective   = 1,
    RoadEfficiencyObjective = 2,
    FinancialObjective     = 3
};

inline constexpr std::size_t kObjectiveCount = 4;

/// Base shift applied to every objective of an infeasible layout.
inline constexpr double kInfeasiblePenalty = 1e9;

/// ROI points deducted per unit of soft shortfall on a feasible layout.
inline constexpr double kSoftPenaltyWeight = 10.0;

/// Value of an objective whose oracle failed. Below any penalized value.
inline constexpr double kWorstObjective = -1e18;

struct FitnessVector {
    std::array<double, kObjectiveCount> objectives{};
    ConstraintReport report;

    FinancialScore financial;           // as returned by the oracle, costs merged
    double      total_road_length = 0.0;
    bool        oracle_failed = false;
    std::string oracle_error;

    bool feasible() const { return report.feasible; }
    double operator[](std::size_t i) const { return objectives[i]; }
    double financialObjective() const { return objectives[FinancialObjective]; }
    double lotCount() const { return objectives[LotCountObjective]; }
};

/**
 * @class FitnessEvaluator
 * @brief Validates a layout and computes its objective vector.
 *
 * @details Terrain is scored first so the validator can check the slope rule,
 * then utility and financial oracles. Utility network cost and grading cost
 * are added to the financial cost and the ROI is recomputed.
 *
 * Infeasible layouts have every objective replaced by
 * -kInfeasiblePenalty * (1 + hard + soft_penalty) + raw / (1 + |raw|), so they
 * keep an order among themselves and stay below every feasible layout.
 *
 * Feasible layouts with soft violations lose kSoftPenaltyWeight * soft_penalty
 * on the financial objective only.
 *
 * A throwing oracle sets the financial objective to kWorstObjective for that
 * layout only and increments the failure counter. Safe to call concurrently
 * when the oracles are.
 */
class FitnessEvaluator {
public:
    /// Oracles are not owned and must outlive the evaluator.
    explicit FitnessEvaluator(const FinancialOracle& financial,
                              const UtilityOracle* utility = nullptr,
                              const TerrainOracle* terrain = nullptr);

    FitnessVector evaluate(const layout::Layout& layout,
                           const site::ConstraintSet& constraints) const;

    std::size_t oracleFailures() const { return m_failures.load(); }
    void resetFailures() { m_failures.store(0); }

    /// Penalized value of a raw objective for the given violation severity.
    static double penalize(double raw, double severity);

private:
    const FinancialOracle& m_financial;
    const UtilityOracle*   m_utility;
    const TerrainOracle*   m_terrain;

    mutable std::atomic<std::size_t> m_failures{0};
};

} // namespace landopt::evaluation

#endif // LANDOPT_FITNESSEVALUATOR_HPP
