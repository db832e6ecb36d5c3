// fitnessEvaluator.cpp
#include "fitnessEvaluator.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <optional>

namespace landopt::evaluation {

namespace {

constexpr double kMaxShift = 1e15;
constexpr const char* kUnknownOracleError = "unknown oracle error";

} // namespace

FitnessEvaluator::FitnessEvaluator(const FinancialOracle& financial,
                                   const UtilityOracle* utility,
                                   const TerrainOracle* terrain)
    : m_financial(financial), m_utility(utility), m_terrain(terrain)
{}

double FitnessEvaluator::penalize(double raw, double severity)
{
    const double shift = std::min(kMaxShift, kInfeasiblePenalty * (1.0 + std::max(0.0, severity)));
    const double remnant = std::isfinite(raw) ? raw / (1.0 + std::abs(raw)) : 0.0;
    return -shift + remnant;
}

FitnessVector FitnessEvaluator::evaluate(const layout::Layout& layout,
                                         const site::ConstraintSet& constraints) const
{
    FitnessVector fv;

    auto fail = [&](const char* what) {
        if (!fv.oracle_failed) fv.oracle_error = what;
        fv.oracle_failed = true;
        m_failures.fetch_add(1);
    };

    std::optional<TerrainScore> terrain;
    if (m_terrain) {
        try {
            terrain = m_terrain->score(layout);
        } catch (const std::exception& e) {
            fail(e.what());
        } catch (...) {
            fail(kUnknownOracleError);
        }
    }

    fv.report = validate(layout, constraints, terrain ? &*terrain : nullptr);

    // raw objectives
    const double lots = static_cast<double>(layout.lots.size());
    double quality = 0.0;
    for (const auto& lot : layout.lots) quality += lot.quality;
    if (!layout.lots.empty()) quality /= lots;

    const double road_area = layout.roads.surfaceArea();
    const double efficiency = road_area > 0.0 ? layout.sellableArea() / road_area : 0.0;
    fv.total_road_length = layout.roads.totalLength();

    double extra_cost = terrain ? terrain->grading_cost : 0.0;
    if (m_utility) {
        try {
            extra_cost += m_utility->score(layout.lots, layout.roads).network_cost;
        } catch (const std::exception& e) {
            fail(e.what());
        } catch (...) {
            fail(kUnknownOracleError);
        }
    }

    double roi = 0.0;
    if (!fv.oracle_failed) {
        try {
            fv.financial = m_financial.score(layout);
            if (m_utility || m_terrain) {
                fv.financial.total_cost += extra_cost;
                fv.financial.roi_percentage = roiPercentage(fv.financial.total_cost, fv.financial.total_revenue);
            }
            roi = fv.financial.roi_percentage;
            if (!std::isfinite(roi)) roi = 0.0;
        } catch (const std::exception& e) {
            fail(e.what());
        } catch (...) {
            fail(kUnknownOracleError);
        }
    }

    fv.objectives = {lots, quality, efficiency, roi};

    if (!fv.report.feasible) {
        const double severity = static_cast<double>(fv.report.hardViolationCount()) + fv.report.soft_penalty;
        for (auto& v : fv.objectives) v = penalize(v, severity);
    } else if (fv.report.soft_penalty > 0.0) {
        fv.objectives[FinancialObjective] -= kSoftPenaltyWeight * fv.report.soft_penalty;
    }
    if (fv.oracle_failed) fv.objectives[FinancialObjective] = kWorstObjective;

    return fv;
}

} // namespace landopt::evaluation
