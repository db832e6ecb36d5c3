//
// Financial oracle whose cost and revenue models are user expressions (muParserX).
//

#ifndef LANDOPT_EXPRESSIONFINANCIALORACLE_HPP
#define LANDOPT_EXPRESSIONFINANCIALORACLE_HPP

#include "oracles.hpp"

#include <mpParser.h>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace landopt::evaluation {

/**
 * @class ExpressionFinancialOracle
 * @brief Evaluates `cost` and `revenue` expressions over layout aggregates.
 *
 * @details Available variables: lot_count, sellable_area, weighted_area
 * (lot area times the zone's revenue weight), office_area, factory_area,
 * warehouse_area, road_area, road_length, green_area, boundary_area,
 * corner_lots, total_frontage.
 *
 * @code
 * ExpressionFinancialOracle oracle("road_area*120 + sellable_area*35",
 *                                  "weighted_area*90 + corner_lots*5000");
 * @endcode
 *
 * The parsers are shared, so evaluation is serialized by a mutex.
 */
class ExpressionFinancialOracle : public FinancialOracle {
public:
    /// @throws std::invalid_argument when an expression does not parse or uses unknown names.
    ExpressionFinancialOracle(const std::string& cost_expression,
                              const std::string& revenue_expression);

    /// @throws std::runtime_error for a non-positive or non-finite cost, or a failed evaluation.
    FinancialScore score(const layout::Layout& layout) const override;

    const std::string& costExpression() const { return m_cost_expr; }
    const std::string& revenueExpression() const { return m_revenue_expr; }

    static const std::vector<std::string>& variableNames();

private:
    void bindVariables(mup::ParserX& parser);
    void assign(const layout::Layout& layout) const;

    std::string m_cost_expr;
    std::string m_revenue_expr;

    mutable std::mutex m_mutex;
    mutable std::map<std::string, mup::Value> m_values;
    mutable mup::ParserX m_cost;
    mutable mup::ParserX m_revenue;
};

} // namespace landopt::evaluation

#endif // LANDOPT_EXPRESSIONFINANCIALORACLE_HPP
