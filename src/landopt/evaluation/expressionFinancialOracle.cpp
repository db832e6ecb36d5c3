// expressionFinancialOracle.cpp
#include "expressionFinancialOracle.hpp"

#include <cmath>
#include <stdexcept>
#include <variant>

namespace landopt::evaluation {

namespace {

// Evaluates a parser and converts library errors to standard exceptions.
double evaluate(mup::ParserX& parser, const char* what)
{
    try {
        return parser.Eval().GetFloat();
    } catch (const mup::ParserError& e) {
        throw std::runtime_error(std::string(what) + " expression failed: " + e.GetMsg());
    }
}

} // namespace

const std::vector<std::string>& ExpressionFinancialOracle::variableNames()
{
    static const std::vector<std::string> names = {
        "lot_count", "sellable_area", "weighted_area",
        "office_area", "factory_area", "warehouse_area",
        "road_area", "road_length", "green_area", "boundary_area",
        "corner_lots", "total_frontage"
    };
    return names;
}

ExpressionFinancialOracle::ExpressionFinancialOracle(const std::string& cost_expression,
                                                     const std::string& revenue_expression)
    : m_cost_expr(cost_expression),
      m_revenue_expr(revenue_expression),
      m_cost(mup::pckALL_NON_COMPLEX),
      m_revenue(mup::pckALL_NON_COMPLEX)
{
    for (const auto& name : variableNames()) m_values.emplace(name, mup::Value(0.0));

    bindVariables(m_cost);
    bindVariables(m_revenue);

    try {
        m_cost.SetExpr(m_cost_expr);
        m_revenue.SetExpr(m_revenue_expr);
        // unknown variables only surface at evaluation time
        m_cost.Eval();
        m_revenue.Eval();
    } catch (const mup::ParserError& e) {
        throw std::invalid_argument("Invalid financial expression: " + e.GetMsg());
    }
}

void ExpressionFinancialOracle::bindVariables(mup::ParserX& parser)
{
    for (auto& kv : m_values) {
        parser.DefineVar(kv.first, mup::Variable(&kv.second));
    }
}

void ExpressionFinancialOracle::assign(const layout::Layout& layout) const
{
    double weighted = 0.0, office = 0.0, factory = 0.0, warehouse = 0.0;
    for (const auto& lot : layout.lots) {
        weighted += lot.area * layout::revenueWeight(lot.zone);
        if (std::holds_alternative<layout::OfficeZone>(lot.zone))       office += lot.area;
        else if (std::holds_alternative<layout::FactoryZone>(lot.zone)) factory += lot.area;
        else                                                            warehouse += lot.area;
    }

    m_values.at("lot_count")      = static_cast<double>(layout.lots.size());
    m_values.at("sellable_area")  = layout.sellableArea();
    m_values.at("weighted_area")  = weighted;
    m_values.at("office_area")    = office;
    m_values.at("factory_area")   = factory;
    m_values.at("warehouse_area") = warehouse;
    m_values.at("road_area")      = layout.roads.surfaceArea();
    m_values.at("road_length")    = layout.roads.totalLength();
    m_values.at("green_area")     = layout.green_area;
    m_values.at("boundary_area")  = layout.boundary_area;
    m_values.at("corner_lots")    = static_cast<double>(layout.cornerLots());
    m_values.at("total_frontage") = layout.totalFrontage();
}

FinancialScore ExpressionFinancialOracle::score(const layout::Layout& layout) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    assign(layout);

    FinancialScore s;
    s.total_cost = evaluate(m_cost, "Cost");
    s.total_revenue = evaluate(m_revenue, "Revenue");

    if (!std::isfinite(s.total_cost) || !std::isfinite(s.total_revenue)) {
        throw std::runtime_error("Financial expressions produced a non-finite value.");
    }
    if (s.total_cost <= 0.0) {
        throw std::runtime_error("Cost expression must be positive, got " + std::to_string(s.total_cost));
    }
    s.roi_percentage = roiPercentage(s.total_cost, s.total_revenue);
    return s;
}

} // namespace landopt::evaluation
