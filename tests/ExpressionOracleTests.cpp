#include "LiteTest.hpp"

#include <landopt/evaluation/expressionFinancialOracle.hpp>
#include <landopt/evaluation/fitnessEvaluator.hpp>

#include <stdexcept>

using namespace landopt;
using namespace landopt::evaluation;

static layout::Layout TwoLots()
{
  layout::Layout l;
  l.boundary_area = 20000.0;
  l.green_area = 2500.0;
  for (double w : {40.0, 50.0}) {
    layout::Lot lot;
    lot.width = w;
    lot.depth = 70.0;
    lot.area = w * 70.0;
    lot.frontage = w;
    l.lots.push_back(lot);
  }
  const std::size_t a = l.roads.addNode({0, 0});
  const std::size_t b = l.roads.addNode({200, 0});
  l.roads.addEdge(a, b, 20.0, layout::RoadHierarchy::Primary);
  l.roads.surfaces.push_back(geom::Bounds2(0, -10, 200, 10).toPolygon());
  return l;
}

static void TestExpressionsOverAggregates()
{
  const ExpressionFinancialOracle oracle("1000 + road_area*10 + road_length", "sellable_area*2 + lot_count*100");
  const FinancialScore s = oracle.score(TwoLots());

  EXPECT_NEAR(s.total_cost, 1000.0 + 4000.0 * 10.0 + 200.0, 1e-6);
  EXPECT_NEAR(s.total_revenue, 6300.0 * 2.0 + 200.0, 1e-6);
  EXPECT_NEAR(s.roi_percentage, roiPercentage(s.total_cost, s.total_revenue), 1e-9);

  const FinancialScore green = ExpressionFinancialOracle("boundary_area", "green_area + total_frontage").score(TwoLots());
  EXPECT_NEAR(green.total_revenue, 2590.0, 1e-6);
}

static void TestInvalidExpressions()
{
  EXPECT_THROW(ExpressionFinancialOracle("road_area*", "1"), std::invalid_argument);
  EXPECT_THROW(ExpressionFinancialOracle("1", "parking_spaces*3"), std::invalid_argument);
}

static void TestNonPositiveCostIsAnOracleFailure()
{
  const ExpressionFinancialOracle oracle("road_area - road_area", "sellable_area");
  EXPECT_THROW(oracle.score(TwoLots()), std::runtime_error);

  const FitnessEvaluator evaluator(oracle);
  const FitnessVector f = evaluator.evaluate(TwoLots(), site::ConstraintSet{});
  EXPECT_TRUE(f.oracle_failed);
  EXPECT_EQ(f.financialObjective(), kWorstObjective);
}

int main()
{
  TestExpressionsOverAggregates();
  TestInvalidExpressions();
  TestNonPositiveCostIsAnOracleFailure();

  return FinishTests("landopt_expression_oracle_tests");
}
