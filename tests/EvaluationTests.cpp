#include "LiteTest.hpp"

#include <landopt/evaluation/constraintValidator.hpp>
#include <landopt/evaluation/fitnessEvaluator.hpp>
#include <landopt/evaluation/oracles.hpp>
#include <landopt/layout/layoutDecoder.hpp>
#include <landopt/site/siteLoader.hpp>

#include <cstdint>
#include <stdexcept>

using namespace landopt;
using namespace landopt::evaluation;
using site::ConstraintRule;
using site::RulePriority;
namespace rules = landopt::site::rules;

static layout::Lot MakeLot(double width, double depth)
{
  layout::Lot lot;
  lot.width = width;
  lot.depth = depth;
  lot.area = width * depth;
  lot.frontage = width;
  lot.aspect_ratio = depth / width;
  lot.quality = 80.0;
  lot.shape = geom::Bounds2(0, 0, width, depth).toPolygon();
  return lot;
}

// Two lots, a primary road and some green space on a 10000 m2 parcel.
static layout::Layout SmallLayout()
{
  layout::Layout l;
  l.boundary_area = 10000.0;
  l.buffer_width = 5.0;
  l.lots.push_back(MakeLot(30, 60));   // 1800
  l.lots.push_back(MakeLot(20, 50));   // 1000
  l.green_area = 1500.0;

  const std::size_t a = l.roads.addNode({0, 0});
  const std::size_t b = l.roads.addNode({100, 0});
  const std::size_t c = l.roads.addNode({100, 50});
  l.roads.addEdge(a, b, 20.0, layout::RoadHierarchy::Primary);
  l.roads.addEdge(b, c, 12.0, layout::RoadHierarchy::Secondary);
  l.roads.surfaces.push_back(geom::Bounds2(0, -10, 100, 10).toPolygon());
  return l;
}

static FinancialScore FixedScore(const layout::Layout& l)
{
  FinancialScore s;
  s.total_cost = 1000.0;
  s.total_revenue = 1000.0 + 10.0 * static_cast<double>(l.lots.size());
  s.roi_percentage = roiPercentage(s.total_cost, s.total_revenue);
  return s;
}

static void TestValidatorPerLotRules()
{
  site::ConstraintSet cs;
  cs.set(rules::LotArea, ConstraintRule::atLeast(1500));
  cs.set(rules::Frontage, ConstraintRule::atLeast(25, RulePriority::Soft));
  cs.set(rules::RoadWidth, ConstraintRule::atLeast(20));

  const ConstraintReport r = validate(SmallLayout(), cs);
  EXPECT_FALSE(r.feasible);
  EXPECT_EQ(r.hardViolationCount(), std::size_t{1});

  const Violation* area = r.find(rules::LotArea);
  ASSERT_TRUE(area != nullptr);
  EXPECT_EQ(area->count, std::size_t{1});
  EXPECT_NEAR(area->actual, 1000.0, 1e-9);
  EXPECT_NEAR(area->required, 1500.0, 1e-9);

  const Violation* frontage = r.find(rules::Frontage);
  ASSERT_TRUE(frontage != nullptr);
  EXPECT_TRUE(frontage->priority == RulePriority::Soft);
  EXPECT_NEAR(r.soft_penalty, 5.0 / 25.0, 1e-12);

  EXPECT_TRUE(r.find(rules::RoadWidth) == nullptr);
}

static void TestValidatorSiteRules()
{
  site::ConstraintSet cs;
  cs.set(rules::GreenSpaceRatio, ConstraintRule::atLeast(0.2));
  cs.set(rules::SellableRatio, ConstraintRule::atLeast(0.25));
  cs.set(rules::LotCount, ConstraintRule::range(1, 5));
  cs.set(rules::SecondaryRoadWidth, ConstraintRule::atLeast(15, RulePriority::Soft));
  cs.set(rules::BufferWidth, ConstraintRule::atLeast(5));

  const ConstraintReport r = validate(SmallLayout(), cs);
  EXPECT_FALSE(r.feasible);
  ASSERT_TRUE(r.find(rules::GreenSpaceRatio) != nullptr);
  EXPECT_NEAR(r.find(rules::GreenSpaceRatio)->actual, 0.15, 1e-12);
  EXPECT_TRUE(r.find(rules::SellableRatio) == nullptr);
  EXPECT_TRUE(r.find(rules::LotCount) == nullptr);
  EXPECT_TRUE(r.find(rules::BufferWidth) == nullptr);
  ASSERT_TRUE(r.find(rules::SecondaryRoadWidth) != nullptr);
  EXPECT_NEAR(r.soft_penalty, 3.0 / 15.0, 1e-12);
}

static void TestValidatorSlopeNeedsTerrain()
{
  site::ConstraintSet cs;
  cs.set(rules::Slope, ConstraintRule::atMost(8));

  EXPECT_TRUE(validate(SmallLayout(), cs).feasible);

  TerrainScore flat;
  EXPECT_TRUE(validate(SmallLayout(), cs, &flat).feasible);

  TerrainScore steep;
  steep.slope_violations = 3;
  const ConstraintReport r = validate(SmallLayout(), cs, &steep);
  EXPECT_FALSE(r.feasible);
  ASSERT_TRUE(r.find(rules::Slope) != nullptr);
  EXPECT_EQ(r.find(rules::Slope)->count, std::size_t{3});
}

static void TestFitnessFeasible()
{
  const FunctionFinancialOracle oracle(FixedScore);
  const FitnessEvaluator evaluator(oracle);

  const FitnessVector f = evaluator.evaluate(SmallLayout(), site::ConstraintSet{});
  EXPECT_TRUE(f.feasible());
  EXPECT_NEAR(f[LotCountObjective], 2.0, 1e-12);
  EXPECT_NEAR(f[MeanQualityObjective], 80.0, 1e-12);
  EXPECT_NEAR(f[RoadEfficiencyObjective], 2800.0 / 2000.0, 1e-12);
  EXPECT_NEAR(f.financialObjective(), 2.0, 1e-12);
  EXPECT_NEAR(f.total_road_length, 150.0, 1e-12);
  EXPECT_EQ(evaluator.oracleFailures(), std::size_t{0});
}

static void TestInfeasibleIsDominatedByConstruction()
{
  const FunctionFinancialOracle oracle(FixedScore);
  const FitnessEvaluator evaluator(oracle);

  site::ConstraintSet one;
  one.set(rules::LotArea, ConstraintRule::atLeast(1500));
  site::ConstraintSet two = one;
  two.set(rules::GreenSpaceRatio, ConstraintRule::atLeast(0.5));

  const FitnessVector ok = evaluator.evaluate(SmallLayout(), site::ConstraintSet{});
  const FitnessVector bad = evaluator.evaluate(SmallLayout(), one);
  const FitnessVector worse = evaluator.evaluate(SmallLayout(), two);

  for (std::size_t i = 0; i < kObjectiveCount; ++i) {
    EXPECT_TRUE(bad[i] < ok[i]);
    EXPECT_TRUE(worse[i] < bad[i]);
    EXPECT_TRUE(bad[i] > kWorstObjective);
  }
  EXPECT_TRUE(FitnessEvaluator::penalize(10.0, 1.0) > FitnessEvaluator::penalize(5.0, 1.0));
  EXPECT_TRUE(FitnessEvaluator::penalize(1e6, 1.0) < FitnessEvaluator::penalize(-1e6, 0.0));
}

static void TestSoftPenaltyOnFeasible()
{
  const FunctionFinancialOracle oracle(FixedScore);
  const FitnessEvaluator evaluator(oracle);

  site::ConstraintSet cs;
  cs.set(rules::Frontage, ConstraintRule::atLeast(25, RulePriority::Soft));
  const FitnessVector f = evaluator.evaluate(SmallLayout(), cs);
  EXPECT_TRUE(f.feasible());
  EXPECT_NEAR(f.financialObjective(), 2.0 - kSoftPenaltyWeight * 0.2, 1e-9);
}

static void TestOracleFailure()
{
  const FunctionFinancialOracle oracle([](const layout::Layout&) -> FinancialScore {
    throw std::runtime_error("pricing service unavailable");
  });
  const FitnessEvaluator evaluator(oracle);

  const FitnessVector f = evaluator.evaluate(SmallLayout(), site::ConstraintSet{});
  EXPECT_TRUE(f.oracle_failed);
  EXPECT_EQ(f.financialObjective(), kWorstObjective);
  EXPECT_NEAR(f[LotCountObjective], 2.0, 1e-12);
  EXPECT_EQ(evaluator.oracleFailures(), std::size_t{1});
  EXPECT_TRUE(f.oracle_error.find("unavailable") != std::string::npos);

  evaluator.evaluate(SmallLayout(), site::ConstraintSet{});
  EXPECT_EQ(evaluator.oracleFailures(), std::size_t{2});
}

static void TestOracleThrowsNonStandard()
{
  const FunctionFinancialOracle oracle([](const layout::Layout&) -> FinancialScore { throw 42; });
  const FitnessEvaluator evaluator(oracle);

  const FitnessVector f = evaluator.evaluate(SmallLayout(), site::ConstraintSet{});
  EXPECT_TRUE(f.oracle_failed);
  EXPECT_EQ(f.financialObjective(), kWorstObjective);
  EXPECT_EQ(evaluator.oracleFailures(), std::size_t{1});
  EXPECT_TRUE(f.oracle_error.find("unknown") != std::string::npos);
}

namespace {

class FlatUtility : public UtilityOracle {
public:
  UtilityScore score(const std::vector<layout::Lot>& lots, const layout::RoadNetwork&) const override
  {
    return {100.0 * static_cast<double>(lots.size())};
  }
};

class GradingTerrain : public TerrainOracle {
public:
  TerrainScore score(const layout::Layout&) const override { return {300.0, 0}; }
};

} // namespace

static void TestExtraCostsRecomputeRoi()
{
  const FunctionFinancialOracle oracle(FixedScore);
  const FlatUtility utility;
  const GradingTerrain terrain;
  const FitnessEvaluator evaluator(oracle, &utility, &terrain);

  const FitnessVector f = evaluator.evaluate(SmallLayout(), site::ConstraintSet{});
  EXPECT_NEAR(f.financial.total_cost, 1000.0 + 200.0 + 300.0, 1e-9);
  EXPECT_NEAR(f.financialObjective(), (1020.0 - 1500.0) / 1500.0 * 100.0, 1e-9);
}

static void TestCachingOracle()
{
  int calls = 0;
  const FunctionFinancialOracle inner([&calls](const layout::Layout& l) {
    ++calls;
    return FixedScore(l);
  });
  CachingFinancialOracle cache(inner);

  layout::Layout a = SmallLayout();
  a.genome_hash = 42;
  layout::Layout b = SmallLayout();
  b.genome_hash = 43;

  cache.score(a);
  cache.score(a);
  cache.score(b);
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(cache.hits(), std::size_t{1});
  EXPECT_EQ(cache.misses(), std::size_t{2});

  cache.clear();
  cache.score(a);
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(cache.size(), std::size_t{1});
}

static void TestCachingOracleLimitAndCollisions()
{
  int calls = 0;
  const FunctionFinancialOracle inner([&calls](const layout::Layout& l) {
    ++calls;
    return FixedScore(l);
  });
  EXPECT_THROW(CachingFinancialOracle zero(inner, 0), std::invalid_argument);

  CachingFinancialOracle cache(inner, 2);
  EXPECT_EQ(cache.limit(), std::size_t{2});
  for (std::uint64_t h = 1; h <= 5; ++h) {
    layout::Layout l = SmallLayout();
    l.genome_hash = h;
    cache.score(l);
  }
  EXPECT_EQ(cache.size(), std::size_t{2});
  EXPECT_EQ(calls, 5);

  // oldest entries were evicted, the newest is still served
  layout::Layout newest = SmallLayout();
  newest.genome_hash = 5;
  cache.score(newest);
  EXPECT_EQ(calls, 5);
  layout::Layout oldest = SmallLayout();
  oldest.genome_hash = 1;
  cache.score(oldest);
  EXPECT_EQ(calls, 6);

  // same hash, different layout: scored again, not served from the entry
  layout::Layout other = SmallLayout();
  other.genome_hash = 5;
  other.lots.pop_back();
  const FinancialScore s = cache.score(other);
  EXPECT_EQ(calls, 7);
  EXPECT_NEAR(s.total_revenue, 1010.0, 1e-9);
  EXPECT_NEAR(cache.score(newest).total_revenue, 1020.0, 1e-9);
  EXPECT_EQ(calls, 8);
}

static void TestInfeasibleGreenScenario()
{
  // 100 x 200 parcel cannot reach 90% green space
  site::Site s(site::Boundary({{0, 0}, {100, 0}, {100, 200}, {0, 200}}));
  s.constraints.set(rules::BufferWidth, ConstraintRule::atLeast(5));
  s.constraints.set(rules::GreenSpaceRatio, ConstraintRule::atLeast(0.9));
  s.constraints.set(rules::LotArea, ConstraintRule::atLeast(1500));

  const layout::LayoutDecoder decoder(s);
  layout::Genome g;
  g.genes.assign(decoder.schema().length(), 0.5);
  const layout::Layout l = decoder.decode(g);
  EXPECT_TRUE(l.lots.size() <= 10);

  const ConstraintReport r = validate(l, s.constraints);
  EXPECT_FALSE(r.feasible);
  const Violation* v = r.find(rules::GreenSpaceRatio);
  ASSERT_TRUE(v != nullptr);
  EXPECT_NEAR(v->required, 0.9, 1e-12);
  EXPECT_TRUE(v->actual < 0.9);
}

int main()
{
  TestValidatorPerLotRules();
  TestValidatorSiteRules();
  TestValidatorSlopeNeedsTerrain();
  TestFitnessFeasible();
  TestInfeasibleIsDominatedByConstruction();
  TestSoftPenaltyOnFeasible();
  TestOracleFailure();
  TestOracleThrowsNonStandard();
  TestExtraCostsRecomputeRoi();
  TestCachingOracle();
  TestCachingOracleLimitAndCollisions();
  TestInfeasibleGreenScenario();

  return FinishTests("landopt_evaluation_tests");
}
