#include "LiteTest.hpp"

#include <landopt/errors.hpp>
#include <landopt/site/siteLoader.hpp>

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <variant>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

using namespace landopt;
using namespace landopt::site;

static void TestBoundaryNormalization()
{
  // clockwise with an explicit closing vertex and a duplicate
  const Boundary b({{0, 0}, {0, 50}, {0, 50}, {100, 50}, {100, 0}, {0, 0}});
  EXPECT_EQ(b.vertices().size(), std::size_t{4});
  EXPECT_TRUE(geom::signedArea(b.vertices()) > 0.0);
  EXPECT_NEAR(b.getArea(), 5000.0, 1e-9);
  EXPECT_NEAR(b.getCentroid().x, 50.0, 1e-9);
  EXPECT_TRUE(b.isInside({10, 10}));
  EXPECT_FALSE(b.isInside({110, 10}));
  EXPECT_NEAR(b.longestEdgeAngle(), 0.0, 1e-12);

  const Boundary tall({{0, 0}, {100, 0}, {100, 200}, {0, 200}});
  EXPECT_NEAR(std::abs(tall.longestEdgeAngle()), M_PI / 2.0, 1e-12);
}

static void TestInvalidBoundaries()
{
  const double nan = std::numeric_limits<double>::quiet_NaN();

  EXPECT_THROW(Boundary({{0, 0}, {10, 10}, {10, 0}, {0, 10}}), InvalidBoundary);
  EXPECT_THROW(Boundary({{0, 0}, {10, 0}}), InvalidBoundary);
  EXPECT_THROW(Boundary({{0, 0}, {10, 0}, {20, 0}}), InvalidBoundary);
  EXPECT_THROW(Boundary({{0, 0}, {10, 0}, {nan, 5}}), InvalidBoundary);

  // InvalidBoundary is an invalid_argument
  EXPECT_THROW(Boundary({{0, 0}, {1, 1}}), std::invalid_argument);
}

static void TestConstraintRules()
{
  const ConstraintRule at_least = ConstraintRule::atLeast(2000.0);
  EXPECT_TRUE(at_least.satisfiedBy(2000.0));
  EXPECT_FALSE(at_least.satisfiedBy(1500.0));
  EXPECT_NEAR(at_least.shortfall(1500.0), 0.25, 1e-12);
  EXPECT_NEAR(at_least.requiredFor(1500.0), 2000.0, 1e-12);

  const ConstraintRule range = ConstraintRule::range(1.5, 2.0, RulePriority::Soft);
  EXPECT_TRUE(range.satisfiedBy(1.75));
  EXPECT_FALSE(range.satisfiedBy(2.5));
  EXPECT_NEAR(range.requiredFor(2.5), 2.0, 1e-12);
  EXPECT_NEAR(range.requiredFor(1.0), 1.5, 1e-12);
  EXPECT_FALSE(range.isHard());

  // small thresholds are normalized by 1
  const ConstraintRule ratio = ConstraintRule::atLeast(0.2);
  EXPECT_NEAR(ratio.shortfall(0.1), 0.1, 1e-12);

  ConstraintSet set;
  set.set(rules::LotArea, at_least);
  set.set(rules::AspectRatio, range);
  EXPECT_TRUE(set.contains(rules::LotArea));
  EXPECT_NEAR(set.lowerOr(rules::LotArea, 1.0), 2000.0, 1e-12);
  EXPECT_NEAR(set.upperOr(rules::LotArea, 7.0), 7.0, 1e-12);
  EXPECT_NEAR(set.upperOr(rules::AspectRatio, 7.0), 2.0, 1e-12);

  EXPECT_THROW(set.set("parking_spaces", at_least), std::invalid_argument);
  EXPECT_THROW(set.set(rules::Frontage, ConstraintRule::range(5.0, 1.0)), std::invalid_argument);
  EXPECT_EQ(set.size(), std::size_t{2});
}

static void TestSiteParsing()
{
  std::istringstream in(
    "# industrial parcel\n"
    "boundary  0,0 1000,0 1000,500 0,500\n"
    "exclusion 400,200 450,200 450,260 400,260   # pond\n"
    "preferred office 0,0 200,0 200,100 0,100\n"
    "guide     0,0 1000,0\n"
    "rule lot_area >= 2000\n"
    "rule aspect_ratio range 1.5 2.0 soft\n"
    "rule green_space_ratio >= 0.1 hard\n");

  const Site site = SiteLoader::parse(in);
  EXPECT_NEAR(site.boundary.getArea(), 500000.0, 1e-6);
  EXPECT_EQ(site.exclusion_zones.size(), std::size_t{1});
  ASSERT_TRUE(site.preferred_zones.size() == 1);
  EXPECT_TRUE(std::holds_alternative<layout::OfficeZone>(site.preferred_zones[0].zone));
  EXPECT_EQ(site.road_guides.size(), std::size_t{1});
  EXPECT_EQ(site.constraints.size(), std::size_t{3});

  const ConstraintRule* ar = site.constraints.find(rules::AspectRatio);
  ASSERT_TRUE(ar != nullptr);
  EXPECT_TRUE(ar->op == RuleOperator::Range);
  EXPECT_TRUE(ar->priority == RulePriority::Soft);
  EXPECT_TRUE(site.constraints.find(rules::LotArea)->isHard());
}

static void TestSiteErrors()
{
  {
    // self-intersecting ring rejected before anything else runs
    std::istringstream in("boundary 0,0 10,10 10,0 0,10\nrule lot_area >= 10\n");
    EXPECT_THROW(SiteLoader::parse(in), InvalidBoundary);
  }
  {
    std::istringstream in("rule lot_area >= 10\n");
    EXPECT_THROW(SiteLoader::parse(in), InvalidBoundary);
  }
  {
    std::istringstream in("boundary 0,0 10,0 10,10 0,10\nrule unknown_rule >= 3\n");
    EXPECT_THROW(SiteLoader::parse(in), std::invalid_argument);
  }
  {
    std::istringstream in("boundary 0,0 10,0 10,10 0,10\nrule lot_area >= abc\n");
    bool mentions_line = false;
    try {
      SiteLoader::parse(in);
    } catch (const std::invalid_argument& e) {
      mentions_line = std::string(e.what()).find("line 2") != std::string::npos;
    }
    EXPECT_TRUE(mentions_line);
  }
  {
    std::istringstream in("boundary 0,0 10,0 10,10 0,10\nroad 0,0 1,1\n");
    EXPECT_THROW(SiteLoader::parse(in), std::invalid_argument);
  }
  EXPECT_THROW(SiteLoader::load("/nonexistent/landopt/site.txt"), std::runtime_error);
}

int main()
{
  TestBoundaryNormalization();
  TestInvalidBoundaries();
  TestConstraintRules();
  TestSiteParsing();
  TestSiteErrors();

  return FinishTests("landopt_site_tests");
}
