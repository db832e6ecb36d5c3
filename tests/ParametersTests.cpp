#include "LiteTest.hpp"

#include <landopt/utils/parameters.hpp>

#include <algorithm>
#include <sstream>
#include <stdexcept>

using namespace landopt;
using namespace landopt::utils;

static void TestParseOverridesDefaults()
{
  std::istringstream in(
    "# run settings\n"
    "population_size = 80\n"
    "crossover       = uniform\n"
    "mutation_sigma  = 0.05   # narrower steps\n"
    "verbose = yes\n"
    "\n"
    "min_frontage = 25\n"
    "max_secondary_cuts = 6\n"
    "seed = 42\n");

  const RunParameters p = parseParameters(in);
  EXPECT_EQ(p.engine.population_size, std::size_t{80});
  EXPECT_TRUE(p.engine.crossover == optim::CrossoverKind::Uniform);
  EXPECT_NEAR(p.engine.mutation_sigma, 0.05, 1e-12);
  EXPECT_TRUE(p.engine.verbose);
  EXPECT_EQ(p.engine.seed, std::uint64_t{42});
  EXPECT_NEAR(p.decoder.min_frontage, 25.0, 1e-12);
  EXPECT_EQ(p.schema.max_secondary_cuts, std::size_t{6});

  // untouched fields keep their defaults
  EXPECT_EQ(p.engine.max_generations, optim::EngineConfig{}.max_generations);
  EXPECT_NEAR(p.decoder.primary_road_width, layout::DecoderConfig{}.primary_road_width, 1e-12);
}

static void TestBadLinesAreSkipped()
{
  RunParameters defaults;
  defaults.engine.tournament_k = 5;

  std::istringstream in(
    "tournament_k = -2\n"
    "crossover = three_point\n"
    "no_equals_sign\n"
    "parking_spaces = 12\n"
    "crossover_rate = 0.7x\n"
    "elitism_count = 2\n");

  const RunParameters p = parseParameters(in, defaults);
  EXPECT_EQ(p.engine.tournament_k, std::size_t{5});
  EXPECT_TRUE(p.engine.crossover == optim::CrossoverKind::TwoPoint);
  EXPECT_NEAR(p.engine.crossover_rate, 0.9, 1e-12);
  EXPECT_EQ(p.engine.elitism_count, std::size_t{2});
}

static void TestKeysAndMissingFile()
{
  const auto keys = parameterKeys();
  EXPECT_TRUE(std::find(keys.begin(), keys.end(), "population_size") != keys.end());
  EXPECT_TRUE(std::find(keys.begin(), keys.end(), "lot_size_span") != keys.end());
  EXPECT_TRUE(std::find(keys.begin(), keys.end(), "min_cut_gap") != keys.end());

  EXPECT_THROW(loadParameters("/nonexistent/landopt/run.cfg"), std::runtime_error);
}

static void TestEveryKeyReachesItsField()
{
  std::ostringstream text;
  for (const auto& key : parameterKeys()) {
    if (key == "crossover") text << key << " = one_point\n";
    else if (key == "verbose") text << key << " = on\n";
    else text << key << " = 3\n";
  }
  std::istringstream in(text.str());
  const RunParameters p = parseParameters(in);

  EXPECT_EQ(p.engine.population_size, std::size_t{3});
  EXPECT_EQ(p.engine.evaluation_cache_limit, std::size_t{3});
  EXPECT_NEAR(p.engine.plateau_tolerance, 3.0, 1e-12);
  EXPECT_EQ(p.engine.num_threads, 3);
  EXPECT_TRUE(p.engine.crossover == optim::CrossoverKind::OnePoint);
  EXPECT_NEAR(p.decoder.max_angle_deg, 3.0, 1e-12);
  EXPECT_NEAR(p.decoder.min_fragment_area, 3.0, 1e-12);
  EXPECT_EQ(p.schema.max_secondary_cuts, std::size_t{3});
  EXPECT_NEAR(p.schema.min_cut_gap, 3.0, 1e-12);
}

int main()
{
  TestParseOverridesDefaults();
  TestBadLinesAreSkipped();
  TestKeysAndMissingFile();
  TestEveryKeyReachesItsField();

  return FinishTests("landopt_parameters_tests");
}
