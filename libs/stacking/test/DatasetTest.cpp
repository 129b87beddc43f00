#include <catch2/catch_test_macros.hpp>
#include <limits>
#include <vector>
#include "Dataset.h"
#include "PredictionMatrix.h"
#include "StackingException.h"

using namespace superlearner;

TEST_CASE("Dataset exposes features and labels by row", "[Dataset]")
{
  std::vector<Observation> rows{
    { { 1.0, 90.0 }, 1, "g1" },
    { { -3.0, 45.0 }, 0, "g1" },
    { { 7.0, 2.0 }, 1, "g2" },
  };
  const Dataset data({ "ScoreDifferential", "TimeLeft" }, std::move(rows));

  REQUIRE(data.getNumObservations() == 3);
  REQUIRE(data.getNumFeatures() == 2);
  REQUIRE(data.getNumPositives() == 2);
  REQUIRE(data.getFeatureIndex("TimeLeft") == 1);
  REQUIRE(data.getLabels() == std::vector<int>{ 1, 0, 1 });
  REQUIRE(data.getObservation(2).groupId == "g2");

  const FeatureMatrix subset = data.selectFeatures({ 2, 0 });
  REQUIRE(subset.getNumRows() == 2);
  REQUIRE(subset(0, 0) == 7.0);
  REQUIRE(subset(1, 1) == 90.0);
  REQUIRE(data.selectLabels({ 1, 2 }) == std::vector<int>{ 0, 1 });

  REQUIRE_THROWS_AS(data.getFeatureIndex("Quarter"), StackingConfigurationException);
}

TEST_CASE("Dataset validation", "[Dataset][error]")
{
  const std::vector<std::string> names{ "a", "b" };

  REQUIRE_THROWS_AS(Dataset(names, {}), StackingConfigurationException);
  REQUIRE_THROWS_AS(Dataset({}, { Observation{ {}, 1, "" } }), StackingConfigurationException);
  REQUIRE_THROWS_AS(Dataset(names, { Observation{ { 1.0 }, 1, "" } }), StackingConfigurationException);
  REQUIRE_THROWS_AS(Dataset(names, { Observation{ { 1.0, 2.0 }, 2, "" } }), StackingConfigurationException);
  REQUIRE_THROWS_AS(Dataset(names, { Observation{ { 1.0, std::numeric_limits<double>::infinity() }, 0, "" } }),
		    StackingConfigurationException);
}

TEST_CASE("PredictionMatrix", "[PredictionMatrix]")
{
  const PredictionMatrix Z({ "a", "b" }, { { 0.1, 0.2, 0.3 }, { 0.9, 0.8, 0.7 } });

  REQUIRE(Z.getNumRows() == 3);
  REQUIRE(Z.getNumLearners() == 2);
  REQUIRE(Z(1, 1) == 0.8);
  REQUIRE(Z.getColumnIndex("b") == 1);
  REQUIRE(Z.getRow(2) == std::vector<double>{ 0.3, 0.7 });

  const auto combined = Z.combine({ 0.5, 0.5 });
  for (double v : combined)
    REQUIRE(v == 0.5);

  REQUIRE_THROWS_AS(Z.getColumn("c"), std::out_of_range);
  REQUIRE_THROWS_AS(Z.combine({ 1.0 }), std::invalid_argument);
  REQUIRE_THROWS_AS(PredictionMatrix({ "a", "b" }, { { 0.1 }, { 0.2, 0.3 } }), std::invalid_argument);
}
