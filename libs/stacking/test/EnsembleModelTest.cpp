#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <stdexcept>
#include <vector>
#include "EnsembleModel.h"
#include "StackingTestHelpers.h"

using namespace superlearner;
using namespace superlearner::testing;
using Catch::Approx;

TEST_CASE("EnsembleModel combines full-data models with the weights", "[EnsembleModel]")
{
  const FeatureMatrix x(1, std::vector<double>{ 0.0, 0.25, 1.0 });
  const std::vector<int> y{ 0, 0, 1 };

  auto identity = makeColumnLearner("identity", 0)->train(x, y);
  auto flat = makeConstantLearner("flat", 0.6)->train(x, y);

  const EnsembleModel ensemble({ identity, flat },
			       CombinationWeights({ "identity", "flat" }, { 0.75, 0.25 }));

  SECTION("Prediction is the weighted sum of component predictions")
  {
    const auto p = ensemble.predict(x);
    REQUIRE(p.size() == 3);
    REQUIRE(p[0] == Approx(0.15));
    REQUIRE(p[1] == Approx(0.75 * 0.25 + 0.15));
    REQUIRE(p[2] == Approx(0.9));
    for (double v : p)
      {
	REQUIRE(v >= 0.0);
	REQUIRE(v <= 1.0);
      }
  }

  SECTION("Components are reported by learner name")
  {
    const PredictionMatrix components = ensemble.predictComponents(x);
    REQUIRE(components.getLearnerNames() == std::vector<std::string>{ "identity", "flat" });
    REQUIRE(components.getColumn("flat") == std::vector<double>(3, 0.6));
    REQUIRE(ensemble.getNumLearners() == 2);
    REQUIRE(ensemble.getWeights().getWeight("identity") == 0.75);
  }
}

TEST_CASE("EnsembleModel rejects inconsistent inputs", "[EnsembleModel][error]")
{
  const FeatureMatrix x(1, std::vector<double>{ 0.5 });
  auto model = makeConstantLearner("flat", 0.5)->train(x, { 1 });

  REQUIRE_THROWS_AS(EnsembleModel({ model }, CombinationWeights({ "a", "b" }, { 0.5, 0.5 })),
		    std::invalid_argument);
  REQUIRE_THROWS_AS(EnsembleModel({ model, nullptr }, CombinationWeights({ "a", "b" }, { 0.5, 0.5 })),
		    std::invalid_argument);
}
