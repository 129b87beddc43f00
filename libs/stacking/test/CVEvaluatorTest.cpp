#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <random>
#include <stdexcept>
#include <vector>
#include "CVEvaluator.h"
#include "StackingException.h"

using namespace superlearner;
using Catch::Approx;

namespace
{
  const std::vector<int> kLabels{ 1, 1, 0, 0, 1, 0, 1, 0 };
  const std::vector<double> kScores{ 0.9, 0.8, 0.1, 0.2, 0.3, 0.6, 0.7, 0.1 };

  FoldAssignment twoBlocks()
  {
    return FoldAssignment({ 0, 0, 0, 0, 1, 1, 1, 1 }, 2);
  }
}

TEST_CASE("CVEvaluator fold AUCs and influence-curve interval", "[CVEvaluator]")
{
  const CVEvaluator evaluator(0.95);
  const AucEstimate estimate = evaluator.evaluateScores("model", kScores, kLabels, twoBlocks());

  // Fold 0 separates perfectly; fold 1 orders 3 of its 4 pairs correctly.
  REQUIRE(estimate.foldAucs.size() == 2);
  REQUIRE(estimate.foldAucs[0] == 1.0);
  REQUIRE(estimate.foldAucs[1] == 0.75);
  REQUIRE(estimate.auc == Approx(0.875));

  // Fold 1 influence values are +-2 * 0.25, fold 0's are zero, so the
  // variance is mean(0, 0.25) / 8.
  REQUIRE(estimate.standardError.has_value());
  REQUIRE(*estimate.standardError == Approx(0.125));
  REQUIRE(*estimate.lowerBound == Approx(0.875 - 1.959964 * 0.125).epsilon(1e-5));
  REQUIRE(*estimate.upperBound == 1.0);
  REQUIRE(estimate.hasConfidenceInterval());
}

TEST_CASE("CVEvaluator on uninformative scores", "[CVEvaluator][noise]")
{
  SECTION("Every score shared by one positive and one negative gives exactly one half")
  {
    std::vector<double> scores;
    std::vector<int> labels;
    for (int k = 0; k < 30; ++k)
      {
	const double s = 0.01 * ((k * 37) % 97);
	scores.insert(scores.end(), { s, s });
	labels.insert(labels.end(), { 1, 0 });
      }
    const FoldAssignment folds = FoldPlan(5).assign(scores.size());
    const AucEstimate estimate = CVEvaluator().evaluateScores("tied", scores, labels, folds);

    REQUIRE(estimate.auc == Approx(0.5));
    REQUIRE(*estimate.lowerBound <= 0.5);
    REQUIRE(*estimate.upperBound >= 0.5);
  }

  SECTION("Random scores stay near one half and the interval covers it")
  {
    std::mt19937_64 rng(2024);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    std::vector<double> scores;
    std::vector<int> labels;
    for (int i = 0; i < 2000; ++i)
      {
	scores.push_back(uniform(rng));
	labels.push_back(i % 2);
      }
    const FoldAssignment folds = FoldPlan(10).assign(scores.size());
    const AucEstimate estimate = CVEvaluator(0.99).evaluateScores("noise", scores, labels, folds);

    REQUIRE(std::abs(estimate.auc - 0.5) < 0.1);
    REQUIRE(*estimate.lowerBound < estimate.auc);
    REQUIRE(*estimate.upperBound > estimate.auc);
  }
}

TEST_CASE("CVEvaluator report for learners and ensemble", "[CVEvaluator][ensemble]")
{
  std::vector<double> opposite;
  for (double s : kScores)
    opposite.push_back(1.0 - s);

  const PredictionMatrix Z({ "model", "opposite" }, { kScores, opposite });
  const CombinationWeights weights({ "model", "opposite" }, { 1.0, 0.0 });
  const AucReport report = CVEvaluator(0.9).evaluate(Z, kLabels, twoBlocks(), weights);

  REQUIRE(report.confidenceLevel == 0.9);
  REQUIRE(report.learners.size() == 2);
  REQUIRE(report.getLearner("model").auc == Approx(0.875));
  REQUIRE(report.getLearner("opposite").auc == Approx(0.125));
  REQUIRE(report.getLearner("opposite").hasConfidenceInterval());

  // The ensemble equals "model" here, but only the point estimate is reported.
  REQUIRE(report.ensemble.auc == Approx(0.875));
  REQUIRE_FALSE(report.ensemble.hasConfidenceInterval());
  REQUIRE_FALSE(report.ensemble.standardError.has_value());
  REQUIRE_THROWS_AS(report.getLearner("missing"), std::out_of_range);
}

TEST_CASE("CVEvaluator errors", "[CVEvaluator][error]")
{
  REQUIRE_THROWS_AS(CVEvaluator(1.0), StackingConfigurationException);
  REQUIRE_THROWS_AS(CVEvaluator(0.0), StackingConfigurationException);

  const CVEvaluator evaluator;

  SECTION("A fold with a single class has no AUC")
  {
    const std::vector<int> labels{ 1, 1, 0, 0 };
    const FoldAssignment folds({ 0, 0, 1, 1 }, 2);
    REQUIRE_THROWS_AS(evaluator.evaluateScores("m", { 0.1, 0.2, 0.3, 0.4 }, labels, folds),
		      NumericalInstabilityException);
  }

  SECTION("Labels must match the scores")
  {
    REQUIRE_THROWS_AS(evaluator.evaluateScores("m", kScores, { 1, 0 }, twoBlocks()),
		      StackingConfigurationException);
  }
}
