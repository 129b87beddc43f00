#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>
#include "WeightSolver.h"
#include "StackingException.h"

using namespace superlearner;
using Catch::Approx;

namespace
{
  std::vector<double> complementOf(const std::vector<int>& labels)
  {
    std::vector<double> out;
    for (int y : labels)
      out.push_back(1.0 - y);
    return out;
  }

  std::vector<double> asDoubles(const std::vector<int>& labels)
  {
    return std::vector<double>(labels.begin(), labels.end());
  }

  double logistic(double eta)
  {
    return 1.0 / (1.0 + std::exp(-eta));
  }

  // Columns sigma(eta), sigma(1.02 eta), a constant 0.5 and the rounded
  // sigma(eta), with labels drawn from sigma(eta).
  PredictionMatrix makeCollinearColumns(std::size_t numRows, std::uint64_t seed, std::vector<int>& labels)
  {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> normal(0.0, 1.5);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    std::vector<double> base, steeper, coin, rounded;
    labels.clear();
    for (std::size_t i = 0; i < numRows; ++i)
      {
	const double eta = normal(rng);
	labels.push_back(uniform(rng) < logistic(eta) ? 1 : 0);
	base.push_back(logistic(eta));
	steeper.push_back(logistic(1.02 * eta));
	coin.push_back(0.5);
	rounded.push_back(logistic(eta) >= 0.5 ? 1.0 : 0.0);
      }
    return PredictionMatrix({ "base", "steeper", "coin", "rounded" }, { base, steeper, coin, rounded });
  }

  // Mean of f_il / (f_i . w) for every learner: the gradient of the mean
  // log-likelihood, equal to one on the support at the optimum and at most
  // one elsewhere.
  std::vector<double> likelihoodGradient(const PredictionMatrix& Z, const std::vector<int>& labels,
					 const std::vector<double>& w, double clamp)
  {
    const std::size_t n = Z.getNumRows();
    std::vector<double> gradient(Z.getNumLearners(), 0.0);
    for (std::size_t i = 0; i < n; ++i)
      {
	std::vector<double> f(Z.getNumLearners());
	double mixture = 0.0;
	for (std::size_t l = 0; l < f.size(); ++l)
	  {
	    const double p = std::min(std::max(Z.getColumn(l)[i], clamp), 1.0 - clamp);
	    f[l] = labels[i] == 1 ? p : 1.0 - p;
	    mixture += w[l] * f[l];
	  }
	for (std::size_t l = 0; l < f.size(); ++l)
	  gradient[l] += f[l] / mixture / static_cast<double>(n);
      }
    return gradient;
  }
}

TEST_CASE("combinationMethodFromString", "[CombinationWeights]")
{
  REQUIRE(combinationMethodFromString("nnls") == CombinationMethod::NonNegativeLeastSquares);
  REQUIRE(combinationMethodFromString(" NNLogLik ") == CombinationMethod::NonNegativeLogLikelihood);
  REQUIRE(combinationMethodToString(CombinationMethod::NonNegativeLeastSquares) == "nnls");
  REQUIRE_THROWS_AS(combinationMethodFromString("ridge"), StackingConfigurationException);
}

TEST_CASE("CombinationWeights validation and queries", "[CombinationWeights]")
{
  REQUIRE_THROWS_AS(CombinationWeights({ "a", "b" }, { 0.5, -0.1 }), std::invalid_argument);
  REQUIRE_THROWS_AS(CombinationWeights({ "a" }, { std::nan("") }), std::invalid_argument);
  REQUIRE_THROWS_AS(CombinationWeights({ "a", "b" }, { 1.0 }), std::invalid_argument);

  const CombinationWeights w({ "a", "b", "c" }, { 0.2, 0.7, 0.1 });
  REQUIRE(w.getWeight("b") == 0.7);
  REQUIRE(w.getDominantLearner() == "b");
  REQUIRE(w.isOnSimplex());
  REQUIRE_THROWS_AS(w.getWeight("d"), std::out_of_range);

  const CombinationWeights u = CombinationWeights::uniform({ "x", "y", "z", "w" });
  REQUIRE(u.getWeight("z") == Approx(0.25));
}

TEST_CASE("WeightSolver nnls", "[WeightSolver][nnls]")
{
  const WeightSolver solver;
  const std::vector<int> labels{ 1, 0, 1, 1, 0, 0, 1, 0 };

  SECTION("A learner equal to the labels takes all the weight")
  {
    const PredictionMatrix Z({ "perfect", "anti", "flat" },
			     { asDoubles(labels), complementOf(labels), std::vector<double>(8, 0.4) });
    const CombinationResult result = solver.solve(Z, labels, CombinationMethod::NonNegativeLeastSquares);

    REQUIRE(result.weights.getWeight("perfect") == Approx(1.0).margin(1e-9));
    REQUIRE(result.weights.getWeight("anti") == Approx(0.0).margin(1e-9));
    REQUIRE(result.weights.getWeight("flat") == Approx(0.0).margin(1e-9));
    REQUIRE(result.cvRisk == Approx(0.0).margin(1e-12));
    REQUIRE_FALSE(result.uniformFallback);
  }

  SECTION("The non-negativity constraint binds and rescaling would raise the risk")
  {
    // Unconstrained least squares gives a = 2/3, b = -1/3; the constrained
    // optimum is a = 0.5, b = 0 with risk 0.125, while a = 1 has risk 0.25.
    const std::vector<int> y{ 0, 1, 0, 0 };
    const PredictionMatrix Z({ "a", "b" }, { { 1, 1, 0, 0 }, { 1, 0, 1, 0 } });
    const CombinationResult result = solver.solve(Z, y, CombinationMethod::NonNegativeLeastSquares);

    REQUIRE(result.weights.getWeight("a") == Approx(0.5));
    REQUIRE(result.weights.getWeight("b") == 0.0);
    REQUIRE_FALSE(result.normalized);
    REQUIRE(result.cvRisk == Approx(0.125));
  }

  SECTION("All-zero solution falls back to uniform weights")
  {
    const std::vector<int> y{ 1, 0, 1, 0 };
    const PredictionMatrix Z({ "a", "b" }, { { 0, 1, 0, 1 }, { 0, 0, 0, 0 } });
    const CombinationResult result = solver.solve(Z, y, CombinationMethod::NonNegativeLeastSquares);

    REQUIRE(result.uniformFallback);
    REQUIRE(result.weights.getWeight("a") == Approx(0.5));
    REQUIRE(result.weights.getWeight("b") == Approx(0.5));
  }
}

TEST_CASE("WeightSolver nnloglik", "[WeightSolver][nnloglik]")
{
  const WeightSolver solver;

  SECTION("Weights stay on the simplex and favour the perfect learner")
  {
    const std::vector<int> labels{ 1, 0, 1, 1, 0, 0, 1, 0, 1, 0 };
    const PredictionMatrix Z({ "perfect", "anti", "coin" },
			     { asDoubles(labels), complementOf(labels), std::vector<double>(10, 0.5) });
    const CombinationResult result = solver.solve(Z, labels, CombinationMethod::NonNegativeLogLikelihood);

    REQUIRE(result.weights.isOnSimplex(1e-9));
    REQUIRE(result.weights.getDominantLearner() == "perfect");
    REQUIRE(result.weights.getWeight("perfect") > 0.999);
    REQUIRE(result.weights.getWeight("anti") < 1e-6);
    REQUIRE(result.cvRisk < 1e-3);
  }

  SECTION("Two constant learners mix to the observed base rate")
  {
    // 0.8 w + 0.2 (1 - w) = 0.5 at w = 0.5; the risk there is log 2.
    const std::vector<int> labels{ 1, 0, 1, 0, 1, 0 };
    const PredictionMatrix Z({ "high", "low" }, { std::vector<double>(6, 0.8), std::vector<double>(6, 0.2) });
    const CombinationResult result = solver.solve(Z, labels, CombinationMethod::NonNegativeLogLikelihood);

    REQUIRE(result.weights.getWeight("high") == Approx(0.5).margin(1e-6));
    REQUIRE(result.cvRisk == Approx(std::log(2.0)).margin(1e-9));
  }

  SECTION("Predictions of exactly 0 and 1 are clamped rather than failing")
  {
    const std::vector<int> labels{ 1, 0, 1, 0 };
    const PredictionMatrix Z({ "wrong", "right" }, { { 0, 1, 0, 1 }, { 1, 0, 1, 0 } });
    const CombinationResult result = solver.solve(Z, labels, CombinationMethod::NonNegativeLogLikelihood);

    REQUIRE(std::isfinite(result.cvRisk));
    REQUIRE(result.weights.getWeight("right") > 0.999);
  }

  SECTION("Nearly collinear learners converge to the optimum")
  {
    for (std::uint64_t seed : { 1u, 2u, 3u, 4u, 5u })
      {
	std::vector<int> labels;
	const PredictionMatrix Z = makeCollinearColumns(3000, seed, labels);
	const CombinationResult result = solver.solve(Z, labels, CombinationMethod::NonNegativeLogLikelihood);

	REQUIRE(result.weights.isOnSimplex(1e-9));
	REQUIRE(result.iterations < 500);

	const std::vector<double>& w = result.weights.getWeights();
	const std::vector<double> gradient = likelihoodGradient(Z, labels, w, solver.getProbabilityClamp());
	for (std::size_t l = 0; l < w.size(); ++l)
	  {
	    REQUIRE(gradient[l] <= 1.0 + 1e-6);
	    if (w[l] > 1e-3)
	      REQUIRE(gradient[l] == Approx(1.0).margin(1e-4));
	  }

	// No single learner beats the combination.
	for (std::size_t l = 0; l < Z.getNumLearners(); ++l)
	  {
	    const PredictionMatrix alone({ Z.getLearnerNames()[l] }, { Z.getColumn(l) });
	    const CombinationResult vertex = solver.solve(alone, labels, CombinationMethod::NonNegativeLogLikelihood);
	    REQUIRE(result.cvRisk <= vertex.cvRisk + 1e-9);
	  }
      }
  }

  SECTION("Duplicated learner columns still converge")
  {
    std::vector<int> labels;
    const PredictionMatrix collinear = makeCollinearColumns(2000, 11, labels);
    const PredictionMatrix Z({ "base", "copy", "coin" },
			     { collinear.getColumn(0), collinear.getColumn(0), collinear.getColumn(2) });
    const CombinationResult result = solver.solve(Z, labels, CombinationMethod::NonNegativeLogLikelihood);

    REQUIRE(result.weights.isOnSimplex(1e-9));
    REQUIRE(result.weights.getWeight("base") + result.weights.getWeight("copy") > 0.9);

    const PredictionMatrix single({ "base", "coin" }, { collinear.getColumn(0), collinear.getColumn(2) });
    const CombinationResult reference = solver.solve(single, labels, CombinationMethod::NonNegativeLogLikelihood);
    REQUIRE(result.cvRisk == Approx(reference.cvRisk).margin(1e-9));
  }

  SECTION("Exceeding the iteration cap is reported")
  {
    const WeightSolver capped(1e-10, 1, 1e-12);
    const std::vector<int> labels{ 1, 0, 1, 0, 1, 0 };
    const PredictionMatrix Z({ "high", "low" }, { std::vector<double>(6, 0.9), std::vector<double>(6, 0.2) });
    REQUIRE_THROWS_AS(capped.solve(Z, labels, CombinationMethod::NonNegativeLogLikelihood),
		      NumericalInstabilityException);
  }
}

TEST_CASE("WeightSolver input validation", "[WeightSolver][error]")
{
  const WeightSolver solver;
  const PredictionMatrix Z({ "a" }, { { 0.2, 0.8, 0.4 } });

  REQUIRE_THROWS_AS(solver.solve(Z, { 0, 1 }, CombinationMethod::NonNegativeLeastSquares),
		    StackingConfigurationException);
  REQUIRE_THROWS_AS(solver.solve(Z, { 0, 1, 2 }, CombinationMethod::NonNegativeLogLikelihood),
		    StackingConfigurationException);

  const PredictionMatrix withNaN({ "a" }, { { 0.2, std::numeric_limits<double>::quiet_NaN(), 0.4 } });
  REQUIRE_THROWS_AS(solver.solve(withNaN, { 0, 1, 0 }, CombinationMethod::NonNegativeLogLikelihood),
		    NumericalInstabilityException);

  REQUIRE_THROWS_AS(WeightSolver(0.0), StackingConfigurationException);
}
