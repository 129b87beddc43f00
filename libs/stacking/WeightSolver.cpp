#include "WeightSolver.h"
#include "StackingException.h"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace superlearner
{
  namespace
  {
    void validateInputs(const PredictionMatrix& Z, const std::vector<int>& labels)
    {
      if (Z.getNumLearners() == 0)
	throw StackingConfigurationException("WeightSolver: prediction matrix has no learner columns");

      if (labels.size() != Z.getNumRows())
	throw StackingConfigurationException("WeightSolver: " + std::to_string(labels.size())
					     + " labels for " + std::to_string(Z.getNumRows())
					     + " prediction rows");
      if (labels.empty())
	throw StackingConfigurationException("WeightSolver: no observations");

      for (std::size_t i = 0; i < labels.size(); ++i)
	if (labels[i] != 0 && labels[i] != 1)
	  throw StackingConfigurationException("WeightSolver: label " + std::to_string(labels[i])
					       + " at row " + std::to_string(i) + " is not 0 or 1");

      for (std::size_t l = 0; l < Z.getNumLearners(); ++l)
	{
	  const auto& column = Z.getColumn(l);
	  for (std::size_t i = 0; i < column.size(); ++i)
	    if (!std::isfinite(column[i]))
	      throw NumericalInstabilityException("WeightSolver: learner '" + Z.getLearnerNames()[l]
						  + "' has non-finite prediction " + std::to_string(column[i])
						  + " at row " + std::to_string(i));
	}
    }

    Eigen::MatrixXd toEigen(const PredictionMatrix& Z)
    {
      Eigen::MatrixXd A(Z.getNumRows(), Z.getNumLearners());
      for (std::size_t l = 0; l < Z.getNumLearners(); ++l)
	A.col(static_cast<Eigen::Index>(l)) =
	  Eigen::Map<const Eigen::VectorXd>(Z.getColumn(l).data(), static_cast<Eigen::Index>(Z.getNumRows()));
      return A;
    }

    Eigen::VectorXd toEigen(const std::vector<int>& labels)
    {
      Eigen::VectorXd y(labels.size());
      for (std::size_t i = 0; i < labels.size(); ++i)
	y(static_cast<Eigen::Index>(i)) = labels[i];
      return y;
    }

    double meanSquaredError(const Eigen::MatrixXd& A, const Eigen::VectorXd& y, const Eigen::VectorXd& w)
    {
      return (y - A * w).squaredNorm() / static_cast<double>(y.size());
    }

    std::string formatWeights(const std::vector<std::string>& names, const Eigen::VectorXd& w)
    {
      std::ostringstream os;
      for (Eigen::Index l = 0; l < w.size(); ++l)
	os << (l ? ", " : "") << names[static_cast<std::size_t>(l)] << "=" << w(l);
      return os.str();
    }
  }

  WeightSolver::WeightSolver(double probabilityClamp, unsigned int maxIterations, double tolerance)
    : mProbabilityClamp(probabilityClamp),
      mMaxIterations(maxIterations),
      mTolerance(tolerance)
  {
    if (!(probabilityClamp > 0.0 && probabilityClamp < 0.5))
      throw StackingConfigurationException("WeightSolver: probability clamp must be in (0, 0.5)");
    if (maxIterations == 0)
      throw StackingConfigurationException("WeightSolver: iteration cap must be positive");
    if (!(tolerance > 0.0))
      throw StackingConfigurationException("WeightSolver: tolerance must be positive");
  }

  WeightSolver::WeightSolver(const WeightSolverSettings& settings)
    : WeightSolver(settings.probabilityClamp, settings.maxIterations, settings.tolerance)
  {}

  CombinationResult WeightSolver::solve(const PredictionMatrix& Z,
					const std::vector<int>& labels,
					CombinationMethod method) const
  {
    validateInputs(Z, labels);

    switch (method)
      {
      case CombinationMethod::NonNegativeLeastSquares:
	return solveNonNegativeLeastSquares(Z, labels);
      case CombinationMethod::NonNegativeLogLikelihood:
	return solveNonNegativeLogLikelihood(Z, labels);
      }
    throw StackingConfigurationException("WeightSolver: unsupported combination method");
  }

  CombinationResult WeightSolver::solveNonNegativeLeastSquares(const PredictionMatrix& Z,
							       const std::vector<int>& labels) const
  {
    const Eigen::MatrixXd A = toEigen(Z);
    const Eigen::VectorXd y = toEigen(labels);
    const Eigen::Index numLearners = A.cols();

    // Lawson & Hanson, "Solving Least Squares Problems", ch. 23.
    const double tol = 10.0 * std::numeric_limits<double>::epsilon()
      * A.cwiseAbs().colwise().sum().maxCoeff() * static_cast<double>(std::max(A.rows(), A.cols()));

    std::vector<bool> passive(static_cast<std::size_t>(numLearners), false);
    Eigen::VectorXd x = Eigen::VectorXd::Zero(numLearners);
    Eigen::VectorXd gradient = A.transpose() * (y - A * x);
    unsigned int iterations = 0;
    Eigen::Index blocked = -1;     // index whose re-entry would not move x

    for (;;)
      {
	Eigen::Index candidate = -1;
	double best = tol;
	for (Eigen::Index j = 0; j < numLearners; ++j)
	  if (!passive[static_cast<std::size_t>(j)] && j != blocked && gradient(j) > best)
	    {
	      best = gradient(j);
	      candidate = j;
	    }
	if (candidate < 0)
	  break;

	passive[static_cast<std::size_t>(candidate)] = true;

	for (;;)
	  {
	    if (++iterations > mMaxIterations)
	      throw NumericalInstabilityException("WeightSolver(nnls): no convergence after "
						  + std::to_string(mMaxIterations) + " iterations; current weights "
						  + formatWeights(Z.getLearnerNames(), x));

	    std::vector<Eigen::Index> active;
	    for (Eigen::Index j = 0; j < numLearners; ++j)
	      if (passive[static_cast<std::size_t>(j)])
		active.push_back(j);

	    Eigen::MatrixXd Ap(A.rows(), static_cast<Eigen::Index>(active.size()));
	    for (std::size_t k = 0; k < active.size(); ++k)
	      Ap.col(static_cast<Eigen::Index>(k)) = A.col(active[k]);
	    const Eigen::VectorXd zp = Ap.colPivHouseholderQr().solve(y);

	    Eigen::VectorXd z = Eigen::VectorXd::Zero(numLearners);
	    for (std::size_t k = 0; k < active.size(); ++k)
	      z(active[k]) = zp(static_cast<Eigen::Index>(k));

	    bool feasible = true;
	    for (Eigen::Index j : active)
	      if (z(j) <= 0.0)
		feasible = false;

	    if (feasible)
	      {
		x = z;
		break;
	      }

	    double alpha = 1.0;
	    for (Eigen::Index j : active)
	      if (z(j) <= 0.0)
		alpha = std::min(alpha, x(j) / (x(j) - z(j)));

	    x += alpha * (z - x);
	    for (Eigen::Index j : active)
	      if (x(j) <= tol)
		{
		  x(j) = 0.0;
		  passive[static_cast<std::size_t>(j)] = false;
		}

	    if (!passive[static_cast<std::size_t>(candidate)] && alpha == 0.0)
	      {
		// The entering column cannot move x; keep it out until x changes.
		blocked = candidate;
		break;
	      }
	    if (std::none_of(passive.begin(), passive.end(), [](bool p) { return p; }))
	      break;
	  }

	if (blocked != candidate)
	  blocked = -1;
	gradient = A.transpose() * (y - A * x);
      }

    const double rawSum = x.sum();
    if (!(rawSum > 0.0))
      {
	auto weights = CombinationWeights::uniform(Z.getLearnerNames());
	const Eigen::VectorXd u = Eigen::Map<const Eigen::VectorXd>(weights.getWeights().data(), numLearners);
	return CombinationResult{ weights, CombinationMethod::NonNegativeLeastSquares,
				  meanSquaredError(A, y, u), true, true, iterations };
      }

    const Eigen::VectorXd normalized = x / rawSum;
    const double rawRisk = meanSquaredError(A, y, x);
    const double normalizedRisk = meanSquaredError(A, y, normalized);

    // The raw solution minimises the risk over the whole non-negative orthant,
    // so rescaling can only tie it; accept the rescaled weights when it does.
    const bool useNormalized = normalizedRisk <= rawRisk + mTolerance * (1.0 + rawRisk);
    const Eigen::VectorXd& chosen = useNormalized ? normalized : x;

    return CombinationResult{ CombinationWeights(Z.getLearnerNames(),
						 std::vector<double>(chosen.data(), chosen.data() + chosen.size())),
			      CombinationMethod::NonNegativeLeastSquares,
			      useNormalized ? normalizedRisk : rawRisk,
			      useNormalized, false, iterations };
  }

  CombinationResult WeightSolver::solveNonNegativeLogLikelihood(const PredictionMatrix& Z,
								const std::vector<int>& labels) const
  {
    const std::size_t numRows = Z.getNumRows();
    const std::size_t numLearners = Z.getNumLearners();
    const Eigen::Index k = static_cast<Eigen::Index>(numLearners);
    const double n = static_cast<double>(numRows);
    const double lo = mProbabilityClamp;
    const double hi = 1.0 - mProbabilityClamp;

    // f(i, l): likelihood of row i's label under learner l alone.
    Eigen::MatrixXd f(numRows, numLearners);
    for (std::size_t l = 0; l < numLearners; ++l)
      {
	const auto& column = Z.getColumn(l);
	for (std::size_t i = 0; i < numRows; ++i)
	  {
	    const double p = std::clamp(column[i], lo, hi);
	    f(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(l)) = labels[i] == 1 ? p : 1.0 - p;
	  }
      }

    auto logLikelihood = [&f](const Eigen::VectorXd& weights) {
      return (f * weights).array().log().sum();
    };

    Eigen::VectorXd w = Eigen::VectorXd::Constant(k, 1.0 / static_cast<double>(numLearners));
    double current = logLikelihood(w);
    unsigned int iterations = 0;

    // Backtracking line search along a feasible direction d (sum(d) == 0).
    // slope is the directional derivative of the mean log-likelihood.
    auto lineSearch = [&](const Eigen::VectorXd& d, double slope) {
      if (!(slope > 0.0))
	return false;

      double alphaMax = 1.0;
      Eigen::Index blocking = -1;
      for (Eigen::Index l = 0; l < k; ++l)
	if (d(l) < 0.0 && -w(l) / d(l) < alphaMax)
	  {
	    alphaMax = -w(l) / d(l);
	    blocking = l;
	  }
      if (!(alphaMax > 0.0))
	return false;

      double alpha = alphaMax;
      for (int halving = 0; halving < 60; ++halving, alpha *= 0.5)
	{
	  Eigen::VectorXd trial = (w + alpha * d).cwiseMax(0.0);
	  if (blocking >= 0 && alpha == alphaMax)
	    trial(blocking) = 0.0;
	  trial /= trial.sum();

	  const double candidate = logLikelihood(trial);
	  if (std::isfinite(candidate) && candidate >= current + 1e-4 * alpha * slope * n)
	    {
	      w = trial;
	      current = candidate;
	      return true;
	    }
	}
      return false;
    };

    while (true)
      {
	if (!std::isfinite(current))
	  throw NumericalInstabilityException("WeightSolver(nnloglik): log-likelihood became "
					      + std::to_string(current) + " at iteration "
					      + std::to_string(iterations) + " with weights "
					      + formatWeights(Z.getLearnerNames(), w));

	// s = gradient of the mean log-likelihood; s . w == 1 on the simplex,
	// so max(s) - 1 is the duality gap of the current weights.
	const Eigen::VectorXd mixture = f * w;
	const Eigen::MatrixXd scaled = f.array().colwise() / mixture.array();
	const Eigen::VectorXd s = scaled.colwise().mean().transpose();
	const double gap = s.maxCoeff() - 1.0;

	if (gap <= mTolerance)
	  break;

	if (iterations == mMaxIterations)
	  throw NumericalInstabilityException("WeightSolver(nnloglik): no convergence after "
					      + std::to_string(mMaxIterations) + " iterations; duality gap "
					      + std::to_string(gap) + ", weights "
					      + formatWeights(Z.getLearnerNames(), w));
	++iterations;

	// Free set: the support plus zero weights whose gradient says they should enter.
	std::vector<Eigen::Index> freeSet;
	for (Eigen::Index l = 0; l < k; ++l)
	  if (w(l) > 0.0 || s(l) > 1.0)
	    freeSet.push_back(l);

	Eigen::VectorXd newton = Eigen::VectorXd::Zero(k);
	while (freeSet.size() > 1)
	  {
	    const Eigen::Index size = static_cast<Eigen::Index>(freeSet.size());
	    Eigen::MatrixXd scaledFree(scaled.rows(), size);
	    Eigen::VectorXd sFree(size);
	    for (Eigen::Index j = 0; j < size; ++j)
	      {
		scaledFree.col(j) = scaled.col(freeSet[static_cast<std::size_t>(j)]);
		sFree(j) = s(freeSet[static_cast<std::size_t>(j)]);
	      }

	    // Negative Hessian of the mean log-likelihood on the free set, with a
	    // small ridge so that collinear learners still factorise.
	    Eigen::MatrixXd hessian = (scaledFree.transpose() * scaledFree) / n;
	    const double ridge = 1e-10 * std::max(hessian.diagonal().maxCoeff(), 1.0);
	    hessian.diagonal().array() += ridge;

	    const Eigen::LDLT<Eigen::MatrixXd> ldlt(hessian);
	    const Eigen::VectorXd hs = ldlt.solve(sFree);
	    const Eigen::VectorXd h1 = ldlt.solve(Eigen::VectorXd::Ones(size));
	    const double nu = h1.sum() > 0.0 ? hs.sum() / h1.sum() : 0.0;
	    const Eigen::VectorXd direction = hs - nu * h1;

	    if (!direction.allFinite())
	      break;

	    // A zero weight that would move negative leaves the free set.
	    std::vector<Eigen::Index> kept;
	    for (Eigen::Index j = 0; j < size; ++j)
	      {
		const Eigen::Index l = freeSet[static_cast<std::size_t>(j)];
		if (w(l) > 0.0 || direction(j) >= 0.0)
		  kept.push_back(l);
	      }

	    if (kept.size() == freeSet.size())
	      {
		for (Eigen::Index j = 0; j < size; ++j)
		  newton(freeSet[static_cast<std::size_t>(j)]) = direction(j);
		break;
	      }
	    freeSet = std::move(kept);
	  }

	if (lineSearch(newton, s.dot(newton)))
	  continue;

	// Newton failed to make progress: move toward the vertex with the largest gradient.
	Eigen::Index best = 0;
	s.maxCoeff(&best);
	Eigen::VectorXd toVertex = -w;
	toVertex(best) += 1.0;
	if (lineSearch(toVertex, gap))
	  continue;

	if (gap <= std::sqrt(mTolerance))
	  break;
	throw NumericalInstabilityException("WeightSolver(nnloglik): line search stalled at iteration "
					    + std::to_string(iterations) + " with duality gap "
					    + std::to_string(gap) + ", weights "
					    + formatWeights(Z.getLearnerNames(), w));
      }

    std::vector<double> weights(numLearners);
    for (std::size_t l = 0; l < numLearners; ++l)
      weights[l] = std::max(0.0, w(static_cast<Eigen::Index>(l)));

    return CombinationResult{ CombinationWeights(Z.getLearnerNames(), std::move(weights)),
			      CombinationMethod::NonNegativeLogLikelihood,
			      -current / n,
			      true, false, iterations };
  }
}
