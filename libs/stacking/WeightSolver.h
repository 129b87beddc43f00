#pragma once

#include <vector>
#include "CombinationWeights.h"
#include "PredictionMatrix.h"

namespace superlearner
{
  /**
   * @brief Meta-model fitted on Z together with how it was obtained.
   */
  struct CombinationResult
  {
    CombinationWeights weights;
    CombinationMethod method;
    // Objective of the returned weights on Z: mean squared error for nnls,
    // mean negative log-likelihood for nnloglik.
    double cvRisk = 0.0;
    // nnls only: raw weights were rescaled onto the simplex.
    bool normalized = false;
    // nnls only: every raw weight was zero and uniform weights were used.
    bool uniformFallback = false;
    unsigned int iterations = 0;
  };

  /**
   * @brief Numerical settings of the weight solvers.
   *
   * probabilityClamp bounds Z away from 0 and 1 for nnloglik. maxIterations
   * caps the active-set iterations of either method. tolerance is the
   * duality gap at which nnloglik stops, and the slack allowed when nnls
   * compares raw and rescaled risk.
   */
  struct WeightSolverSettings
  {
    double probabilityClamp = 1e-10;
    unsigned int maxIterations = 20000;
    double tolerance = 1e-10;
  };

  /**
   * @class WeightSolver
   * @brief Fits non-negative combination weights over the learner columns of Z.
   *
   * nnls: Lawson-Hanson active-set non-negative least squares of labels on Z.
   * The raw solution is rescaled to sum to one only when that does not
   * increase the cross-validated risk (the squared error on Z); if every
   * weight is zero the solver falls back to uniform weights.
   *
   * nnloglik: maximises the binomial log-likelihood of Z . w over the
   * simplex. Z is clamped to [eps, 1 - eps] first. On the simplex
   * 1 - Z_i . w = sum_l w_l (1 - z_il), so row i's likelihood is the mixture
   * sum_l w_l f_il with f_il = z_il for positives and 1 - z_il for negatives.
   * The objective is concave. With s_l = mean_i(f_il / sum_k w_k f_ik) we
   * have s . w = 1, so max_l s_l - 1 bounds the distance to the optimum and
   * is used as the stopping rule. Each iteration takes a projected Newton
   * step on the free set (support plus zero weights with s_l > 1) under
   * sum(w) = 1, with a ratio test that pins blocking weights at exactly
   * zero and Armijo backtracking. A step toward the vertex of the largest
   * s_l is the fallback when Newton makes no progress.
   */
  class WeightSolver
  {
  public:
    explicit WeightSolver(double probabilityClamp = 1e-10,
			  unsigned int maxIterations = 20000,
			  double tolerance = 1e-10);

    // @throws StackingConfigurationException on an out-of-range setting
    explicit WeightSolver(const WeightSolverSettings& settings);

    /**
     * @throws StackingConfigurationException if labels do not match Z or are not 0/1
     * @throws NumericalInstabilityException on non-finite entries of Z, a
     *         non-finite objective, or no convergence within the iteration cap
     */
    CombinationResult solve(const PredictionMatrix& Z,
			    const std::vector<int>& labels,
			    CombinationMethod method) const;

    double getProbabilityClamp() const
    {
      return mProbabilityClamp;
    }

    unsigned int getMaxIterations() const
    {
      return mMaxIterations;
    }

    double getTolerance() const
    {
      return mTolerance;
    }

  private:
    CombinationResult solveNonNegativeLeastSquares(const PredictionMatrix& Z,
						   const std::vector<int>& labels) const;
    CombinationResult solveNonNegativeLogLikelihood(const PredictionMatrix& Z,
						    const std::vector<int>& labels) const;

    double mProbabilityClamp;
    unsigned int mMaxIterations;
    double mTolerance;
  };
}
