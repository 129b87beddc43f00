#pragma once

#include <optional>
#include <string>
#include <vector>
#include "CombinationWeights.h"
#include "FoldPlan.h"
#include "PredictionMatrix.h"

namespace superlearner
{
  /**
   * @brief Cross-validated AUC of one column of scores.
   *
   * auc is the mean of the per-fold AUCs. The interval fields are empty when
   * no valid interval exists (the ensemble entry).
   */
  struct AucEstimate
  {
    std::string name;
    double auc = 0.0;
    std::vector<double> foldAucs;
    std::optional<double> standardError;
    std::optional<double> lowerBound;
    std::optional<double> upperBound;

    bool hasConfidenceInterval() const
    {
      return lowerBound.has_value() && upperBound.has_value();
    }
  };

  struct AucReport
  {
    double confidenceLevel = 0.95;
    std::vector<AucEstimate> learners;
    AucEstimate ensemble;

    // @throws std::out_of_range for an unknown learner name
    const AucEstimate& getLearner(const std::string& learnerName) const;
  };

  /**
   * @class CVEvaluator
   * @brief Cross-validated AUC with influence-curve confidence intervals.
   *
   * Within each fold v the Mann-Whitney AUC_v is computed from the held-out
   * predictions, together with each row's influence value
   *   positives: (N / N_1) * (P_i - AUC_v)
   *   negatives: (N / N_0) * (Q_i - AUC_v)
   * where P_i (Q_i) is the fraction of the fold's negatives (positives)
   * ranked below (above) row i, ties counting one half, and N_1, N_0 are the
   * class counts over the whole data set. The variance of the cross-validated
   * AUC is estimated as mean_v(mean_{i in v} IC_i^2) / N, and the interval is
   * the normal approximation around the mean fold AUC, clipped to [0,1].
   * Computing the influence values fold by fold accounts for predictions in
   * one fold sharing a training set, which treating all N rows as
   * independent would ignore.
   */
  class CVEvaluator
  {
  public:
    // @throws StackingConfigurationException unless 0 < confidenceLevel < 1
    explicit CVEvaluator(double confidenceLevel = 0.95);

    /**
     * @throws StackingConfigurationException if labels or folds do not match Z
     * @throws NumericalInstabilityException if a fold lacks either class
     */
    AucReport evaluate(const PredictionMatrix& Z,
		       const std::vector<int>& labels,
		       const FoldAssignment& folds,
		       const CombinationWeights& weights) const;

    // Point estimate and interval for one column of out-of-fold scores.
    AucEstimate evaluateScores(const std::string& name,
			       const std::vector<double>& scores,
			       const std::vector<int>& labels,
			       const FoldAssignment& folds) const;

    double getConfidenceLevel() const
    {
      return mConfidenceLevel;
    }

  private:
    double mConfidenceLevel;
  };
}
