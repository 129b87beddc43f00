#pragma once

#include <memory>
#include <string>
#include <vector>
#include "Learner.h"

namespace superlearner
{
  namespace learners
  {
    /**
     * @class LogisticRegressionLearner
     * @brief Ridge-penalised logistic regression fitted by iteratively
     * reweighted least squares.
     *
     * Features are standardised on the training rows. With quadratic terms
     * enabled every squared column and pairwise product is added before
     * standardising. The penalty applies to the intercept as well, so the fit
     * stays finite on separable or single-class training folds.
     */
    class LogisticRegressionLearner : public ILearner
    {
    public:
      LogisticRegressionLearner(std::string name = "logistic",
				bool quadraticTerms = false,
				double ridgePenalty = 1e-2,
				unsigned int maxIterations = 100,
				double tolerance = 1e-8);

      std::string getName() const override
      {
	return mName;
      }

      // @throws std::runtime_error if IRLS does not converge
      std::shared_ptr<const ILearnerModel> train(const FeatureMatrix& features,
						 const std::vector<int>& labels) const override;

      bool hasQuadraticTerms() const
      {
	return mQuadraticTerms;
      }

    private:
      std::string mName;
      bool mQuadraticTerms;
      double mRidgePenalty;
      unsigned int mMaxIterations;
      double mTolerance;
    };
  }
}
