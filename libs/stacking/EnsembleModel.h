#pragma once

#include <memory>
#include <string>
#include <vector>
#include "CombinationWeights.h"
#include "FeatureMatrix.h"
#include "Learner.h"
#include "PredictionMatrix.h"

namespace superlearner
{
  /**
   * @class EnsembleModel
   * @brief Full-data learner models combined with the fitted weights.
   *
   * Immutable after construction and safe to share between threads. When
   * every component predicts in [0,1] and the weights lie on the simplex the
   * combined prediction is a convex combination and stays in [0,1].
   */
  class EnsembleModel
  {
  public:
    /**
     * @throws std::invalid_argument if the model count differs from the
     *         weight count or a model is null
     */
    EnsembleModel(std::vector<std::shared_ptr<const ILearnerModel>> fullModels,
		  CombinationWeights weights);

    std::vector<double> predict(const FeatureMatrix& features) const;

    // Per-learner predictions as named columns (the full-data analogue of Z).
    PredictionMatrix predictComponents(const FeatureMatrix& features) const;

    const CombinationWeights& getWeights() const
    {
      return mWeights;
    }

    const std::vector<std::string>& getLearnerNames() const
    {
      return mWeights.getLearnerNames();
    }

    std::size_t getNumLearners() const
    {
      return mModels.size();
    }

  private:
    std::vector<std::shared_ptr<const ILearnerModel>> mModels;
    CombinationWeights mWeights;
  };
}
