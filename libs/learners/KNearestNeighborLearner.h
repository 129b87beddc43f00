#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "Learner.h"

namespace superlearner
{
  namespace learners
  {
    /**
     * @class KNearestNeighborLearner
     * @brief Positive rate among the k nearest training rows.
     *
     * Distances are Euclidean on features standardised with the training
     * rows' mean and standard deviation. Equal distances are broken by
     * training row order, so predictions are deterministic. When fewer than
     * k rows were trained on, all of them are used.
     */
    class KNearestNeighborLearner : public ILearner
    {
    public:
      explicit KNearestNeighborLearner(std::string name = "knn", std::size_t numNeighbors = 25);

      std::string getName() const override
      {
	return mName;
      }

      std::shared_ptr<const ILearnerModel> train(const FeatureMatrix& features,
						 const std::vector<int>& labels) const override;

      std::size_t getNumNeighbors() const
      {
	return mNumNeighbors;
      }

    private:
      std::string mName;
      std::size_t mNumNeighbors;
    };
  }
}
