#pragma once

#include <memory>
#include <string>
#include <vector>
#include "Learner.h"

namespace superlearner
{
  namespace learners
  {
    // Predicts the training positive rate for every row.
    class MeanLearner : public ILearner
    {
    public:
      explicit MeanLearner(std::string name = "mean");

      std::string getName() const override
      {
	return mName;
      }

      std::shared_ptr<const ILearnerModel> train(const FeatureMatrix& features,
						 const std::vector<int>& labels) const override;

    private:
      std::string mName;
    };
  }
}
