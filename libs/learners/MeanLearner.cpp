#include "MeanLearner.h"
#include <numeric>
#include <stdexcept>

namespace superlearner
{
  namespace learners
  {
    namespace
    {
      class ConstantModel : public ILearnerModel
      {
      public:
	explicit ConstantModel(double probability)
	  : mProbability(probability)
	{}

	std::vector<double> predict(const FeatureMatrix& features) const override
	{
	  return std::vector<double>(features.getNumRows(), mProbability);
	}

      private:
	double mProbability;
      };
    }

    MeanLearner::MeanLearner(std::string name)
      : mName(std::move(name))
    {}

    std::shared_ptr<const ILearnerModel> MeanLearner::train(const FeatureMatrix& features,
							    const std::vector<int>& labels) const
    {
      if (labels.empty())
	throw std::invalid_argument("MeanLearner: no training rows");
      if (labels.size() != features.getNumRows())
	throw std::invalid_argument("MeanLearner: label count does not match feature rows");

      const double positives = std::accumulate(labels.begin(), labels.end(), 0.0);
      return std::make_shared<ConstantModel>(positives / static_cast<double>(labels.size()));
    }
  }
}
