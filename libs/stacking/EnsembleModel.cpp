#include "EnsembleModel.h"
#include <stdexcept>

namespace superlearner
{
  EnsembleModel::EnsembleModel(std::vector<std::shared_ptr<const ILearnerModel>> fullModels,
			       CombinationWeights weights)
    : mModels(std::move(fullModels)),
      mWeights(std::move(weights))
  {
    if (mModels.size() != mWeights.size())
      throw std::invalid_argument("EnsembleModel: " + std::to_string(mModels.size())
				  + " models for " + std::to_string(mWeights.size()) + " weights");

    for (std::size_t l = 0; l < mModels.size(); ++l)
      if (!mModels[l])
	throw std::invalid_argument("EnsembleModel: no model for learner '"
				    + mWeights.getLearnerNames()[l] + "'");
  }

  PredictionMatrix EnsembleModel::predictComponents(const FeatureMatrix& features) const
  {
    std::vector<std::vector<double>> columns;
    columns.reserve(mModels.size());

    for (std::size_t l = 0; l < mModels.size(); ++l)
      {
	auto column = mModels[l]->predict(features);
	if (column.size() != features.getNumRows())
	  throw std::runtime_error("EnsembleModel: learner '" + mWeights.getLearnerNames()[l]
				   + "' returned " + std::to_string(column.size()) + " predictions for "
				   + std::to_string(features.getNumRows()) + " rows");
	columns.push_back(std::move(column));
      }

    return PredictionMatrix(mWeights.getLearnerNames(), std::move(columns));
  }

  std::vector<double> EnsembleModel::predict(const FeatureMatrix& features) const
  {
    return predictComponents(features).combine(mWeights.getWeights());
  }
}
