#include "KNearestNeighborLearner.h"
#include "FeatureScaler.h"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace superlearner
{
  namespace learners
  {
    namespace
    {
      class NeighborModel : public ILearnerModel
      {
      public:
	NeighborModel(FeatureScaler scaler, Eigen::MatrixXd trainingRows,
		      std::vector<int> labels, std::size_t numNeighbors)
	  : mScaler(std::move(scaler)),
	    mTrainingRows(std::move(trainingRows)),
	    mLabels(std::move(labels)),
	    mNumNeighbors(std::min(numNeighbors, mLabels.size()))
	{}

	std::vector<double> predict(const FeatureMatrix& features) const override
	{
	  if (features.getNumColumns() != static_cast<std::size_t>(mTrainingRows.cols()))
	    throw std::invalid_argument("NeighborModel: feature width does not match the training rows");

	  const Eigen::MatrixXd query = mScaler.transform(toEigen(features));
	  std::vector<double> out;
	  out.reserve(features.getNumRows());

	  std::vector<std::pair<double, std::size_t>> distances(mLabels.size());
	  for (Eigen::Index q = 0; q < query.rows(); ++q)
	    {
	      for (std::size_t i = 0; i < mLabels.size(); ++i)
		distances[i] = { (mTrainingRows.row(static_cast<Eigen::Index>(i)) - query.row(q)).squaredNorm(), i };

	      std::nth_element(distances.begin(), distances.begin() + static_cast<std::ptrdiff_t>(mNumNeighbors - 1),
			       distances.end());
	      std::sort(distances.begin(), distances.begin() + static_cast<std::ptrdiff_t>(mNumNeighbors));

	      std::size_t positives = 0;
	      for (std::size_t k = 0; k < mNumNeighbors; ++k)
		positives += static_cast<std::size_t>(mLabels[distances[k].second]);
	      out.push_back(static_cast<double>(positives) / static_cast<double>(mNumNeighbors));
	    }
	  return out;
	}

      private:
	FeatureScaler mScaler;
	Eigen::MatrixXd mTrainingRows;   // standardised
	std::vector<int> mLabels;
	std::size_t mNumNeighbors;
      };
    }

    KNearestNeighborLearner::KNearestNeighborLearner(std::string name, std::size_t numNeighbors)
      : mName(std::move(name)),
	mNumNeighbors(numNeighbors)
    {
      if (numNeighbors == 0)
	throw std::invalid_argument("KNearestNeighborLearner: k must be positive");
    }

    std::shared_ptr<const ILearnerModel> KNearestNeighborLearner::train(const FeatureMatrix& features,
									const std::vector<int>& labels) const
    {
      if (labels.empty() || labels.size() != features.getNumRows())
	throw std::invalid_argument("KNearestNeighborLearner: need one label per training row");

      const Eigen::MatrixXd x = toEigen(features);
      FeatureScaler scaler(x);
      Eigen::MatrixXd standardised = scaler.transform(x);
      return std::make_shared<NeighborModel>(std::move(scaler), std::move(standardised), labels, mNumNeighbors);
    }
  }
}
