#include "CombinationWeights.h"
#include "StackingException.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <boost/algorithm/string.hpp>

namespace superlearner
{
  CombinationMethod combinationMethodFromString(const std::string& name)
  {
    const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
    if (key == "nnls")
      return CombinationMethod::NonNegativeLeastSquares;
    if (key == "nnloglik")
      return CombinationMethod::NonNegativeLogLikelihood;

    throw StackingConfigurationException("Unknown combination method '" + name
					 + "' (expected nnls or nnloglik)");
  }

  std::string combinationMethodToString(CombinationMethod method)
  {
    switch (method)
      {
      case CombinationMethod::NonNegativeLeastSquares:
	return "nnls";
      case CombinationMethod::NonNegativeLogLikelihood:
	return "nnloglik";
      }
    throw std::logic_error("combinationMethodToString: unhandled method");
  }

  CombinationWeights::CombinationWeights(std::vector<std::string> learnerNames, std::vector<double> weights)
    : mLearnerNames(std::move(learnerNames)),
      mWeights(std::move(weights))
  {
    if (mLearnerNames.size() != mWeights.size())
      throw std::invalid_argument("CombinationWeights: " + std::to_string(mWeights.size())
				  + " weights for " + std::to_string(mLearnerNames.size()) + " learners");
    if (mWeights.empty())
      throw std::invalid_argument("CombinationWeights: no learners");

    for (std::size_t l = 0; l < mWeights.size(); ++l)
      if (!std::isfinite(mWeights[l]) || mWeights[l] < 0.0)
	throw std::invalid_argument("CombinationWeights: weight " + std::to_string(mWeights[l])
				    + " for learner '" + mLearnerNames[l] + "' is not a non-negative number");
  }

  CombinationWeights CombinationWeights::uniform(const std::vector<std::string>& learnerNames)
  {
    if (learnerNames.empty())
      throw std::invalid_argument("CombinationWeights::uniform - no learners");
    return CombinationWeights(learnerNames,
			      std::vector<double>(learnerNames.size(), 1.0 / static_cast<double>(learnerNames.size())));
  }

  double CombinationWeights::getWeight(const std::string& learnerName) const
  {
    auto it = std::find(mLearnerNames.begin(), mLearnerNames.end(), learnerName);
    if (it == mLearnerNames.end())
      throw std::out_of_range("CombinationWeights: no weight for learner '" + learnerName + "'");
    return mWeights[static_cast<std::size_t>(it - mLearnerNames.begin())];
  }

  double CombinationWeights::getSum() const
  {
    return std::accumulate(mWeights.begin(), mWeights.end(), 0.0);
  }

  bool CombinationWeights::isOnSimplex(double tolerance) const
  {
    return std::all_of(mWeights.begin(), mWeights.end(), [](double w) { return w >= 0.0; })
      && std::fabs(getSum() - 1.0) <= tolerance;
  }

  const std::string& CombinationWeights::getDominantLearner() const
  {
    const auto it = std::max_element(mWeights.begin(), mWeights.end());
    return mLearnerNames[static_cast<std::size_t>(it - mWeights.begin())];
  }
}
