#include "Dataset.h"
#include "StackingException.h"
#include <algorithm>
#include <cmath>

namespace superlearner
{
  Dataset::Dataset(std::vector<std::string> featureNames, std::vector<Observation> observations)
    : mFeatureNames(std::move(featureNames)),
      mObservations(std::move(observations)),
      mFeatures(0, mFeatureNames.size()),
      mLabels()
  {
    if (mFeatureNames.empty())
      throw StackingConfigurationException("Dataset: at least one feature column is required");

    if (mObservations.empty())
      throw StackingConfigurationException("Dataset: no observations");

    mLabels.reserve(mObservations.size());
    for (std::size_t i = 0; i < mObservations.size(); ++i)
      {
	const Observation& obs = mObservations[i];
	if (obs.features.size() != mFeatureNames.size())
	  throw StackingConfigurationException("Dataset: row " + std::to_string(i) + " has "
					       + std::to_string(obs.features.size()) + " features, expected "
					       + std::to_string(mFeatureNames.size()));

	if (obs.label != 0 && obs.label != 1)
	  throw StackingConfigurationException("Dataset: row " + std::to_string(i) + " has label "
					       + std::to_string(obs.label) + ", labels must be 0 or 1");

	if (std::any_of(obs.features.begin(), obs.features.end(), [](double v) { return !std::isfinite(v); }))
	  throw StackingConfigurationException("Dataset: row " + std::to_string(i) + " has a non-finite feature");

	mFeatures.appendRow(obs.features);
	mLabels.push_back(obs.label);
      }
  }

  std::size_t Dataset::getFeatureIndex(const std::string& name) const
  {
    auto it = std::find(mFeatureNames.begin(), mFeatureNames.end(), name);
    if (it == mFeatureNames.end())
      throw StackingConfigurationException("Dataset: unknown feature column '" + name + "'");
    return static_cast<std::size_t>(it - mFeatureNames.begin());
  }

  std::vector<int> Dataset::selectLabels(const std::vector<std::size_t>& rows) const
  {
    std::vector<int> result;
    result.reserve(rows.size());
    for (std::size_t row : rows)
      result.push_back(mLabels.at(row));
    return result;
  }

  std::size_t Dataset::getNumPositives() const
  {
    return static_cast<std::size_t>(std::count(mLabels.begin(), mLabels.end(), 1));
  }
}
