#include "EmpiricalRateTable.h"
#include "StackingException.h"
#include <cmath>
#include <string>

namespace superlearner
{
  EmpiricalRateTable EmpiricalRateTable::fromDataset(const Dataset& dataset,
						     std::size_t differentialIndex,
						     std::size_t timeLeftIndex)
  {
    if (differentialIndex >= dataset.getNumFeatures() || timeLeftIndex >= dataset.getNumFeatures())
      throw StackingConfigurationException("EmpiricalRateTable: feature index out of range for "
					   + std::to_string(dataset.getNumFeatures()) + " columns");

    std::map<Key, std::pair<std::size_t, std::size_t>> tallies;   // positives, total
    const FeatureMatrix& features = dataset.getFeatureMatrix();
    const std::vector<int>& labels = dataset.getLabels();

    for (std::size_t i = 0; i < dataset.getNumObservations(); ++i)
      {
	const Key key(static_cast<int>(std::lround(features(i, differentialIndex))),
		      static_cast<int>(std::lround(features(i, timeLeftIndex))));
	auto& tally = tallies[key];
	tally.first += static_cast<std::size_t>(labels[i]);
	tally.second += 1;
      }

    EmpiricalRateTable table;
    for (const auto& [key, tally] : tallies)
      table.mCells.emplace(key, EmpiricalRate{ static_cast<double>(tally.first) / static_cast<double>(tally.second),
					       tally.second });
    return table;
  }

  void EmpiricalRateTable::addCell(int scoreDifferential, int timeLeft, double rate, std::size_t count)
  {
    if (!(rate >= 0.0 && rate <= 1.0))
      throw StackingConfigurationException("EmpiricalRateTable: rate " + std::to_string(rate)
					   + " at (" + std::to_string(scoreDifferential) + ", "
					   + std::to_string(timeLeft) + ") is outside [0,1]");
    if (count == 0)
      throw StackingConfigurationException("EmpiricalRateTable: zero observation count at ("
					   + std::to_string(scoreDifferential) + ", "
					   + std::to_string(timeLeft) + ")");

    const bool inserted = mCells.emplace(Key(scoreDifferential, timeLeft), EmpiricalRate{ rate, count }).second;
    if (!inserted)
      throw StackingConfigurationException("EmpiricalRateTable: duplicate cell ("
					   + std::to_string(scoreDifferential) + ", "
					   + std::to_string(timeLeft) + ")");
  }

  std::optional<EmpiricalRate> EmpiricalRateTable::lookup(int scoreDifferential, int timeLeft) const
  {
    auto it = mCells.find(Key(scoreDifferential, timeLeft));
    if (it == mCells.end())
      return std::nullopt;
    return it->second;
  }
}
