#include "RankStatistics.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace superlearner
{
  namespace
  {
    // Number of entries in a sorted vector strictly below / equal to value.
    std::pair<std::size_t, std::size_t> countBelowAndEqual(const std::vector<double>& sorted, double value)
    {
      const auto lo = std::lower_bound(sorted.begin(), sorted.end(), value);
      const auto hi = std::upper_bound(lo, sorted.end(), value);
      return { static_cast<std::size_t>(lo - sorted.begin()),
	       static_cast<std::size_t>(hi - lo) };
    }
  }

  AucPlacements RankStatistics::computePlacements(const std::vector<double>& scores,
						  const std::vector<int>& labels)
  {
    if (scores.size() != labels.size())
      throw std::invalid_argument("RankStatistics::computePlacements - " + std::to_string(scores.size())
				  + " scores but " + std::to_string(labels.size()) + " labels");

    std::vector<double> positives, negatives;
    positives.reserve(scores.size());
    negatives.reserve(scores.size());

    for (std::size_t i = 0; i < scores.size(); ++i)
      {
	if (std::isnan(scores[i]))
	  throw std::domain_error("RankStatistics::computePlacements - NaN score at row " + std::to_string(i));

	if (labels[i] == 1)
	  positives.push_back(scores[i]);
	else if (labels[i] == 0)
	  negatives.push_back(scores[i]);
	else
	  throw std::invalid_argument("RankStatistics::computePlacements - label "
				      + std::to_string(labels[i]) + " is not 0 or 1");
      }

    if (positives.empty() || negatives.empty())
      throw std::domain_error("RankStatistics::computePlacements - AUC is undefined without both classes ("
			      + std::to_string(positives.size()) + " positives, "
			      + std::to_string(negatives.size()) + " negatives)");

    std::sort(positives.begin(), positives.end());
    std::sort(negatives.begin(), negatives.end());

    AucPlacements result;
    result.numPositives = positives.size();
    result.numNegatives = negatives.size();
    result.placements.resize(scores.size());

    const double n1 = static_cast<double>(positives.size());
    const double n0 = static_cast<double>(negatives.size());
    double positivePlacementSum = 0.0;

    for (std::size_t i = 0; i < scores.size(); ++i)
      {
	if (labels[i] == 1)
	  {
	    const auto [below, equal] = countBelowAndEqual(negatives, scores[i]);
	    const double placement = (static_cast<double>(below) + 0.5 * static_cast<double>(equal)) / n0;
	    result.placements[i] = placement;
	    positivePlacementSum += placement;
	  }
	else
	  {
	    const auto [below, equal] = countBelowAndEqual(positives, scores[i]);
	    const double above = n1 - static_cast<double>(below) - static_cast<double>(equal);
	    result.placements[i] = (above + 0.5 * static_cast<double>(equal)) / n1;
	  }
      }

    result.auc = positivePlacementSum / n1;
    return result;
  }
}
