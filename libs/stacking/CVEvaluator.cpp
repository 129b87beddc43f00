#include "CVEvaluator.h"
#include "StackingException.h"
#include "RankStatistics.h"
#include "NormalQuantile.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace superlearner
{
  namespace
  {
    void validateShapes(std::size_t numRows, const std::vector<int>& labels, const FoldAssignment& folds)
    {
      if (labels.size() != numRows)
	throw StackingConfigurationException("CVEvaluator: " + std::to_string(labels.size())
					     + " labels for " + std::to_string(numRows) + " predictions");
      if (folds.getNumObservations() != numRows)
	throw StackingConfigurationException("CVEvaluator: fold assignment covers "
					     + std::to_string(folds.getNumObservations()) + " rows, expected "
					     + std::to_string(numRows));
    }

    struct FoldStatistics
    {
      double auc;
      double meanSquaredInfluence;
    };

    FoldStatistics computeFold(const std::string& name,
			       unsigned int fold,
			       const std::vector<double>& scores,
			       const std::vector<int>& labels,
			       const std::vector<std::size_t>& rows,
			       double positiveWeight,
			       double negativeWeight)
    {
      std::vector<double> foldScores;
      std::vector<int> foldLabels;
      foldScores.reserve(rows.size());
      foldLabels.reserve(rows.size());
      for (std::size_t row : rows)
	{
	  foldScores.push_back(scores[row]);
	  foldLabels.push_back(labels[row]);
	}

      AucPlacements placements;
      try
	{
	  placements = RankStatistics::computePlacements(foldScores, foldLabels);
	}
      catch (const std::domain_error& e)
	{
	  throw NumericalInstabilityException("CVEvaluator: AUC of '" + name + "' undefined on fold "
					      + std::to_string(fold) + ": " + e.what());
	}
      catch (const std::invalid_argument& e)
	{
	  throw StackingConfigurationException("CVEvaluator: fold " + std::to_string(fold) + ": " + e.what());
	}

      double sumSquares = 0.0;
      for (std::size_t k = 0; k < foldLabels.size(); ++k)
	{
	  const double weight = foldLabels[k] == 1 ? positiveWeight : negativeWeight;
	  const double influence = weight * (placements.placements[k] - placements.auc);
	  sumSquares += influence * influence;
	}

      return FoldStatistics{ placements.auc, sumSquares / static_cast<double>(foldLabels.size()) };
    }
  }

  const AucEstimate& AucReport::getLearner(const std::string& learnerName) const
  {
    auto it = std::find_if(learners.begin(), learners.end(),
			   [&learnerName](const AucEstimate& e) { return e.name == learnerName; });
    if (it == learners.end())
      throw std::out_of_range("AucReport: no estimate for learner '" + learnerName + "'");
    return *it;
  }

  CVEvaluator::CVEvaluator(double confidenceLevel)
    : mConfidenceLevel(confidenceLevel)
  {
    if (!(confidenceLevel > 0.0 && confidenceLevel < 1.0))
      throw StackingConfigurationException("CVEvaluator: confidence level must be in (0, 1), got "
					   + std::to_string(confidenceLevel));
  }

  AucEstimate CVEvaluator::evaluateScores(const std::string& name,
					  const std::vector<double>& scores,
					  const std::vector<int>& labels,
					  const FoldAssignment& folds) const
  {
    validateShapes(scores.size(), labels, folds);

    const double numRows = static_cast<double>(labels.size());
    const double numPositives = static_cast<double>(std::count(labels.begin(), labels.end(), 1));
    const double numNegatives = numRows - numPositives;
    if (numPositives == 0.0 || numNegatives == 0.0)
      throw NumericalInstabilityException("CVEvaluator: AUC of '" + name + "' is undefined, the data has only one class");

    // Inverse class prevalences over the whole data set.
    const double positiveWeight = numRows / numPositives;
    const double negativeWeight = numRows / numNegatives;

    AucEstimate estimate;
    estimate.name = name;
    estimate.foldAucs.reserve(folds.getNumFolds());
    double sumMeanSquaredInfluence = 0.0;

    for (unsigned int f = 0; f < folds.getNumFolds(); ++f)
      {
	const FoldStatistics stats = computeFold(name, f, scores, labels, folds.getRowsInFold(f),
						 positiveWeight, negativeWeight);
	estimate.foldAucs.push_back(stats.auc);
	sumMeanSquaredInfluence += stats.meanSquaredInfluence;
      }

    const double numFolds = static_cast<double>(folds.getNumFolds());
    estimate.auc = std::accumulate(estimate.foldAucs.begin(), estimate.foldAucs.end(), 0.0) / numFolds;

    const double variance = (sumMeanSquaredInfluence / numFolds) / numRows;
    const double se = std::sqrt(variance);
    const double z = detail::compute_normal_critical_value(mConfidenceLevel);

    estimate.standardError = se;
    estimate.lowerBound = std::max(0.0, estimate.auc - z * se);
    estimate.upperBound = std::min(1.0, estimate.auc + z * se);
    return estimate;
  }

  AucReport CVEvaluator::evaluate(const PredictionMatrix& Z,
				  const std::vector<int>& labels,
				  const FoldAssignment& folds,
				  const CombinationWeights& weights) const
  {
    validateShapes(Z.getNumRows(), labels, folds);

    AucReport report;
    report.confidenceLevel = mConfidenceLevel;
    report.learners.reserve(Z.getNumLearners());
    for (std::size_t l = 0; l < Z.getNumLearners(); ++l)
      report.learners.push_back(evaluateScores(Z.getLearnerNames()[l], Z.getColumn(l), labels, folds));

    std::vector<double> orderedWeights;
    orderedWeights.reserve(Z.getNumLearners());
    for (const auto& learnerName : Z.getLearnerNames())
      orderedWeights.push_back(weights.getWeight(learnerName));

    // The ensemble only gets a point estimate. Its weights were fitted on
    // this same Z, so the fold-wise influence curve would understate the
    // variance; a valid interval needs a nested cross-validation layer.
    AucEstimate ensemble = evaluateScores("SuperLearner", Z.combine(orderedWeights), labels, folds);
    ensemble.standardError.reset();
    ensemble.lowerBound.reset();
    ensemble.upperBound.reset();
    report.ensemble = std::move(ensemble);

    return report;
  }
}
