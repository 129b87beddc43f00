#include "StackingEngine.h"
#include "StackingException.h"
#include <chrono>
#include <cmath>
#include <future>
#include <set>
#include <string>

namespace superlearner
{
  namespace
  {
    // Training and held-out inputs for one fold, shared by every learner.
    struct FoldData
    {
      std::vector<std::size_t> heldOutRows;
      FeatureMatrix trainingFeatures;
      std::vector<int> trainingLabels;
      FeatureMatrix heldOutFeatures;
    };

    void validatePredictions(const std::string& learnerName,
			     std::optional<unsigned int> fold,
			     const std::vector<double>& predictions,
			     std::size_t expectedRows)
    {
      if (predictions.size() != expectedRows)
	throw LearnerTrainingException(learnerName, fold,
				       "returned " + std::to_string(predictions.size())
				       + " predictions for " + std::to_string(expectedRows) + " rows");

      for (std::size_t k = 0; k < predictions.size(); ++k)
	{
	  const double p = predictions[k];
	  if (!std::isfinite(p) || p < 0.0 || p > 1.0)
	    throw LearnerTrainingException(learnerName, fold,
					   "prediction " + std::to_string(p) + " at held-out row "
					   + std::to_string(k) + " is not a probability");
	}
    }

    std::shared_ptr<const ILearnerModel> trainUnit(const ILearner& learner,
						   const std::string& learnerName,
						   std::optional<unsigned int> fold,
						   const FeatureMatrix& features,
						   const std::vector<int>& labels)
    {
      std::shared_ptr<const ILearnerModel> model;
      try
	{
	  model = learner.train(features, labels);
	}
      catch (const std::exception& e)
	{
	  throw LearnerTrainingException(learnerName, fold, e.what());
	}

      if (!model)
	throw LearnerTrainingException(learnerName, fold, "training returned no model");
      return model;
    }

    double secondsSince(std::chrono::steady_clock::time_point start)
    {
      return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }
  }

  StackingEngine::StackingEngine(concurrency::IParallelExecutor& executor,
				 std::shared_ptr<IStackingObserver> observer)
    : mExecutor(executor),
      mObserver(observer ? std::move(observer) : std::make_shared<NullStackingObserver>())
  {}

  void StackingEngine::validateInputs(const Dataset& dataset,
				      const LearnerSet& learners,
				      const FoldAssignment& folds) const
  {
    if (learners.empty())
      throw StackingConfigurationException("StackingEngine: the learner set is empty");

    std::set<std::string> names;
    for (const auto& learner : learners)
      {
	if (!learner)
	  throw StackingConfigurationException("StackingEngine: null learner in the learner set");
	if (!names.insert(learner->getName()).second)
	  throw StackingConfigurationException("StackingEngine: duplicate learner name '"
					       + learner->getName() + "'");
      }

    if (folds.getNumObservations() != dataset.getNumObservations())
      throw StackingConfigurationException("StackingEngine: fold assignment covers "
					   + std::to_string(folds.getNumObservations())
					   + " rows but the dataset has "
					   + std::to_string(dataset.getNumObservations()));

    if (folds.getNumFolds() < 2)
      throw StackingConfigurationException("StackingEngine: at least 2 folds are required");

    const auto sizes = folds.getFoldSizes();
    for (unsigned int f = 0; f < sizes.size(); ++f)
      if (sizes[f] == 0)
	throw StackingConfigurationException("StackingEngine: fold " + std::to_string(f) + " is empty");
  }

  StackingResult StackingEngine::fit(const Dataset& dataset,
				     const LearnerSet& learners,
				     const FoldAssignment& folds,
				     std::ostream& outputStream) const
  {
    validateInputs(dataset, learners, folds);

    const std::size_t numRows = dataset.getNumObservations();
    const std::size_t numLearners = learners.size();
    const unsigned int numFolds = folds.getNumFolds();

    outputStream << "Stacking " << numLearners << " learners over " << numFolds << " folds ("
		 << numRows << " observations)" << std::endl;

    std::vector<FoldData> foldData(numFolds);
    for (unsigned int f = 0; f < numFolds; ++f)
      {
	const auto trainingRows = folds.getRowsNotInFold(f);
	foldData[f].heldOutRows = folds.getRowsInFold(f);
	foldData[f].trainingFeatures = dataset.selectFeatures(trainingRows);
	foldData[f].trainingLabels = dataset.selectLabels(trainingRows);
	foldData[f].heldOutFeatures = dataset.selectFeatures(foldData[f].heldOutRows);
      }

    std::vector<std::string> learnerNames;
    learnerNames.reserve(numLearners);
    for (const auto& learner : learners)
      learnerNames.push_back(learner->getName());

    std::vector<std::vector<double>> columns(numLearners, std::vector<double>(numRows, 0.0));

    std::vector<std::future<void>> futures;
    futures.reserve(numLearners * numFolds);
    for (std::size_t l = 0; l < numLearners; ++l)
      for (unsigned int f = 0; f < numFolds; ++f)
	{
	  futures.emplace_back(mExecutor.submit([&, l, f]() {
	    const auto start = std::chrono::steady_clock::now();
	    const FoldData& data = foldData[f];
	    const std::string& name = learnerNames[l];

	    auto model = trainUnit(*learners[l], name, f, data.trainingFeatures, data.trainingLabels);

	    std::vector<double> predictions;
	    try
	      {
		predictions = model->predict(data.heldOutFeatures);
	      }
	    catch (const std::exception& e)
	      {
		throw LearnerTrainingException(name, f, std::string("prediction failed: ") + e.what());
	      }
	    validatePredictions(name, f, predictions, data.heldOutRows.size());

	    std::vector<double>& column = columns[l];
	    for (std::size_t k = 0; k < data.heldOutRows.size(); ++k)
	      column[data.heldOutRows[k]] = predictions[k];

	    mObserver->onUnitCompleted(StackingUnitRecord{ name, f, data.trainingLabels.size(),
							   data.heldOutRows.size(), secondsSince(start) });
	  }));
	}

    // Barrier: Z is complete (or the run has failed) only after every unit.
    mExecutor.waitAll(futures);
    outputStream << "Out-of-fold predictions complete" << std::endl;

    std::vector<std::shared_ptr<const ILearnerModel>> fullModels(numLearners);
    futures.clear();
    for (std::size_t l = 0; l < numLearners; ++l)
      {
	futures.emplace_back(mExecutor.submit([&, l]() {
	  const auto start = std::chrono::steady_clock::now();
	  fullModels[l] = trainUnit(*learners[l], learnerNames[l], std::nullopt,
				    dataset.getFeatureMatrix(), dataset.getLabels());
	  mObserver->onUnitCompleted(StackingUnitRecord{ learnerNames[l], std::nullopt, numRows, 0,
							 secondsSince(start) });
	}));
      }
    mExecutor.waitAll(futures);
    outputStream << "Full-data fits complete" << std::endl;

    return StackingResult{ PredictionMatrix(std::move(learnerNames), std::move(columns)),
			   std::move(fullModels) };
  }
}
