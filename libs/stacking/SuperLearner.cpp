#include "SuperLearner.h"
#include "StackingEngine.h"
#include "StackingException.h"
#include <iomanip>
#include <string>

namespace superlearner
{
  void SuperLearnerConfiguration::validate(std::size_t numObservations) const
  {
    if (mNumFolds < 2)
      throw StackingConfigurationException("SuperLearner: number of folds must be at least 2, got "
					   + std::to_string(mNumFolds));
    if (mNumFolds > numObservations)
      throw StackingConfigurationException("SuperLearner: " + std::to_string(mNumFolds)
					   + " folds requested for " + std::to_string(numObservations)
					   + " observations");
    if (!(mConfidenceLevel > 0.0 && mConfidenceLevel < 1.0))
      throw StackingConfigurationException("SuperLearner: confidence level must be in (0, 1), got "
					   + std::to_string(mConfidenceLevel));
  }

  SuperLearner::SuperLearner(const SuperLearnerConfiguration& configuration,
			     concurrency::IParallelExecutor& executor,
			     std::shared_ptr<IStackingObserver> observer)
    : mConfiguration(configuration),
      mExecutor(executor),
      mObserver(observer ? std::move(observer) : std::make_shared<NullStackingObserver>())
  {}

  SuperLearnerFit SuperLearner::fit(const Dataset& dataset,
				    const LearnerSet& learners,
				    std::ostream& outputStream) const
  {
    mConfiguration.validate(dataset.getNumObservations());
    if (learners.empty())
      throw StackingConfigurationException("SuperLearner: the learner set is empty");

    // Constructed up front so bad solver or confidence settings fail before training.
    const WeightSolver solver(mConfiguration.getSolverSettings());
    const CVEvaluator evaluator(mConfiguration.getConfidenceLevel());

    const FoldPlan plan(mConfiguration.getNumFolds(), mConfiguration.isShuffled(), mConfiguration.getSeed());
    FoldAssignment folds = plan.assign(dataset.getNumObservations());

    StackingEngine engine(mExecutor, mObserver);
    StackingResult stacked = engine.fit(dataset, learners, folds, outputStream);

    CombinationResult combination = solver.solve(stacked.predictions, dataset.getLabels(),
						 mConfiguration.getMethod());

    outputStream << "Combination weights (" << combinationMethodToString(combination.method)
		 << ", cv risk " << combination.cvRisk << "):" << std::endl;
    for (std::size_t l = 0; l < combination.weights.size(); ++l)
      outputStream << "  " << std::setw(24) << std::left << combination.weights.getLearnerNames()[l]
		   << std::right << combination.weights.getWeights()[l] << std::endl;

    auto ensemble = std::make_shared<const EnsembleModel>(stacked.fullModels, combination.weights);

    AucReport auc = evaluator.evaluate(stacked.predictions, dataset.getLabels(), folds, combination.weights);
    outputStream << "Cross-validated AUC of the ensemble: " << auc.ensemble.auc << std::endl;

    return SuperLearnerFit{ std::move(folds),
			    std::move(stacked.predictions),
			    std::move(combination),
			    std::move(ensemble),
			    std::move(auc) };
  }
}
