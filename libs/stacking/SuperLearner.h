#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include "CVEvaluator.h"
#include "CombinationWeights.h"
#include "Dataset.h"
#include "EnsembleModel.h"
#include "FoldPlan.h"
#include "IParallelExecutor.h"
#include "IStackingObserver.h"
#include "Learner.h"
#include "PredictionMatrix.h"
#include "WeightSolver.h"

namespace superlearner
{
  /**
   * @class SuperLearnerConfiguration
   * @brief Settings for one stacking run.
   */
  class SuperLearnerConfiguration
  {
  public:
    SuperLearnerConfiguration(unsigned int numFolds = 10,
			      bool shuffle = false,
			      std::uint64_t seed = 42,
			      CombinationMethod method = CombinationMethod::NonNegativeLogLikelihood,
			      double confidenceLevel = 0.95,
			      const WeightSolverSettings& solverSettings = WeightSolverSettings())
      : mNumFolds(numFolds),
	mShuffle(shuffle),
	mSeed(seed),
	mMethod(method),
	mConfidenceLevel(confidenceLevel),
	mSolverSettings(solverSettings)
    {}

    unsigned int getNumFolds() const
    {
      return mNumFolds;
    }

    bool isShuffled() const
    {
      return mShuffle;
    }

    std::uint64_t getSeed() const
    {
      return mSeed;
    }

    CombinationMethod getMethod() const
    {
      return mMethod;
    }

    double getConfidenceLevel() const
    {
      return mConfidenceLevel;
    }

    const WeightSolverSettings& getSolverSettings() const
    {
      return mSolverSettings;
    }

    // @throws StackingConfigurationException describing the first invalid setting
    void validate(std::size_t numObservations) const;

  private:
    unsigned int mNumFolds;
    bool mShuffle;
    std::uint64_t mSeed;
    CombinationMethod mMethod;
    double mConfidenceLevel;
    WeightSolverSettings mSolverSettings;
  };

  struct SuperLearnerFit
  {
    FoldAssignment folds;
    PredictionMatrix predictions;   // Z
    CombinationResult combination;
    std::shared_ptr<const EnsembleModel> ensemble;
    AucReport auc;
  };

  /**
   * @class SuperLearner
   * @brief Runs fold assignment, stacking, weight fitting and CV-AUC in order.
   *
   * The configuration and learner set are checked before any learner is
   * trained. Every stage consumes the previous stage's finished output.
   */
  class SuperLearner
  {
  public:
    SuperLearner(const SuperLearnerConfiguration& configuration,
		 concurrency::IParallelExecutor& executor,
		 std::shared_ptr<IStackingObserver> observer = std::make_shared<NullStackingObserver>());

    SuperLearnerFit fit(const Dataset& dataset,
			const LearnerSet& learners,
			std::ostream& outputStream) const;

    const SuperLearnerConfiguration& getConfiguration() const
    {
      return mConfiguration;
    }

  private:
    SuperLearnerConfiguration mConfiguration;
    concurrency::IParallelExecutor& mExecutor;
    std::shared_ptr<IStackingObserver> mObserver;
  };
}
