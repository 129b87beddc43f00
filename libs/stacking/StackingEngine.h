#pragma once

#include <memory>
#include <ostream>
#include <vector>
#include "Dataset.h"
#include "FoldPlan.h"
#include "Learner.h"
#include "PredictionMatrix.h"
#include "IStackingObserver.h"
#include "IParallelExecutor.h"

namespace superlearner
{
  /**
   * @brief Output of the stacking stage: the out-of-fold matrix Z and one
   * model per learner trained on every observation.
   */
  struct StackingResult
  {
    PredictionMatrix predictions;
    std::vector<std::shared_ptr<const ILearnerModel>> fullModels;
  };

  /**
   * @class StackingEngine
   * @brief Builds the out-of-fold prediction matrix for a set of learners.
   *
   * Every (learner, fold) pair is an independent unit submitted to the
   * executor: train on the rows outside the fold, predict the rows inside it,
   * write those rows of the learner's column. Units share only read-only
   * inputs and write disjoint cells, so no locking is needed. Z is complete
   * only after a barrier over all units; the full-data fits run afterwards
   * and never contribute to Z.
   *
   * Any unit failure aborts the run with a LearnerTrainingException once the
   * remaining units have drained. Z is never returned partially filled.
   */
  class StackingEngine
  {
  public:
    explicit StackingEngine(concurrency::IParallelExecutor& executor,
			    std::shared_ptr<IStackingObserver> observer = std::make_shared<NullStackingObserver>());

    /**
     * @throws StackingConfigurationException for an empty or inconsistent
     *         learner set, or a fold assignment that does not match the data
     * @throws LearnerTrainingException naming the learner and fold that failed
     */
    StackingResult fit(const Dataset& dataset,
		       const LearnerSet& learners,
		       const FoldAssignment& folds,
		       std::ostream& outputStream) const;

  private:
    void validateInputs(const Dataset& dataset,
			const LearnerSet& learners,
			const FoldAssignment& folds) const;

    concurrency::IParallelExecutor& mExecutor;
    std::shared_ptr<IStackingObserver> mObserver;
  };
}
