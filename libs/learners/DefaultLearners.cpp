#include "DefaultLearners.h"
#include "LearnerRegistry.h"
#include "MeanLearner.h"
#include "LogisticRegressionLearner.h"
#include "KNearestNeighborLearner.h"

namespace superlearner
{
  namespace learners
  {
    void registerDefaultLearners()
    {
      LearnerRegistry::registerLearner(
	LearnerMetadata{ "mean", "Training positive rate", "baseline" },
	[](const LearnerParameters&) { return std::make_shared<MeanLearner>("mean"); });

      LearnerRegistry::registerLearner(
	LearnerMetadata{ "logistic", "Ridge logistic regression on the raw features", "parametric" },
	[](const LearnerParameters&) {
	  return std::make_shared<LogisticRegressionLearner>("logistic", false);
	});

      LearnerRegistry::registerLearner(
	LearnerMetadata{ "logistic_quadratic", "Ridge logistic regression with squares and interactions",
			 "parametric" },
	[](const LearnerParameters&) {
	  return std::make_shared<LogisticRegressionLearner>("logistic_quadratic", true);
	});

      LearnerRegistry::registerLearner(
	LearnerMetadata{ "knn", "25-nearest-neighbour positive rate", "nonparametric" },
	[](const LearnerParameters&) { return std::make_shared<KNearestNeighborLearner>("knn", 25); });
    }
  }
}
