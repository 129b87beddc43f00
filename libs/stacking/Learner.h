#pragma once

#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include "FeatureMatrix.h"

namespace superlearner
{
  /**
   * @brief A fitted model. The stacking engine treats it as opaque and only
   * ever asks it for probabilities.
   *
   * predict() is called concurrently from several threads on the same
   * instance, so implementations must not mutate state in it.
   */
  class ILearnerModel
  {
  public:
    virtual ~ILearnerModel() = default;

    // One probability in [0,1] per row of features.
    virtual std::vector<double> predict(const FeatureMatrix& features) const = 0;
  };

  /**
   * @brief A base learning algorithm behind a uniform train capability.
   *
   * train() must be safe to call concurrently on the same instance; each
   * call returns an independent model. A learner that cannot fit the data
   * it was given throws, and the engine reports the learner and fold.
   */
  class ILearner
  {
  public:
    virtual ~ILearner() = default;

    virtual std::string getName() const = 0;

    virtual std::shared_ptr<const ILearnerModel> train(const FeatureMatrix& features,
						       const std::vector<int>& labels) const = 0;
  };

  // Construction parameters handed to registered learner factories. The seed
  // is the only source of randomness a learner may use.
  struct LearnerParameters
  {
    std::uint64_t seed = 0;
  };

  using LearnerSet = std::vector<std::shared_ptr<const ILearner>>;
}
