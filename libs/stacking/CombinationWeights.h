#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace superlearner
{
  enum class CombinationMethod
  {
    NonNegativeLeastSquares,
    NonNegativeLogLikelihood
  };

  // "nnls" | "nnloglik"; @throws StackingConfigurationException otherwise
  CombinationMethod combinationMethodFromString(const std::string& name);
  std::string combinationMethodToString(CombinationMethod method);

  /**
   * @class CombinationWeights
   * @brief Non-negative mixing weights of the meta-model, one per learner.
   */
  class CombinationWeights
  {
  public:
    /**
     * @throws std::invalid_argument on a size mismatch or a negative or
     *         non-finite weight
     */
    CombinationWeights(std::vector<std::string> learnerNames, std::vector<double> weights);

    static CombinationWeights uniform(const std::vector<std::string>& learnerNames);

    const std::vector<std::string>& getLearnerNames() const
    {
      return mLearnerNames;
    }

    const std::vector<double>& getWeights() const
    {
      return mWeights;
    }

    std::size_t size() const
    {
      return mWeights.size();
    }

    // @throws std::out_of_range for an unknown learner name
    double getWeight(const std::string& learnerName) const;

    double getSum() const;

    // Non-negative and summing to one within tolerance.
    bool isOnSimplex(double tolerance = 1e-9) const;

    // Learner name with the largest weight (first one on ties).
    const std::string& getDominantLearner() const;

  private:
    std::vector<std::string> mLearnerNames;
    std::vector<double> mWeights;
  };
}
