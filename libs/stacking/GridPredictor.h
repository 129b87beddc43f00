#pragma once

#include <functional>
#include <vector>
#include <cstddef>
#include "EnsembleModel.h"
#include "FeatureMatrix.h"
#include "IParallelExecutor.h"

namespace superlearner
{
  /**
   * @brief Inclusive integer range [low, high].
   */
  struct IntegerRange
  {
    int low = 0;
    int high = 0;

    // @throws StackingConfigurationException if low > high
    static IntegerRange make(int low, int high);

    // Smallest range holding every value (rounded to the nearest integer).
    // @throws StackingConfigurationException for an empty input
    static IntegerRange spanning(const std::vector<double>& values);

    // Range symmetric about zero that covers this one and its negation.
    IntegerRange mirrored() const;

    std::size_t size() const
    {
      return static_cast<std::size_t>(static_cast<long long>(high) - low + 1);
    }

    bool contains(int value) const
    {
      return value >= low && value <= high;
    }
  };

  struct GridPoint
  {
    int scoreDifferential = 0;
    int timeLeft = 0;
  };

  struct PredictionGridCell
  {
    int scoreDifferential = 0;
    int timeLeft = 0;
    double predictedProbability = 0.0;
  };

  /**
   * @brief Tie probability derived from the two mirrored win predictions.
   *
   * tieProbability = 1 - (winProbability + mirroredWinProbability), reported
   * as computed. A negative value means the two sides' predictions add up to
   * more than one at that cell.
   */
  struct TieProbabilityCell
  {
    int scoreDifferential = 0;
    int timeLeft = 0;
    double winProbability = 0.0;           // p(d)
    double mirroredWinProbability = 0.0;   // p(-d), the other side's view
    double tieProbability = 0.0;
  };

  // Turns a grid point into the feature vector the learners were trained on.
  using GridFeatureMapper = std::function<std::vector<double>(const GridPoint&)>;

  // {scoreDifferential, timeLeft}
  GridFeatureMapper defaultGridFeatureMapper();

  double deriveTieProbability(double winProbability, double mirroredWinProbability);

  /**
   * @class GridPredictor
   * @brief Evaluates an ensemble over every (differential, time left) cell.
   *
   * Cells are predicted in fixed-size chunks on the executor; each chunk
   * writes only its own slice of the output.
   */
  class GridPredictor
  {
  public:
    GridPredictor(concurrency::IParallelExecutor& executor,
		  GridFeatureMapper mapper = defaultGridFeatureMapper(),
		  std::size_t chunkSize = 4096);

    // Time-major order: for each time left, every differential ascending.
    static std::vector<GridPoint> buildGrid(const IntegerRange& timeLeftRange,
					    const IntegerRange& differentialRange);

    std::vector<PredictionGridCell> predict(const EnsembleModel& model,
					    const std::vector<GridPoint>& grid) const;

    // Win probability for the non-negative part of differentialRange.
    std::vector<PredictionGridCell> predictWinSurface(const EnsembleModel& model,
						      const IntegerRange& timeLeftRange,
						      const IntegerRange& differentialRange) const;

    // One cell per non-negative d of differentialRange, from p(d) and p(-d).
    std::vector<TieProbabilityCell> predictTieSurface(const EnsembleModel& model,
						      const IntegerRange& timeLeftRange,
						      const IntegerRange& differentialRange) const;

  private:
    std::vector<double> predictPoints(const EnsembleModel& model,
				      const std::vector<GridPoint>& grid) const;

    concurrency::IParallelExecutor& mExecutor;
    GridFeatureMapper mMapper;
    std::size_t mChunkSize;
  };
}
