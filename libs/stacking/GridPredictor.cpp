#include "GridPredictor.h"
#include "StackingException.h"
#include "ParallelFor.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>

namespace superlearner
{
  IntegerRange IntegerRange::make(int low, int high)
  {
    if (low > high)
      throw StackingConfigurationException("IntegerRange: low bound " + std::to_string(low)
					   + " exceeds high bound " + std::to_string(high));
    return IntegerRange{ low, high };
  }

  IntegerRange IntegerRange::spanning(const std::vector<double>& values)
  {
    if (values.empty())
      throw StackingConfigurationException("IntegerRange::spanning - no values");

    const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    return make(static_cast<int>(std::lround(*lo)), static_cast<int>(std::lround(*hi)));
  }

  IntegerRange IntegerRange::mirrored() const
  {
    const int extent = std::max(std::abs(low), std::abs(high));
    return IntegerRange{ -extent, extent };
  }

  GridFeatureMapper defaultGridFeatureMapper()
  {
    return [](const GridPoint& point) {
      return std::vector<double>{ static_cast<double>(point.scoreDifferential),
				  static_cast<double>(point.timeLeft) };
    };
  }

  double deriveTieProbability(double winProbability, double mirroredWinProbability)
  {
    // Not clamped: values below zero expose miscalibration downstream.
    return 1.0 - (winProbability + mirroredWinProbability);
  }

  GridPredictor::GridPredictor(concurrency::IParallelExecutor& executor,
			       GridFeatureMapper mapper,
			       std::size_t chunkSize)
    : mExecutor(executor),
      mMapper(std::move(mapper)),
      mChunkSize(chunkSize)
  {
    if (!mMapper)
      throw StackingConfigurationException("GridPredictor: feature mapper must be set");
    if (mChunkSize == 0)
      throw StackingConfigurationException("GridPredictor: chunk size must be positive");
  }

  std::vector<GridPoint> GridPredictor::buildGrid(const IntegerRange& timeLeftRange,
						  const IntegerRange& differentialRange)
  {
    IntegerRange::make(timeLeftRange.low, timeLeftRange.high);
    IntegerRange::make(differentialRange.low, differentialRange.high);

    std::vector<GridPoint> grid;
    grid.reserve(timeLeftRange.size() * differentialRange.size());
    for (int t = timeLeftRange.low; t <= timeLeftRange.high; ++t)
      for (int d = differentialRange.low; d <= differentialRange.high; ++d)
	grid.push_back(GridPoint{ d, t });
    return grid;
  }

  std::vector<double> GridPredictor::predictPoints(const EnsembleModel& model,
						   const std::vector<GridPoint>& grid) const
  {
    std::vector<double> probabilities(grid.size(), 0.0);

    concurrency::parallel_for_chunks(grid.size(), mChunkSize, mExecutor,
				     [&](std::size_t, std::size_t begin, std::size_t end) {
				       const std::size_t width = mMapper(grid[begin]).size();
				       FeatureMatrix features(0, width);
				       for (std::size_t i = begin; i < end; ++i)
					 features.appendRow(mMapper(grid[i]));

				       const auto chunk = model.predict(features);
				       std::copy(chunk.begin(), chunk.end(), probabilities.begin() + begin);
				     });
    return probabilities;
  }

  std::vector<PredictionGridCell> GridPredictor::predict(const EnsembleModel& model,
							 const std::vector<GridPoint>& grid) const
  {
    const auto probabilities = predictPoints(model, grid);

    std::vector<PredictionGridCell> cells;
    cells.reserve(grid.size());
    for (std::size_t i = 0; i < grid.size(); ++i)
      cells.push_back(PredictionGridCell{ grid[i].scoreDifferential, grid[i].timeLeft, probabilities[i] });
    return cells;
  }

  std::vector<PredictionGridCell> GridPredictor::predictWinSurface(const EnsembleModel& model,
								   const IntegerRange& timeLeftRange,
								   const IntegerRange& differentialRange) const
  {
    if (differentialRange.high < 0)
      throw StackingConfigurationException("GridPredictor: differential range has no non-negative values");

    const IntegerRange nonNegative = IntegerRange::make(std::max(0, differentialRange.low), differentialRange.high);
    return predict(model, buildGrid(timeLeftRange, nonNegative));
  }

  std::vector<TieProbabilityCell> GridPredictor::predictTieSurface(const EnsembleModel& model,
								   const IntegerRange& timeLeftRange,
								   const IntegerRange& differentialRange) const
  {
    if (differentialRange.high < 0)
      throw StackingConfigurationException("GridPredictor: differential range has no non-negative values");

    const IntegerRange nonNegative = IntegerRange::make(std::max(0, differentialRange.low), differentialRange.high);
    const auto grid = buildGrid(timeLeftRange, nonNegative);

    std::vector<GridPoint> mirroredGrid;
    mirroredGrid.reserve(grid.size());
    for (const auto& point : grid)
      mirroredGrid.push_back(GridPoint{ -point.scoreDifferential, point.timeLeft });

    const auto win = predictPoints(model, grid);
    const auto mirrored = predictPoints(model, mirroredGrid);

    std::vector<TieProbabilityCell> cells;
    cells.reserve(grid.size());
    for (std::size_t i = 0; i < grid.size(); ++i)
      cells.push_back(TieProbabilityCell{ grid[i].scoreDifferential, grid[i].timeLeft,
					  win[i], mirrored[i], deriveTieProbability(win[i], mirrored[i]) });
    return cells;
  }
}
