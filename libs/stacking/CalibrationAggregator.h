#pragma once

#include <cstddef>
#include <optional>
#include <vector>
#include "EmpiricalRateTable.h"
#include "GridPredictor.h"
#include "IParallelExecutor.h"

namespace superlearner
{
  /**
   * @brief Summary of the grid cells whose predicted probability falls in
   * [lowerBound, upperBound). The last bin is closed at 1.
   *
   * count includes cells with no empirical counterpart; meanEmpirical
   * averages only the empiricalCount cells that have one and is empty when
   * there are none.
   */
  struct CalibrationBin
  {
    std::size_t index = 0;
    double lowerBound = 0.0;
    double upperBound = 0.0;
    double meanPredicted = 0.0;
    std::optional<double> meanEmpirical;
    std::size_t count = 0;
    std::size_t empiricalCount = 0;
  };

  /**
   * @brief Cells whose prediction lies outside [0,1], such as negative tie
   * probabilities. Kept apart from the bins so the miscalibration shows.
   */
  struct OutOfRangeSummary
  {
    double meanPredicted = 0.0;
    std::optional<double> meanEmpirical;
    std::size_t count = 0;
    std::size_t empiricalCount = 0;
    std::size_t belowZero = 0;
    std::size_t aboveOne = 0;
  };

  struct CalibrationTable
  {
    double binWidth = 0.0;
    std::vector<CalibrationBin> bins;    // non-empty bins, ascending
    std::size_t skippedOutOfRange = 0;   // predictions outside [0,1]
    std::size_t missingEmpirical = 0;    // binned cells with no empirical rate
    // Finite predictions outside [0,1]; non-finite ones are only counted in skippedOutOfRange.
    std::optional<OutOfRangeSummary> outOfRange;

    std::size_t getNumBinnedCells() const;
  };

  // Turns tie cells into binnable cells carrying the tie probability.
  std::vector<PredictionGridCell> toPredictionCells(const std::vector<TieProbabilityCell>& tieCells);

  /**
   * @class CalibrationAggregator
   * @brief Bins grid predictions and joins them against empirical rates.
   *
   * Cells are aggregated in fixed-size chunks on the executor into partial
   * per-bin sums which are merged in chunk order, so the result does not
   * depend on the number of threads.
   */
  class CalibrationAggregator
  {
  public:
    explicit CalibrationAggregator(concurrency::IParallelExecutor& executor,
				   std::size_t chunkSize = 8192);

    // Smallest bin width is 1 / kMaxNumberOfBins.
    static constexpr double kMaxNumberOfBins = 1e15;

    // @throws StackingConfigurationException unless 1 / kMaxNumberOfBins <= binWidth <= 1
    CalibrationTable bin(const std::vector<PredictionGridCell>& cells,
			 const EmpiricalRateTable& empirical,
			 double binWidth) const;

    // @throws StackingConfigurationException for a bin width bin() rejects
    static std::size_t numberOfBins(double binWidth);

    // Bin holding probability p in [0,1]; 1.0 belongs to the last bin.
    static std::size_t binIndex(double probability, double binWidth);

  private:
    concurrency::IParallelExecutor& mExecutor;
    std::size_t mChunkSize;
  };
}
