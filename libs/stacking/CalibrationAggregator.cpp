#include "CalibrationAggregator.h"
#include "StackingException.h"
#include "ParallelFor.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <string>

namespace superlearner
{
  namespace
  {
    struct BinAccumulator
    {
      double sumPredicted = 0.0;
      double sumEmpirical = 0.0;
      std::size_t count = 0;
      std::size_t empiricalCount = 0;

      void merge(const BinAccumulator& other)
      {
	sumPredicted += other.sumPredicted;
	sumEmpirical += other.sumEmpirical;
	count += other.count;
	empiricalCount += other.empiricalCount;
      }
    };

    struct ChunkPartial
    {
      std::map<std::size_t, BinAccumulator> bins;
      BinAccumulator outOfRange;
      std::size_t belowZero = 0;
      std::size_t aboveOne = 0;
      std::size_t skippedOutOfRange = 0;
      std::size_t missingEmpirical = 0;
    };

    void validateBinWidth(double binWidth)
    {
      if (!(binWidth > 0.0 && binWidth <= 1.0))
	throw StackingConfigurationException("CalibrationAggregator: bin width must satisfy 0 < w <= 1, got "
					     + std::to_string(binWidth));
      if (1.0 / binWidth > CalibrationAggregator::kMaxNumberOfBins)
	throw StackingConfigurationException("CalibrationAggregator: bin width " + std::to_string(binWidth)
					     + " needs more than 1e15 bins");
    }
  }

  std::size_t CalibrationTable::getNumBinnedCells() const
  {
    std::size_t total = 0;
    for (const auto& b : bins)
      total += b.count;
    return total;
  }

  std::vector<PredictionGridCell> toPredictionCells(const std::vector<TieProbabilityCell>& tieCells)
  {
    std::vector<PredictionGridCell> cells;
    cells.reserve(tieCells.size());
    for (const auto& tie : tieCells)
      cells.push_back(PredictionGridCell{ tie.scoreDifferential, tie.timeLeft, tie.tieProbability });
    return cells;
  }

  CalibrationAggregator::CalibrationAggregator(concurrency::IParallelExecutor& executor,
					       std::size_t chunkSize)
    : mExecutor(executor),
      mChunkSize(chunkSize)
  {
    if (mChunkSize == 0)
      throw StackingConfigurationException("CalibrationAggregator: chunk size must be positive");
  }

  std::size_t CalibrationAggregator::numberOfBins(double binWidth)
  {
    validateBinWidth(binWidth);
    // 1/0.1 is not exactly 10 in binary; do not let rounding add a bin.
    const double bins = std::ceil(1.0 / binWidth - 1e-9);
    return std::max<std::size_t>(1, static_cast<std::size_t>(bins));
  }

  std::size_t CalibrationAggregator::binIndex(double probability, double binWidth)
  {
    const std::size_t lastBin = numberOfBins(binWidth) - 1;
    if (probability >= 1.0)
      return lastBin;

    std::size_t k = std::min(lastBin, static_cast<std::size_t>(std::floor(probability / binWidth)));

    // Keep the index consistent with the reported bounds k*w and (k+1)*w.
    if (k > 0 && probability < static_cast<double>(k) * binWidth)
      --k;
    else if (k < lastBin && probability >= static_cast<double>(k + 1) * binWidth)
      ++k;
    return k;
  }

  CalibrationTable CalibrationAggregator::bin(const std::vector<PredictionGridCell>& cells,
					      const EmpiricalRateTable& empirical,
					      double binWidth) const
  {
    const std::size_t numBins = numberOfBins(binWidth);

    const std::size_t numChunks = cells.empty() ? 0 : concurrency::num_chunks(cells.size(), mChunkSize);
    std::vector<ChunkPartial> partials(numChunks);

    concurrency::parallel_for_chunks(cells.size(), mChunkSize, mExecutor,
				     [&](std::size_t chunk, std::size_t begin, std::size_t end) {
				       ChunkPartial& partial = partials[chunk];
				       for (std::size_t i = begin; i < end; ++i)
					 {
					   const PredictionGridCell& cell = cells[i];
					   const double p = cell.predictedProbability;
					   const bool inRange = p >= 0.0 && p <= 1.0;
					   if (!inRange)
					     {
					       ++partial.skippedOutOfRange;
					       if (!std::isfinite(p))
						 continue;
					       if (p < 0.0)
						 ++partial.belowZero;
					       else
						 ++partial.aboveOne;
					     }

					   BinAccumulator& acc = inRange ? partial.bins[binIndex(p, binWidth)]
									 : partial.outOfRange;
					   acc.sumPredicted += p;
					   acc.count += 1;

					   auto rate = empirical.lookupRate(cell.scoreDifferential, cell.timeLeft);
					   if (rate)
					     {
					       acc.sumEmpirical += *rate;
					       acc.empiricalCount += 1;
					     }
					   else if (inRange)
					     ++partial.missingEmpirical;
					 }
				     });

    std::map<std::size_t, BinAccumulator> merged;
    BinAccumulator outOfRange;
    std::size_t belowZero = 0;
    std::size_t aboveOne = 0;
    CalibrationTable table;
    table.binWidth = binWidth;
    for (const auto& partial : partials)
      {
	for (const auto& [index, acc] : partial.bins)
	  merged[index].merge(acc);
	outOfRange.merge(partial.outOfRange);
	belowZero += partial.belowZero;
	aboveOne += partial.aboveOne;
	table.skippedOutOfRange += partial.skippedOutOfRange;
	table.missingEmpirical += partial.missingEmpirical;
      }

    if (outOfRange.count > 0)
      {
	OutOfRangeSummary summary;
	summary.count = outOfRange.count;
	summary.meanPredicted = outOfRange.sumPredicted / static_cast<double>(outOfRange.count);
	summary.empiricalCount = outOfRange.empiricalCount;
	if (outOfRange.empiricalCount > 0)
	  summary.meanEmpirical = outOfRange.sumEmpirical / static_cast<double>(outOfRange.empiricalCount);
	summary.belowZero = belowZero;
	summary.aboveOne = aboveOne;
	table.outOfRange = summary;
      }

    table.bins.reserve(merged.size());
    for (const auto& [index, acc] : merged)
      {
	CalibrationBin b;
	b.index = index;
	b.lowerBound = static_cast<double>(index) * binWidth;
	b.upperBound = (index + 1 == numBins) ? 1.0 : static_cast<double>(index + 1) * binWidth;
	b.count = acc.count;
	b.meanPredicted = acc.sumPredicted / static_cast<double>(acc.count);
	b.empiricalCount = acc.empiricalCount;
	if (acc.empiricalCount > 0)
	  b.meanEmpirical = acc.sumEmpirical / static_cast<double>(acc.empiricalCount);
	table.bins.push_back(b);
      }

    return table;
  }
}
