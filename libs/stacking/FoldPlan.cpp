#include "FoldPlan.h"
#include "StackingException.h"
#include <algorithm>
#include <numeric>
#include <random>
#include <string>

namespace superlearner
{
  FoldAssignment::FoldAssignment(std::vector<unsigned int> foldOfRow, unsigned int numFolds)
    : mFoldOfRow(std::move(foldOfRow)),
      mNumFolds(numFolds)
  {
    if (mNumFolds == 0)
      throw StackingConfigurationException("FoldAssignment: number of folds must be positive");

    for (std::size_t i = 0; i < mFoldOfRow.size(); ++i)
      if (mFoldOfRow[i] >= mNumFolds)
	throw StackingConfigurationException("FoldAssignment: row " + std::to_string(i) + " assigned to fold "
					     + std::to_string(mFoldOfRow[i]) + " of "
					     + std::to_string(mNumFolds));
  }

  std::vector<std::size_t> FoldAssignment::getFoldSizes() const
  {
    std::vector<std::size_t> sizes(mNumFolds, 0);
    for (unsigned int fold : mFoldOfRow)
      ++sizes[fold];
    return sizes;
  }

  std::vector<std::size_t> FoldAssignment::getRowsInFold(unsigned int fold) const
  {
    std::vector<std::size_t> rows;
    for (std::size_t i = 0; i < mFoldOfRow.size(); ++i)
      if (mFoldOfRow[i] == fold)
	rows.push_back(i);
    return rows;
  }

  std::vector<std::size_t> FoldAssignment::getRowsNotInFold(unsigned int fold) const
  {
    std::vector<std::size_t> rows;
    for (std::size_t i = 0; i < mFoldOfRow.size(); ++i)
      if (mFoldOfRow[i] != fold)
	rows.push_back(i);
    return rows;
  }

  FoldPlan::FoldPlan(unsigned int numFolds, bool shuffle, std::uint64_t seed)
    : mNumFolds(numFolds),
      mShuffle(shuffle),
      mSeed(seed)
  {
    if (numFolds < 2)
      throw StackingConfigurationException("FoldPlan: number of folds must be at least 2, got "
					   + std::to_string(numFolds));
  }

  FoldAssignment FoldPlan::assign(std::size_t numObservations) const
  {
    if (mNumFolds > numObservations)
      throw StackingConfigurationException("FoldPlan: " + std::to_string(mNumFolds) + " folds requested for "
					   + std::to_string(numObservations) + " observations");

    std::vector<std::size_t> order(numObservations);
    std::iota(order.begin(), order.end(), std::size_t(0));

    if (mShuffle)
      {
	std::mt19937_64 rng(mSeed);
	std::shuffle(order.begin(), order.end(), rng);
      }

    const std::size_t baseSize = numObservations / mNumFolds;
    const std::size_t remainder = numObservations % mNumFolds;

    std::vector<unsigned int> foldOfRow(numObservations, 0);
    std::size_t position = 0;
    for (unsigned int fold = 0; fold < mNumFolds; ++fold)
      {
	const std::size_t blockSize = baseSize + (fold < remainder ? 1 : 0);
	for (std::size_t k = 0; k < blockSize; ++k)
	  foldOfRow[order[position++]] = fold;
      }

    return FoldAssignment(std::move(foldOfRow), mNumFolds);
  }

  FoldAssignment FoldPlan::assign(std::size_t numObservations, unsigned int numFolds)
  {
    return FoldPlan(numFolds).assign(numObservations);
  }
}
