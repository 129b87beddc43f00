#pragma once

#include <vector>
#include <cstddef>
#include <cstdint>

namespace superlearner
{
  /**
   * @class FoldAssignment
   * @brief Immutable map from observation index to fold index in [0, V).
   */
  class FoldAssignment
  {
  public:
    FoldAssignment(std::vector<unsigned int> foldOfRow, unsigned int numFolds);

    unsigned int getFold(std::size_t row) const
    {
      return mFoldOfRow.at(row);
    }

    unsigned int getNumFolds() const
    {
      return mNumFolds;
    }

    std::size_t getNumObservations() const
    {
      return mFoldOfRow.size();
    }

    const std::vector<unsigned int>& getFolds() const
    {
      return mFoldOfRow;
    }

    std::vector<std::size_t> getFoldSizes() const;

    // Row indices in ascending order.
    std::vector<std::size_t> getRowsInFold(unsigned int fold) const;
    std::vector<std::size_t> getRowsNotInFold(unsigned int fold) const;

    bool operator==(const FoldAssignment& rhs) const
    {
      return mNumFolds == rhs.mNumFolds && mFoldOfRow == rhs.mFoldOfRow;
    }

  private:
    std::vector<unsigned int> mFoldOfRow;
    unsigned int mNumFolds;
  };

  /**
   * @class FoldPlan
   * @brief Partitions N observations into V folds of near-equal size.
   *
   * Rule: rows are laid out in order (row order when shuffle is off, a
   * permutation drawn from std::mt19937_64(seed) when it is on) and cut into
   * V contiguous blocks. The first N % V blocks hold ceil(N/V) rows, the
   * remaining blocks floor(N/V). Contiguous blocks keep consecutive rows of
   * the same game together in one fold except at block boundaries.
   */
  class FoldPlan
  {
  public:
    FoldPlan(unsigned int numFolds, bool shuffle = false, std::uint64_t seed = 0);

    // @throws StackingConfigurationException if v < 2 or v > n
    FoldAssignment assign(std::size_t numObservations) const;

    // Unshuffled assignment.
    static FoldAssignment assign(std::size_t numObservations, unsigned int numFolds);

    unsigned int getNumFolds() const
    {
      return mNumFolds;
    }

    bool isShuffled() const
    {
      return mShuffle;
    }

  private:
    unsigned int mNumFolds;
    bool mShuffle;
    std::uint64_t mSeed;
  };
}
