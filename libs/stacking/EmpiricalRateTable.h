#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <utility>
#include "Dataset.h"

namespace superlearner
{
  struct EmpiricalRate
  {
    double rate = 0.0;
    std::size_t count = 0;
  };

  /**
   * @class EmpiricalRateTable
   * @brief Observed rate of positive outcomes per (score differential, time left) cell.
   */
  class EmpiricalRateTable
  {
  public:
    using Key = std::pair<int, int>;

    EmpiricalRateTable() = default;

    // Positive rate of the labels in each cell. Feature values are rounded
    // to the nearest integer to form the key.
    // @throws StackingConfigurationException if either column index is out of range
    static EmpiricalRateTable fromDataset(const Dataset& dataset,
					  std::size_t differentialIndex,
					  std::size_t timeLeftIndex);

    // @throws StackingConfigurationException for a rate outside [0,1],
    //         a zero count or a duplicate cell
    void addCell(int scoreDifferential, int timeLeft, double rate, std::size_t count = 1);

    std::optional<EmpiricalRate> lookup(int scoreDifferential, int timeLeft) const;

    std::optional<double> lookupRate(int scoreDifferential, int timeLeft) const
    {
      auto cell = lookup(scoreDifferential, timeLeft);
      if (!cell)
	return std::nullopt;
      return cell->rate;
    }

    std::size_t size() const
    {
      return mCells.size();
    }

    bool empty() const
    {
      return mCells.empty();
    }

    const std::map<Key, EmpiricalRate>& getCells() const
    {
      return mCells;
    }

  private:
    std::map<Key, EmpiricalRate> mCells;
  };
}
