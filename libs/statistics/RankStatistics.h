#pragma once

#include <vector>
#include <cstddef>

namespace superlearner
{
  /**
   * @brief Placement values of a scored binary sample.
   *
   * For a positive row the placement is the fraction of negatives scored
   * below it; for a negative row, the fraction of positives scored above it.
   * Ties count one half. The mean placement over either class equals the
   * Mann-Whitney AUC, and placement minus AUC is the per-row influence value
   * used for DeLong / influence-curve variance estimates.
   */
  struct AucPlacements
  {
    double auc = 0.0;
    std::size_t numPositives = 0;
    std::size_t numNegatives = 0;
    std::vector<double> placements;   // one entry per input row
  };

  class RankStatistics
  {
  public:
    /**
     * @brief Mann-Whitney AUC with mid-rank tie handling, plus the per-row
     * placements.
     *
     * @param scores predicted scores, larger means "more positive"
     * @param labels 0/1 labels, same length as scores
     * @throws std::invalid_argument on length mismatch or a label outside {0,1}
     * @throws std::domain_error if either class is absent or a score is NaN
     */
    static AucPlacements computePlacements(const std::vector<double>& scores,
					   const std::vector<int>& labels);
  };
}
