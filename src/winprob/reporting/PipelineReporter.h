#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "CalibrationAggregator.h"
#include "CVEvaluator.h"
#include "Dataset.h"
#include "FoldPlan.h"
#include "GridPredictor.h"
#include "PredictionMatrix.h"
#include "WeightSolver.h"

namespace winprob
{
namespace reporting
{

/**
 * @brief CSV writers for the artefacts of a win-probability run.
 *
 * Every writer emits a header line followed by one row per record. Optional
 * values that are absent are written as empty fields.
 */
class PipelineReporter
{
public:
    /**
     * @brief Out-of-fold prediction matrix Z, one row per observation
     *
     * Columns: Row, GroupId, Fold, Label, then one column per learner.
     */
    static void writePredictionMatrix(std::ostream& os,
                                      const superlearner::PredictionMatrix& Z,
                                      const superlearner::Dataset& dataset,
                                      const superlearner::FoldAssignment& folds);

    static void writeWeights(std::ostream& os, const superlearner::CombinationResult& combination);

    // One row per learner followed by the ensemble row.
    static void writeAucTable(std::ostream& os, const superlearner::AucReport& report);

    static void writeWinGrid(std::ostream& os, const std::vector<superlearner::PredictionGridCell>& cells);

    static void writeTieGrid(std::ostream& os, const std::vector<superlearner::TieProbabilityCell>& cells);

    // Non-empty bins, then an OutOfRange row when any finite prediction fell
    // outside [0,1]. Missing counts go to writeCalibrationSummary.
    static void writeCalibrationTable(std::ostream& os, const superlearner::CalibrationTable& table);

    static void writeCalibrationSummary(std::ostream& os,
                                        const std::string& label,
                                        const superlearner::CalibrationTable& table);

private:
    static void writeAucRow(std::ostream& os, const superlearner::AucEstimate& estimate);
};

} // namespace reporting
} // namespace winprob
