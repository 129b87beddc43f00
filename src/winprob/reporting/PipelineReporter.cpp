#include "PipelineReporter.h"
#include <iomanip>
#include <optional>
#include <stdexcept>

namespace winprob
{
namespace reporting
{

namespace
{
    constexpr int kPrecision = 12;

    template <class T>
    void writeOptional(std::ostream& os, const std::optional<T>& value)
    {
        if (value)
            os << *value;
    }
}

void PipelineReporter::writePredictionMatrix(std::ostream& os,
                                             const superlearner::PredictionMatrix& Z,
                                             const superlearner::Dataset& dataset,
                                             const superlearner::FoldAssignment& folds)
{
    if (Z.getNumRows() != dataset.getNumObservations() || folds.getNumObservations() != dataset.getNumObservations())
        throw std::invalid_argument("PipelineReporter::writePredictionMatrix - row counts of Z, dataset and folds differ");

    os << std::setprecision(kPrecision);
    os << "Row,GroupId,Fold,Label";
    for (const auto& name : Z.getLearnerNames())
        os << "," << name;
    os << "\n";

    for (std::size_t row = 0; row < Z.getNumRows(); ++row)
    {
        const auto& observation = dataset.getObservation(row);
        os << row << "," << observation.groupId << "," << folds.getFold(row) << "," << observation.label;
        for (std::size_t k = 0; k < Z.getNumLearners(); ++k)
            os << "," << Z(row, k);
        os << "\n";
    }
}

void PipelineReporter::writeWeights(std::ostream& os, const superlearner::CombinationResult& combination)
{
    os << std::setprecision(kPrecision);
    os << "Learner,Weight,Method,CvRisk\n";

    const auto& names = combination.weights.getLearnerNames();
    const auto& weights = combination.weights.getWeights();
    const std::string method = superlearner::combinationMethodToString(combination.method);

    for (std::size_t k = 0; k < names.size(); ++k)
        os << names[k] << "," << weights[k] << "," << method << "," << combination.cvRisk << "\n";
}

void PipelineReporter::writeAucRow(std::ostream& os, const superlearner::AucEstimate& estimate)
{
    os << estimate.name << "," << estimate.auc << ",";
    writeOptional(os, estimate.standardError);
    os << ",";
    writeOptional(os, estimate.lowerBound);
    os << ",";
    writeOptional(os, estimate.upperBound);
    os << "\n";
}

void PipelineReporter::writeAucTable(std::ostream& os, const superlearner::AucReport& report)
{
    os << std::setprecision(kPrecision);
    os << "Name,CvAuc,StandardError,LowerBound,UpperBound\n";
    for (const auto& estimate : report.learners)
        writeAucRow(os, estimate);
    writeAucRow(os, report.ensemble);
}

void PipelineReporter::writeWinGrid(std::ostream& os, const std::vector<superlearner::PredictionGridCell>& cells)
{
    os << std::setprecision(kPrecision);
    os << "ScoreDifferential,TimeLeft,WinProbability\n";
    for (const auto& cell : cells)
        os << cell.scoreDifferential << "," << cell.timeLeft << "," << cell.predictedProbability << "\n";
}

void PipelineReporter::writeTieGrid(std::ostream& os, const std::vector<superlearner::TieProbabilityCell>& cells)
{
    os << std::setprecision(kPrecision);
    os << "ScoreDifferential,TimeLeft,WinProbability,MirroredWinProbability,TieProbability\n";
    for (const auto& cell : cells)
        os << cell.scoreDifferential << "," << cell.timeLeft << ","
           << cell.winProbability << "," << cell.mirroredWinProbability << ","
           << cell.tieProbability << "\n";
}

void PipelineReporter::writeCalibrationTable(std::ostream& os, const superlearner::CalibrationTable& table)
{
    os << std::setprecision(kPrecision);
    os << "Bin,LowerBound,UpperBound,MeanPredicted,MeanEmpirical,Count,EmpiricalCount\n";
    for (const auto& bin : table.bins)
    {
        os << bin.index << "," << bin.lowerBound << "," << bin.upperBound << ","
           << bin.meanPredicted << ",";
        writeOptional(os, bin.meanEmpirical);
        os << "," << bin.count << "," << bin.empiricalCount << "\n";
    }

    if (table.outOfRange)
    {
        const auto& outside = *table.outOfRange;
        os << "OutOfRange,,," << outside.meanPredicted << ",";
        writeOptional(os, outside.meanEmpirical);
        os << "," << outside.count << "," << outside.empiricalCount << "\n";
    }
}

void PipelineReporter::writeCalibrationSummary(std::ostream& os,
                                               const std::string& label,
                                               const superlearner::CalibrationTable& table)
{
    os << label << " calibration: " << table.bins.size() << " non-empty bins of width " << table.binWidth
       << ", " << table.getNumBinnedCells() << " cells binned";
    if (table.skippedOutOfRange > 0)
        os << ", " << table.skippedOutOfRange << " outside [0,1]";
    if (table.outOfRange)
    {
        os << " (" << table.outOfRange->belowZero << " below 0, " << table.outOfRange->aboveOne
           << " above 1, mean predicted " << table.outOfRange->meanPredicted;
        if (table.outOfRange->meanEmpirical)
            os << ", mean empirical " << *table.outOfRange->meanEmpirical;
        os << ")";
    }
    if (table.missingEmpirical > 0)
        os << ", " << table.missingEmpirical << " without an empirical rate";
    os << std::endl;
}

} // namespace reporting
} // namespace winprob
