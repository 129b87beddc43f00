#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include "CalibrationAggregator.h"
#include "DatasetCsvReader.h"
#include "DefaultLearners.h"
#include "EmpiricalRateTable.h"
#include "GridPredictor.h"
#include "LearnerRegistry.h"
#include "ParallelExecutors.h"
#include "PipelineConfiguration.h"
#include "StackingException.h"
#include "SuperLearner.h"
#include "diagnostics/CsvStackingCollector.h"
#include "reporting/PipelineReporter.h"
#include "utils/OutputUtils.h"

namespace po = boost::program_options;

using namespace superlearner;
using winprob::reporting::PipelineReporter;

void printUsage(const po::options_description& desc) {
    std::cout << "Win probability super learner\n\n";
    std::cout << "Usage: winprob --config <file.csv> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nConfiguration file (one header row, one settings row):\n";
    std::cout << "  DataFile,EmpiricalFile,TieEmpiricalFile,Folds,Shuffle,Seed,Method,BinWidth,"
              << "TimeLeftMin,TimeLeftMax,Learners\n";
    std::cout << "  games.csv,,,10,false,42,nnloglik,0.01,1,90,mean;logistic;logistic_quadratic;knn\n";

    std::cout << "\nAvailable learners:\n";
    for (const auto& name : LearnerRegistry::getAvailableLearners()) {
        const auto& metadata = LearnerRegistry::getLearnerMetadata(name);
        std::cout << "  " << name << " (" << metadata.family << "): " << metadata.description << "\n";
    }
}

template <class Writer>
void writeReport(const std::string& fileName, std::ostream& log, Writer writer) {
    std::ofstream file(fileName);
    if (!file.is_open())
        throw std::runtime_error("Failed to open output file: " + fileName);
    writer(file);
    log << "  wrote " << fileName << std::endl;
}

std::vector<double> featureColumn(const Dataset& dataset, std::size_t featureIndex) {
    std::vector<double> values;
    values.reserve(dataset.getNumObservations());
    for (std::size_t row = 0; row < dataset.getNumObservations(); ++row)
        values.push_back(dataset.getObservation(row).features[featureIndex]);
    return values;
}

int main(int argc, char* argv[]) {
    learners::registerDefaultLearners();

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help message")
        ("config,c", po::value<std::string>(), "Run configuration CSV file")
        ("output,o", po::value<std::string>()->default_value("output"), "Output directory")
        ("threads,t", po::value<std::size_t>()->default_value(0),
         "Worker threads (0 = ncpu environment variable or hardware concurrency)")
        ("confidence", po::value<double>()->default_value(0.95), "Confidence level of the CV-AUC intervals")
        ("folds", po::value<unsigned int>(), "Override the number of cross-validation folds")
        ("method", po::value<std::string>(), "Override the combination method (nnls or nnloglik)")
        ("bin-width", po::value<double>(), "Override the calibration bin width")
        ("solver-clamp", po::value<double>()->default_value(WeightSolverSettings().probabilityClamp),
         "Probability clamp applied to Z by the nnloglik solver")
        ("solver-max-iterations", po::value<unsigned int>()->default_value(WeightSolverSettings().maxIterations),
         "Iteration cap of the weight solver")
        ("solver-tolerance", po::value<double>()->default_value(WeightSolverSettings().tolerance),
         "Convergence tolerance of the weight solver");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(desc);
        return 1;
    }

    if (vm.count("help") || !vm.count("config")) {
        printUsage(desc);
        return vm.count("help") ? 0 : 1;
    }

    const std::string outputDir = vm["output"].as<std::string>();
    const double confidenceLevel = vm["confidence"].as<double>();

    WeightSolverSettings solverSettings;
    solverSettings.probabilityClamp = vm["solver-clamp"].as<double>();
    solverSettings.maxIterations = vm["solver-max-iterations"].as<unsigned int>();
    solverSettings.tolerance = vm["solver-tolerance"].as<double>();

    try {
        std::shared_ptr<winprob::PipelineConfiguration> config =
            winprob::PipelineConfigurationFileReader(vm["config"].as<std::string>()).readConfigurationFile();

        std::optional<unsigned int> foldsOverride;
        std::optional<CombinationMethod> methodOverride;
        std::optional<double> binWidthOverride;
        if (vm.count("folds"))
            foldsOverride = vm["folds"].as<unsigned int>();
        if (vm.count("method"))
            methodOverride = combinationMethodFromString(vm["method"].as<std::string>());
        if (vm.count("bin-width"))
            binWidthOverride = vm["bin-width"].as<double>();

        const winprob::PipelineConfiguration runConfig =
            config->withOverrides(foldsOverride, methodOverride, binWidthOverride);

        const std::string timestamp = winprob::utils::getCurrentTimestamp();
        const std::string logFileName =
            winprob::utils::createOutputFileName(outputDir, "SuperLearner_Run", timestamp, "log");
        std::ofstream logFile(logFileName);
        if (!logFile.is_open())
            throw std::runtime_error("Failed to open run log: " + logFileName);
        winprob::utils::TeeStream out(std::cout, logFile);

        const std::size_t requestedThreads = vm["threads"].as<std::size_t>();
        concurrency::ThreadPoolExecutor<> pool(requestedThreads);

        out << "Win probability super learner run " << timestamp << std::endl;
        out << "  data file: " << runConfig.getDataFilePath() << std::endl;
        out << "  folds: " << runConfig.getNumFolds()
            << (runConfig.isShuffled() ? " (shuffled, seed " + std::to_string(runConfig.getSeed()) + ")" : "")
            << ", method: " << combinationMethodToString(runConfig.getMethod())
            << ", bin width: " << runConfig.getBinWidth()
            << ", threads: " << pool.getNumThreads() << std::endl;

        const Dataset dataset = winprob::DatasetCsvReader(runConfig.getDataFilePath()).read();
        out << "  observations: " << dataset.getNumObservations()
            << " (" << dataset.getNumPositives() << " wins)" << std::endl;

        const LearnerSet learners =
            LearnerRegistry::createLearners(runConfig.getLearnerNames(), LearnerParameters{ runConfig.getSeed() });

        auto collector = std::make_shared<winprob::diagnostics::CsvStackingCollector>(
            winprob::utils::createOutputFileName(outputDir, "StackingUnits", timestamp));

        const SuperLearner superLearner(runConfig.toSuperLearnerConfiguration(confidenceLevel, solverSettings), pool, collector);
        const SuperLearnerFit fit = superLearner.fit(dataset, learners, out);

        for (const auto& estimate : fit.auc.learners) {
            out << "  " << estimate.name << ": CV-AUC " << estimate.auc;
            if (estimate.hasConfidenceInterval())
                out << " [" << *estimate.lowerBound << ", " << *estimate.upperBound << "]";
            out << std::endl;
        }

        const std::size_t differentialIndex = dataset.getFeatureIndex(winprob::kScoreDifferentialColumn);
        const std::size_t timeLeftIndex = dataset.getFeatureIndex(winprob::kTimeLeftColumn);

        const IntegerRange differentialRange =
            IntegerRange::spanning(featureColumn(dataset, differentialIndex)).mirrored();
        const IntegerRange& timeLeftRange = runConfig.getTimeLeftRange();

        GridPredictor gridPredictor(pool);
        const auto winCells = gridPredictor.predictWinSurface(*fit.ensemble, timeLeftRange, differentialRange);
        const auto tieCells = gridPredictor.predictTieSurface(*fit.ensemble, timeLeftRange, differentialRange);
        out << "Predicted " << winCells.size() << " grid cells over differentials [0, "
            << differentialRange.high << "] and time left [" << timeLeftRange.low << ", "
            << timeLeftRange.high << "]" << std::endl;

        const EmpiricalRateTable winEmpirical = runConfig.hasEmpiricalFile()
            ? winprob::EmpiricalTableCsvReader(runConfig.getEmpiricalFilePath()).read()
            : EmpiricalRateTable::fromDataset(dataset, differentialIndex, timeLeftIndex);
        const EmpiricalRateTable tieEmpirical = runConfig.hasTieEmpiricalFile()
            ? winprob::EmpiricalTableCsvReader(runConfig.getTieEmpiricalFilePath()).read()
            : EmpiricalRateTable();

        CalibrationAggregator aggregator(pool);
        const CalibrationTable winCalibration = aggregator.bin(winCells, winEmpirical, runConfig.getBinWidth());
        const CalibrationTable tieCalibration =
            aggregator.bin(toPredictionCells(tieCells), tieEmpirical, runConfig.getBinWidth());
        PipelineReporter::writeCalibrationSummary(out, "Win", winCalibration);
        PipelineReporter::writeCalibrationSummary(out, "Tie", tieCalibration);

        auto outputFile = [&](const std::string& stem) {
            return winprob::utils::createOutputFileName(outputDir, stem, timestamp);
        };

        out << "Writing reports" << std::endl;
        writeReport(outputFile("OutOfFoldPredictions"), out, [&](std::ostream& os) {
            PipelineReporter::writePredictionMatrix(os, fit.predictions, dataset, fit.folds);
        });
        writeReport(outputFile("CombinationWeights"), out, [&](std::ostream& os) {
            PipelineReporter::writeWeights(os, fit.combination);
        });
        writeReport(outputFile("CvAuc"), out, [&](std::ostream& os) {
            PipelineReporter::writeAucTable(os, fit.auc);
        });
        writeReport(outputFile("WinProbabilityGrid"), out, [&](std::ostream& os) {
            PipelineReporter::writeWinGrid(os, winCells);
        });
        writeReport(outputFile("TieProbabilityGrid"), out, [&](std::ostream& os) {
            PipelineReporter::writeTieGrid(os, tieCells);
        });
        writeReport(outputFile("WinCalibration"), out, [&](std::ostream& os) {
            PipelineReporter::writeCalibrationTable(os, winCalibration);
        });
        writeReport(outputFile("TieCalibration"), out, [&](std::ostream& os) {
            PipelineReporter::writeCalibrationTable(os, tieCalibration);
        });

        out << "Run log: " << logFileName << std::endl;
    }
    catch (const winprob::PipelineConfigurationException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    catch (const winprob::DatasetReaderException& e) {
        std::cerr << "Data error: " << e.what() << std::endl;
        return 1;
    }
    catch (const LearnerTrainingException& e) {
        std::cerr << "Learner " << e.getLearnerName();
        if (e.isFullDataFit())
            std::cerr << " (full-data fit)";
        else
            std::cerr << " (fold " << *e.getFold() << ")";
        std::cerr << " failed: " << e.what() << std::endl;
        return 1;
    }
    catch (const NumericalInstabilityException& e) {
        std::cerr << "Numerical instability: " << e.what() << std::endl;
        return 1;
    }
    catch (const StackingException& e) {
        std::cerr << "Stacking error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
