#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "CombinationWeights.h"
#include "GridPredictor.h"
#include "SuperLearner.h"

namespace winprob
{
  class PipelineConfigurationException : public std::runtime_error
  {
  public:
    explicit PipelineConfigurationException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    ~PipelineConfigurationException() noexcept override = default;
  };

  /**
   * @class PipelineConfiguration
   * @brief Everything one win-probability run needs: inputs, fold settings,
   * combination method, grid extent and the learners to stack.
   *
   * An empty empirical file path means the win-rate table is computed from
   * the data file itself. Tie probabilities are only compared against
   * observed tie rates when a tie empirical file is given.
   */
  class PipelineConfiguration
  {
  public:
    PipelineConfiguration(const std::string& dataFilePath,
			  const std::string& empiricalFilePath,
			  const std::string& tieEmpiricalFilePath,
			  unsigned int numFolds,
			  bool shuffle,
			  std::uint64_t seed,
			  superlearner::CombinationMethod method,
			  double binWidth,
			  const superlearner::IntegerRange& timeLeftRange,
			  const std::vector<std::string>& learnerNames);

    const std::string& getDataFilePath() const
    {
      return mDataFilePath;
    }

    const std::string& getEmpiricalFilePath() const
    {
      return mEmpiricalFilePath;
    }

    bool hasEmpiricalFile() const
    {
      return !mEmpiricalFilePath.empty();
    }

    const std::string& getTieEmpiricalFilePath() const
    {
      return mTieEmpiricalFilePath;
    }

    bool hasTieEmpiricalFile() const
    {
      return !mTieEmpiricalFilePath.empty();
    }

    unsigned int getNumFolds() const
    {
      return mNumFolds;
    }

    bool isShuffled() const
    {
      return mShuffle;
    }

    std::uint64_t getSeed() const
    {
      return mSeed;
    }

    superlearner::CombinationMethod getMethod() const
    {
      return mMethod;
    }

    double getBinWidth() const
    {
      return mBinWidth;
    }

    const superlearner::IntegerRange& getTimeLeftRange() const
    {
      return mTimeLeftRange;
    }

    const std::vector<std::string>& getLearnerNames() const
    {
      return mLearnerNames;
    }

    // Copy with command-line overrides applied and validated.
    PipelineConfiguration withOverrides(std::optional<unsigned int> numFolds,
					std::optional<superlearner::CombinationMethod> method,
					std::optional<double> binWidth) const;

    superlearner::SuperLearnerConfiguration
    toSuperLearnerConfiguration(double confidenceLevel,
				const superlearner::WeightSolverSettings& solverSettings =
				superlearner::WeightSolverSettings()) const;

  private:
    void validate() const;

    std::string mDataFilePath;
    std::string mEmpiricalFilePath;
    std::string mTieEmpiricalFilePath;
    unsigned int mNumFolds;
    bool mShuffle;
    std::uint64_t mSeed;
    superlearner::CombinationMethod mMethod;
    double mBinWidth;
    superlearner::IntegerRange mTimeLeftRange;
    std::vector<std::string> mLearnerNames;
  };

  /**
   * @class PipelineConfigurationFileReader
   * @brief Reads a one-row run configuration CSV with a header line.
   *
   * Required columns: DataFile, Learners (names separated by ';').
   * Optional columns, defaulted when absent or empty: EmpiricalFile,
   * TieEmpiricalFile, Folds (10),
   * Shuffle (false), Seed (42), Method (nnloglik), BinWidth (0.01),
   * TimeLeftMin (1), TimeLeftMax (90). Relative file paths are resolved
   * against the configuration file's directory.
   */
  class PipelineConfigurationFileReader
  {
  public:
    explicit PipelineConfigurationFileReader(const std::string& configurationFileName);

    std::shared_ptr<PipelineConfiguration> readConfigurationFile() const;

  private:
    std::string mConfigurationFileName;
  };
}
