#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"
#include "CalibrationAggregator.h"
#include "PipelineConfiguration.h"
#include "StackingException.h"

using namespace boost::filesystem;

namespace winprob
{
  namespace
  {
    template <class T>
    T parseField(const std::string& columnName, const std::string& value, const T& defaultValue)
    {
      const std::string trimmed = boost::algorithm::trim_copy(value);
      if (trimmed.empty())
	return defaultValue;

      try
	{
	  return boost::lexical_cast<T>(trimmed);
	}
      catch (const boost::bad_lexical_cast&)
	{
	  throw PipelineConfigurationException("PipelineConfigurationFileReader: column " + columnName
					       + " has invalid value '" + value + "'");
	}
    }

    bool parseBoolean(const std::string& columnName, const std::string& value, bool defaultValue)
    {
      const std::string trimmed = boost::algorithm::trim_copy(value);
      if (trimmed.empty())
	return defaultValue;

      if (boost::iequals(trimmed, "true") || boost::iequals(trimmed, "yes") || trimmed == "1")
	return true;
      if (boost::iequals(trimmed, "false") || boost::iequals(trimmed, "no") || trimmed == "0")
	return false;

      throw PipelineConfigurationException("PipelineConfigurationFileReader: column " + columnName
					   + " must be true or false, got '" + value + "'");
    }

    std::string resolvePath(const path& configurationDirectory, const std::string& fileName)
    {
      path filePath(boost::algorithm::trim_copy(fileName));
      if (filePath.is_relative())
	filePath = configurationDirectory / filePath;
      return filePath.string();
    }

    // Empty when the column is absent or blank.
    std::string resolveOptionalPath(const path& configurationDirectory,
				    const std::string& fileName,
				    const std::string& description)
    {
      if (boost::algorithm::trim_copy(fileName).empty())
	return std::string();

      const std::string filePath = resolvePath(configurationDirectory, fileName);
      if (!exists(path(filePath)))
	throw PipelineConfigurationException(description + " path " + filePath + " does not exist");
      return filePath;
    }

    std::vector<std::string> parseLearnerNames(const std::string& value)
    {
      std::vector<std::string> tokens;
      boost::split(tokens, value, boost::is_any_of(";"));

      std::vector<std::string> names;
      for (auto& token : tokens)
	{
	  boost::algorithm::trim(token);
	  if (!token.empty())
	    names.push_back(token);
	}
      return names;
    }
  }

  PipelineConfiguration::PipelineConfiguration(const std::string& dataFilePath,
					       const std::string& empiricalFilePath,
					       const std::string& tieEmpiricalFilePath,
					       unsigned int numFolds,
					       bool shuffle,
					       std::uint64_t seed,
					       superlearner::CombinationMethod method,
					       double binWidth,
					       const superlearner::IntegerRange& timeLeftRange,
					       const std::vector<std::string>& learnerNames)
    : mDataFilePath(dataFilePath),
      mEmpiricalFilePath(empiricalFilePath),
      mTieEmpiricalFilePath(tieEmpiricalFilePath),
      mNumFolds(numFolds),
      mShuffle(shuffle),
      mSeed(seed),
      mMethod(method),
      mBinWidth(binWidth),
      mTimeLeftRange(timeLeftRange),
      mLearnerNames(learnerNames)
  {
    validate();
  }

  void PipelineConfiguration::validate() const
  {
    if (mDataFilePath.empty())
      throw PipelineConfigurationException("PipelineConfiguration: data file path is empty");

    if (mNumFolds < 2)
      throw PipelineConfigurationException("PipelineConfiguration: at least two folds are required, got "
					   + std::to_string(mNumFolds));

    if (!(mBinWidth > 0.0 && mBinWidth <= 1.0))
      throw PipelineConfigurationException("PipelineConfiguration: bin width must lie in (0, 1], got "
					   + std::to_string(mBinWidth));
    if (1.0 / mBinWidth > superlearner::CalibrationAggregator::kMaxNumberOfBins)
      throw PipelineConfigurationException("PipelineConfiguration: bin width " + std::to_string(mBinWidth)
					   + " is too small to index its bins");

    if (mTimeLeftRange.low < 0 || mTimeLeftRange.low > mTimeLeftRange.high)
      throw PipelineConfigurationException("PipelineConfiguration: invalid time left range ["
					   + std::to_string(mTimeLeftRange.low) + ", "
					   + std::to_string(mTimeLeftRange.high) + "]");

    if (mLearnerNames.empty())
      throw PipelineConfigurationException("PipelineConfiguration: no learners configured");
  }

  PipelineConfiguration
  PipelineConfiguration::withOverrides(std::optional<unsigned int> numFolds,
				       std::optional<superlearner::CombinationMethod> method,
				       std::optional<double> binWidth) const
  {
    return PipelineConfiguration(mDataFilePath,
				 mEmpiricalFilePath,
				 mTieEmpiricalFilePath,
				 numFolds.value_or(mNumFolds),
				 mShuffle,
				 mSeed,
				 method.value_or(mMethod),
				 binWidth.value_or(mBinWidth),
				 mTimeLeftRange,
				 mLearnerNames);
  }

  superlearner::SuperLearnerConfiguration
  PipelineConfiguration::toSuperLearnerConfiguration(double confidenceLevel,
						     const superlearner::WeightSolverSettings& solverSettings) const
  {
    return superlearner::SuperLearnerConfiguration(mNumFolds, mShuffle, mSeed, mMethod, confidenceLevel,
						   solverSettings);
  }

  PipelineConfigurationFileReader::PipelineConfigurationFileReader(const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  std::shared_ptr<PipelineConfiguration> PipelineConfigurationFileReader::readConfigurationFile() const
  {
    if (!exists(path(mConfigurationFileName)))
      throw PipelineConfigurationException("Configuration file " + mConfigurationFileName + " does not exist");

    std::string dataFileStr, empiricalFileStr, tieEmpiricalFileStr, foldsStr, shuffleStr, seedStr;
    std::string methodStr, binWidthStr, timeLeftMinStr, timeLeftMaxStr, learnersStr;

    try
      {
	io::CSVReader<11> csvConfigFile(mConfigurationFileName.c_str());
	csvConfigFile.read_header(io::ignore_extra_column | io::ignore_missing_column,
				  "DataFile", "EmpiricalFile", "TieEmpiricalFile", "Folds", "Shuffle", "Seed",
				  "Method", "BinWidth", "TimeLeftMin", "TimeLeftMax", "Learners");

	if (!csvConfigFile.has_column("DataFile"))
	  throw PipelineConfigurationException("Configuration file " + mConfigurationFileName
					       + " has no DataFile column");
	if (!csvConfigFile.has_column("Learners"))
	  throw PipelineConfigurationException("Configuration file " + mConfigurationFileName
					       + " has no Learners column");

	if (!csvConfigFile.read_row(dataFileStr, empiricalFileStr, tieEmpiricalFileStr, foldsStr, shuffleStr, seedStr,
				    methodStr, binWidthStr, timeLeftMinStr, timeLeftMaxStr, learnersStr))
	  throw PipelineConfigurationException("Configuration file " + mConfigurationFileName
					       + " has a header but no settings row");
      }
    catch (const io::error::base& e)
      {
	throw PipelineConfigurationException("Configuration file " + mConfigurationFileName
					     + ": " + e.what());
      }

    const path configurationDirectory = absolute(path(mConfigurationFileName)).parent_path();

    if (boost::algorithm::trim_copy(dataFileStr).empty())
      throw PipelineConfigurationException("Configuration file " + mConfigurationFileName
					   + " does not name a data file");

    const std::string dataFilePath = resolvePath(configurationDirectory, dataFileStr);
    if (!exists(path(dataFilePath)))
      throw PipelineConfigurationException("Data file path " + dataFilePath + " does not exist");

    const std::string empiricalFilePath = resolveOptionalPath(configurationDirectory, empiricalFileStr,
							     "Empirical file");
    const std::string tieEmpiricalFilePath = resolveOptionalPath(configurationDirectory, tieEmpiricalFileStr,
								"Tie empirical file");

    const unsigned int numFolds = parseField<unsigned int>("Folds", foldsStr, 10);
    const bool shuffle = parseBoolean("Shuffle", shuffleStr, false);
    const std::uint64_t seed = parseField<std::uint64_t>("Seed", seedStr, 42);
    const double binWidth = parseField<double>("BinWidth", binWidthStr, 0.01);
    const int timeLeftMin = parseField<int>("TimeLeftMin", timeLeftMinStr, 1);
    const int timeLeftMax = parseField<int>("TimeLeftMax", timeLeftMaxStr, 90);

    superlearner::CombinationMethod method = superlearner::CombinationMethod::NonNegativeLogLikelihood;
    if (!boost::algorithm::trim_copy(methodStr).empty())
      {
	try
	  {
	    method = superlearner::combinationMethodFromString(methodStr);
	  }
	catch (const superlearner::StackingConfigurationException& e)
	  {
	    throw PipelineConfigurationException(e.what());
	  }
      }

    if (timeLeftMin > timeLeftMax)
      throw PipelineConfigurationException("TimeLeftMin " + std::to_string(timeLeftMin)
					   + " exceeds TimeLeftMax " + std::to_string(timeLeftMax));

    return std::make_shared<PipelineConfiguration>(dataFilePath,
						   empiricalFilePath,
						   tieEmpiricalFilePath,
						   numFolds,
						   shuffle,
						   seed,
						   method,
						   binWidth,
						   superlearner::IntegerRange{ timeLeftMin, timeLeftMax },
						   parseLearnerNames(learnersStr));
  }
}
