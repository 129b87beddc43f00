#include <boost/filesystem.hpp>
#include "csv.h"
#include "DatasetCsvReader.h"
#include "StackingException.h"
#include <cmath>
#include <string>
#include <vector>

namespace winprob
{
  const char* const kScoreDifferentialColumn = "ScoreDifferential";
  const char* const kTimeLeftColumn = "TimeLeft";

  namespace
  {
    void checkFileExists(const std::string& fileName)
    {
      if (!boost::filesystem::exists(boost::filesystem::path(fileName)))
	throw DatasetReaderException("File " + fileName + " does not exist");
    }
  }

  DatasetCsvReader::DatasetCsvReader(const std::string& fileName)
    : mFileName(fileName)
  {}

  superlearner::Dataset DatasetCsvReader::read() const
  {
    checkFileExists(mFileName);

    std::vector<superlearner::Observation> observations;

    try
      {
	io::CSVReader<4> csvFile(mFileName.c_str());
	csvFile.read_header(io::ignore_extra_column, "GameId", kScoreDifferentialColumn,
			    kTimeLeftColumn, "Outcome");

	std::string gameId;
	double scoreDifferential, timeLeft;
	int outcome;

	while (csvFile.read_row(gameId, scoreDifferential, timeLeft, outcome))
	  {
	    if (outcome != 0 && outcome != 1)
	      throw DatasetReaderException(mFileName + " line " + std::to_string(csvFile.get_file_line())
					   + ": Outcome must be 0 or 1, got " + std::to_string(outcome));

	    if (!std::isfinite(scoreDifferential) || !std::isfinite(timeLeft))
	      throw DatasetReaderException(mFileName + " line " + std::to_string(csvFile.get_file_line())
					   + ": non-finite feature value");

	    observations.push_back(superlearner::Observation{ { scoreDifferential, timeLeft }, outcome, gameId });
	  }
      }
    catch (const io::error::base& e)
      {
	throw DatasetReaderException(std::string("DatasetCsvReader: ") + e.what());
      }

    if (observations.empty())
      throw DatasetReaderException("DatasetCsvReader: " + mFileName + " has no observations");

    return superlearner::Dataset({ kScoreDifferentialColumn, kTimeLeftColumn }, std::move(observations));
  }

  EmpiricalTableCsvReader::EmpiricalTableCsvReader(const std::string& fileName)
    : mFileName(fileName)
  {}

  superlearner::EmpiricalRateTable EmpiricalTableCsvReader::read() const
  {
    checkFileExists(mFileName);

    superlearner::EmpiricalRateTable table;

    try
      {
	io::CSVReader<4> csvFile(mFileName.c_str());
	csvFile.read_header(io::ignore_extra_column | io::ignore_missing_column,
			    kScoreDifferentialColumn, kTimeLeftColumn, "EmpiricalRate", "Count");

	const std::vector<std::string> requiredColumns{ kScoreDifferentialColumn, kTimeLeftColumn, "EmpiricalRate" };
	for (const auto& required : requiredColumns)
	  if (!csvFile.has_column(required))
	    throw DatasetReaderException("EmpiricalTableCsvReader: " + mFileName + " has no "
					 + required + " column");

	int scoreDifferential, timeLeft;
	double rate;
	std::size_t count = 1;

	while (csvFile.read_row(scoreDifferential, timeLeft, rate, count))
	  {
	    try
	      {
		table.addCell(scoreDifferential, timeLeft, rate, count);
	      }
	    catch (const superlearner::StackingConfigurationException& e)
	      {
		throw DatasetReaderException(mFileName + " line " + std::to_string(csvFile.get_file_line())
					     + ": " + e.what());
	      }
	  }
      }
    catch (const io::error::base& e)
      {
	throw DatasetReaderException(std::string("EmpiricalTableCsvReader: ") + e.what());
      }

    return table;
  }
}
