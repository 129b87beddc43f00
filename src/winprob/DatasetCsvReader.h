#pragma once

#include <stdexcept>
#include <string>
#include "Dataset.h"
#include "EmpiricalRateTable.h"

namespace winprob
{
  class DatasetReaderException : public std::runtime_error
  {
  public:
    explicit DatasetReaderException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    ~DatasetReaderException() noexcept override = default;
  };

  extern const char* const kScoreDifferentialColumn;
  extern const char* const kTimeLeftColumn;

  /**
   * @class DatasetCsvReader
   * @brief Loads game-state observations from a CSV file.
   *
   * Header columns (any order, extra columns ignored):
   *   GameId, ScoreDifferential, TimeLeft, Outcome
   *
   * Outcome must be 0 or 1. GameId becomes the observation's group id.
   * The resulting dataset has the features {ScoreDifferential, TimeLeft}.
   */
  class DatasetCsvReader
  {
  public:
    explicit DatasetCsvReader(const std::string& fileName);

    superlearner::Dataset read() const;

  private:
    std::string mFileName;
  };

  /**
   * @class EmpiricalTableCsvReader
   * @brief Loads observed win or tie rates per (differential, time left) cell.
   *
   * Header columns: ScoreDifferential, TimeLeft, EmpiricalRate and an
   * optional Count (defaults to 1).
   */
  class EmpiricalTableCsvReader
  {
  public:
    explicit EmpiricalTableCsvReader(const std::string& fileName);

    superlearner::EmpiricalRateTable read() const;

  private:
    std::string mFileName;
  };
}
