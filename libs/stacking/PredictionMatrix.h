#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace superlearner
{
  /**
   * @class PredictionMatrix
   * @brief The N x L out-of-fold prediction matrix Z.
   *
   * Z(i, l) is the prediction for row i from learner l, made by a model
   * that never saw row i. Columns are addressed by learner name so that
   * reordering the learner set cannot silently shift a column.
   */
  class PredictionMatrix
  {
  public:
    // columns[l] holds learner l's predictions for every row
    PredictionMatrix(std::vector<std::string> learnerNames,
		     std::vector<std::vector<double>> columns);

    std::size_t getNumRows() const
    {
      return mNumRows;
    }

    std::size_t getNumLearners() const
    {
      return mLearnerNames.size();
    }

    const std::vector<std::string>& getLearnerNames() const
    {
      return mLearnerNames;
    }

    double operator()(std::size_t row, std::size_t learner) const
    {
      return mColumns[learner][row];
    }

    const std::vector<double>& getColumn(std::size_t learner) const
    {
      return mColumns.at(learner);
    }

    // @throws std::out_of_range for an unknown learner name
    const std::vector<double>& getColumn(const std::string& learnerName) const;

    std::size_t getColumnIndex(const std::string& learnerName) const;

    std::vector<double> getRow(std::size_t row) const;

    // Z . weights, one value per row.
    std::vector<double> combine(const std::vector<double>& weights) const;

  private:
    std::vector<std::string> mLearnerNames;
    std::vector<std::vector<double>> mColumns;
    std::size_t mNumRows;
  };
}
