#include "PredictionMatrix.h"
#include <algorithm>
#include <stdexcept>

namespace superlearner
{
  PredictionMatrix::PredictionMatrix(std::vector<std::string> learnerNames,
				     std::vector<std::vector<double>> columns)
    : mLearnerNames(std::move(learnerNames)),
      mColumns(std::move(columns)),
      mNumRows(0)
  {
    if (mLearnerNames.size() != mColumns.size())
      throw std::invalid_argument("PredictionMatrix: " + std::to_string(mLearnerNames.size())
				  + " learner names for " + std::to_string(mColumns.size()) + " columns");

    if (!mColumns.empty())
      mNumRows = mColumns.front().size();

    for (std::size_t l = 0; l < mColumns.size(); ++l)
      if (mColumns[l].size() != mNumRows)
	throw std::invalid_argument("PredictionMatrix: column '" + mLearnerNames[l] + "' has "
				    + std::to_string(mColumns[l].size()) + " rows, expected "
				    + std::to_string(mNumRows));
  }

  std::size_t PredictionMatrix::getColumnIndex(const std::string& learnerName) const
  {
    auto it = std::find(mLearnerNames.begin(), mLearnerNames.end(), learnerName);
    if (it == mLearnerNames.end())
      throw std::out_of_range("PredictionMatrix: no column for learner '" + learnerName + "'");
    return static_cast<std::size_t>(it - mLearnerNames.begin());
  }

  const std::vector<double>& PredictionMatrix::getColumn(const std::string& learnerName) const
  {
    return mColumns[getColumnIndex(learnerName)];
  }

  std::vector<double> PredictionMatrix::getRow(std::size_t row) const
  {
    if (row >= mNumRows)
      throw std::out_of_range("PredictionMatrix::getRow - row " + std::to_string(row) + " out of range");

    std::vector<double> values;
    values.reserve(mColumns.size());
    for (const auto& column : mColumns)
      values.push_back(column[row]);
    return values;
  }

  std::vector<double> PredictionMatrix::combine(const std::vector<double>& weights) const
  {
    if (weights.size() != mColumns.size())
      throw std::invalid_argument("PredictionMatrix::combine - " + std::to_string(weights.size())
				  + " weights for " + std::to_string(mColumns.size()) + " learners");

    std::vector<double> combined(mNumRows, 0.0);
    for (std::size_t l = 0; l < mColumns.size(); ++l)
      {
	const double w = weights[l];
	if (w == 0.0)
	  continue;
	const auto& column = mColumns[l];
	for (std::size_t i = 0; i < mNumRows; ++i)
	  combined[i] += w * column[i];
      }
    return combined;
  }
}
