#pragma once

#include <vector>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace superlearner
{
  /**
   * @class FeatureMatrix
   * @brief Dense row-major matrix of numeric predictors, one row per observation.
   */
  class FeatureMatrix
  {
  public:
    FeatureMatrix()
      : mNumRows(0),
	mNumColumns(0),
	mValues()
    {}

    FeatureMatrix(std::size_t numRows, std::size_t numColumns)
      : mNumRows(numRows),
	mNumColumns(numColumns),
	mValues(numRows * numColumns, 0.0)
    {}

    FeatureMatrix(std::size_t numColumns, std::vector<double> rowMajorValues)
      : mNumRows(0),
	mNumColumns(numColumns),
	mValues(std::move(rowMajorValues))
    {
      if (numColumns == 0)
	{
	  if (!mValues.empty())
	    throw std::invalid_argument("FeatureMatrix: values supplied for a zero-column matrix");
	  return;
	}

      if (mValues.size() % numColumns != 0)
	throw std::invalid_argument("FeatureMatrix: " + std::to_string(mValues.size())
				    + " values do not fill rows of width " + std::to_string(numColumns));
      mNumRows = mValues.size() / numColumns;
    }

    std::size_t getNumRows() const
    {
      return mNumRows;
    }

    std::size_t getNumColumns() const
    {
      return mNumColumns;
    }

    double operator()(std::size_t row, std::size_t column) const
    {
      return mValues[row * mNumColumns + column];
    }

    double& operator()(std::size_t row, std::size_t column)
    {
      return mValues[row * mNumColumns + column];
    }

    const double* getRowData(std::size_t row) const
    {
      return mValues.data() + row * mNumColumns;
    }

    std::vector<double> getRow(std::size_t row) const
    {
      if (row >= mNumRows)
	throw std::out_of_range("FeatureMatrix::getRow - row " + std::to_string(row) + " out of range");
      return std::vector<double>(getRowData(row), getRowData(row) + mNumColumns);
    }

    const std::vector<double>& getValues() const
    {
      return mValues;
    }

    void appendRow(const std::vector<double>& row)
    {
      if (row.size() != mNumColumns)
	throw std::invalid_argument("FeatureMatrix::appendRow - expected " + std::to_string(mNumColumns)
				    + " values, got " + std::to_string(row.size()));
      mValues.insert(mValues.end(), row.begin(), row.end());
      ++mNumRows;
    }

    FeatureMatrix selectRows(const std::vector<std::size_t>& rows) const
    {
      FeatureMatrix result(rows.size(), mNumColumns);
      for (std::size_t r = 0; r < rows.size(); ++r)
	{
	  if (rows[r] >= mNumRows)
	    throw std::out_of_range("FeatureMatrix::selectRows - row " + std::to_string(rows[r]) + " out of range");
	  for (std::size_t c = 0; c < mNumColumns; ++c)
	    result(r, c) = (*this)(rows[r], c);
	}
      return result;
    }

  private:
    std::size_t mNumRows;
    std::size_t mNumColumns;
    std::vector<double> mValues;
  };
}
